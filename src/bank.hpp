#pragma once

#include <expected>

#include "database.hpp"
#include "generator.hpp"
#include "models.hpp"
#include "session.hpp"
#include "unexpected_codes.hpp"

namespace bank {

class Bank {
public:
  Bank(const database::Store &store, generator::Generator numbers);

  std::expected<models::Credentials, UNEXPECTED_CODE> createAccount();

  std::expected<session::Session, UNEXPECTED_CODE>
  authenticate(const models::Credentials &credentials) const;

private:
  const database::Store
    *handle;
  generator::Generator
    numbers;
};
}
