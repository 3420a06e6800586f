#include "bank.hpp"

#include <iostream>
#include <utility>

namespace bank {

Bank::Bank(const database::Store &store, generator::Generator numbers)
  : handle(&store), numbers(std::move(numbers)) {
}

std::expected<models::Credentials, UNEXPECTED_CODE> Bank::createAccount() {
  while(true) {
    auto credentials = numbers.generate(*handle);

    if(!credentials.has_value()) {
      return credentials;
    }

    auto connection = database::getConnection(*handle);

    auto created = database::createCard(connection.get(), *credentials);

    if(!created.has_value()) {
      return std::unexpected(created.error());
    }

    if(*created) {
      return credentials;
    }

    // another process inserted the same number between the draw and the insert
    std::cerr << "[LOG] card " << credentials->number << " already taken, drawing again" << std::endl;
  }
}

std::expected<session::Session, UNEXPECTED_CODE>
Bank::authenticate(const models::Credentials &credentials) const {
  return session::Session::open(*handle, credentials);
}
}
