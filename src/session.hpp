#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "database.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace session {

enum class STATE {
  AUTHENTICATED,
  CLOSED,
  LOGGED_OUT
};

// Binding to one verified card. Only open() creates a session, so an
// unauthenticated Session never exists. After close() or logout() every
// operation fails with SESSION_CLOSED. Move-only: a moved-from session is
// LOGGED_OUT so one card never has two live state machines.
class Session {
public:
  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;
  Session(Session &&other) noexcept;
  Session &operator=(Session &&other) noexcept;

  static std::expected<Session, UNEXPECTED_CODE>
  open(const database::Store &store, const models::Credentials &credentials);

  const std::string &cardNumber() const { return number; }
  STATE state() const { return current; }
  bool active() const { return current == STATE::AUTHENTICATED; }

  std::expected<long long, UNEXPECTED_CODE> balance() const;

  // Returns the balance after the deposit.
  std::expected<long long, UNEXPECTED_CODE> deposit(long long amount);

  std::expected<models::TRANSFER_OUTCOME, UNEXPECTED_CODE>
  checkRecipient(std::string_view destination) const;

  std::expected<models::TRANSFER_OUTCOME, UNEXPECTED_CODE>
  transfer(std::string_view destination, long long amount);

  std::expected<void, UNEXPECTED_CODE> close();
  void logout();

private:
  Session(const database::Store &store, std::string number);

  const database::Store
    *store;
  std::string
    number;
  STATE
    current = STATE::AUTHENTICATED;
};
}
