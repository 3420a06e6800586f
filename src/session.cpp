#include "session.hpp"
#include "transfer.hpp"

#include <utility>

namespace session {

Session::Session(const database::Store &store, std::string number)
  : store(&store), number(std::move(number)) {
}

Session::Session(Session &&other) noexcept
  : store(other.store),
    number(std::move(other.number)),
    current(std::exchange(other.current, STATE::LOGGED_OUT)) {
}

Session &Session::operator=(Session &&other) noexcept {
  if(this != &other) {
    store = other.store;
    number = std::move(other.number);
    current = std::exchange(other.current, STATE::LOGGED_OUT);
  }

  return *this;
}

std::expected<Session, UNEXPECTED_CODE>
Session::open(const database::Store &store, const models::Credentials &credentials) {
  auto connection = database::getConnection(store);

  auto verified = database::verifyCredentials(connection.get(), credentials);

  if(!verified.has_value()) {
    return std::unexpected(verified.error());
  }

  if(!*verified) {
    return std::unexpected(UNEXPECTED_CODE::AUTHENTICATION_FAILED);
  }

  return Session{store, credentials.number};
}

std::expected<long long, UNEXPECTED_CODE> Session::balance() const {
  if(!active()) {
    return std::unexpected(UNEXPECTED_CODE::SESSION_CLOSED);
  }

  auto connection = database::getConnection(*store);

  return database::getBalance(connection.get(), number);
}

std::expected<long long, UNEXPECTED_CODE> Session::deposit(long long amount) {
  if(!active()) {
    return std::unexpected(UNEXPECTED_CODE::SESSION_CLOSED);
  }

  if(amount <= 0) {
    return std::unexpected(UNEXPECTED_CODE::INVALID_AMOUNT);
  }

  auto connection = database::getConnection(*store, true);

  auto added = database::addBalance(connection.get(), number, amount);

  if(!added.has_value()) {
    return std::unexpected(added.error());
  }

  auto balance = database::getBalance(connection.get(), number);

  if(!balance.has_value()) {
    return balance;
  }

  auto committed = database::commit(connection.get());

  if(!committed.has_value()) {
    return std::unexpected(committed.error());
  }

  return balance;
}

std::expected<models::TRANSFER_OUTCOME, UNEXPECTED_CODE>
Session::checkRecipient(std::string_view destination) const {
  if(!active()) {
    return std::unexpected(UNEXPECTED_CODE::SESSION_CLOSED);
  }

  return transfer::checkRecipient(*store, number, destination);
}

std::expected<models::TRANSFER_OUTCOME, UNEXPECTED_CODE>
Session::transfer(std::string_view destination, long long amount) {
  if(!active()) {
    return std::unexpected(UNEXPECTED_CODE::SESSION_CLOSED);
  }

  return transfer::execute(*store, number, destination, amount);
}

std::expected<void, UNEXPECTED_CODE> Session::close() {
  if(!active()) {
    return std::unexpected(UNEXPECTED_CODE::SESSION_CLOSED);
  }

  auto connection = database::getConnection(*store);

  auto deleted = database::deleteCard(connection.get(), number);

  // a card already gone is closed all the same
  if(deleted.has_value() || deleted.error() == UNEXPECTED_CODE::NOT_FOUND) {
    current = STATE::CLOSED;
  }

  return deleted;
}

void Session::logout() {
  if(active()) {
    current = STATE::LOGGED_OUT;
  }
}
}
