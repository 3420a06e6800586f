#include "transfer.hpp"
#include "checksum.hpp"

#include <iostream>

namespace transfer {

namespace {

std::expected<models::TRANSFER_OUTCOME, UNEXPECTED_CODE>
checkRecipient(database::Connection *connection, std::string_view source, std::string_view destination) {
  if(destination == source) {
    return models::TRANSFER_OUTCOME::SELF_TRANSFER;
  }

  if(!checksum::isValid(destination)) {
    return models::TRANSFER_OUTCOME::INVALID_CARD_NUMBER;
  }

  auto exists = database::cardExists(connection, destination);

  if(!exists.has_value()) {
    return std::unexpected(exists.error());
  }

  if(!*exists) {
    return models::TRANSFER_OUTCOME::UNKNOWN_RECIPIENT;
  }

  return models::TRANSFER_OUTCOME::SUCCESS;
}

}

std::expected<models::TRANSFER_OUTCOME, UNEXPECTED_CODE>
checkRecipient(const database::Store &store, std::string_view source, std::string_view destination) {
  auto connection = database::getConnection(store);

  return checkRecipient(connection.get(), source, destination);
}

std::expected<models::TRANSFER_OUTCOME, UNEXPECTED_CODE>
execute(const database::Store &store, std::string_view source,
        std::string_view destination, long long amount) {
  auto connection = database::getConnection(store, true);

  auto recipient = checkRecipient(connection.get(), source, destination);

  if(!recipient.has_value() || *recipient != models::TRANSFER_OUTCOME::SUCCESS) {
    return recipient;
  }

  if(amount <= 0) {
    return models::TRANSFER_OUTCOME::INVALID_AMOUNT;
  }

  auto balance = database::getBalance(connection.get(), source);

  if(!balance.has_value()) {
    return std::unexpected(balance.error());
  }

  if(amount > *balance) {
    return models::TRANSFER_OUTCOME::INSUFFICIENT_FUNDS;
  }

  auto debit = database::addBalance(connection.get(), source, -amount);

  if(!debit.has_value()) {
    return std::unexpected(debit.error());
  }

  auto credit = database::addBalance(connection.get(), destination, amount);

  if(!credit.has_value()) {
    std::cerr << "[LOG] transfer to " << destination << " failed, rolling back" << std::endl;
    return std::unexpected(credit.error());
  }

  auto committed = database::commit(connection.get());

  if(!committed.has_value()) {
    return std::unexpected(committed.error());
  }

  return models::TRANSFER_OUTCOME::SUCCESS;
}
}
