#pragma once

#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include "models.hpp"
#include "unexpected_codes.hpp"

namespace database {

struct Connection;

// Thrown when the database file can't be opened or a transaction can't begin.
struct StorageUnavailable: public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Handle owned by main and passed down; every unit of work opens its own
// Connection from it.
struct Store {
  std::string
    path = "card.s3db";
  int
    busyTimeoutMs = 1000;
};

using ConnectionPtr = std::unique_ptr<Connection, void(*)(Connection*)>;

//Database specific

// A transactional connection runs inside BEGIN IMMEDIATE. Releasing it
// without a successful commit() rolls the transaction back.
ConnectionPtr getConnection(const Store &store, bool transactional = false);
int run_stmt(Connection*, const char *);

std::expected<void, UNEXPECTED_CODE>
commit(Connection* connection);

void initSchema(const Store &store);

//Model operations

std::expected<bool, UNEXPECTED_CODE>
createCard(Connection* connection, const models::Credentials &credentials);

std::expected<bool, UNEXPECTED_CODE>
cardExists(Connection* connection, std::string_view number);

std::expected<long long, UNEXPECTED_CODE>
getBalance(Connection* connection, std::string_view number);

std::expected<bool, UNEXPECTED_CODE>
verifyCredentials(Connection* connection, const models::Credentials &credentials);

std::expected<void, UNEXPECTED_CODE>
addBalance(Connection* connection, std::string_view number, long long delta);

std::expected<void, UNEXPECTED_CODE>
deleteCard(Connection* connection, std::string_view number);
}
