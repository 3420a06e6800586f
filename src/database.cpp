#include "database.hpp"
#include "sqlite3.h"
#include <string>

#include <iostream>

namespace database {

namespace {

bool isOk(int rc) {
  return rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW;
}

constexpr const char *SCHEMA = R"(
  CREATE TABLE IF NOT EXISTS card (
    id INTEGER NOT NULL PRIMARY KEY AUTOINCREMENT,
    number TEXT NOT NULL UNIQUE,
    pin TEXT NOT NULL,
    balance INTEGER NOT NULL DEFAULT 0
  );
)";

}

struct Connection {
  sqlite3 *db = nullptr;
  sqlite3_stmt* stmt = nullptr;
  const bool transactional;
  bool committed = false;
  int rc = SQLITE_OK;

  Connection(const Store &store, bool transactional): transactional(transactional) {
    rc = sqlite3_open_v2(store.path.c_str(), &db,
                         SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);

    if(rc != SQLITE_OK) {
      fail("DATABASE couldn't be opened: ");
    }

    sqlite3_busy_timeout(db, store.busyTimeoutMs);

    // the busy handler has already waited busyTimeoutMs when BUSY comes back
    if(transactional) {
      rc = sqlite3_exec(db, "BEGIN IMMEDIATE", 0, 0, 0);

      if(rc != SQLITE_OK) {
        fail("DATABASE transaction couldn't begin: ");
      }
    }
  }

  [[noreturn]] void fail(const std::string &what) {
    std::string reason = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    sqlite3_close(db);
    db = nullptr;
    throw StorageUnavailable(what + reason);
  }

  template<typename Functor>
  void prepare(Functor functor) {
    if(stmt != nullptr) {
      sqlite3_finalize(stmt);
      stmt = nullptr;
    }
    command(functor);
  }

  // A failed call leaves rc set, so every later command on this
  // connection is skipped.
  template<typename Functor>
  void command(Functor functor) {
    if(!isOk(rc)) {
      return;
    }

    rc = functor();

    if(!isOk(rc)) {
      std::cerr << "[SQLITE3_ERROR] " << sqlite3_errmsg(db) << std::endl;
    }
  }

  template<typename... Functors>
  void command(Functors&&... functors) {
    ([&]{
     command(functors);
    } (), ...);
  }

  bool changed() const {
    return sqlite3_changes(db) > 0;
  }
};

void deleteConnection(Connection* connection) {
  sqlite3_finalize(connection->stmt);
  connection->stmt = nullptr;

  if(connection->transactional && !connection->committed) {
    connection->rc = sqlite3_exec(connection->db, "ROLLBACK", 0, 0, 0);

    if (connection->rc != SQLITE_OK) {
      std::cerr << "[SQLITE3_ERROR ROLLBACK] " << sqlite3_errmsg(connection->db) << std::endl;
    }
  }

  connection->rc = sqlite3_close(connection->db);

  if (connection->rc != SQLITE_OK) {
    std::cerr << "[SQLITE3_ERROR DELETE] " << sqlite3_errmsg(connection->db) << std::endl;
  }

  delete connection;
}

namespace {

// Locked database after the busy timeout is a storage outage, anything else
// an unexpected result.
std::unexpected<UNEXPECTED_CODE> failure(const Connection *connection) {
  const int primary = connection->rc & 0xff;

  if(primary == SQLITE_BUSY || primary == SQLITE_LOCKED) {
    return std::unexpected(UNEXPECTED_CODE::STORAGE_UNAVAILABLE);
  }

  return std::unexpected(UNEXPECTED_CODE::UNKNOWN);
}

}

ConnectionPtr getConnection(const Store &store, bool transactional) {
  return ConnectionPtr(new Connection(store, transactional), deleteConnection);
}

int run_stmt(Connection *connection, const char *sql) {
  char *zErrMsg = 0;

  int rc = sqlite3_exec(connection->db, sql, nullptr, 0, &zErrMsg);

  if (rc != SQLITE_OK) {
    std::cerr << "[SQLITE3_ERROR] " << (zErrMsg != nullptr ? zErrMsg : sqlite3_errstr(rc)) << std::endl;
    sqlite3_free(zErrMsg);
  }

  return rc;
}

std::expected<void, UNEXPECTED_CODE>
commit(Connection *connection) {
  if(!connection->transactional || connection->committed) {
    return {};
  }

  if(!isOk(connection->rc)) {
    return failure(connection);
  }

  sqlite3_finalize(connection->stmt);
  connection->stmt = nullptr;

  connection->rc = run_stmt(connection, "COMMIT");

  if(connection->rc != SQLITE_OK) {
    return std::unexpected(UNEXPECTED_CODE::STORAGE_UNAVAILABLE);
  }

  connection->committed = true;
  return {};
}

void initSchema(const Store &store) {
  auto connection = getConnection(store, false);

  if(run_stmt(connection.get(), SCHEMA) != SQLITE_OK) {
    throw StorageUnavailable("DATABASE schema couldn't be created");
  }
}

std::expected<bool, UNEXPECTED_CODE>
createCard(Connection *connection, const models::Credentials &credentials) {

    auto sql = R"(
      INSERT OR IGNORE INTO card (number, pin, balance)
      VALUES (?, ?, 0)
    )";

    connection->prepare([&]() {
        return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
    });

    connection->command(
        [&]() {
            return sqlite3_bind_text(connection->stmt, 1, credentials.number.c_str(),
                                   credentials.number.size(), SQLITE_STATIC);
        },
        [&]() {
            return sqlite3_bind_text(connection->stmt, 2, credentials.pin.c_str(),
                                   credentials.pin.size(), SQLITE_STATIC);
        },
        [&]() { return sqlite3_step(connection->stmt); }
    );

    if(connection->rc == SQLITE_DONE) {
      return connection->changed();
    }

    return failure(connection);
}

std::expected<bool, UNEXPECTED_CODE>
cardExists(Connection *connection, std::string_view number) {

    auto sql = "SELECT 1 FROM card WHERE number = ? LIMIT 1";

    connection->prepare([&]() {
        return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
    });

    connection->command(
        [&]() {
            return sqlite3_bind_text(connection->stmt, 1, number.data(), number.size(), SQLITE_STATIC);
        },
        [&]() { return sqlite3_step(connection->stmt); }
    );

    if(connection->rc == SQLITE_ROW) {
      return true;
    }

    if(connection->rc == SQLITE_DONE) {
      return false;
    }

    return failure(connection);
}

std::expected<long long, UNEXPECTED_CODE>
getBalance(Connection *connection, std::string_view number) {

  auto sql = "SELECT balance FROM card WHERE number = ? LIMIT 1";

  connection->prepare([&]() {
    return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
  });

  connection->command([&]() {
    return sqlite3_bind_text(connection->stmt, 1, number.data(), number.size(), SQLITE_STATIC);
  });

  connection->command([&]() { return sqlite3_step(connection->stmt); });

  if (connection->rc == SQLITE_DONE) {
    return std::unexpected(UNEXPECTED_CODE::NOT_FOUND);
  }

  if (connection->rc == SQLITE_ROW) {
    return static_cast<long long>(sqlite3_column_int64(connection->stmt, 0));
  }

  return failure(connection);
}

std::expected<bool, UNEXPECTED_CODE>
verifyCredentials(Connection *connection, const models::Credentials &credentials) {

    auto sql = "SELECT 1 FROM card WHERE number = ? AND pin = ? LIMIT 1";

    connection->prepare([&]() {
        return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
    });

    connection->command(
        [&]() {
            return sqlite3_bind_text(connection->stmt, 1, credentials.number.c_str(),
                                   credentials.number.size(), SQLITE_STATIC);
        },
        [&]() {
            return sqlite3_bind_text(connection->stmt, 2, credentials.pin.c_str(),
                                   credentials.pin.size(), SQLITE_STATIC);
        },
        [&]() { return sqlite3_step(connection->stmt); }
    );

    if(connection->rc == SQLITE_ROW) {
      return true;
    }

    if(connection->rc == SQLITE_DONE) {
      return false;
    }

    return failure(connection);
}

std::expected<void, UNEXPECTED_CODE>
addBalance(Connection *connection, std::string_view number, long long delta) {

    // an integer overflow makes SQLite produce a REAL, so such a row is left alone
    auto sql = R"(
      UPDATE card SET balance = balance + ?1
      WHERE number = ?2 AND typeof(balance + ?1) = 'integer'
    )";

    connection->prepare([&]() {
      return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
    });

    connection->command(
      [&]() { return sqlite3_bind_int64(connection->stmt, 1, delta); },
      [&]() {
        return sqlite3_bind_text(connection->stmt, 2, number.data(), number.size(), SQLITE_STATIC);
      },
      [&]() { return sqlite3_step(connection->stmt); }
    );

    if(connection->rc != SQLITE_DONE) {
      return failure(connection);
    }

    if(!connection->changed()) {
      auto exists = cardExists(connection, number);

      if(!exists.has_value()) {
        return std::unexpected(exists.error());
      }

      return std::unexpected(*exists ? UNEXPECTED_CODE::BALANCE_OVERFLOW : UNEXPECTED_CODE::NOT_FOUND);
    }

    return {};
}

std::expected<void, UNEXPECTED_CODE>
deleteCard(Connection *connection, std::string_view number) {

    auto sql = "DELETE FROM card WHERE number = ?";

    connection->prepare([&]() {
      return sqlite3_prepare_v2(connection->db, sql, -1, &(connection->stmt), nullptr);
    });

    connection->command(
      [&]() {
        return sqlite3_bind_text(connection->stmt, 1, number.data(), number.size(), SQLITE_STATIC);
      },
      [&]() { return sqlite3_step(connection->stmt); }
    );

    if(connection->rc != SQLITE_DONE) {
      return failure(connection);
    }

    if(!connection->changed()) {
      return std::unexpected(UNEXPECTED_CODE::NOT_FOUND);
    }

    return {};
}

}
