#include <catch2/catch.hpp>

#include <limits>
#include <string>
#include <utility>

#include "session.hpp"
#include "test_store.hpp"
#include "transfer.hpp"

namespace {

session::Session login(TestStore &fixture, const std::string &number, const std::string &pin) {
  auto opened = session::Session::open(fixture.store, {number, pin});
  REQUIRE(opened.has_value());
  return std::move(*opened);
}

void refuseCreditsTo(TestStore &fixture, const std::string &number) {
  auto connection = database::getConnection(fixture.store);

  const std::string sql =
    "CREATE TRIGGER refuse_credit BEFORE UPDATE OF balance ON card "
    "WHEN NEW.number = '" + number + "' AND NEW.balance > OLD.balance "
    "BEGIN SELECT RAISE(ABORT, 'credit refused'); END;";

  REQUIRE(database::run_stmt(connection.get(), sql.c_str()) == 0);
}

}

TEST_CASE("transfer moves funds from sender to recipient", "[transfer]") {
  TestStore fixture;
  fixture.add(CARD_A, "1234", 500);
  fixture.add(CARD_B, "5678");

  auto sender = login(fixture, CARD_A, "1234");

  auto outcome = sender.transfer(CARD_B, 200);

  REQUIRE(outcome.has_value());
  REQUIRE(*outcome == models::TRANSFER_OUTCOME::SUCCESS);
  REQUIRE(fixture.balance(CARD_A) == 300);
  REQUIRE(fixture.balance(CARD_B) == 200);
}

TEST_CASE("transfer of the whole balance is allowed", "[transfer]") {
  TestStore fixture;
  fixture.add(CARD_A, "1234", 300);
  fixture.add(CARD_B, "5678", 5);

  auto outcome = transfer::execute(fixture.store, CARD_A, CARD_B, 300);

  REQUIRE(outcome.value() == models::TRANSFER_OUTCOME::SUCCESS);
  REQUIRE(fixture.balance(CARD_A) == 0);
  REQUIRE(fixture.balance(CARD_B) == 305);
}

TEST_CASE("transfer rejections leave every balance unchanged", "[transfer]") {
  TestStore fixture;
  fixture.add(CARD_A, "1234", 300);
  fixture.add(CARD_B, "5678", 20);

  auto sender = login(fixture, CARD_A, "1234");

  SECTION("self transfer") {
    REQUIRE(sender.transfer(CARD_A, 1).value() == models::TRANSFER_OUTCOME::SELF_TRANSFER);
  }

  SECTION("malformed card number") {
    REQUIRE(sender.transfer("not-a-card", 1).value() == models::TRANSFER_OUTCOME::INVALID_CARD_NUMBER);
    REQUIRE(sender.transfer("4000009876543210", 1).value() == models::TRANSFER_OUTCOME::INVALID_CARD_NUMBER);
  }

  SECTION("unknown recipient") {
    REQUIRE(sender.transfer(CARD_C, 1).value() == models::TRANSFER_OUTCOME::UNKNOWN_RECIPIENT);
  }

  SECTION("non-positive amount") {
    REQUIRE(sender.transfer(CARD_B, 0).value() == models::TRANSFER_OUTCOME::INVALID_AMOUNT);
    REQUIRE(sender.transfer(CARD_B, -50).value() == models::TRANSFER_OUTCOME::INVALID_AMOUNT);
  }

  SECTION("insufficient funds") {
    REQUIRE(sender.transfer(CARD_B, 10000).value() == models::TRANSFER_OUTCOME::INSUFFICIENT_FUNDS);
    REQUIRE(sender.transfer(CARD_B, 301).value() == models::TRANSFER_OUTCOME::INSUFFICIENT_FUNDS);
  }

  REQUIRE(fixture.balance(CARD_A) == 300);
  REQUIRE(fixture.balance(CARD_B) == 20);
}

TEST_CASE("transfer checks run in order", "[transfer]") {
  TestStore fixture;
  fixture.add(CARD_A, "1234", 0);

  // self transfer wins over the amount and balance checks
  REQUIRE(transfer::execute(fixture.store, CARD_A, CARD_A, 10000).value()
      == models::TRANSFER_OUTCOME::SELF_TRANSFER);

  // checksum is checked before existence
  REQUIRE(transfer::execute(fixture.store, CARD_A, "4000001234567890", 1).value()
      == models::TRANSFER_OUTCOME::INVALID_CARD_NUMBER);

  // existence is checked before the amount
  REQUIRE(transfer::execute(fixture.store, CARD_A, CARD_D, -1).value()
      == models::TRANSFER_OUTCOME::UNKNOWN_RECIPIENT);
}

TEST_CASE("checkRecipient reports the recipient outcome without moving funds", "[transfer]") {
  TestStore fixture;
  fixture.add(CARD_A, "1234", 50);
  fixture.add(CARD_B, "5678");

  auto sender = login(fixture, CARD_A, "1234");

  REQUIRE(sender.checkRecipient(CARD_B).value() == models::TRANSFER_OUTCOME::SUCCESS);
  REQUIRE(sender.checkRecipient(CARD_A).value() == models::TRANSFER_OUTCOME::SELF_TRANSFER);
  REQUIRE(sender.checkRecipient("12").value() == models::TRANSFER_OUTCOME::INVALID_CARD_NUMBER);
  REQUIRE(sender.checkRecipient(CARD_C).value() == models::TRANSFER_OUTCOME::UNKNOWN_RECIPIENT);
  REQUIRE(fixture.balance(CARD_A) == 50);
}

TEST_CASE("A failing credit rolls back the debit", "[transfer][atomicity]") {
  TestStore fixture;
  fixture.add(CARD_A, "1234", 500);
  fixture.add(CARD_B, "5678");
  refuseCreditsTo(fixture, CARD_B);

  auto sender = login(fixture, CARD_A, "1234");

  auto outcome = sender.transfer(CARD_B, 200);

  REQUIRE_FALSE(outcome.has_value());
  REQUIRE(outcome.error() == UNEXPECTED_CODE::UNKNOWN);
  REQUIRE(fixture.balance(CARD_A) == 500);
  REQUIRE(fixture.balance(CARD_B) == 0);
}

TEST_CASE("Transfers keep the total balance constant", "[transfer]") {
  TestStore fixture;
  fixture.add(CARD_A, "1234", 500);
  fixture.add(CARD_B, "5678", 120);
  fixture.add(CARD_C, "0000", 7);

  const auto before = fixture.total();

  REQUIRE(transfer::execute(fixture.store, CARD_A, CARD_B, 200).value() == models::TRANSFER_OUTCOME::SUCCESS);
  REQUIRE(transfer::execute(fixture.store, CARD_B, CARD_C, 320).value() == models::TRANSFER_OUTCOME::SUCCESS);
  REQUIRE(transfer::execute(fixture.store, CARD_C, CARD_A, 1000).value() == models::TRANSFER_OUTCOME::INSUFFICIENT_FUNDS);
  REQUIRE(transfer::execute(fixture.store, CARD_C, CARD_A, 327).value() == models::TRANSFER_OUTCOME::SUCCESS);

  REQUIRE(fixture.total() == before);
  REQUIRE(fixture.balance(CARD_A) == 627);
  REQUIRE(fixture.balance(CARD_B) == 0);
  REQUIRE(fixture.balance(CARD_C) == 0);
}

TEST_CASE("A credit past the 64-bit range is refused and the debit rolled back", "[transfer][atomicity]") {
  TestStore fixture;
  fixture.add(CARD_A, "1234", 10);
  fixture.add(CARD_B, "5678", std::numeric_limits<long long>::max());

  auto outcome = transfer::execute(fixture.store, CARD_A, CARD_B, 10);

  REQUIRE_FALSE(outcome.has_value());
  REQUIRE(outcome.error() == UNEXPECTED_CODE::BALANCE_OVERFLOW);
  REQUIRE(fixture.balance(CARD_A) == 10);
  REQUIRE(fixture.balance(CARD_B) == std::numeric_limits<long long>::max());
}
