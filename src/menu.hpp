#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "bank.hpp"
#include "models.hpp"
#include "session.hpp"
#include "unexpected_codes.hpp"

namespace menu {

enum class MAIN_COMMAND {
  EXIT,
  CREATE_ACCOUNT,
  LOG_IN
};

enum class ACCOUNT_COMMAND {
  EXIT,
  BALANCE,
  ADD_INCOME,
  DO_TRANSFER,
  CLOSE_ACCOUNT,
  LOG_OUT
};

// What a handler asks the enclosing loop to do next.
enum class SIGNAL {
  CONTINUE,
  LOGGED_OUT,
  EXIT
};

std::optional<MAIN_COMMAND> parseMainCommand(std::string_view input);
std::optional<ACCOUNT_COMMAND> parseAccountCommand(std::string_view input);
std::optional<long long> parseAmount(std::string_view input);

const char *describe(models::TRANSFER_OUTCOME outcome);

class Menu {
public:
  Menu(bank::Bank &bank, std::istream &in, std::ostream &out);

  // Loops until Exit or end of input. Returns the process exit status.
  int run();

private:
  SIGNAL dispatch(MAIN_COMMAND command);
  SIGNAL dispatch(session::Session &session, ACCOUNT_COMMAND command);

  SIGNAL createAccount();
  SIGNAL logIn();
  SIGNAL account(session::Session &session);

  SIGNAL showBalance(session::Session &session);
  SIGNAL addIncome(session::Session &session);
  SIGNAL doTransfer(session::Session &session);
  SIGNAL closeAccount(session::Session &session);
  SIGNAL logOut(session::Session &session);

  SIGNAL failure(UNEXPECTED_CODE code);
  std::optional<std::string> ask(const char *prompt);

  bank::Bank
    &accounts;
  std::istream
    &in;
  std::ostream
    &out;
};
}
