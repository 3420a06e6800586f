#include "menu.hpp"

#include <array>
#include <charconv>
#include <iostream>
#include <utility>

namespace menu {

namespace {

constexpr std::array<std::pair<std::string_view, MAIN_COMMAND>, 3> MAIN_COMMANDS{{
  {"1", MAIN_COMMAND::CREATE_ACCOUNT},
  {"2", MAIN_COMMAND::LOG_IN},
  {"0", MAIN_COMMAND::EXIT},
}};

constexpr std::array<std::pair<std::string_view, ACCOUNT_COMMAND>, 6> ACCOUNT_COMMANDS{{
  {"1", ACCOUNT_COMMAND::BALANCE},
  {"2", ACCOUNT_COMMAND::ADD_INCOME},
  {"3", ACCOUNT_COMMAND::DO_TRANSFER},
  {"4", ACCOUNT_COMMAND::CLOSE_ACCOUNT},
  {"5", ACCOUNT_COMMAND::LOG_OUT},
  {"0", ACCOUNT_COMMAND::EXIT},
}};

constexpr const char *MAIN_MENU =
  "1. Create an account\n"
  "2. Log into account\n"
  "0. Exit\n";

constexpr const char *ACCOUNT_MENU =
  "1. Balance\n"
  "2. Add income\n"
  "3. Do transfer\n"
  "4. Close account\n"
  "5. Log out\n"
  "0. Exit\n";

std::string_view trim(std::string_view input) {
  constexpr std::string_view blanks = " \t\r\n";

  auto begin = input.find_first_not_of(blanks);

  if(begin == std::string_view::npos) {
    return {};
  }

  auto end = input.find_last_not_of(blanks);
  return input.substr(begin, end - begin + 1);
}

template<typename Command, std::size_t N>
std::optional<Command>
lookup(const std::array<std::pair<std::string_view, Command>, N> &commands, std::string_view input) {
  input = trim(input);

  for(const auto &[key, command] : commands) {
    if(key == input) {
      return command;
    }
  }

  return std::nullopt;
}

}

std::optional<MAIN_COMMAND> parseMainCommand(std::string_view input) {
  return lookup(MAIN_COMMANDS, input);
}

std::optional<ACCOUNT_COMMAND> parseAccountCommand(std::string_view input) {
  return lookup(ACCOUNT_COMMANDS, input);
}

std::optional<long long> parseAmount(std::string_view input) {
  input = trim(input);

  long long amount = 0;
  auto [end, ec] = std::from_chars(input.data(), input.data() + input.size(), amount);

  if(input.empty() || ec != std::errc{} || end != input.data() + input.size()) {
    return std::nullopt;
  }

  return amount;
}

const char *describe(models::TRANSFER_OUTCOME outcome) {
  switch(outcome) {
    case models::TRANSFER_OUTCOME::SUCCESS:
      return "Success!";
    case models::TRANSFER_OUTCOME::SELF_TRANSFER:
      return "You can't transfer money to the same account!";
    case models::TRANSFER_OUTCOME::INVALID_CARD_NUMBER:
      return "You probably made a mistake in the card number. Please try again!";
    case models::TRANSFER_OUTCOME::UNKNOWN_RECIPIENT:
      return "Such card does not exist.";
    case models::TRANSFER_OUTCOME::INVALID_AMOUNT:
      return "Invalid amount.";
    case models::TRANSFER_OUTCOME::INSUFFICIENT_FUNDS:
      return "Not enough money!";
  }

  return "Unknown transfer outcome.";
}

Menu::Menu(bank::Bank &bank, std::istream &in, std::ostream &out)
  : accounts(bank), in(in), out(out) {
}

int Menu::run() {
  while(true) {
    auto line = ask(MAIN_MENU);

    if(!line.has_value()) {
      break;
    }

    auto command = parseMainCommand(*line);

    if(!command.has_value()) {
      out << "Unknown option.\n\n";
      continue;
    }

    if(dispatch(*command) == SIGNAL::EXIT) {
      break;
    }
  }

  out << "\nBye!\n";
  return 0;
}

SIGNAL Menu::dispatch(MAIN_COMMAND command) {
  switch(command) {
    case MAIN_COMMAND::CREATE_ACCOUNT:
      return createAccount();
    case MAIN_COMMAND::LOG_IN:
      return logIn();
    case MAIN_COMMAND::EXIT:
      return SIGNAL::EXIT;
  }

  return SIGNAL::CONTINUE;
}

SIGNAL Menu::dispatch(session::Session &session, ACCOUNT_COMMAND command) {
  switch(command) {
    case ACCOUNT_COMMAND::BALANCE:
      return showBalance(session);
    case ACCOUNT_COMMAND::ADD_INCOME:
      return addIncome(session);
    case ACCOUNT_COMMAND::DO_TRANSFER:
      return doTransfer(session);
    case ACCOUNT_COMMAND::CLOSE_ACCOUNT:
      return closeAccount(session);
    case ACCOUNT_COMMAND::LOG_OUT:
      return logOut(session);
    case ACCOUNT_COMMAND::EXIT:
      return SIGNAL::EXIT;
  }

  return SIGNAL::CONTINUE;
}

SIGNAL Menu::createAccount() {
  auto credentials = accounts.createAccount();

  if(!credentials.has_value()) {
    return failure(credentials.error());
  }

  out << "\nYour card has been created\n"
      << "Your card number:\n" << credentials->number << "\n"
      << "Your card PIN:\n" << credentials->pin << "\n\n";

  return SIGNAL::CONTINUE;
}

SIGNAL Menu::logIn() {
  auto number = ask("\nEnter your card number:\n");

  if(!number.has_value()) {
    return SIGNAL::EXIT;
  }

  auto pin = ask("Enter your PIN:\n");

  if(!pin.has_value()) {
    return SIGNAL::EXIT;
  }

  auto session = accounts.authenticate({std::string{trim(*number)}, std::string{trim(*pin)}});

  if(!session.has_value()) {
    if(session.error() == UNEXPECTED_CODE::AUTHENTICATION_FAILED) {
      out << "\nWrong card number or PIN\n\n";
      return SIGNAL::CONTINUE;
    }

    return failure(session.error());
  }

  out << "\nYou have successfully logged in!\n\n";

  return account(*session);
}

SIGNAL Menu::account(session::Session &session) {
  while(session.active()) {
    auto line = ask(ACCOUNT_MENU);

    if(!line.has_value()) {
      session.logout();
      return SIGNAL::EXIT;
    }

    auto command = parseAccountCommand(*line);

    if(!command.has_value()) {
      out << "Unknown option.\n\n";
      continue;
    }

    switch(dispatch(session, *command)) {
      case SIGNAL::CONTINUE:
        break;
      case SIGNAL::LOGGED_OUT:
        session.logout();
        return SIGNAL::CONTINUE;
      case SIGNAL::EXIT:
        session.logout();
        return SIGNAL::EXIT;
    }
  }

  return SIGNAL::CONTINUE;
}

SIGNAL Menu::showBalance(session::Session &session) {
  auto balance = session.balance();

  if(!balance.has_value()) {
    return failure(balance.error());
  }

  out << "\nBalance: " << *balance << "\n\n";
  return SIGNAL::CONTINUE;
}

SIGNAL Menu::addIncome(session::Session &session) {
  auto line = ask("\nEnter income:\n");

  if(!line.has_value()) {
    return SIGNAL::EXIT;
  }

  auto amount = parseAmount(*line);

  if(!amount.has_value()) {
    out << "Invalid amount.\n\n";
    return SIGNAL::CONTINUE;
  }

  auto deposited = session.deposit(*amount);

  if(!deposited.has_value()) {
    if(deposited.error() == UNEXPECTED_CODE::INVALID_AMOUNT) {
      out << "Invalid amount.\n\n";
      return SIGNAL::CONTINUE;
    }

    return failure(deposited.error());
  }

  out << "Income was added!\n\n";
  return SIGNAL::CONTINUE;
}

SIGNAL Menu::doTransfer(session::Session &session) {
  auto line = ask("\nTransfer\nEnter card number:\n");

  if(!line.has_value()) {
    return SIGNAL::EXIT;
  }

  const std::string destination{trim(*line)};

  auto recipient = session.checkRecipient(destination);

  if(!recipient.has_value()) {
    return failure(recipient.error());
  }

  if(*recipient != models::TRANSFER_OUTCOME::SUCCESS) {
    out << describe(*recipient) << "\n\n";
    return SIGNAL::CONTINUE;
  }

  line = ask("Enter how much money you want to transfer:\n");

  if(!line.has_value()) {
    return SIGNAL::EXIT;
  }

  auto amount = parseAmount(*line);

  if(!amount.has_value()) {
    out << describe(models::TRANSFER_OUTCOME::INVALID_AMOUNT) << "\n\n";
    return SIGNAL::CONTINUE;
  }

  auto outcome = session.transfer(destination, *amount);

  if(!outcome.has_value()) {
    return failure(outcome.error());
  }

  out << describe(*outcome) << "\n\n";
  return SIGNAL::CONTINUE;
}

SIGNAL Menu::closeAccount(session::Session &session) {
  auto closed = session.close();

  if(!closed.has_value() && closed.error() != UNEXPECTED_CODE::NOT_FOUND) {
    return failure(closed.error());
  }

  out << "\nThe account has been closed!\n\n";
  return SIGNAL::LOGGED_OUT;
}

SIGNAL Menu::logOut(session::Session &session) {
  session.logout();

  out << "\nYou have successfully logged out.\n\n";
  return SIGNAL::LOGGED_OUT;
}

SIGNAL Menu::failure(UNEXPECTED_CODE code) {
  std::cerr << "[LOG] " << ::describe(code) << std::endl;
  out << "\nError: " << ::describe(code) << "\n\n";

  if(code == UNEXPECTED_CODE::NOT_FOUND || code == UNEXPECTED_CODE::SESSION_CLOSED) {
    return SIGNAL::LOGGED_OUT;
  }

  return SIGNAL::CONTINUE;
}

std::optional<std::string> Menu::ask(const char *prompt) {
  out << prompt;
  out.flush();

  std::string line;

  if(!std::getline(in, line)) {
    return std::nullopt;
  }

  return line;
}
}
