#include "generator.hpp"
#include "checksum.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace generator {

bool isIssuerPrefix(const std::string &prefix) {
  return prefix.size() == 6
      && std::all_of(prefix.begin(), prefix.end(), [](char c) { return c >= '0' && c <= '9'; });
}

Generator::Generator(std::string issuerPrefix)
  : Generator(std::move(issuerPrefix), std::random_device{}()) {
}

Generator::Generator(std::string issuerPrefix, std::uint32_t seed)
  : issuerPrefix(std::move(issuerPrefix)), engine(seed) {
  if(!isIssuerPrefix(this->issuerPrefix)) {
    throw std::invalid_argument("issuer prefix must be 6 digits: " + this->issuerPrefix);
  }
}

std::string Generator::digits(std::size_t count) {
  std::string result;
  result.reserve(count);

  for(std::size_t i = 0; i < count; ++i) {
    result.push_back(static_cast<char>('0' + digit(engine)));
  }

  return result;
}

std::expected<models::Credentials, UNEXPECTED_CODE>
Generator::generate(const database::Store &store) {
  auto connection = database::getConnection(store);

  while(true) {
    // 9 account digits and a candidate check digit
    auto number = issuerPrefix + digits(CARD_LENGTH - issuerPrefix.size());

    if(!checksum::isValid(number)) {
      continue;
    }

    auto taken = database::cardExists(connection.get(), number);

    if(!taken.has_value()) {
      return std::unexpected(taken.error());
    }

    if(*taken) {
      continue;
    }

    return models::Credentials{number, digits(PIN_LENGTH)};
  }
}
}
