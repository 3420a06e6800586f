#pragma once

#include <cstdint>
#include <expected>
#include <random>
#include <string>

#include "database.hpp"
#include "models.hpp"
#include "unexpected_codes.hpp"

namespace generator {

constexpr const char *DEFAULT_ISSUER_PREFIX = "400000";
constexpr std::size_t CARD_LENGTH = 16;
constexpr std::size_t PIN_LENGTH = 4;

class Generator {
public:
  explicit Generator(std::string issuerPrefix = DEFAULT_ISSUER_PREFIX);
  Generator(std::string issuerPrefix, std::uint32_t seed);

  // Draws card numbers until one passes the checksum and is not already in
  // the store. There is no retry cap; about one draw in ten is valid.
  std::expected<models::Credentials, UNEXPECTED_CODE>
  generate(const database::Store &store);

private:
  std::string digits(std::size_t count);

  std::string
    issuerPrefix;
  std::mt19937
    engine;
  std::uniform_int_distribution<int>
    digit{0, 9};
};

bool isIssuerPrefix(const std::string &prefix);
}
