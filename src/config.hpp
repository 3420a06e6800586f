#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "database.hpp"
#include "generator.hpp"
#include "unexpected_codes.hpp"

namespace config {

constexpr const char *DEFAULT_PATH = "bank.json";

struct Config {
  database::Store
    store;
  std::string
    issuerPrefix = generator::DEFAULT_ISSUER_PREFIX;
};

// Keys: "database" (string), "issuer_prefix" (6 digits), "busy_timeout_ms"
// (non-negative integer). Absent keys keep their defaults.
std::expected<Config, UNEXPECTED_CODE> parse(std::string_view text);

// A missing file yields the defaults.
std::expected<Config, UNEXPECTED_CODE> load(const std::string &path);
}
