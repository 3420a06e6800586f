#include "config.hpp"
#include "nlohmann/json.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

namespace config {

namespace {

std::unexpected<UNEXPECTED_CODE> invalid(const char *reason) {
  std::cerr << "[LOG] config: " << reason << std::endl;
  return std::unexpected(UNEXPECTED_CODE::INVALID_CONFIG);
}

}

std::expected<Config, UNEXPECTED_CODE> parse(std::string_view text) {
  nlohmann::json data = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);

  if (data.is_discarded() || !data.is_object()) {
    return invalid("not a JSON object");
  }

  Config config;

  if(data.contains("database")) {
    if(!data["database"].is_string() || data["database"].get<std::string>().empty()) {
      return invalid("\"database\" must be a non-empty string");
    }

    config.store.path = data["database"].get<std::string>();
  }

  if(data.contains("issuer_prefix")) {
    if(!data["issuer_prefix"].is_string()
        || !generator::isIssuerPrefix(data["issuer_prefix"].get<std::string>())) {
      return invalid("\"issuer_prefix\" must be a string of 6 digits");
    }

    config.issuerPrefix = data["issuer_prefix"].get<std::string>();
  }

  if(data.contains("busy_timeout_ms")) {
    if(!data["busy_timeout_ms"].is_number_integer()
        || data["busy_timeout_ms"].get<long long>() < 0
        || data["busy_timeout_ms"].get<long long>() > std::numeric_limits<int>::max()) {
      return invalid("\"busy_timeout_ms\" must be an integer between 0 and INT_MAX");
    }

    config.store.busyTimeoutMs = data["busy_timeout_ms"].get<int>();
  }

  return config;
}

std::expected<Config, UNEXPECTED_CODE> load(const std::string &path) {
  if(!std::filesystem::exists(path)) {
    return Config{};
  }

  std::fstream s{path, s.in};

  if(!s.is_open()) {
    return invalid("file can't be read");
  }

  std::stringstream text;

  text << s.rdbuf();

  return parse(text.str());
}
}
