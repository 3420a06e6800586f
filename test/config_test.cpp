#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <limits>

#include "config.hpp"

TEST_CASE("parse fills in every key", "[config]") {
  auto loaded = config::parse(R"({
    "database": "/tmp/bank.s3db",
    "issuer_prefix": "512345",
    "busy_timeout_ms": 250
  })");

  REQUIRE(loaded.has_value());
  REQUIRE(loaded->store.path == "/tmp/bank.s3db");
  REQUIRE(loaded->issuerPrefix == "512345");
  REQUIRE(loaded->store.busyTimeoutMs == 250);
}

TEST_CASE("parse keeps defaults for absent keys", "[config]") {
  auto loaded = config::parse("{}");

  REQUIRE(loaded.has_value());
  REQUIRE(loaded->store.path == "card.s3db");
  REQUIRE(loaded->issuerPrefix == generator::DEFAULT_ISSUER_PREFIX);
  REQUIRE(loaded->store.busyTimeoutMs == 1000);
}

TEST_CASE("parse rejects malformed documents and wrong types", "[config]") {
  for(const char *text: {
        "not json",
        "[1, 2]",
        R"({"database": 12})",
        R"({"database": ""})",
        R"({"issuer_prefix": "4000"})",
        R"({"issuer_prefix": 400000})",
        R"({"busy_timeout_ms": -1})",
        R"({"busy_timeout_ms": "fast"})",
        R"({"busy_timeout_ms": 2147483648})",
        R"({"busy_timeout_ms": 18446744073709551615})"}) {
    INFO(text);

    auto loaded = config::parse(text);

    REQUIRE_FALSE(loaded.has_value());
    REQUIRE(loaded.error() == UNEXPECTED_CODE::INVALID_CONFIG);
  }
}

TEST_CASE("load falls back to defaults when the file is missing", "[config]") {
  auto loaded = config::load("/nonexistent-directory/bank.json");

  REQUIRE(loaded.has_value());
  REQUIRE(loaded->store.path == "card.s3db");
}

TEST_CASE("load reads the file", "[config]") {
  auto path = std::filesystem::temp_directory_path() / "simple_banking_config_test.json";

  {
    std::ofstream file{path};
    file << R"({"database": "elsewhere.s3db"})";
  }

  auto loaded = config::load(path.string());
  std::filesystem::remove(path);

  REQUIRE(loaded.has_value());
  REQUIRE(loaded->store.path == "elsewhere.s3db");
}

TEST_CASE("parse accepts a busy timeout up to INT_MAX", "[config]") {
  auto loaded = config::parse(R"({"busy_timeout_ms": 2147483647})");

  REQUIRE(loaded.has_value());
  REQUIRE(loaded->store.busyTimeoutMs == std::numeric_limits<int>::max());
}
