#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <cstdlib>

using namespace ssmpatch;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing whitespace", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
    REQUIRE(trim("\t hello \n") == "hello");
    REQUIRE(trim("hello") == "hello");
}

TEST_CASE("trim: empty and all-whitespace inputs", "[util]") {
    REQUIRE(trim("").empty());
    REQUIRE(trim("   \t\n  ").empty());
}

// ── split ────────────────────────────────────────────────────────

TEST_CASE("split: basic split by delimiter", "[util]") {
    auto parts = split("us-east-1", '-');
    REQUIRE(parts == std::vector<std::string>{"us", "east", "1"});
}

TEST_CASE("split: keeps interior empty fields", "[util]") {
    auto parts = split("a,,b", ',');
    REQUIRE(parts.size() == 3);
    REQUIRE(parts[1].empty());
    REQUIRE(split("", ',').empty());
}

// ── case conversion ──────────────────────────────────────────────

TEST_CASE("to_lower / to_upper: ASCII only", "[util]") {
    REQUIRE(to_lower("TUE") == "tue");
    REQUIRE(to_upper("Wed") == "WED");
    REQUIRE(to_lower("already-lower-1") == "already-lower-1");
}

// ── environment ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_home("~/.aws/config") == std::string(home) + "/.aws/config");
    }
    REQUIRE(expand_home("/etc/hosts") == "/etc/hosts");
    REQUIRE(expand_home("").empty());
}

TEST_CASE("env_value: empty counts as unset", "[util]") {
    setenv("SSMPATCH_TEST_VAR", "", 1);
    REQUIRE_FALSE(env_value("SSMPATCH_TEST_VAR").has_value());
    setenv("SSMPATCH_TEST_VAR", "x", 1);
    REQUIRE(env_value("SSMPATCH_TEST_VAR").value() == "x");
    unsetenv("SSMPATCH_TEST_VAR");
    REQUIRE_FALSE(env_value("SSMPATCH_TEST_VAR").has_value());
}

// ── encoding ─────────────────────────────────────────────────────

TEST_CASE("hex_encode: lowercase pairs", "[util]") {
    const unsigned char bytes[] = {0x00, 0x0f, 0xa5, 0xff};
    REQUIRE(hex_encode(bytes, sizeof(bytes)) == "000fa5ff");
    REQUIRE(hex_encode(bytes, 0).empty());
}

TEST_CASE("format_utc: formats in UTC", "[util]") {
    REQUIRE(format_utc(1440938160, "%Y%m%dT%H%M%SZ") == "20150830T123600Z");
    REQUIRE(format_utc(0, "%Y-%m-%d") == "1970-01-01");
}
