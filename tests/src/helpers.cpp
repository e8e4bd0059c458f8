#include <catch2/catch.hpp>

#include <cstdlib>

#include "helpers/env.hpp"
#include "helpers/utilities.hpp"

TEST_CASE("Parses whole numbers only", "util::parse")
{
    auto ok = util::parse<int>("2031");
    REQUIRE(ok.ec == std::errc{});
    REQUIRE(ok.value == 2031);

    REQUIRE(util::parse<int>("20x1").ec == std::errc::invalid_argument);
    REQUIRE(util::parse<int>("").ec != std::errc{});
    REQUIRE(util::parse<uint16_t>("70000").ec == std::errc::result_out_of_range);
}

TEST_CASE("Parses boolean words", "util::parse")
{
    REQUIRE(util::parse<bool>("true").value);
    REQUIRE(util::parse<bool>("on").value);
    REQUIRE(util::parse<bool>("1").value);
    REQUIRE_FALSE(util::parse<bool>("off").value);
    REQUIRE(util::parse<bool>("maybe").ec == std::errc::invalid_argument);
}

TEST_CASE("Splits on every delimiter", "util::split_string")
{
    auto fields = util::split_string("a|b||c", '|');
    REQUIRE(fields.size() == 4);
    REQUIRE(fields[0] == "a");
    REQUIRE(fields[2].empty());
    REQUIRE(fields[3] == "c");

    REQUIRE(util::split_string("", '|').size() == 1);
    REQUIRE(util::split_string("bad|entry", '|').size() == 2);
}

TEST_CASE("Trims and detects blank strings", "util")
{
    REQUIRE(util::trim("  12 \t") == "12");
    REQUIRE(util::trim("   ").empty());
    REQUIRE(util::is_blank(""));
    REQUIRE(util::is_blank(" \t\r"));
    REQUIRE_FALSE(util::is_blank(" x "));
}

TEST_CASE("Reading a missing file throws", "util")
{
    REQUIRE_THROWS_AS(util::read_file("/nonexistent/cardlab/file.pem"), std::ios_base::failure);
}

TEST_CASE("Reads typed environment variables", "env")
{
    setenv("CARDLAB_TEST_PORT", "8443", 1);
    setenv("CARDLAB_TEST_FLAG", "yes", 1);
    setenv("CARDLAB_TEST_SEED", "18446744073709551615", 1);
    setenv("CARDLAB_TEST_BAD", "eighty", 1);
    setenv("CARDLAB_TEST_EMPTY", "", 1);

    REQUIRE(env::get_int("CARDLAB_TEST_PORT") == uint16_t{8443});
    REQUIRE(env::get_bool("CARDLAB_TEST_FLAG") == true);
    REQUIRE(env::get_ulong("CARDLAB_TEST_SEED") == uint64_t{18446744073709551615ULL});
    REQUIRE_FALSE(env::get_int("CARDLAB_TEST_BAD").has_value());
    REQUIRE_FALSE(env::get_string("CARDLAB_TEST_EMPTY").has_value());
    REQUIRE(env::get_string("CARDLAB_TEST_UNSET_VARIABLE", "fallback") == "fallback");
    REQUIRE(env::get_int("CARDLAB_TEST_BAD", 80) == 80);

    unsetenv("CARDLAB_TEST_PORT");
    unsetenv("CARDLAB_TEST_FLAG");
    unsetenv("CARDLAB_TEST_SEED");
    unsetenv("CARDLAB_TEST_BAD");
    unsetenv("CARDLAB_TEST_EMPTY");
}

TEST_CASE("Case folding and integer checks handle non-ASCII bytes", "util")
{
    REQUIRE(util::to_lower("TRUE") == "true");
    REQUIRE(util::to_lower("Yes\xC3\x89") == "yes\xC3\x89");
    REQUIRE_FALSE(util::is_integer("\xC3\xA9"));
    REQUIRE(util::is_integer("-12"));
    REQUIRE_FALSE(util::is_integer("12x"));

    setenv("CARDLAB_TEST_FLAG", "\xFFon", 1);
    REQUIRE(env::get_bool("CARDLAB_TEST_FLAG") == false);
    unsetenv("CARDLAB_TEST_FLAG");
}
