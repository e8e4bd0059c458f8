#include <catch2/catch.hpp>

#include <algorithm>
#include <ctime>
#include <set>
#include <string>

#include "core/generation.hpp"
#include "core/luhn.hpp"
#include "core/network.hpp"
#include "core/results.hpp"
#include "core/validation.hpp"

using card::CardError;
using card::NetworkKind;

TEST_CASE("Synthesized numbers keep the prefix and pass Luhn", "generation")
{
    generation::CardGenerator gen{7};

    for (const auto* prefix : { "411111", "371449", "601100", "555555", "305693", "353011", "9999" })
    {
        auto kind = network::classify(prefix);
        for (int i = 0; i < 50; ++i)
        {
            auto number = gen.synthesize(prefix);
            REQUIRE(number);
            REQUIRE(number.value.size() == network::expected_length(kind));
            REQUIRE(number.value.rfind(prefix, 0) == 0);
            REQUIRE(network::classify(number.value) == kind);
            REQUIRE(luhn::is_valid(number.value));
        }
    }
}

TEST_CASE("Synthesis ignores spaces in the prefix", "generation")
{
    generation::CardGenerator gen{7};
    auto number = gen.synthesize("4111 11");
    REQUIRE(number);
    REQUIRE(number.value.rfind("411111", 0) == 0);
    REQUIRE(number.value.size() == 16);
}

TEST_CASE("A prefix one short of the length only gets the check digit", "generation")
{
    generation::CardGenerator gen{7};
    auto number = gen.synthesize("411111111111111");
    REQUIRE(number);
    REQUIRE(number.value == "4111111111111111");
}

TEST_CASE("Bad prefixes are rejected", "generation")
{
    generation::CardGenerator gen{7};

    auto empty = gen.synthesize("");
    REQUIRE_FALSE(empty);
    REQUIRE(empty.ec == CardError::InvalidPrefix);

    REQUIRE(gen.synthesize("   ").ec == CardError::InvalidPrefix);
    REQUIRE(gen.synthesize("41a111").ec == CardError::InvalidPrefix);
    REQUIRE(gen.synthesize("4111111111111111").ec == CardError::InvalidPrefix);
    REQUIRE(gen.synthesize("37144963539843").ec == CardError::None);
    REQUIRE(gen.synthesize("371449635398431").ec == CardError::InvalidPrefix);
}

TEST_CASE("The same seed gives the same cards", "generation")
{
    generation::CardGenerator first{2024};
    generation::CardGenerator second{2024};

    for (int i = 0; i < 10; ++i)
    {
        auto a = first.synthesize_record("411111");
        auto b = second.synthesize_record("411111");
        REQUIRE(a);
        REQUIRE(b);
        REQUIRE(a.value.serialize() == b.value.serialize());
    }
}

TEST_CASE("Synthesized expiration dates are always in the future", "generation")
{
    generation::CardGenerator gen;
    auto now = std::time(nullptr);
    auto year = generation::current_year();

    for (int i = 0; i < 1000; ++i)
    {
        auto date = gen.synthesize_expiration();
        REQUIRE(date.month >= 1);
        REQUIRE(date.month <= 12);
        REQUIRE(date.year >= year + 1);
        REQUIRE(date.year <= year + 6);
        REQUIRE(date.is_after(now));
    }
}

TEST_CASE("Synthesized CVVs are exactly three digits", "generation")
{
    generation::CardGenerator gen{99};
    std::set<std::string> seen;

    for (int i = 0; i < 500; ++i)
    {
        auto cvv = gen.synthesize_cvv();
        REQUIRE(cvv.size() == 3);
        REQUIRE(validation::validate_cvv(cvv));
        seen.insert(cvv);
    }

    REQUIRE(seen.size() > 1);
}

TEST_CASE("Synthesized records serialize in the batch format and validate", "generation")
{
    generation::CardGenerator gen{5};
    auto record = gen.synthesize_record("371449");
    REQUIRE(record);

    auto line = record.value.serialize();
    REQUIRE(line.rfind("3714 49", 0) == 0);
    REQUIRE(std::count(line.begin(), line.end(), '|') == 3);

    auto verdict = validation::validate_record(line, std::time(nullptr));
    REQUIRE(verdict.valid);
    REQUIRE(verdict.network == NetworkKind::AmericanExpress);
}

TEST_CASE("generate_cards writes a header and one line per card", "generation")
{
    generation::CardGenerator gen{11};
    results::ResultsCollection results;

    auto made = generation::generate_cards(gen, "411111", 5, results);
    REQUIRE(made == 5);
    REQUIRE(results.lines().size() == 6);
    REQUIRE(results.lines().front() == "Generated 5 cards with BIN: 411111");
    REQUIRE(results.entries().size() == 5);
}

TEST_CASE("generate_cards marks every failed slot", "generation")
{
    generation::CardGenerator gen{11};
    results::ResultsCollection results;

    auto made = generation::generate_cards(gen, "41x111", 3, results);
    REQUIRE(made == 0);
    REQUIRE(results.lines().size() == 4);
    REQUIRE(results.lines()[1] == "Invalid BIN");
    REQUIRE(results.lines()[3] == "Invalid BIN");
    REQUIRE_FALSE(results.has_entries());
}
