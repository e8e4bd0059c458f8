#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "commands.hpp"

namespace
{
    class fixed_lookup : public bin_lookup::BinLookup
    {
    public:
        std::string requested;
        bin_lookup::LookupResult result;

        explicit fixed_lookup(bin_lookup::LookupResult r) : result(std::move(r)) {}

        bin_lookup::LookupResult fetch(const std::string_view& number) override
        {
            requested = std::string{number};
            return result;
        }
    };

    Options with_arguments(std::string command, std::vector<std::string> arguments)
    {
        Options opts;
        opts.seed = 1;
        opts.command = std::move(command);
        opts.arguments = std::move(arguments);
        return opts;
    }
}

TEST_CASE("generate prints the header and the cards", "commands")
{
    auto opts = with_arguments("generate", { "4111 11" });
    opts.count = 3;

    std::ostringstream out, err;
    REQUIRE(commands::generate(opts, out, err) == 0);
    REQUIRE(err.str().empty());

    std::istringstream lines(out.str());
    std::string line;
    std::getline(lines, line);
    REQUIRE(line == "Generated 3 cards with BIN: 411111");
    int cards = 0;
    while (std::getline(lines, line))
    {
        REQUIRE(line.rfind("4111 11", 0) == 0);
        ++cards;
    }
    REQUIRE(cards == 3);
}

TEST_CASE("generate with --check prints a validation report", "commands")
{
    auto opts = with_arguments("generate", { "601100" });
    opts.count = 2;
    opts.check = true;

    std::ostringstream out, err;
    REQUIRE(commands::generate(opts, out, err) == 0);
    REQUIRE(out.str().rfind("=== VALIDATION RESULTS ===\n", 0) == 0);
    REQUIRE(out.str().find("Summary: 2/2 valid cards\n") != std::string::npos);
}

TEST_CASE("generate rejects short BINs", "commands")
{
    auto opts = with_arguments("generate", { "4111" });

    std::ostringstream out, err;
    REQUIRE(commands::generate(opts, out, err) == 1);
    REQUIRE(err.str() == "Please enter a valid BIN (at least 6 digits)\n");
    REQUIRE(out.str().empty());
}

TEST_CASE("validate reads entries from the stream", "commands")
{
    auto opts = with_arguments("validate", {});
    std::istringstream in("4111 1111 1111 1111|01|2099|123\r\n\nbad|entry\n");

    std::ostringstream out, err;
    REQUIRE(commands::validate(opts, in, out, err) == 0);
    REQUIRE(out.str() ==
        "4111 1111 1111 1111 (Visa) -> VALID\n"
        "[Invalid Format] bad|entry\n"
        "\n"
        "Summary: 1/2 valid cards\n");
}

TEST_CASE("validate reports a missing file", "commands")
{
    auto opts = with_arguments("validate", { "/nonexistent/cards.txt" });
    std::istringstream in;

    std::ostringstream out, err;
    REQUIRE(commands::validate(opts, in, out, err) == 1);
    REQUIRE(err.str() == "Unable to open /nonexistent/cards.txt\n");
}

TEST_CASE("classify describes each number", "commands")
{
    auto opts = with_arguments("classify", { "371449635398431", "4111111111111112" });

    std::ostringstream out, err;
    REQUIRE(commands::classify(opts, out, err) == 0);
    REQUIRE(out.str() ==
        "3714 496353 98431 -> American Express (15 digits, Luhn ok)\n"
        "4111 1111 1111 1112 -> Visa (16 digits, Luhn failed)\n");
}

TEST_CASE("bin prints the prefix without a lookup", "commands")
{
    auto opts = with_arguments("bin", { "5555 5555 5555 4444" });
    opts.bin_length = 8;
    fixed_lookup lookup{{ bin_lookup::LookupStatus::Found, "unused" }};

    std::ostringstream out, err;
    REQUIRE(commands::bin(opts, lookup, out, err) == 0);
    REQUIRE(out.str() == "BIN (8): 55555555 -> Mastercard\n");
    REQUIRE(lookup.requested.empty());
}

TEST_CASE("bin prints the lookup summary", "commands")
{
    auto opts = with_arguments("bin", { "4111 1111 1111 1111" });
    opts.lookup = true;
    fixed_lookup lookup{{ bin_lookup::LookupStatus::Found, "BIN Info: Test Bank (Nowhere) - credit visa" }};

    std::ostringstream out, err;
    REQUIRE(commands::bin(opts, lookup, out, err) == 0);
    REQUIRE(lookup.requested == "4111111111111111");
    REQUIRE(out.str() ==
        "BIN (6): 411111 -> Visa\n"
        "Fetching BIN information...\n"
        "BIN Info: Test Bank (Nowhere) - credit visa\n");
}

TEST_CASE("bin fails when the lookup fails", "commands")
{
    auto opts = with_arguments("bin", { "4111111111111111" });
    opts.lookup = true;
    fixed_lookup lookup{{ bin_lookup::LookupStatus::Error, std::string{bin_lookup::error_fetching} }};

    std::ostringstream out, err;
    REQUIRE(commands::bin(opts, lookup, out, err) == 1);
    REQUIRE(out.str().find("BIN Info: Error fetching data") != std::string::npos);
}

TEST_CASE("bin rejects numbers shorter than the BIN", "commands")
{
    auto opts = with_arguments("bin", { "41111" });
    fixed_lookup lookup{{ bin_lookup::LookupStatus::Found, "" }};

    std::ostringstream out, err;
    REQUIRE(commands::bin(opts, lookup, out, err) == 1);
    REQUIRE(err.str() == "Please enter a valid CC number\n");
}

TEST_CASE("bin still looks up when the BIN cannot be extracted", "commands")
{
    auto opts = with_arguments("bin", { "4111111" });
    opts.bin_length = 8;
    opts.lookup = true;
    fixed_lookup lookup{{ bin_lookup::LookupStatus::Found, "BIN Info: Test Bank (Nowhere) - credit visa" }};

    std::ostringstream out, err;
    REQUIRE(commands::bin(opts, lookup, out, err) == 1);
    REQUIRE(err.str() == "Please enter a valid CC number\n");
    REQUIRE(lookup.requested == "4111111");
    REQUIRE(out.str() ==
        "Fetching BIN information...\n"
        "BIN Info: Test Bank (Nowhere) - credit visa\n");
}

TEST_CASE("bin does not look up fewer than six digits", "commands")
{
    auto opts = with_arguments("bin", { "41111" });
    opts.lookup = true;
    fixed_lookup lookup{{ bin_lookup::LookupStatus::Found, "unused" }};

    std::ostringstream out, err;
    REQUIRE(commands::bin(opts, lookup, out, err) == 1);
    REQUIRE(lookup.requested.empty());
    REQUIRE(out.str().empty());
    REQUIRE(err.str() == "Please enter a valid CC number\nPlease enter a valid CC number\n");
}
