#include <catch2/catch.hpp>

#include <ctime>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/validation.hpp"

using card::FailureReason;
using card::NetworkKind;

// Local midnight on the given day.
static std::time_t local_time(int year, int month, int day)
{
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_isdst = -1;
    return std::mktime(&tm);
}

TEST_CASE("Mixed batch reports each record and the summary", "validation")
{
    std::vector<std::string> entries {
        "4111 1111 1111 1111|01|2099|123",
        "bad|entry",
        "4111111111111112|01|2099|123"
    };

    auto report = validation::validate(entries, local_time(2024, 6, 15));
    REQUIRE(report.records.size() == 3);

    REQUIRE(report.records[0].verdict.valid);
    REQUIRE(report.records[0].verdict.network == NetworkKind::Visa);
    REQUIRE(report.records[0].text == "4111 1111 1111 1111 (Visa) -> VALID");

    REQUIRE_FALSE(report.records[1].verdict.valid);
    REQUIRE(report.records[1].text == "[Invalid Format] bad|entry");

    REQUIRE_FALSE(report.records[2].verdict.valid);
    REQUIRE(report.records[2].verdict.reasons == std::vector<FailureReason>{ FailureReason::LuhnFailed });
    REQUIRE(report.records[2].text == "4111 1111 1111 1112 (Visa) -> INVALID [Luhn check failed]");

    // Malformed entries count toward the total.
    REQUIRE(report.summary.valid_count == 1);
    REQUIRE(report.summary.total_count == 3);
    REQUIRE(report.summary.to_string() == "Summary: 1/3 valid cards");
    REQUIRE(report.lines().back() == "Summary: 1/3 valid cards");
}

TEST_CASE("Empty batch still has a summary", "validation")
{
    auto report = validation::validate({}, local_time(2024, 6, 15));
    REQUIRE(report.records.empty());
    REQUIRE(report.summary.to_string() == "Summary: 0/0 valid cards");
    REQUIRE(report.lines() == std::vector<std::string>{ "Summary: 0/0 valid cards" });
}

TEST_CASE("Blank entries are skipped and not counted", "validation")
{
    std::vector<std::string> entries { "", "   ", "4111111111111111|12|2099|999", "\t" };

    auto report = validation::validate(entries, local_time(2024, 6, 15));
    REQUIRE(report.records.size() == 1);
    REQUIRE(report.summary.total_count == 1);
    REQUIRE(report.summary.valid_count == 1);
}

TEST_CASE("Every failing check is listed in order", "validation")
{
    auto verdict = validation::validate_record("4111111111111112|13|2099|12a", local_time(2024, 6, 15));
    REQUIRE_FALSE(verdict.valid);
    REQUIRE(verdict.reasons == std::vector<FailureReason>{
        FailureReason::LuhnFailed, FailureReason::ExpiredOrInvalidDate, FailureReason::InvalidCvv });

    auto report = validation::validate({ "4111111111111112|13|2099|12a" }, local_time(2024, 6, 15));
    REQUIRE(report.records[0].text ==
        "4111 1111 1111 1112 (Visa) -> INVALID [Luhn check failed, Expired or invalid date, Invalid CVV]");
}

TEST_CASE("Fields past the fourth are ignored", "validation")
{
    auto verdict = validation::validate_record("371449635398431|07|2099|1234|extra|fields", local_time(2024, 6, 15));
    REQUIRE(verdict.valid);
    REQUIRE(verdict.network == NetworkKind::AmericanExpress);
    REQUIRE(verdict.formatted == "3714 496353 98431");
}

TEST_CASE("A number with no digits fails the Luhn check", "validation")
{
    auto verdict = validation::validate_record("abcd|01|2099|123", local_time(2024, 6, 15));
    REQUIRE_FALSE(verdict.valid);
    REQUIRE(verdict.reasons == std::vector<FailureReason>{ FailureReason::LuhnFailed });
}

TEST_CASE("Expiration is checked against the first of the month", "validation::expiration")
{
    auto now = local_time(2024, 6, 15);

    REQUIRE(validation::validate_expiration("07", "2024", now));
    REQUIRE(validation::validate_expiration("1", "2030", now));
    REQUIRE_FALSE(validation::validate_expiration("06", "2024", now));
    REQUIRE_FALSE(validation::validate_expiration("05", "2024", now));
    REQUIRE_FALSE(validation::validate_expiration("12", "2023", now));
}

TEST_CASE("Unparsable or out of range dates are never valid", "validation::expiration")
{
    auto now = local_time(2024, 6, 15);

    REQUIRE_FALSE(validation::validate_expiration("ab", "2099", now));
    REQUIRE_FALSE(validation::validate_expiration("01", "20x9", now));
    REQUIRE_FALSE(validation::validate_expiration("", "2099", now));
    REQUIRE_FALSE(validation::validate_expiration("0", "2099", now));
    REQUIRE_FALSE(validation::validate_expiration("13", "2099", now));

    auto parsed = validation::parse_expiration("ab", "2099");
    REQUIRE_FALSE(parsed);
    REQUIRE(parsed.ec == card::CardError::InvalidDateLiteral);

    auto ok = validation::parse_expiration(" 03 ", "2031");
    REQUIRE(ok);
    REQUIRE(ok.value.month == 3);
    REQUIRE(ok.value.year == 2031);
}

TEST_CASE("CVV must be three or four digits", "validation::cvv")
{
    REQUIRE(validation::validate_cvv("123"));
    REQUIRE(validation::validate_cvv("0000"));
    REQUIRE_FALSE(validation::validate_cvv("12"));
    REQUIRE_FALSE(validation::validate_cvv("12345"));
    REQUIRE_FALSE(validation::validate_cvv("12a"));
    REQUIRE_FALSE(validation::validate_cvv(" 123"));
    REQUIRE_FALSE(validation::validate_cvv(""));
}

TEST_CASE("A record whose check throws is reported and the batch goes on", "validation")
{
    auto now = local_time(2024, 6, 15);
    auto check = [now](const std::string_view& entry) -> card::ValidationVerdict
    {
        if (entry.find("2O99") != std::string_view::npos)
            throw std::runtime_error("year literal out of range");
        return validation::validate_record(entry, now);
    };

    std::vector<std::string> entries {
        "4111111111111111|01|2O99|123",
        "4111111111111111|01|2099|123"
    };

    auto report = validation::validate(entries, check);
    REQUIRE(report.records.size() == 2);

    REQUIRE(report.records[0].errored);
    REQUIRE_FALSE(report.records[0].verdict.valid);
    REQUIRE(report.records[0].text == "[Error processing] 4111111111111111|01|2O99|123: year literal out of range");

    REQUIRE_FALSE(report.records[1].errored);
    REQUIRE(report.records[1].verdict.valid);

    REQUIRE(report.summary.to_string() == "Summary: 1/2 valid cards");
}
