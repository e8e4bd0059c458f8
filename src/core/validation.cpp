#include "validation.hpp"

#include <cctype>
#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

#include "luhn.hpp"
#include "network.hpp"
#include "helpers/utilities.hpp"

namespace validation
{
    using card::FailureReason;

    std::string BatchSummary::to_string() const
    {
        return "Summary: " + std::to_string(valid_count) + "/" + std::to_string(total_count) + " valid cards";
    }

    std::vector<std::string> BatchReport::lines() const
    {
        auto lines = util::vector_map(records, [](const RecordOutcome& r) { return r.text; });
        lines.push_back(summary.to_string());
        return lines;
    }

    card::card_result<card::ExpirationDate> parse_expiration(const std::string_view& month, const std::string_view& year)
    {
        using result = card::card_result<card::ExpirationDate>;

        auto parsed_month = util::parse<int>(util::trim(month));
        auto parsed_year = util::parse<int>(util::trim(year));
        if (parsed_month.ec != std::errc{} || parsed_year.ec != std::errc{})
            return result::failure(card::CardError::InvalidDateLiteral,
                    "invalid expiration '" + std::string{month} + "/" + std::string{year} + "'");

        result res;
        res.value.month = parsed_month.value;
        res.value.year = parsed_year.value;
        return res;
    }

    bool validate_expiration(const std::string_view& month, const std::string_view& year, std::time_t now)
    {
        auto date = parse_expiration(month, year);
        if (!date)
            return false;

        return date.value.is_after(now);
    }

    bool validate_cvv(const std::string_view& cvv)
    {
        if (cvv.size() != 3 && cvv.size() != 4)
            return false;

        return std::all_of(cvv.begin(), cvv.end(), [](unsigned char c) { return c >= '0' && c <= '9'; });
    }

    card::ValidationVerdict validate_record(const std::string_view& entry, std::time_t now)
    {
        card::ValidationVerdict verdict;

        auto fields = util::split_string(entry, card::record_delimiter);
        if (fields.size() < 4)
        {
            verdict.reasons.push_back(FailureReason::MalformedRecord);
            return verdict;
        }

        auto number = luhn::digits_only(fields[0]);
        verdict.network = network::classify(number);
        verdict.formatted = network::format(number, verdict.network);

        // No digits at all sums to a "valid" zero, which is never a card.
        if (number.empty() || !luhn::is_valid(number))
            verdict.reasons.push_back(FailureReason::LuhnFailed);
        if (!validate_expiration(fields[1], fields[2], now))
            verdict.reasons.push_back(FailureReason::ExpiredOrInvalidDate);
        if (!validate_cvv(fields[3]))
            verdict.reasons.push_back(FailureReason::InvalidCvv);

        verdict.valid = verdict.reasons.empty();
        return verdict;
    }

    static std::string describe(const card::ValidationVerdict& verdict)
    {
        std::string text = verdict.formatted + " (" + std::string{network::to_string(verdict.network)} + ") -> ";
        if (verdict.valid)
            return text + "VALID";

        text += "INVALID [";
        for (std::size_t i = 0; i < verdict.reasons.size(); ++i)
        {
            if (i != 0)
                text += ", ";
            text += card::failure_reason_to_string(verdict.reasons[i]);
        }
        text += "]";
        return text;
    }

    BatchReport validate(const std::vector<std::string>& entries, const RecordCheck& check)
    {
        BatchReport report;

        for (const auto& entry : entries)
        {
            if (util::is_blank(entry))
                continue;

            report.summary.total_count++;

            RecordOutcome outcome;
            outcome.entry = entry;
            try
            {
                outcome.verdict = check(entry);

                const auto& reasons = outcome.verdict.reasons;
                if (std::find(reasons.begin(), reasons.end(), FailureReason::MalformedRecord) != reasons.end())
                {
                    spdlog::debug("Malformed card record: {}", entry);
                    outcome.text = "[Invalid Format] " + entry;
                }
                else
                {
                    outcome.text = describe(outcome.verdict);
                }
            }
            catch (std::exception& e)
            {
                spdlog::warn("Error processing card record '{}': {}", entry, e.what());
                outcome.verdict = card::ValidationVerdict{};
                outcome.errored = true;
                outcome.text = "[Error processing] " + entry + ": " + e.what();
            }

            if (outcome.verdict.valid)
                report.summary.valid_count++;

            report.records.push_back(std::move(outcome));
        }

        return report;
    }

    BatchReport validate(const std::vector<std::string>& entries, std::time_t now)
    {
        return validate(entries, [now](const std::string_view& entry) { return validate_record(entry, now); });
    }

    BatchReport validate(const std::vector<std::string>& entries)
    {
        return validate(entries, std::time(nullptr));
    }
}
