#pragma once

#include <ctime>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "card.hpp"

namespace validation
{
    struct BatchSummary
    {
        std::size_t valid_count = 0;
        std::size_t total_count = 0;

        [[nodiscard]] std::string to_string() const;
    };

    struct RecordOutcome
    {
        std::string entry;
        std::string text;
        card::ValidationVerdict verdict;
        bool errored = false;
    };

    struct BatchReport
    {
        std::vector<RecordOutcome> records;
        BatchSummary summary;

        /**
         * One display line per counted record, in input order, followed by
         * the summary line.
         */
        [[nodiscard]] std::vector<std::string> lines() const;
    };

    /**
     * Parses a month and a year literal. Both must be whole integers.
     *
     * @return CardError::InvalidDateLiteral when either field is not an integer
     */
    card::card_result<card::ExpirationDate> parse_expiration(const std::string_view& month, const std::string_view& year);

    // False for unparsable literals, out of range months and past dates alike.
    bool validate_expiration(const std::string_view& month, const std::string_view& year, std::time_t now);

    // Three or four ASCII digits and nothing else.
    bool validate_cvv(const std::string_view& cvv);

    /**
     * Validates a single `NUMBER|MM|YYYY|CVV` entry. Fields past the fourth
     * are ignored. An entry with fewer than four fields comes back invalid
     * with only FailureReason::MalformedRecord set.
     */
    card::ValidationVerdict validate_record(const std::string_view& entry, std::time_t now);

    /**
     * Validates every non-blank entry. Blank entries are skipped and do not
     * count; malformed ones count toward the total but never as valid. A
     * record that throws while being checked is reported on its own line and
     * the batch carries on.
     */
    BatchReport validate(const std::vector<std::string>& entries, std::time_t now);
    BatchReport validate(const std::vector<std::string>& entries);

    using RecordCheck = std::function<card::ValidationVerdict(const std::string_view&)>;

    /**
     * Same batch rules with a caller supplied per-record check.
     * `validate_record` itself reports bad input through the verdict, so the
     * `[Error processing]` line is only produced when `check` throws.
     */
    BatchReport validate(const std::vector<std::string>& entries, const RecordCheck& check);
}
