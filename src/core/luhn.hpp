#pragma once

#include <string>
#include <string_view>

namespace luhn
{
    /**
     * Copies only the decimal digits of `text`, so "4111 1111-1111" becomes
     * "411111111111".
     */
    std::string digits_only(const std::string_view& text);

    /**
     * Sums the digits of `number` from the right. When `double_odd` is set the
     * digits at odd positions (0-based, counted from the units digit) are
     * doubled, otherwise the even positions are. A doubled value above 9 has 9
     * subtracted. Non-digit characters are skipped entirely.
     */
    unsigned int digit_sum(const std::string_view& number, bool double_odd);

    /**
     * Mod 10 check over the digits of `number`. A string with no digits sums
     * to 0 and therefore passes; callers validating user input must reject
     * empty numbers themselves.
     */
    bool is_valid(const std::string_view& number);

    /**
     * The digit that, appended to `partial`, makes the whole sequence pass
     * `is_valid`.
     */
    char compute_check_digit(const std::string_view& partial);
}
