#include "luhn.hpp"

#include <array>
#include <cstdint>
#include <cctype>

namespace
{
    // 2 * d, minus 9 when the product has two digits
    constexpr std::array<uint8_t, 10> doubled = {0, 2, 4, 6, 8, 1, 3, 5, 7, 9};
}

std::string luhn::digits_only(const std::string_view& text)
{
    std::string digits;
    digits.reserve(text.size());
    for (auto c : text)
    {
        if (std::isdigit(static_cast<unsigned char>(c)))
            digits += c;
    }
    return digits;
}

unsigned int luhn::digit_sum(const std::string_view& number, bool double_odd)
{
    unsigned int sum = 0;
    bool should_double = !double_odd;
    for (std::size_t i = number.size(); i > 0; --i)
    {
        const auto c = number[i - 1];
        if (!std::isdigit(static_cast<unsigned char>(c)))
            continue;

        const auto d = static_cast<unsigned int>(c - '0');
        sum += should_double ? doubled[d] : d;
        should_double = !should_double;
    }
    return sum;
}

bool luhn::is_valid(const std::string_view& number)
{
    return digit_sum(number, true) % 10 == 0;
}

char luhn::compute_check_digit(const std::string_view& partial)
{
    // The check digit will take the units position, so every digit of the
    // partial number moves one place left and the doubling starts at index 0.
    auto sum = digit_sum(partial, false);
    return static_cast<char>('0' + (10 - sum % 10) % 10);
}
