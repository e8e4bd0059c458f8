#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * Value types shared by the card engine. A card number is always held as a
 * plain digit string; spaces only ever appear in the display form.
 */
namespace card
{
    enum class NetworkKind : uint8_t
    {
        Visa,
        Mastercard,
        AmericanExpress,
        DinersClub,
        Discover,
        JCB,
        Unknown
    };

    enum class CardError : uint8_t
    {
        None = 0,
        InvalidPrefix,
        MalformedRecord,
        InvalidDateLiteral
    };

    std::string_view card_error_to_string(CardError error);

    /**
     * Outcome of an operation that can fail without aborting the caller's
     * loop. `value` is only meaningful when `ec == CardError::None`.
     */
    template<typename T>
    struct card_result
    {
        CardError ec = CardError::None;
        T value{};
        std::string message;

        inline explicit operator bool() const noexcept { return ec == CardError::None; }

        static card_result failure(CardError error, std::string why)
        {
            card_result res;
            res.ec = error;
            res.message = std::move(why);
            return res;
        }
    };

    struct ExpirationDate
    {
        int month = 1;
        int year = 1970;

        /**
         * True when local midnight on the first day of (month, year) is
         * strictly after `now`. Out of range months or years are never valid.
         */
        [[nodiscard]] bool is_after(std::time_t now) const;

        [[nodiscard]] std::string month_string() const;
    };

    struct CardRecord
    {
        std::string number;
        ExpirationDate expiration;
        std::string cvv;

        /**
         * Renders the `FORMATTED_NUMBER|MM|YYYY|CVV` line, with the number in
         * its network's display grouping and the month zero padded.
         */
        [[nodiscard]] std::string serialize() const;
    };

    enum class FailureReason : uint8_t
    {
        LuhnFailed,
        ExpiredOrInvalidDate,
        InvalidCvv,
        MalformedRecord
    };

    std::string_view failure_reason_to_string(FailureReason reason);

    struct ValidationVerdict
    {
        bool valid = false;
        NetworkKind network = NetworkKind::Unknown;
        std::string formatted;
        std::vector<FailureReason> reasons;
    };

    constexpr char record_delimiter = '|';
}
