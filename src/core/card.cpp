#include "card.hpp"

#include "network.hpp"

namespace card
{
    std::string_view card_error_to_string(CardError error)
    {
        switch (error)
        {
        case CardError::None: return "none";
        case CardError::InvalidPrefix: return "invalid prefix";
        case CardError::MalformedRecord: return "malformed record";
        case CardError::InvalidDateLiteral: return "invalid date literal";
        default: return "unknown error";
        }
    }

    std::string_view failure_reason_to_string(FailureReason reason)
    {
        switch (reason)
        {
        case FailureReason::LuhnFailed: return "Luhn check failed";
        case FailureReason::ExpiredOrInvalidDate: return "Expired or invalid date";
        case FailureReason::InvalidCvv: return "Invalid CVV";
        case FailureReason::MalformedRecord: return "Invalid Format";
        default: return "Unknown failure";
        }
    }

    bool ExpirationDate::is_after(std::time_t now) const
    {
        if (month < 1 || month > 12 || year < 1 || year > 9999)
            return false;

        std::tm first_day{};
        first_day.tm_year = year - 1900;
        first_day.tm_mon = month - 1;
        first_day.tm_mday = 1;
        first_day.tm_isdst = -1;

        std::time_t when = std::mktime(&first_day);
        if (when == static_cast<std::time_t>(-1))
            return false;

        return when > now;
    }

    std::string ExpirationDate::month_string() const
    {
        std::string result;
        if (month < 10)
            result += '0';
        result.append(std::to_string(month));
        return result;
    }

    std::string CardRecord::serialize() const
    {
        std::string line = network::format(number, network::classify(number));
        line += record_delimiter;
        line += expiration.month_string();
        line += record_delimiter;
        line += std::to_string(expiration.year);
        line += record_delimiter;
        line += cvv;
        return line;
    }
}
