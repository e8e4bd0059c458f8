#include "network.hpp"

#include <array>
#include <algorithm>
#include <initializer_list>

#include "luhn.hpp"

namespace
{
    using card::NetworkKind;

    struct PrefixRule
    {
        std::string_view prefix;
        NetworkKind kind;
    };

    /**
     * Rules are tried in order. No prefix of one network is a prefix of
     * another's, so the order only matters for readability.
     */
    constexpr std::array<PrefixRule, 27> prefix_table {{
        { "4", NetworkKind::Visa },

        { "51", NetworkKind::Mastercard },
        { "52", NetworkKind::Mastercard },
        { "53", NetworkKind::Mastercard },
        { "54", NetworkKind::Mastercard },
        { "55", NetworkKind::Mastercard },
        { "22", NetworkKind::Mastercard },
        { "23", NetworkKind::Mastercard },
        { "24", NetworkKind::Mastercard },
        { "25", NetworkKind::Mastercard },
        { "26", NetworkKind::Mastercard },
        { "27", NetworkKind::Mastercard },

        { "34", NetworkKind::AmericanExpress },
        { "37", NetworkKind::AmericanExpress },

        { "300", NetworkKind::DinersClub },
        { "301", NetworkKind::DinersClub },
        { "302", NetworkKind::DinersClub },
        { "303", NetworkKind::DinersClub },
        { "304", NetworkKind::DinersClub },
        { "305", NetworkKind::DinersClub },
        { "36", NetworkKind::DinersClub },
        { "38", NetworkKind::DinersClub },

        { "6011", NetworkKind::Discover },
        { "65", NetworkKind::Discover },
        { "64", NetworkKind::Discover },
        { "622", NetworkKind::Discover },

        { "35", NetworkKind::JCB },
    }};

    std::string group_digits(const std::string& digits, std::initializer_list<std::size_t> groups)
    {
        std::string result;
        std::size_t offset = 0;
        for (auto width : groups)
        {
            if (offset >= digits.size())
                break;
            if (!result.empty())
                result += ' ';
            result.append(digits, offset, width);
            offset += width;
        }

        // Anything past the last fixed group keeps its own group.
        if (offset < digits.size())
        {
            if (!result.empty())
                result += ' ';
            result.append(digits, offset, std::string::npos);
        }
        return result;
    }
}

namespace network
{
    NetworkKind classify(const std::string_view& number)
    {
        auto digits = luhn::digits_only(number);
        std::string_view view{digits};

        auto rule = std::find_if(prefix_table.begin(), prefix_table.end(), [&view](const PrefixRule& r) {
            return view.substr(0, r.prefix.size()) == r.prefix;
        });

        return rule == prefix_table.end() ? NetworkKind::Unknown : rule->kind;
    }

    std::string format(const std::string_view& number, NetworkKind kind)
    {
        auto digits = luhn::digits_only(number);

        if (kind == NetworkKind::AmericanExpress)
            return group_digits(digits, {4, 6});

        std::string result;
        for (std::size_t i = 0; i < digits.size(); i += 4)
        {
            if (i != 0)
                result += ' ';
            result.append(digits, i, 4);
        }
        return result;
    }

    std::string_view to_string(NetworkKind kind)
    {
        switch (kind)
        {
        case NetworkKind::Visa: return "Visa";
        case NetworkKind::Mastercard: return "Mastercard";
        case NetworkKind::AmericanExpress: return "American Express";
        case NetworkKind::DinersClub: return "Diners Club";
        case NetworkKind::Discover: return "Discover";
        case NetworkKind::JCB: return "JCB";
        default: return "Unknown";
        }
    }

    card::card_result<std::string> extract_bin(const std::string_view& number, std::size_t length)
    {
        using result = card::card_result<std::string>;

        if (length != 6 && length != 8)
            return result::failure(card::CardError::InvalidPrefix, "BIN length must be 6 or 8");

        std::string compact;
        for (auto c : number)
        {
            if (c != ' ')
                compact += c;
        }

        if (compact.empty() || compact.size() < length)
            return result::failure(card::CardError::InvalidPrefix, "Please enter a valid CC number");

        result res;
        res.value = compact.substr(0, length);
        return res;
    }
}
