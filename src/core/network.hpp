#pragma once

#include <string>
#include <string_view>

#include "card.hpp"

namespace network
{
    using card::NetworkKind;

    /**
     * Classifies a number by its leading digits. Only digits are considered,
     * so display-formatted numbers classify the same as raw ones. Anything not
     * in the prefix table is NetworkKind::Unknown.
     */
    NetworkKind classify(const std::string_view& number);

    /**
     * Number of digits a full card of this network carries: 15 for American
     * Express and 16 for everything else, Unknown included.
     */
    constexpr std::size_t expected_length(NetworkKind kind) noexcept
    {
        return kind == NetworkKind::AmericanExpress ? 15 : 16;
    }

    /**
     * Display grouping: 4-6-5 for American Express, otherwise groups of four
     * separated by a single space with a possibly shorter last group.
     */
    std::string format(const std::string_view& number, NetworkKind kind);

    std::string_view to_string(NetworkKind kind);

    /**
     * Takes the first `length` digits (6 or 8) of a number after removing its
     * spaces.
     */
    card::card_result<std::string> extract_bin(const std::string_view& number, std::size_t length);
}
