#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <type_traits>

#include "card.hpp"

namespace results
{
    class ResultsCollection;
}

namespace generation
{
    /**
     * Builds synthetic card data. Every instance owns its own pseudo-random
     * engine, which is not suitable for anything but test data. Construct it
     * with a seed to get a reproducible sequence.
     */
    class CardGenerator
    {
        std::mt19937_64 p_gen;
    public:
        CardGenerator();
        explicit CardGenerator(uint64_t seed);

        /**
         * Completes `prefix` into a full number for its network: random digits
         * up to one short of the network's length, then the Luhn check digit.
         * Spaces in the prefix are ignored.
         *
         * @return CardError::InvalidPrefix when the prefix is empty, holds
         *         anything but digits, or leaves no room for the check digit.
         */
        card::card_result<std::string> synthesize(const std::string_view& prefix);

        /**
         * A date between one and six years after `current_year`, so it is
         * never expired at the time it is made.
         */
        card::ExpirationDate synthesize_expiration(int current_year);
        card::ExpirationDate synthesize_expiration();

        // Always three digits, even though four digit codes validate.
        std::string synthesize_cvv();

        card::card_result<card::CardRecord> synthesize_record(const std::string_view& prefix);

    private:
        template<typename T>
        inline T number_in_range(T min, T max)
        {
            static_assert(std::is_integral_v<T>);
            std::uniform_int_distribution<T> dist{min, max};
            return dist(p_gen);
        }
    };

    int current_year();

    /**
     * Appends a "Generated ..." header and then `count` serialized records to
     * `results`. A slot whose synthesis fails is written as "Invalid BIN" and
     * does not stop the rest of the batch.
     *
     * @return The number of records that were generated successfully.
     */
    std::size_t generate_cards(CardGenerator& generator, const std::string_view& prefix, std::size_t count, results::ResultsCollection& results);
}
