#include "generation.hpp"

#include <cctype>
#include <chrono>
#include <ctime>

#include <spdlog/spdlog.h>

#include "luhn.hpp"
#include "network.hpp"
#include "results.hpp"

namespace generation
{
    using card::CardError;

    CardGenerator::CardGenerator() : p_gen(std::random_device{}())
    {}

    CardGenerator::CardGenerator(uint64_t seed) : p_gen(seed)
    {}

    card::card_result<std::string> CardGenerator::synthesize(const std::string_view& prefix)
    {
        using result = card::card_result<std::string>;

        std::string digits;
        for (auto c : prefix)
        {
            if (std::isspace(static_cast<unsigned char>(c)))
                continue;
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return result::failure(CardError::InvalidPrefix, "prefix must contain only digits");
            digits += c;
        }

        if (digits.empty())
            return result::failure(CardError::InvalidPrefix, "prefix is empty");

        auto length = network::expected_length(network::classify(digits));
        if (digits.size() >= length)
            return result::failure(CardError::InvalidPrefix,
                    "prefix of " + std::to_string(digits.size()) + " digits leaves no room in a "
                    + std::to_string(length) + " digit number");

        auto missing = length - digits.size();
        for (std::size_t i = 0; i < missing - 1; ++i)
            digits += static_cast<char>('0' + number_in_range(0, 9));

        digits += luhn::compute_check_digit(digits);

        result res;
        res.value = std::move(digits);
        return res;
    }

    card::ExpirationDate CardGenerator::synthesize_expiration(int year)
    {
        card::ExpirationDate date;
        date.month = number_in_range(1, 12);
        date.year = number_in_range(year + 1, year + 6);
        return date;
    }

    card::ExpirationDate CardGenerator::synthesize_expiration()
    {
        return synthesize_expiration(current_year());
    }

    std::string CardGenerator::synthesize_cvv()
    {
        std::string result;
        for (int i = 0; i < 3; ++i)
            result += static_cast<char>('0' + number_in_range(0, 9));
        return result;
    }

    card::card_result<card::CardRecord> CardGenerator::synthesize_record(const std::string_view& prefix)
    {
        using result = card::card_result<card::CardRecord>;

        auto number = synthesize(prefix);
        if (!number)
            return result::failure(number.ec, std::move(number.message));

        result res;
        res.value.number = std::move(number.value);
        res.value.expiration = synthesize_expiration();
        res.value.cvv = synthesize_cvv();
        return res;
    }

    int current_year()
    {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
        localtime_r(&now, &local);
        return local.tm_year + 1900;
    }

    std::size_t generate_cards(CardGenerator& generator, const std::string_view& prefix, std::size_t count, results::ResultsCollection& results)
    {
        results.append("Generated " + std::to_string(count) + " cards with BIN: " + std::string{prefix});

        std::size_t generated = 0;
        for (std::size_t i = 0; i < count; ++i)
        {
            auto record = generator.synthesize_record(prefix);
            if (!record)
            {
                spdlog::debug("Card {} of {} for BIN {} failed, {}: {}", i + 1, count, prefix, card::card_error_to_string(record.ec), record.message);
                results.append("Invalid BIN");
                continue;
            }

            results.append(record.value.serialize(), true);
            ++generated;
        }

        return generated;
    }
}
