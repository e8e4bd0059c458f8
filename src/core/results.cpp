#include "results.hpp"

#include "card.hpp"
#include "validation.hpp"

namespace results
{
    void ResultsCollection::append(std::string text, bool is_card_data)
    {
        if (is_card_data && text.find(card::record_delimiter) != std::string::npos && text.rfind("Generated", 0) != 0)
            p_entries.push_back(text);

        p_lines.push_back(std::move(text));
    }

    void ResultsCollection::clear() noexcept
    {
        p_lines.clear();
        p_entries.clear();
    }

    std::string ResultsCollection::text() const
    {
        std::string out;
        for (const auto& line : p_lines)
        {
            out += line;
            out += '\n';
        }
        return out;
    }

    bool ResultsCollection::check_generated(std::time_t now)
    {
        if (p_entries.empty())
            return false;

        auto report = validation::validate(p_entries, now);

        clear();
        append("=== VALIDATION RESULTS ===");
        append("");
        for (const auto& record : report.records)
            append(record.text);
        append("");
        append(report.summary.to_string());
        return true;
    }

    bool ResultsCollection::check_generated()
    {
        return check_generated(std::time(nullptr));
    }
}
