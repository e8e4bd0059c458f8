#include "commands.hpp"

#include <fstream>
#include <future>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/generation.hpp"
#include "core/luhn.hpp"
#include "core/network.hpp"
#include "core/results.hpp"
#include "core/validation.hpp"

namespace commands
{
    static std::string strip_spaces(const std::string& text)
    {
        std::string out;
        for (auto c : text)
        {
            if (c != ' ')
                out += c;
        }
        return out;
    }

    static std::vector<std::string> read_lines(std::istream& in)
    {
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty() && line[line.size() - 1] == '\r')
                line.erase(line.size() - 1);
            lines.push_back(std::move(line));
        }
        return lines;
    }

    int generate(const Options& opts, std::ostream& out, std::ostream& err)
    {
        if (opts.arguments.empty())
        {
            err << "generate needs a BIN\n";
            return 1;
        }

        auto prefix = strip_spaces(opts.arguments.front());
        if (prefix.size() < 6)
        {
            err << "Please enter a valid BIN (at least 6 digits)\n";
            return 1;
        }

        auto generator = opts.seed ? generation::CardGenerator(*opts.seed) : generation::CardGenerator();
        results::ResultsCollection results;

        auto made = generation::generate_cards(generator, prefix, opts.count, results);
        spdlog::info("Generated {} of {} cards for BIN {}", made, opts.count, prefix);

        if (opts.check && !results.check_generated())
        {
            err << "No generated cards found to check\n";
            out << results.text();
            return 1;
        }

        out << results.text();
        return made == opts.count ? 0 : 1;
    }

    int validate(const Options& opts, std::istream& in, std::ostream& out, std::ostream& err)
    {
        std::vector<std::string> entries;
        if (opts.arguments.empty())
        {
            entries = read_lines(in);
        }
        else
        {
            std::ifstream file(opts.arguments.front());
            if (!file)
            {
                err << "Unable to open " << opts.arguments.front() << "\n";
                return 1;
            }
            entries = read_lines(file);
        }

        auto report = validation::validate(entries);
        for (const auto& record : report.records)
            out << record.text << "\n";
        out << "\n" << report.summary.to_string() << "\n";

        spdlog::info("Validated {} records, {} valid", report.summary.total_count, report.summary.valid_count);
        return 0;
    }

    int classify(const Options& opts, std::ostream& out, std::ostream& err)
    {
        if (opts.arguments.empty())
        {
            err << "classify needs at least one card number\n";
            return 1;
        }

        for (const auto& number : opts.arguments)
        {
            auto digits = luhn::digits_only(number);
            auto kind = network::classify(digits);
            out << network::format(digits, kind)
                << " -> " << network::to_string(kind)
                << " (" << network::expected_length(kind) << " digits, Luhn "
                << (!digits.empty() && luhn::is_valid(digits) ? "ok" : "failed") << ")\n";
        }
        return 0;
    }

    int bin(const Options& opts, bin_lookup::BinLookup& lookup, std::ostream& out, std::ostream& err)
    {
        if (opts.arguments.empty())
        {
            err << "bin needs a card number\n";
            return 1;
        }

        auto number = strip_spaces(opts.arguments.front());
        int status = 0;

        // Extraction and lookup are independent; a failed extraction does not
        // stop a lookup that has its six digits.
        auto bin = network::extract_bin(number, opts.bin_length);
        if (bin)
        {
            out << "BIN (" << opts.bin_length << "): " << bin.value << " -> " << network::to_string(network::classify(bin.value)) << "\n";
        }
        else
        {
            err << bin.message << "\n";
            status = 1;
        }

        if (!opts.lookup)
            return status;

        if (number.size() < 6)
        {
            err << "Please enter a valid CC number\n";
            return 1;
        }

        out << "Fetching BIN information..." << std::endl;

        // Lookups can take the full timeout, so they run on their own thread.
        auto pending = std::async(std::launch::async, [&lookup, number]() { return lookup.fetch(number); });
        auto result = pending.get();
        out << result.summary << "\n";
        return result.status == bin_lookup::LookupStatus::Error ? 1 : status;
    }

    std::unique_ptr<bin_lookup::BinLookup> make_lookup(const Options& opts)
    {
        return std::make_unique<bin_lookup::HttpBinLookup>(opts.bin_lookup_url, opts.bin_lookup_timeout);
    }
}
