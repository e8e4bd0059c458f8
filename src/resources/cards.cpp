#include "resources.hpp"

#include <optional>
#include <sstream>

#include <spdlog/spdlog.h>

#include "helpers/xml_builder.hpp"
#include "helpers/utilities.hpp"

#include "core/luhn.hpp"
#include "core/network.hpp"
#include "core/validation.hpp"

namespace resources
{
    using httpserver::string_response;

    static std::optional<std::string> get_arg(const http_request& req, const std::string& name)
    {
        std::string value = req.get_arg(name);
        if (value.empty())
            return std::nullopt;
        return value;
    }

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

    static Ref<http_response> xml_ok(XmlBuilder& builder)
    {
        return std::make_shared<string_response>(builder.serialize(), 200, "application/xml");
    }

    static void add_report(XmlBuilder& builder, const validation::BatchReport& report)
    {
        builder.add_array("Records", report.records, [](XmlBuilder& b, const validation::RecordOutcome& r) -> void {
            b.add_string("Record", {
                { "Valid", r.verdict.valid ? "true" : "false" },
                { "Network", std::string{network::to_string(r.verdict.network)} }
            }, r.text);
        });
        builder.add_string("Summary", {
            { "Valid", std::to_string(report.summary.valid_count) },
            { "Total", std::to_string(report.summary.total_count) }
        }, report.summary.to_string());
    }

    const Ref<http_response> classify_card::process(const http_request& req)
    {
        auto number = get_arg(req, "number");
        if (!number)
            return reject(req, "A card number is required! Expected /classify?number={number}", 400);

        auto digits = luhn::digits_only(*number);
        if (digits.empty())
            return reject(req, "The card number has no digits!", 400);

        auto kind = network::classify(digits);
        record(req, Activity::Classified, std::string{network::to_string(kind)});

        XmlBuilder builder;
        builder
            .add_child("Data")
                .add_child("Card", {
                    { "Network", std::string{network::to_string(kind)} },
                    { "ExpectedLength", std::to_string(network::expected_length(kind)) }
                })
                    .add_string("Number", network::format(digits, kind))
                    .add_string("Luhn", luhn::is_valid(digits) ? "valid" : "invalid");

        return xml_ok(builder);
    }

    const Ref<http_response> generate_cards::process(const http_request& req)
    {
        if (req.get_method() != "GET" && req.get_method() != "POST")
            return reject(req, "Only GET and POST are supported on /generate!", 405);

        auto bin = get_arg(req, "bin");
        auto prefix = bin ? strip_spaces(*bin) : std::string{};
        if (prefix.size() < 6)
            return reject(req, "Please enter a valid BIN (at least 6 digits)", 400);

        uint16_t count = 1;
        if (auto count_str = get_arg(req, "count"))
        {
            auto parsed = util::parse<uint16_t>(*count_str);
            if (parsed.ec != std::errc{} || parsed.value < 1 || parsed.value > 100)
                return reject(req, "count must be an integer between 1 and 100!", 400);
            count = parsed.value;
        }

        std::vector<std::string> lines;
        std::size_t made;
        {
            auto& ws = workspace();
            std::lock_guard<std::mutex> lock(ws.mutex);

            // One header line plus one line per card.
            if (ws.results.room() < std::size_t{count} + 1)
                return reject(req, "Results are full, clear them with DELETE /results first!", 409);

            auto first = ws.results.lines().size();
            made = generation::generate_cards(ws.generator, prefix, count, ws.results);
            lines.assign(ws.results.lines().begin() + first, ws.results.lines().end());
        }

        record(req, Activity::Generated, std::to_string(made) + "/" + std::to_string(count) + " for " + prefix);

        XmlBuilder builder;
        builder
            .add_child("Data")
                .add_array("Cards", { { "Requested", std::to_string(count) }, { "Generated", std::to_string(made) } },
                    lines, [](XmlBuilder& b, const std::string& line) -> void {
                        b.add_string("Line", line);
                    });

        return xml_ok(builder);
    }

    const Ref<http_response> validate_cards::process(const http_request& req)
    {
        XmlBuilder builder;
        builder.add_child("Data");

        if (req.get_method() == "POST")
        {
            std::vector<std::string> entries;
            std::istringstream body{std::string(req.get_content())};
            std::string line;
            while (std::getline(body, line))
            {
                if (!line.empty() && line[line.size() - 1] == '\r')
                    line.erase(line.size() - 1);
                entries.push_back(std::move(line));
            }

            auto report = validation::validate(entries);
            record(req, Activity::Validated, report.summary.to_string());
            add_report(builder, report);
            return xml_ok(builder);
        }

        if (req.get_method() != "GET")
            return reject(req, "Only GET and POST are supported on /validate!", 405);

        std::vector<std::string> lines;
        {
            auto& ws = workspace();
            std::lock_guard<std::mutex> lock(ws.mutex);
            if (!ws.results.check_generated())
                return reject(req, "No generated cards found to check", 404);
            lines = ws.results.lines();
        }

        record(req, Activity::Validated, lines.empty() ? std::string{} : lines.back());
        builder.add_array("Results", lines, [](XmlBuilder& b, const std::string& l) -> void {
            b.add_string("Line", l);
        });
        return xml_ok(builder);
    }

    const Ref<http_response> results_list::process(const http_request& req)
    {
        auto& ws = workspace();

        if (req.get_method() == "DELETE")
        {
            {
                std::lock_guard<std::mutex> lock(ws.mutex);
                ws.results.clear();
            }
            record(req, Activity::Cleared, {});
            return std::make_shared<string_response>("", 204, "text/plain");
        }

        if (req.get_method() != "GET")
            return reject(req, "Only GET and DELETE are supported on /results!", 405);

        std::vector<std::string> lines;
        std::size_t pending;
        {
            std::lock_guard<std::mutex> lock(ws.mutex);
            lines = ws.results.lines();
            pending = ws.results.entries().size();
        }

        XmlBuilder builder;
        builder
            .add_child("Data")
                .add_array("Results", { { "Pending", std::to_string(pending) } }, lines,
                    [](XmlBuilder& b, const std::string& l) -> void {
                        b.add_string("Line", l);
                    });
        return xml_ok(builder);
    }

    const Ref<http_response> bin_info::process(const http_request& req)
    {
        auto& path_pieces = req.get_path_pieces();
        if (path_pieces.size() > 2)
            return reject(req, "Too many path elements! Expected /bin/{number}/!", 400);

        auto number_arg = path_pieces.size() == 2 ? std::optional<std::string>{path_pieces.at(1)} : get_arg(req, "number");
        if (!number_arg)
            return reject(req, "A card number is required! Expected /bin/{number}", 400);
        auto number = strip_spaces(*number_arg);

        std::size_t length = 6;
        if (auto length_str = get_arg(req, "length"))
        {
            auto parsed = util::parse<uint16_t>(*length_str);
            if (parsed.ec != std::errc{})
                return reject(req, "length must be 6 or 8!", 400);
            length = parsed.value;
        }

        auto bin = network::extract_bin(number, length);
        if (!bin)
            return reject(req, bin.message, 400);

        auto kind = network::classify(bin.value);
        record(req, Activity::BinExtracted, bin.value);

        XmlBuilder builder;
        builder
            .add_child("Data")
                .add_child("Bin", { { "Length", std::to_string(length) } })
                    .add_string("Value", bin.value)
                    .add_string("Network", network::to_string(kind))
                    .add_string("Display", "BIN (" + std::to_string(length) + "): " + bin.value + " -> " + std::string{network::to_string(kind)});

        auto lookup = get_arg(req, "lookup");
        if (lookup && util::parse<bool>(util::to_lower(*lookup)).value)
        {
            // Called without the workspace lock, lookups may take seconds.
            auto result = workspace().lookup->fetch(number);
            record(req, Activity::BinLookup, result.summary);
            builder.add_string("Info", result.summary);
        }

        return xml_ok(builder);
    }
}
