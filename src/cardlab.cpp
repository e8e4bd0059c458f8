#include "cardlab.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <stdexcept>

#include "options.hpp"
#include "commands.hpp"
#include "server.hpp"

static void initialize_logging(const Options& opts)
{
    spdlog::set_pattern("[%D %r] [thread %t] [%^%n - %l%$] %v");

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);

    auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(opts.log_dir + "/cardlab.log", 0, 0);
    file_sink->set_level(spdlog::level::trace);

    auto logger = std::make_shared<spdlog::logger>("cardlab", spdlog::sinks_init_list({file_sink, console_sink}));
    logger->set_level(spdlog::level::from_str(opts.log_level));
    spdlog::set_default_logger(logger);

    spdlog::flush_every(std::chrono::seconds(2));
}

// Pairs curl_global_init with curl_global_cleanup for the life of the process.
struct curl_global
{
    CURLcode code;

    curl_global() : code(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~curl_global() { if (code == CURLE_OK) curl_global_cleanup(); }

    curl_global(const curl_global&) = delete;
    curl_global& operator=(const curl_global&) = delete;
};

int cardlab::run(int argc, const char** argv)
{
    Options opts;
    try
    {
        opts = parse_options(argc, argv);
    }
    catch (std::invalid_argument& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    catch (nlohmann::json::exception& e)
    {
        std::cerr << "Bad config file: " << e.what() << std::endl;
        return 1;
    }

    try
    {
        initialize_logging(opts);
    }
    catch (spdlog::spdlog_ex& e)
    {
        std::cerr << "Unable to set up logging in `" << opts.log_dir << "`: " << e.what() << std::endl;
        return 1;
    }

    curl_global curl;
    if (curl.code != CURLE_OK)
    {
        spdlog::critical("Unable to initialize libcurl: {}", curl_easy_strerror(curl.code));
        return 1;
    }

    spdlog::debug("Running `{}` with {} argument(s)", opts.command, opts.arguments.size());

    try
    {
        if (opts.command == "generate")
            return commands::generate(opts, std::cout, std::cerr);
        if (opts.command == "validate")
            return commands::validate(opts, std::cin, std::cout, std::cerr);
        if (opts.command == "classify")
            return commands::classify(opts, std::cout, std::cerr);
        if (opts.command == "bin")
        {
            auto lookup = commands::make_lookup(opts);
            return commands::bin(opts, *lookup, std::cout, std::cerr);
        }
        if (opts.command == "serve")
            return server::serve(opts);
    }
    catch (std::exception& e)
    {
        spdlog::critical("`{}` failed: {}", opts.command, e.what());
        return 1;
    }

    spdlog::error("Unknown command `{}`", opts.command);
    std::cerr << "Unknown command `" << opts.command << "`, expected one of generate, validate, classify, bin, serve" << std::endl;
    return 1;
}
