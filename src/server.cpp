#include "server.hpp"

#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <thread>

#include "commands.hpp"
#include "resources.hpp"
#include "monitors/activity_monitor.hpp"

static std::atomic_bool should_run{true};

static void signal_callback_handler(int signum)
{
    if (signum == SIGINT)
        should_run = false;
}

int server::serve(const Options& opts)
{
    using httpserver::create_webserver;
    using httpserver::http::http_utils;

    auto builder = create_webserver(opts.port)
            .max_connections(opts.max_connections)
            .connection_timeout(opts.timeout)
            .log_access([](const auto& url) {
                spdlog::info("ACCESSING: {}", url);
            })
            .log_error([](const auto& err) {
                spdlog::error("ERROR: {}", err);
            });

    std::optional<std::pair<std::string, std::string>> credentials;
    try
    {
        credentials = read_credentials(opts);
    }
    catch (std::invalid_argument& e)
    {
        spdlog::critical("{}", e.what());
        return 1;
    }

    if (credentials)
    {
        builder
            .use_ssl()
            .https_mem_key(credentials->first)
            .https_mem_cert(credentials->second);
    }

    if (opts.thread_per_connection)
        builder.start_method(http_utils::THREAD_PER_CONNECTION);
    else
        builder.start_method(http_utils::INTERNAL_SELECT).max_threads(opts.max_threads);

    /**
     * There is no option to turn off IPv4, likely as a safety measure
     * to stop you from starting a server with no means of connecting
     * to it. So IPv6 only and dual stack have to be picked by hand.
     *
     * The default behavior of the library is to just use IPv4.
     */
    if (opts.use_ipv6 && !opts.use_ipv4)
        builder.use_ipv6();
    else if (opts.use_ipv6 && opts.use_ipv4)
        builder.use_dual_stack();

    signal(SIGINT, signal_callback_handler);

    auto [activity, activity_thread] = activity_monitor::initialize(opts.log_dir);

    auto generator = opts.seed ? generation::CardGenerator(*opts.seed) : generation::CardGenerator();
    auto workspace = std::make_shared<resources::Workspace>(generator, commands::make_lookup(opts));

    auto stop_monitor = [&activity = activity, &activity_thread = activity_thread]()
    {
        activity->should_close = true;
        activity->queue.interrupt();
        activity_thread.join();
    };

    try
    {
        httpserver::webserver ws = builder;
        auto resource_list = resources::resources(workspace, activity);
        for (auto& resource : resource_list)
        {
            ws.register_resource(resource->endpoint(), resource.get(), resource->family());
        }

        spdlog::info("Starting server on port {}...", opts.port);
        ws.start(false);

        while (ws.is_running() && should_run)
        {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        spdlog::info("Graceful shutdown requested, shutting down...");

        if (ws.is_running())
            ws.stop();
    }
    catch (std::exception& e)
    {
        spdlog::critical("Server failed: {}", e.what());
        stop_monitor();
        return 1;
    }

    stop_monitor();

    spdlog::debug("Activity monitor done and webserver stopped.");
    return 0;
}
