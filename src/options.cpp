#include "options.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <popl.hpp>

#include "helpers/env.hpp"
#include "helpers/utilities.hpp"

namespace fs = std::filesystem;

/**
 * The format of the JSON file is the following:
 * @code
 * {
 *      "port": int,
 *      "connections": int,
 *      "timeout": int,
 *      "threads": int,
 *      "thread_per_connection": bool,
 *      "ipv6": bool,
 *      "ipv4": bool,
 *      "certificate": string,
 *      "private_key": string,
 *      "seed": int,
 *      "bin_lookup_url": string,
 *      "bin_lookup_timeout": int,
 *      "log_level": string,
 *      "log_dir": string
 * }
 * @endcode
 */
Options parse_options_from_file(const fs::path& file)
{
    std::ifstream i(file);
    if (!i)
        throw std::invalid_argument("unable to open config file " + file.string());

    nlohmann::json j;
    i >> j;

    Options opts;

    auto get_or_default = [&j](const char* name, auto default_val) -> decltype(default_val)
    {
        if (!j.contains(name) || j[name].is_null())
            return default_val;

        return j[name].template get<decltype(default_val)>();
    };

    auto get_optional = [&j](const char* name, auto current) -> decltype(current)
    {
        if (!j.contains(name) || j[name].is_null())
            return current;

        return j[name].template get<typename decltype(current)::value_type>();
    };

    opts.port = get_or_default("port", opts.port);
    opts.max_connections = get_or_default("connections", opts.max_connections);
    opts.timeout = get_or_default("timeout", opts.timeout);
    opts.max_threads = get_or_default("threads", opts.max_threads);
    opts.thread_per_connection = get_or_default("thread_per_connection", opts.thread_per_connection);
    opts.use_ipv6 = get_or_default("ipv6", opts.use_ipv6);
    opts.use_ipv4 = get_or_default("ipv4", opts.use_ipv4);
    opts.certificate = get_optional("certificate", opts.certificate);
    opts.private_key = get_optional("private_key", opts.private_key);
    opts.seed = get_optional("seed", opts.seed);
    opts.bin_lookup_url = get_or_default("bin_lookup_url", opts.bin_lookup_url);
    opts.bin_lookup_timeout = get_or_default("bin_lookup_timeout", opts.bin_lookup_timeout);
    opts.log_level = get_or_default("log_level", opts.log_level);
    opts.log_dir = get_or_default("log_dir", opts.log_dir);

    return opts;
}

static void apply_environment(Options& options)
{
    options.port = env::get_int("CARDLAB_PORT", options.port);
    options.max_connections = env::get_int("CARDLAB_MAX_CONNECTIONS", options.max_connections);
    options.timeout = env::get_int("CARDLAB_TIMEOUT", options.timeout);
    options.max_threads = env::get_int("CARDLAB_MAX_THREADS", options.max_threads);
    options.thread_per_connection = env::get_bool("CARDLAB_THREAD_PER_CONNECTION", options.thread_per_connection);
    options.use_ipv4 = env::get_bool("CARDLAB_USE_IPV4", options.use_ipv4);
    options.use_ipv6 = env::get_bool("CARDLAB_USE_IPV6", options.use_ipv6);
    if (auto certificate = env::get_string("CARDLAB_CERTIFICATE"))
        options.certificate = certificate;
    if (auto private_key = env::get_string("CARDLAB_PRIVATE_KEY"))
        options.private_key = private_key;
    if (auto seed = env::get_ulong("CARDLAB_SEED"))
        options.seed = seed;
    options.bin_lookup_url = env::get_string("CARDLAB_BIN_LOOKUP_URL", options.bin_lookup_url);
    options.bin_lookup_timeout = env::get_int("CARDLAB_BIN_LOOKUP_TIMEOUT", options.bin_lookup_timeout);
    options.log_level = env::get_string("CARDLAB_LOG_LEVEL", options.log_level);
    options.log_dir = env::get_string("CARDLAB_LOG_DIR", options.log_dir);
}

static void print_usage(const char* program, const popl::OptionParser& op)
{
    std::cout << "usage:\n";
    std::cout << "\t" << program << " [OPTIONS] generate <bin>\n";
    std::cout << "\t" << program << " [OPTIONS] validate [file]\n";
    std::cout << "\t" << program << " [OPTIONS] classify <number>...\n";
    std::cout << "\t" << program << " [OPTIONS] bin <number>\n";
    std::cout << "\t" << program << " [OPTIONS] serve\n\n";
    std::cout << op << "\n";
}

Options parse_options(int argc, const char** argv)
{
    Options options;
    popl::OptionParser op("OPTIONS");
    auto help_opt = op.add<popl::Switch>("h", "help", "show this message");
    auto conf_opt = op.add<popl::Value<std::string>>("i", "config", "config file to use");
    auto count_opt = op.add<popl::Value<uint16_t>>("n", "count", "number of cards to generate (1-100)");
    auto check_opt = op.add<popl::Switch>("", "check", "validate the generated cards afterwards");
    auto bin_len_opt = op.add<popl::Value<uint16_t>>("b", "bin-length", "digits to extract as the BIN (6 or 8)");
    auto lookup_opt = op.add<popl::Switch>("l", "lookup", "fetch issuer information for the BIN");
    auto seed_opt = op.add<popl::Value<uint64_t>>("s", "seed", "seed for reproducible card generation");
    auto level_opt = op.add<popl::Value<std::string>>("L", "log-level", "trace, debug, info, warn, error, critical or off");
    auto port_opt = op.add<popl::Value<uint16_t>>("p", "port", "port to start the server on");
    auto conn_opt = op.add<popl::Value<uint16_t>>("c", "connections", "maximum connections to allow");
    auto time_opt = op.add<popl::Value<uint16_t>>("t", "timeout", "seconds of inactivity before connection is timed out");
    auto thread_opt = op.add<popl::Value<uint16_t>>("T", "threads", "max threads for the thread pool");
    auto tpc_opt = op.add<popl::Switch>("e", "tpc", "switch to thread-per-connection model");
    auto ipv4_opt = op.add<popl::Switch>("4", "use-ipv4", "allow IPv4 connections");
    auto ipv6_opt = op.add<popl::Switch>("6", "use-ipv6", "allow IPv6 connections");
    auto noipv4_opt = op.add<popl::Switch>("", "no-ipv4", "disallow IPv4 connections");
    auto noipv6_opt = op.add<popl::Switch>("", "no-ipv6", "disallow IPv6 connections");
    auto cert_opt = op.add<popl::Value<std::string>>("C", "cert", "certificate to authenticate with");
    auto key_opt = op.add<popl::Value<std::string>>("K", "key", "private key for the certificate");
    op.parse(argc, argv);

    if (help_opt->is_set())
    {
        print_usage(argv[0], op);
        std::exit(EXIT_SUCCESS);
    }

    if (conf_opt->is_set())
    {
        if (!fs::exists(conf_opt->value()))
            throw std::invalid_argument("config file " + conf_opt->value() + " does not exist!");
        options = parse_options_from_file(conf_opt->value());
    }
    else
    {
        auto configFile = env::get_string("CARDLAB_CONFIG_FILE", "cardlab.json");
        if (fs::exists(configFile))
            options = parse_options_from_file(configFile);
    }

    apply_environment(options);

    if ((ipv4_opt->is_set() && noipv4_opt->is_set()) || (ipv6_opt->is_set() && noipv6_opt->is_set()))
        throw std::invalid_argument("ipv4/6 is both set and unset!");

    if (cert_opt->is_set() != key_opt->is_set())
    {
        throw std::invalid_argument("--cert and --key must be both set or unset!");
    }
    else if (cert_opt->is_set())
    {
        options.certificate = cert_opt->value();
        options.private_key = key_opt->value();
    }

    if (port_opt->is_set())
        options.port = port_opt->value();
    if (conn_opt->is_set())
        options.max_connections = conn_opt->value();
    if (time_opt->is_set())
        options.timeout = time_opt->value();
    if (thread_opt->is_set())
        options.max_threads = thread_opt->value();
    if (tpc_opt->is_set())
        options.thread_per_connection = true;
    if (seed_opt->is_set())
        options.seed = seed_opt->value();
    if (level_opt->is_set())
        options.log_level = level_opt->value();
    if (count_opt->is_set())
        options.count = count_opt->value();
    if (bin_len_opt->is_set())
        options.bin_length = bin_len_opt->value();
    options.check = check_opt->is_set();
    options.lookup = lookup_opt->is_set();

    if (noipv4_opt->is_set())
        options.use_ipv4 = false;
    else if (ipv4_opt->is_set())
        options.use_ipv4 = true;

    if (noipv6_opt->is_set())
        options.use_ipv6 = false;
    else if (ipv6_opt->is_set())
        options.use_ipv6 = true;

    if (!options.use_ipv4 && !options.use_ipv6)
        throw std::invalid_argument("both ipv4 and ipv6 are disallowed, so no connections can be made!");

    if (options.count < 1 || options.count > 100)
        throw std::invalid_argument("--count must be between 1 and 100!");

    if (options.bin_length != 6 && options.bin_length != 8)
        throw std::invalid_argument("--bin-length must be 6 or 8!");

    constexpr std::array<const char*, 7> levels { "trace", "debug", "info", "warn", "error", "critical", "off" };
    if (std::find(levels.begin(), levels.end(), options.log_level) == levels.end())
        throw std::invalid_argument("unknown log level '" + options.log_level + "'!");

    auto args = op.non_option_args();
    if (args.empty())
    {
        print_usage(argv[0], op);
        throw std::invalid_argument("no command given!");
    }

    options.command = args.front();
    options.arguments.assign(args.begin() + 1, args.end());

    return options;
}

std::optional<std::pair<std::string, std::string>> read_credentials(const Options& opts)
{
    if (!opts.certificate.has_value() || !opts.private_key.has_value())
        return std::nullopt;

    try
    {
        return std::make_pair(util::read_file(*opts.private_key), util::read_file(*opts.certificate));
    }
    catch (std::ios_base::failure& e)
    {
        throw std::invalid_argument(std::string("unable to load TLS credentials: ") + e.what());
    }
}
