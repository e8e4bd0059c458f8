#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <optional>
#include <utility>
#include <vector>

/**
 * Everything cardlab can be configured with.
 *
 * There are multiple ways to set these options, which are:
 *   A cardlab.json file
 *   Environment variables
 *   Command line flags
 *
 * Note that command line arguments override environment variables
 * Environment variables override config files
 * and config files override the defaults.
 *
 * So defaults -> config files -> environment variables -> command line flags.
 */
struct Options
{
    uint16_t port = 8080;
    uint16_t max_connections = 0;
    uint16_t timeout = 180;
    uint16_t max_threads = 1;
    bool thread_per_connection = false;
    bool use_ipv6 = false;
    bool use_ipv4 = true;
    std::optional<std::string> certificate;
    std::optional<std::string> private_key;

    std::optional<uint64_t> seed;
    std::string bin_lookup_url = "https://lookup.binlist.net/";
    uint16_t bin_lookup_timeout = 10;
    std::string log_level = "info";
    std::string log_dir = "logs";

    // Only ever set from the command line.
    uint16_t count = 1;
    uint16_t bin_length = 6;
    bool check = false;
    bool lookup = false;
    std::string command;
    std::vector<std::string> arguments;
};

/**
 * Reads a json configuration file on top of the defaults. Keys that are
 * missing or null keep their default value.
 *
 * @throws nlohmann::json::exception when the file is not valid json or a key
 *         has the wrong type
 */
Options parse_options_from_file(const std::filesystem::path& file);

/**
 * Generates an Options structure with values from config files,
 * environment variables, and command line arguments, and sanity
 * checks the options to make sure they're valid.
 *
 * @param argc Argument count passed in from `main`
 * @param argv Argument list passed in from `main`
 * @returns A populated and sanity checked Options struct
 * @throws std::invalid_argument Thrown whenever a sanity check fails
 */
Options parse_options(int argc, const char** argv);

/**
 * Loads the PEM contents of the certificate and private key, when both are
 * configured.
 *
 * @returns {key, certificate}, or nothing when TLS is not configured
 * @throws std::invalid_argument when either file cannot be read
 */
std::optional<std::pair<std::string, std::string>> read_credentials(const Options& opts);
