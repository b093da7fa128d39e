#ifndef UNROLL_CLI_PARSER_HPP
#define UNROLL_CLI_PARSER_HPP

#include "../../../libunroll/include/ingest_config.hpp"
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <thread>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    // sources (batch mode)
    std::vector<std::string> urls;
    std::vector<std::filesystem::path> zips;
    std::filesystem::path output_path;
    bool pretty = false;

    // server mode
    bool serve = false;
    std::string host = "127.0.0.1";
    int port = 8000;
    std::string allowed_origins = "http://localhost:3000,http://127.0.0.1:3000";

    bool quiet = false;
    unsigned num_threads = 1;
    std::string log_level = "INFO";
    std::string log_file;

    // ingestion limits, copied into `config` once parsing succeeds
    std::string allowed_hosts = "github.com,www.github.com";
    std::uintmax_t max_zip_bytes = 50ull * 1024 * 1024;
    std::uintmax_t max_extract_bytes = 200ull * 1024 * 1024;
    std::uintmax_t max_file_bytes = 512000;
    long clone_timeout_seconds = 60;
    double binary_threshold = 0.30;
    std::size_t max_depth = 64;
    std::string git_binary = "git";
    std::filesystem::path scratch_dir;

    unroll::IngestConfig config;

    [[nodiscard]] std::set<std::string> origin_set() const;
};

/**
 * @brief Configures the CLI11 parser with all options and flags.
 *
 * Ingestion limits fall back to their environment variables
 * (ALLOWED_GIT_HOSTS, MAX_ZIP_BYTES, ...). The final callback cross-checks
 * the mode and builds a validated `settings.config`.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif // UNROLL_CLI_PARSER_HPP
