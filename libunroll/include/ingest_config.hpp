/**
 * @file ingest_config.hpp
 * @brief Immutable process-wide limits and allow-lists.
 */

#ifndef UNROLL_INGEST_CONFIG_HPP
#define UNROLL_INGEST_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>

namespace unroll {

/**
 * @brief Limits, allow-lists and tunables for one ingestion service.
 *
 * @details Built once at startup (the CLI fills it from options and their
 * environment fallbacks), validated, and then passed by const reference into
 * every component. Nothing mutates it after construction.
 */
struct IngestConfig {
    std::set<std::string> allowed_hosts{"github.com", "www.github.com"}; ///< Lowercase, no port
    std::uintmax_t max_zip_bytes = 50ull * 1024 * 1024;      ///< Upload stream ceiling
    std::uintmax_t max_extract_bytes = 200ull * 1024 * 1024; ///< Declared/actual extracted total
    std::uintmax_t max_file_bytes = 512000;                  ///< Per-file content ceiling
    std::chrono::seconds clone_timeout{60};                  ///< Wall-clock budget for git clone

    std::size_t binary_sample_bytes = 1024; ///< Leading bytes sampled for binary detection
    double binary_threshold = 0.30;         ///< Share of non-text bytes above which a file is binary
    std::size_t max_depth = 64;             ///< Directories deeper than this are not descended

    /// Entry names pruned (with their subtree) during collection.
    std::set<std::string> skip_names{
        ".git", "node_modules", "__pycache__", "build", ".venv", "venv", ".next",
        "dist", "out", "coverage", ".pytest_cache", ".mypy_cache", ".ruff_cache",
        ".tox", ".idea", ".vscode", ".cache"
    };

    std::string git_binary = "git";          ///< Resolved through PATH unless absolute
    std::filesystem::path scratch_root;      ///< Empty: system temp directory

    /**
     * @brief Lowercases and trims a comma separated host list.
     * Empty items are dropped; a ":port" suffix is not allowed here.
     */
    static std::set<std::string> parse_host_list(const std::string& csv);

    /**
     * @brief Checks internal consistency.
     * @throws std::invalid_argument describing the first bad field.
     */
    void validate() const;
};

} // namespace unroll

#endif // UNROLL_INGEST_CONFIG_HPP
