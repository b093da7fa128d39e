#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <chrono>
#include <stdexcept>

std::set<std::string> Settings::origin_set() const {
    std::set<std::string> origins;
    std::string::size_type start = 0;
    while (start <= allowed_origins.size()) {
        const auto comma = allowed_origins.find(',', start);
        const auto end = comma == std::string::npos ? allowed_origins.size() : comma;
        std::string item = allowed_origins.substr(start, end - start);
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        while (!item.empty() && item.back() == '/') item.pop_back();
        if (!item.empty()) origins.insert(std::move(item));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return origins;
}

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Sources ---
    app.add_option("-u,--url", settings.urls,
                   "Repository URL to clone and ingest. (Can be used multiple times).");

    app.add_option("-z,--zip", settings.zips,
                   "Zip archive to ingest. (Can be used multiple times).")
                   ->check(CLI::ExistingFile);

    app.add_option("-o,--output", settings.output_path,
                   "Write the JSON report to PATH instead of stdout.");

    app.add_flag("--pretty", settings.pretty,
                 "Indent the JSON report.");

    // --- Server ---
    app.add_flag("--serve", settings.serve,
                 "Run the HTTP API instead of ingesting command line sources.");

    app.add_option("--host", settings.host,
                   "Address the HTTP API binds to.")
                   ->capture_default_str();

    app.add_option("--port", settings.port,
                   "Port the HTTP API listens on.")
                   ->envname("PORT")
                   ->capture_default_str()
                   ->check(CLI::Range(1, 65535));

    app.add_option("--allowed-origins", settings.allowed_origins,
                   "Comma separated CORS origins.")
                   ->envname("ALLOWED_ORIGINS")
                   ->capture_default_str();

    // --- General ---
    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress progress lines and console logging.");

    settings.num_threads = std::max(1U, std::thread::hardware_concurrency());
    app.add_option("--threads", settings.num_threads,
                   "Requests processed in parallel.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("INFO")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Append logs to FILE (default: no file logging).");

    // --- Ingestion limits ---
    app.add_option("--allowed-hosts", settings.allowed_hosts,
                   "Comma separated git hosts accepted in repository URLs.")
                   ->envname("ALLOWED_GIT_HOSTS")
                   ->capture_default_str();

    app.add_option("--max-zip-bytes", settings.max_zip_bytes,
                   "Largest accepted zip upload.")
                   ->envname("MAX_ZIP_BYTES")
                   ->capture_default_str()
                   ->check(CLI::PositiveNumber);

    app.add_option("--max-extract-bytes", settings.max_extract_bytes,
                   "Largest total uncompressed size of a zip.")
                   ->envname("MAX_EXTRACT_BYTES")
                   ->capture_default_str()
                   ->check(CLI::PositiveNumber);

    app.add_option("--max-file-bytes", settings.max_file_bytes,
                   "Files above this size are listed without content.")
                   ->envname("MAX_FILE_BYTES")
                   ->capture_default_str()
                   ->check(CLI::PositiveNumber);

    app.add_option("--clone-timeout", settings.clone_timeout_seconds,
                   "Seconds before a git clone is killed.")
                   ->envname("GIT_CLONE_TIMEOUT_SECONDS")
                   ->capture_default_str()
                   ->check(CLI::PositiveNumber);

    app.add_option("--binary-threshold", settings.binary_threshold,
                   "Share of non-text bytes above which a file counts as binary.")
                   ->envname("BINARY_THRESHOLD")
                   ->capture_default_str()
                   ->check(CLI::Range(0.0, 1.0));

    app.add_option("--max-depth", settings.max_depth,
                   "Directories nested deeper are listed but not walked.")
                   ->envname("MAX_TREE_DEPTH")
                   ->capture_default_str()
                   ->check(CLI::PositiveNumber);

    app.add_option("--git", settings.git_binary,
                   "git executable.")
                   ->envname("GIT_BINARY")
                   ->capture_default_str();

    app.add_option("--scratch-dir", settings.scratch_dir,
                   "Parent directory of per-request workspaces (default: system temp dir).")
                   ->envname("UNROLL_SCRATCH_DIR")
                   ->check(CLI::ExistingDirectory);

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        const bool has_sources = !settings.urls.empty() || !settings.zips.empty();
        if (settings.serve && has_sources) {
            throw CLI::ValidationError("--serve cannot be combined with --url or --zip.");
        }
        if (!settings.serve && !has_sources) {
            throw CLI::ValidationError("Provide at least one --url or --zip, or use --serve.");
        }
        if (settings.serve && !settings.output_path.empty()) {
            throw CLI::ValidationError("--output has no effect with --serve.");
        }

        unroll::IngestConfig& config = settings.config;
        config.allowed_hosts = unroll::IngestConfig::parse_host_list(settings.allowed_hosts);
        config.max_zip_bytes = settings.max_zip_bytes;
        config.max_extract_bytes = settings.max_extract_bytes;
        config.max_file_bytes = settings.max_file_bytes;
        config.clone_timeout = std::chrono::seconds(settings.clone_timeout_seconds);
        config.binary_threshold = settings.binary_threshold;
        config.max_depth = settings.max_depth;
        config.git_binary = settings.git_binary;
        config.scratch_root = settings.scratch_dir;
        try {
            config.validate();
        } catch (const std::invalid_argument& e) {
            throw CLI::ValidationError(e.what());
        }
    });
}
