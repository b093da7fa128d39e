#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"
#include "report/report_writer.hpp"
#include "server/http_server.hpp"
#include "../../libunroll/include/batch_executor.hpp"
#include "../../libunroll/include/cloner.hpp"
#include "../../libunroll/include/event_bus.hpp"
#include "../../libunroll/include/events.hpp"
#include "../../libunroll/include/ingest_error.hpp"
#include "../../libunroll/include/ingest_service.hpp"
#include "../../libunroll/include/logger.hpp"
#include "../utils/console_log_sink.hpp"
#include "../utils/file_log_sink.hpp"

using namespace unroll;

static std::atomic<bool> interrupted{false};
static BatchExecutor* g_executor = nullptr;
static HttpServer* g_server = nullptr;

// handle ctrl+c or termination signals
void signal_handler(const int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        interrupted.store(true);
        if (g_executor) {
            g_executor->request_stop();
        }
        if (g_server) {
            g_server->stop();
        }
    }
}

static void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    if (!settings.log_file.empty()) {
        auto file_sink = std::make_unique<FileLogSink>(settings.log_file);
        if (!file_sink->is_open()) {
            std::cerr << "Cannot open log file: " << settings.log_file << std::endl;
        } else {
            Logger::add_sink(std::move(file_sink));
        }
    }

    if (settings.quiet) return;
    if (const auto level = Logger::string_to_level(settings.log_level)) {
        auto console_sink = std::make_unique<ConsoleLogSink>();
        console_sink->log_level = *level;
        Logger::add_sink(std::move(console_sink));
    }
}

static int run_server(const Settings& settings, const IngestService& service) {
    ServerOptions options;
    options.host = settings.host;
    options.port = settings.port;
    options.allowed_origins = settings.origin_set();
    options.threads = settings.num_threads;

    HttpServer server(service, std::move(options));
    g_server = &server;
    const bool ok = server.listen();
    g_server = nullptr;

    if (interrupted.load()) {
        return 130;
    }
    if (!ok) {
        Logger::log(LogLevel::Error,
            "Cannot listen on " + settings.host + ":" + std::to_string(settings.port), "main");
        return 1;
    }
    return 0;
}

static int run_batch(const Settings& settings, const IngestService& service) {
    std::vector<IngestRequest> requests;
    for (const auto& url : settings.urls) {
        requests.push_back(IngestRequest{url, std::nullopt});
    }
    for (const auto& zip : settings.zips) {
        requests.push_back(IngestRequest{std::nullopt, ArchiveUpload::from_file(zip)});
    }

    EventBus bus;
    if (!settings.quiet) {
        bus.subscribe<IngestStartEvent>([](const IngestStartEvent& e) {
            std::cerr << "[START] " << e.source << std::endl;
        });
        bus.subscribe<IngestCompleteEvent>([](const IngestCompleteEvent& e) {
            std::cerr << "[DONE] " << e.source << " (" << e.file_count << " files, "
                      << e.omitted_count << " omitted, " << e.duration.count() << " ms)" << std::endl;
        });
    }
    bus.subscribe<IngestErrorEvent>([](const IngestErrorEvent& e) {
        Logger::log(LogLevel::Error, e.source + ": " + e.error_message, "main");
    });

    BatchExecutor executor(service, bus, settings.num_threads);
    g_executor = &executor;
    const auto outcomes = executor.run(requests);
    g_executor = nullptr;

    if (interrupted.load()) {
        return 130; // standard exit code for SIGINT
    }

    if (outcomes.size() == 1 && !outcomes.front().ok()) {
        std::cerr << "Error: " << outcomes.front().error_message << std::endl;
        return 1;
    }
    write_report(build_report(outcomes), settings.output_path, settings.pretty);

    const bool all_ok = std::all_of(outcomes.begin(), outcomes.end(),
                                    [](const IngestOutcome& o) { return o.ok(); });
    return all_ok ? 0 : 1;
}

int main(int argc, char* argv[]) {
    CLI::App app{"unroll: turns a git repository or zip archive into a JSON file tree."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp& e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion& e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    setup_logging(settings);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        GitCloner cloner(settings.config.git_binary);
        const IngestService service(settings.config, cloner);
        return settings.serve ? run_server(settings, service) : run_batch(settings, service);
    } catch (const IngestError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Fatal: ") + e.what(), "main");
        return 1;
    }
}
