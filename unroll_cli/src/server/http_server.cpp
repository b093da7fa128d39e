#include "http_server.hpp"
#include "../../../libunroll/include/bounded_writer.hpp"
#include "../../../libunroll/include/file_utils.hpp"
#include "../../../libunroll/include/ingest_error.hpp"
#include "../../../libunroll/include/json_codec.hpp"
#include "../../../libunroll/include/logger.hpp"
#include "../../../libunroll/include/random_utils.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>

namespace unroll {

using nlohmann::json;

namespace {

constexpr std::string_view kTag = "http";
constexpr const char* kRequestIdHeader = "X-Request-ID";
constexpr std::size_t kMaxRequestIdLength = 128;
constexpr std::size_t kMaxFieldBytes = 8 * 1024;
// multipart boundaries and part headers on top of the archive itself
constexpr std::size_t kMultipartOverhead = 64 * 1024;

// handler and logger of one request run on the same worker thread
thread_local std::chrono::steady_clock::time_point t_request_start;

bool usable_request_id(const std::string& id) {
    if (id.empty() || id.size() > kMaxRequestIdLength)
        return false;
    return std::all_of(id.begin(), id.end(), [](const char c) {
        return c > 0x20 && c < 0x7f;
    });
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

void send_json(httplib::Response& res, const int status, const json& body) {
    res.status = status;
    res.set_content(dump_json(body), "application/json");
}

void send_error(httplib::Response& res, const ErrorKind kind, const std::string& message) {
    send_json(res, http_status(kind), error_to_json(kind, message));
}

/// State of one multipart upload while it is being received. After the
/// first failure the rest of the body is read and discarded, so the client
/// gets the error status instead of a reset connection.
struct ParseForm {
    std::string current_field;
    std::string repo_url;
    bool repo_url_seen = false;
    std::optional<std::string> zip_filename;
    std::unique_ptr<BoundedFileWriter> zip_writer;
    std::optional<IngestError> failure;
};

} // namespace

HttpServer::HttpServer(const IngestService& service, ServerOptions options)
    : service_(service), options_(std::move(options)), server_(std::make_unique<httplib::Server>()) {
    const unsigned threads = options_.threads == 0 ? 1 : options_.threads;
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    server_->set_payload_max_length(service_.config().max_zip_bytes + kMultipartOverhead);
    setup_routes();
}

HttpServer::~HttpServer() = default;

bool HttpServer::listen() {
    Logger::log(LogLevel::Info,
        "Listening on " + options_.host + ":" + std::to_string(options_.port), kTag);
    return server_->listen(options_.host, options_.port);
}

int HttpServer::bind_to_any_port() {
    return server_->bind_to_any_port(options_.host);
}

bool HttpServer::listen_after_bind() {
    return server_->listen_after_bind();
}

bool HttpServer::is_running() const {
    return server_->is_running();
}

void HttpServer::stop() {
    server_->stop();
}

void HttpServer::setup_routes() {
    // request id, CORS and timing for every request
    server_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        t_request_start = std::chrono::steady_clock::now();

        std::string request_id = trim(req.get_header_value(kRequestIdHeader));
        if (!usable_request_id(request_id)) {
            request_id = RandomUtils::random_suffix();
        }
        res.set_header(kRequestIdHeader, request_id);

        const std::string origin = req.get_header_value("Origin");
        if (!origin.empty() && options_.allowed_origins.contains(origin)) {
            res.set_header("Access-Control-Allow-Origin", origin);
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type, X-Request-ID");
            res.set_header("Access-Control-Expose-Headers", "X-Request-ID");
            res.set_header("Vary", "Origin");
        }
        return httplib::Server::HandlerResponse::Unhandled;
    });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        const auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - t_request_start);
        const json line{
            {"event", "request"},
            {"request_id", res.get_header_value(kRequestIdHeader)},
            {"method", req.method},
            {"path", req.path},
            {"status_code", res.status},
            {"duration_ms", std::round(elapsed.count() * 100.0) / 100.0},
            {"client", req.remote_addr},
        };
        Logger::log(res.status >= 500 ? LogLevel::Error : LogLevel::Info, dump_json(line), kTag);
    });

    server_->Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    server_->Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, json{{"status", "ok"}});
    });

    server_->Post("/parse", [this](const httplib::Request& req,
                                   httplib::Response& res,
                                   const httplib::ContentReader& content_reader) {
        if (!req.is_multipart_form_data()) {
            send_error(res, ErrorKind::InvalidInput, "Expected multipart/form-data");
            return;
        }

        try {
            const ScratchWorkspace staging("upload", service_.config().scratch_root);
            const auto staged_zip = staging.path() / "upload.zip";
            ParseForm form;

            const bool complete = content_reader(
                [&](const httplib::MultipartFormData& part) {
                    if (form.failure)
                        return true;
                    form.current_field = part.name;
                    if (part.name == "zipFile" && !part.filename.empty()) {
                        if (form.zip_writer) {
                            form.failure.emplace(ErrorKind::InvalidInput, "Upload a single zipFile");
                            return true;
                        }
                        try {
                            form.zip_writer = std::make_unique<BoundedFileWriter>(
                                staged_zip, service_.config().max_zip_bytes);
                        } catch (const IngestError& e) {
                            form.failure.emplace(e);
                            return true;
                        }
                        form.zip_filename = part.filename;
                    } else if (part.name == "repoUrl") {
                        form.repo_url_seen = true;
                    }
                    return true;
                },
                [&](const char* data, const std::size_t length) {
                    if (form.failure)
                        return true;
                    try {
                        if (form.current_field == "zipFile" && form.zip_writer) {
                            form.zip_writer->write(std::string_view(data, length));
                        } else if (form.current_field == "repoUrl") {
                            if (form.repo_url.size() + length > kMaxFieldBytes) {
                                form.failure.emplace(ErrorKind::InvalidInput, "Repo URL is too long");
                                return true;
                            }
                            form.repo_url.append(data, length);
                        }
                    } catch (const IngestError& e) {
                        form.failure.emplace(e);
                    }
                    return true;
                });

            if (form.failure) {
                send_error(res, form.failure->kind(), form.failure->what());
                return;
            }
            if (!complete) {
                send_error(res, ErrorKind::InvalidInput, "Malformed multipart body");
                return;
            }

            IngestRequest request;
            const std::string repo_url = trim(form.repo_url);
            if (form.repo_url_seen && !repo_url.empty()) {
                request.repo_url = repo_url;
            }
            if (form.zip_writer) {
                form.zip_writer->close();
                request.archive = ArchiveUpload::staged(*form.zip_filename, staged_zip);
            }

            const IngestResult result = service_.ingest(request);
            send_json(res, 200, json(result));
        } catch (const IngestError& e) {
            send_error(res, e.kind(), e.what());
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Error, std::string("Unhandled error in /parse: ") + e.what(), kTag);
            send_error(res, ErrorKind::Internal, "Internal server error");
        }
    });
}

} // namespace unroll
