/**
 * @file http_server.hpp
 * @brief HTTP front end of the ingestion service.
 */

#ifndef UNROLL_HTTP_SERVER_HPP
#define UNROLL_HTTP_SERVER_HPP

#include "../../../libunroll/include/ingest_service.hpp"
#include <memory>
#include <set>
#include <string>

namespace httplib { class Server; }

namespace unroll {

struct ServerOptions {
    std::string host = "127.0.0.1";
    int port = 8000;
    std::set<std::string> allowed_origins; ///< Exact Origin values granted CORS access
    unsigned threads = 4;                  ///< Concurrent request handlers
};

/**
 * @brief cpp-httplib server exposing IngestService.
 *
 * @details Routes:
 * - `POST /parse`: multipart form with a `repoUrl` field or a `zipFile`
 *   file part. The file part is streamed to disk through a
 *   BoundedFileWriter, so an oversized upload is refused with 413 as soon
 *   as it crosses the ceiling. Responds with `{files, tree}` or
 *   `{"detail": ...}` and the status mapped from the ErrorKind.
 * - `GET /healthz`: liveness probe.
 * - `OPTIONS *`: CORS preflight.
 *
 * Every response carries `X-Request-ID` (echoed from the request or newly
 * generated) and one JSON access-log line is emitted per request.
 */
class HttpServer {
public:
    HttpServer(const IngestService& service, ServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Binds to options.host:options.port and serves until stop().
    bool listen();

    /// Binds to a free port on options.host and returns it (-1 on failure).
    int bind_to_any_port();

    /// Serves on the socket bound by bind_to_any_port() until stop().
    bool listen_after_bind();

    [[nodiscard]] bool is_running() const;

    void stop();

private:
    void setup_routes();

    const IngestService& service_;
    ServerOptions options_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace unroll

#endif // UNROLL_HTTP_SERVER_HPP
