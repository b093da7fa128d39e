#include <catch2/catch.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "server/http_server.hpp"
#include "test_support.hpp"

#include <chrono>
#include <thread>

using namespace unroll;
using namespace test_support;
using nlohmann::json;

namespace {

/// Runs an HttpServer on an ephemeral port for the lifetime of the object.
class RunningServer {
public:
    RunningServer(const IngestService& service, ServerOptions options)
        : server_(service, std::move(options)) {
        port_ = server_.bind_to_any_port();
        if (port_ > 0) {
            thread_ = std::thread([this] { server_.listen_after_bind(); });
            for (int i = 0; i < 200 && !server_.is_running(); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
    }

    ~RunningServer() {
        server_.stop();
        if (thread_.joinable()) thread_.join();
    }

    [[nodiscard]] int port() const { return port_; }

private:
    HttpServer server_;
    int port_ = -1;
    std::thread thread_;
};

} // namespace

TEST_CASE("HttpServer: parse endpoint", "[http]") {
    const ScratchWorkspace scratch("test");
    IngestConfig config;
    config.scratch_root = scratch.path();
    FakeCloner cloner([](const fs::path& dest) { write_file(dest / "README.md", "# cloned"); });
    const IngestService service(config, cloner);

    ServerOptions options;
    options.allowed_origins = {"http://localhost:3000"};
    options.threads = 2;
    RunningServer running(service, options);
    REQUIRE(running.port() > 0);

    httplib::Client client("127.0.0.1", running.port());

    SECTION("health probe carries a request id") {
        const auto res = client.Get("/healthz");
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(json::parse(res->body) == json{{"status", "ok"}});
        CHECK_FALSE(res->get_header_value("X-Request-ID").empty());

        const auto echoed = client.Get("/healthz", httplib::Headers{{"X-Request-ID", "req-42"}});
        REQUIRE(echoed);
        CHECK(echoed->get_header_value("X-Request-ID") == "req-42");
    }

    SECTION("repository url") {
        const httplib::MultipartFormDataItems items{{"repoUrl", "https://github.com/a/b", "", ""}};
        const auto res = client.Post("/parse", items);
        REQUIRE(res);
        CHECK(res->status == 200);
        const auto body = json::parse(res->body);
        REQUIRE(body["files"].size() == 1);
        CHECK(body["files"][0]["path"] == "README.md");
        CHECK(body["files"][0]["content"] == "# cloned");
    }

    SECTION("rejected url maps to 400 with a detail") {
        const httplib::MultipartFormDataItems items{{"repoUrl", "https://gitlab.com/a/b", "", ""}};
        const auto res = client.Post("/parse", items);
        REQUIRE(res);
        CHECK(res->status == 400);
        CHECK(json::parse(res->body)["detail"] == "Repo host is not allowed");
    }

    SECTION("zip upload") {
        const auto zip = scratch.path() / "fixture.zip";
        write_zip(zip, {zip_file("src/main.txt", "hello"), zip_file("node_modules/x.txt", "x")});
        const std::string bytes = read_file(zip);
        fs::remove(zip);

        const httplib::MultipartFormDataItems items{{"zipFile", bytes, "repo.zip", "application/zip"}};
        const auto res = client.Post("/parse", items);
        REQUIRE(res);
        CHECK(res->status == 200);
        const auto body = json::parse(res->body);
        REQUIRE(body["files"].size() == 1);
        CHECK(body["files"][0]["path"] == "src/main.txt");
        CHECK(body["tree"][0]["name"] == "src");
    }

    SECTION("both sources are refused") {
        const httplib::MultipartFormDataItems items{
            {"repoUrl", "https://github.com/a/b", "", ""},
            {"zipFile", "PK", "repo.zip", "application/zip"},
        };
        const auto res = client.Post("/parse", items);
        REQUIRE(res);
        CHECK(res->status == 400);
    }

    SECTION("non-multipart body is refused") {
        const auto res = client.Post("/parse", R"({"repoUrl":"https://github.com/a/b"})", "application/json");
        REQUIRE(res);
        CHECK(res->status == 400);
    }

    SECTION("CORS preflight for allowed and unknown origins") {
        const auto allowed = client.Options("/parse", httplib::Headers{{"Origin", "http://localhost:3000"}});
        REQUIRE(allowed);
        CHECK(allowed->status == 204);
        CHECK(allowed->get_header_value("Access-Control-Allow-Origin") == "http://localhost:3000");
        CHECK_FALSE(allowed->has_header("Access-Control-Allow-Credentials"));

        const auto unknown = client.Options("/parse", httplib::Headers{{"Origin", "http://evil.example"}});
        REQUIRE(unknown);
        CHECK_FALSE(unknown->has_header("Access-Control-Allow-Origin"));
    }
}

TEST_CASE("HttpServer: upload and field limits", "[http]") {
    const ScratchWorkspace scratch("test");
    IngestConfig config;
    config.scratch_root = scratch.path();
    config.max_zip_bytes = 1024;
    FakeCloner cloner([](const fs::path&) {});
    const IngestService service(config, cloner);

    ServerOptions options;
    options.threads = 2;
    RunningServer running(service, options);
    REQUIRE(running.port() > 0);

    httplib::Client client("127.0.0.1", running.port());

    SECTION("zip part above the ceiling is refused with 413") {
        const httplib::MultipartFormDataItems items{
            {"zipFile", std::string(4096, 'z'), "big.zip", "application/zip"}};
        const auto res = client.Post("/parse", items);
        REQUIRE(res);
        CHECK(res->status == 413);
        CHECK(json::parse(res->body)["detail"] == "Zip exceeds allowed size");
        CHECK(cloner.urls().empty());
    }

    SECTION("zip part within the ceiling is ingested") {
        const auto zip = scratch.path() / "small.zip";
        write_zip(zip, {zip_file("a.txt", "a")});
        const std::string bytes = read_file(zip);
        fs::remove(zip);
        REQUIRE(bytes.size() <= config.max_zip_bytes);

        const httplib::MultipartFormDataItems items{{"zipFile", bytes, "small.zip", "application/zip"}};
        const auto res = client.Post("/parse", items);
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(json::parse(res->body)["files"][0]["content"] == "a");
    }

    SECTION("oversized repoUrl field is refused with 400") {
        const std::string url = "https://github.com/a/" + std::string(9000, 'b');
        const httplib::MultipartFormDataItems items{{"repoUrl", url, "", ""}};
        const auto res = client.Post("/parse", items);
        REQUIRE(res);
        CHECK(res->status == 400);
        CHECK(json::parse(res->body)["detail"] == "Repo URL is too long");
        CHECK(cloner.urls().empty());
    }

    // staging and ingestion workspaces are gone once the response is sent
    CHECK(count_entries(scratch.path()) == 0);
}
