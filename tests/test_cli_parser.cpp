#include <catch2/catch.hpp>
#include <CLI/CLI.hpp>
#include "cli/cli_parser.hpp"

#include <cstdlib>

TEST_CASE("CLI: sources and limits map onto the ingestion config", "[cli]") {
    CLI::App app;
    Settings settings;
    setup_cli_parser(app, settings);

    app.parse("--url https://github.com/a/b --url https://github.com/c/d --max-file-bytes 100 "
              "--allowed-hosts GitHub.com,git.example.org --clone-timeout 5 --pretty");

    CHECK(settings.urls.size() == 2);
    CHECK(settings.pretty);
    CHECK(settings.config.max_file_bytes == 100);
    CHECK(settings.config.clone_timeout == std::chrono::seconds(5));
    CHECK(settings.config.allowed_hosts == std::set<std::string>{"github.com", "git.example.org"});
}

TEST_CASE("CLI: limits fall back to environment variables", "[cli]") {
    ::setenv("MAX_FILE_BYTES", "1234", 1);
    ::setenv("GIT_CLONE_TIMEOUT_SECONDS", "7", 1);

    CLI::App app;
    Settings settings;
    setup_cli_parser(app, settings);
    app.parse("--url https://github.com/a/b");

    ::unsetenv("MAX_FILE_BYTES");
    ::unsetenv("GIT_CLONE_TIMEOUT_SECONDS");

    CHECK(settings.config.max_file_bytes == 1234);
    CHECK(settings.config.clone_timeout == std::chrono::seconds(7));
    CHECK(settings.config.max_zip_bytes == 50ull * 1024 * 1024);
}

TEST_CASE("CLI: mode cross-checks", "[cli]") {
    SECTION("no source and no server") {
        CLI::App app;
        Settings settings;
        setup_cli_parser(app, settings);
        CHECK_THROWS_AS(app.parse(""), CLI::ValidationError);
    }
    SECTION("server with sources") {
        CLI::App app;
        Settings settings;
        setup_cli_parser(app, settings);
        CHECK_THROWS_AS(app.parse("--serve --url https://github.com/a/b"), CLI::ValidationError);
    }
    SECTION("server alone") {
        CLI::App app;
        Settings settings;
        setup_cli_parser(app, settings);
        CHECK_NOTHROW(app.parse("--serve --port 9090"));
        CHECK(settings.serve);
        CHECK(settings.port == 9090);
    }
}

TEST_CASE("CLI: origin list is trimmed", "[cli]") {
    Settings settings;
    settings.allowed_origins = " http://a.example/, http://b.example ,,";
    CHECK(settings.origin_set() == std::set<std::string>{"http://a.example", "http://b.example"});
}
