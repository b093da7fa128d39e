#include <catch2/catch.hpp>
#include "ingest_error.hpp"
#include "ingest_service.hpp"
#include "test_support.hpp"

using namespace unroll;
using namespace test_support;

namespace {

struct Fixture {
    ScratchWorkspace scratch{"test"};   // parent of every ingestion workspace
    ScratchWorkspace inputs{"inputs"};  // fixtures live outside the scratch root
    IngestConfig config;

    Fixture() { config.scratch_root = scratch.path(); }

    [[nodiscard]] bool scratch_is_clean() const { return fs::is_empty(scratch.path()); }
};

ErrorKind failure_kind(const IngestService& service, const IngestRequest& request) {
    try {
        (void)service.ingest(request);
    } catch (const IngestError& e) {
        return e.kind();
    }
    FAIL("expected ingest to fail");
    return ErrorKind::Internal;
}

} // namespace

TEST_CASE("IngestService: zip upload end to end", "[service]") {
    Fixture fx;
    FakeCloner cloner([](const fs::path&) {});
    const IngestService service(fx.config, cloner);

    const auto zip = fx.inputs.path() / "repo.zip";
    write_zip(zip, {
        zip_file("src/main.txt", "hello"),
        zip_file("node_modules/x.txt", "dependency"),
    });

    const auto result = service.ingest(IngestRequest{std::nullopt, ArchiveUpload::from_file(zip)});

    REQUIRE(result.files.size() == 1);
    CHECK(result.files[0].path == "src/main.txt");
    CHECK(result.files[0].size == 5);
    CHECK_FALSE(result.files[0].omitted());
    CHECK(result.files[0].content == std::string("hello"));

    REQUIRE(result.tree.size() == 1);
    CHECK(result.tree[0].name == "src");
    CHECK(result.tree[0].type == NodeType::Directory);
    CHECK(fx.scratch_is_clean());
}

TEST_CASE("IngestService: zip with a symlink member is rejected and leaves nothing behind", "[service]") {
    Fixture fx;
    FakeCloner cloner([](const fs::path&) {});
    const IngestService service(fx.config, cloner);

    const auto zip = fx.inputs.path() / "repo.zip";
    write_zip(zip, {
        zip_file("src/main.txt", "hello"),
        zip_file("node_modules/x.txt", "dependency"),
        zip_symlink("src/link", "../../../etc/passwd"),
    });

    CHECK(failure_kind(service, IngestRequest{std::nullopt, ArchiveUpload::from_file(zip)})
          == ErrorKind::ArchiveRejected);
    CHECK(fx.scratch_is_clean());
}

TEST_CASE("IngestService: exactly one source is required", "[service]") {
    Fixture fx;
    FakeCloner cloner([](const fs::path& dest) { write_file(dest / "a.txt", "a"); });
    const IngestService service(fx.config, cloner);

    const auto zip = fx.inputs.path() / "repo.zip";
    write_zip(zip, {zip_file("a.txt", "a")});

    CHECK(failure_kind(service, IngestRequest{}) == ErrorKind::InvalidInput);
    CHECK(failure_kind(service, IngestRequest{"https://github.com/a/b", ArchiveUpload::from_file(zip)})
          == ErrorKind::InvalidInput);
    CHECK(cloner.urls().empty());
    CHECK(fx.scratch_is_clean());
}

TEST_CASE("IngestService: invalid url fails before any workspace exists", "[service]") {
    Fixture fx;
    FakeCloner cloner([](const fs::path&) {});
    const IngestService service(fx.config, cloner);

    CHECK(failure_kind(service, IngestRequest{"https://evil.example/a/b", std::nullopt}) == ErrorKind::InvalidInput);
    CHECK(failure_kind(service, IngestRequest{"https://user:pw@github.com/a/b", std::nullopt}) == ErrorKind::InvalidInput);
    CHECK(cloner.urls().empty());
    CHECK(fx.scratch_is_clean());
}

TEST_CASE("IngestService: clone path collects without .git", "[service]") {
    Fixture fx;
    FakeCloner cloner([](const fs::path& dest) {
        write_file(dest / ".git" / "config", "[core]");
        write_file(dest / "README.md", "# hi");
        write_file(dest / "docs" / "guide.md", "guide");
    });
    const IngestService service(fx.config, cloner);

    const auto result = service.ingest(IngestRequest{"https://github.com/octo/repo.git", std::nullopt});

    CHECK(cloner.urls() == std::vector<std::string>{"https://github.com/octo/repo.git"});
    REQUIRE(result.files.size() == 2);
    CHECK(result.files[0].path == "README.md");
    CHECK(result.files[1].path == "docs/guide.md");
    CHECK(fx.scratch_is_clean());
}

TEST_CASE("IngestService: clone failure cleans up the workspace", "[service]") {
    Fixture fx;
    FakeCloner cloner([](const fs::path& dest) {
        write_file(dest / "partial.txt", "half a clone");
        throw IngestError(ErrorKind::AcquisitionFailed, "fatal: could not read from remote");
    });
    const IngestService service(fx.config, cloner);

    CHECK(failure_kind(service, IngestRequest{"https://github.com/a/b", std::nullopt}) == ErrorKind::AcquisitionFailed);
    CHECK(fx.scratch_is_clean());
}

TEST_CASE("IngestService: unexpected exceptions become Internal errors", "[service]") {
    Fixture fx;
    FakeCloner cloner([](const fs::path&) { throw std::runtime_error("disk on fire"); });
    const IngestService service(fx.config, cloner);

    try {
        (void)service.ingest(IngestRequest{"https://github.com/a/b", std::nullopt});
        FAIL("expected Internal");
    } catch (const IngestError& e) {
        CHECK(e.kind() == ErrorKind::Internal);
        CHECK(std::string(e.what()).find("disk on fire") == std::string::npos);
    }
    CHECK(fx.scratch_is_clean());
}

TEST_CASE("IngestService: oversized upload is PayloadTooLarge", "[service]") {
    Fixture fx;
    fx.config.max_zip_bytes = 128;
    FakeCloner cloner([](const fs::path&) {});
    const IngestService service(fx.config, cloner);

    const auto zip = fx.inputs.path() / "big.zip";
    write_zip(zip, {zip_file("big.txt", std::string(4096, 'q'))});

    CHECK(failure_kind(service, IngestRequest{std::nullopt, ArchiveUpload::from_file(zip)})
          == ErrorKind::PayloadTooLarge);
    CHECK(fx.scratch_is_clean());
}
