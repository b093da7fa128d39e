#include <catch2/catch.hpp>
#include "archive_sanitizer.hpp"
#include "ingest_error.hpp"
#include "test_support.hpp"

using namespace unroll;
using namespace test_support;

namespace {

std::string rejection(const fs::path& zip, const fs::path& dest, const std::uintmax_t max_total = 1 << 20) {
    try {
        ArchiveSanitizer::extract(zip, dest, max_total);
    } catch (const IngestError& e) {
        CHECK(e.kind() == ErrorKind::ArchiveRejected);
        return e.what();
    }
    return {};
}

} // namespace

TEST_CASE("ArchiveSanitizer: extracts a well-formed zip", "[sanitizer]") {
    const ScratchWorkspace ws("test");
    const auto zip = ws.path() / "ok.zip";
    const auto dest = ws.path() / "project";
    fs::create_directories(dest);
    write_zip(zip, {
        zip_dir("src/"),
        zip_file("src/main.txt", "hello"),
        zip_file("README.md", "# readme\n"),
        zip_file("empty.txt", ""),
    });

    const auto members = ArchiveSanitizer::list_members(zip);
    REQUIRE(members.size() == 4);
    CHECK(members[0].type == MemberType::Directory);
    CHECK(members[1].declared_size == 5);

    ArchiveSanitizer::extract(zip, dest, 1 << 20);
    CHECK(read_file(dest / "src" / "main.txt") == "hello");
    CHECK(read_file(dest / "README.md") == "# readme\n");
    CHECK(fs::is_regular_file(dest / "empty.txt"));
}

TEST_CASE("ArchiveSanitizer: symlink member rejects the whole archive", "[sanitizer]") {
    const ScratchWorkspace ws("test");
    const auto zip = ws.path() / "link.zip";
    const auto dest = ws.path() / "project";
    fs::create_directories(dest);
    write_zip(zip, {
        zip_file("a.txt", "first"),
        zip_symlink("evil", "/etc/passwd"),
    });

    CHECK(rejection(zip, dest) == "Zip contains symlinks");
    CHECK(fs::is_empty(dest));
}

TEST_CASE("ArchiveSanitizer: traversal names are rejected before anything is written", "[sanitizer]") {
    const ScratchWorkspace ws("test");
    const auto dest = ws.path() / "project";
    fs::create_directories(dest);

    SECTION("parent references") {
        const auto zip = ws.path() / "dotdot.zip";
        write_zip(zip, {zip_file("ok.txt", "fine"), zip_file("../../etc/passwd", "root:x:0:0")});
        CHECK(rejection(zip, dest) == "Zip contains invalid paths");
    }
    SECTION("absolute path") {
        const auto zip = ws.path() / "abs.zip";
        write_zip(zip, {zip_file("ok.txt", "fine"), zip_file("/tmp/owned.txt", "x")});
        CHECK(rejection(zip, dest) == "Zip contains invalid paths");
    }
    SECTION("dot-dot hidden in the middle") {
        const auto zip = ws.path() / "middle.zip";
        write_zip(zip, {zip_file("ok.txt", "fine"), zip_file("a/../../escape.txt", "x")});
        CHECK(rejection(zip, dest) == "Zip contains invalid paths");
    }

    CHECK(fs::is_empty(dest));
    CHECK_FALSE(fs::exists(ws.path() / "escape.txt"));
}

TEST_CASE("ArchiveSanitizer: declared size above the ceiling fails with a tiny archive", "[sanitizer]") {
    const ScratchWorkspace ws("test");
    const auto zip = ws.path() / "bomb.zip";
    const auto dest = ws.path() / "project";
    fs::create_directories(dest);
    write_zip(zip, {zip_file("zeros.bin", std::string(4 * 1024 * 1024, '\0'))}, true);

    REQUIRE(fs::file_size(zip) < 64 * 1024);
    CHECK(rejection(zip, dest, 1024 * 1024) == "Zip exceeds allowed total size");
    CHECK(fs::is_empty(dest));
}

TEST_CASE("ArchiveSanitizer: sizes are summed across members", "[sanitizer]") {
    const ScratchWorkspace ws("test");
    const auto zip = ws.path() / "sum.zip";
    const auto dest = ws.path() / "project";
    fs::create_directories(dest);
    write_zip(zip, {zip_file("a", std::string(600, 'a')), zip_file("b", std::string(600, 'b'))});

    CHECK(rejection(zip, dest, 1000) == "Zip exceeds allowed total size");
    CHECK(fs::is_empty(dest));
    CHECK_NOTHROW(ArchiveSanitizer::extract(zip, dest, 1200));
}

TEST_CASE("ArchiveSanitizer: non-zip input is rejected", "[sanitizer]") {
    const ScratchWorkspace ws("test");
    const auto bogus = ws.path() / "bogus.zip";
    write_file(bogus, "this is not an archive at all");
    const auto dest = ws.path() / "project";
    fs::create_directories(dest);

    const std::string message = rejection(bogus, dest);
    CHECK(message.rfind("Invalid zip archive", 0) == 0);
}

TEST_CASE("ArchiveSanitizer: resolve_member_path", "[sanitizer]") {
    const fs::path root = "/srv/work/project";

    CHECK(ArchiveSanitizer::resolve_member_path("a/b.txt", root) == fs::path("/srv/work/project/a/b.txt"));
    CHECK(ArchiveSanitizer::resolve_member_path("a/./b/../c.txt", root) == fs::path("/srv/work/project/a/c.txt"));
    CHECK(ArchiveSanitizer::resolve_member_path("dir/", root) == fs::path("/srv/work/project/dir"));
    CHECK(ArchiveSanitizer::resolve_member_path("a\\b.txt", root) == fs::path("/srv/work/project/a/b.txt"));

    CHECK_FALSE(ArchiveSanitizer::resolve_member_path("", root));
    CHECK_FALSE(ArchiveSanitizer::resolve_member_path("../x", root));
    CHECK_FALSE(ArchiveSanitizer::resolve_member_path("..\\..\\x", root));
    CHECK_FALSE(ArchiveSanitizer::resolve_member_path("/etc/passwd", root));
    CHECK_FALSE(ArchiveSanitizer::resolve_member_path("../project2/x", root));
}
