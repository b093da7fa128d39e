#include <catch2/catch.hpp>
#include "bounded_writer.hpp"
#include "ingest_error.hpp"
#include "test_support.hpp"

#include <sstream>

using namespace unroll;
using test_support::read_file;

TEST_CASE("BoundedFileWriter: accepts exactly the limit", "[bounded_writer]") {
    const ScratchWorkspace ws("test");
    const auto path = ws.path() / "out.bin";

    BoundedFileWriter writer(path, 8);
    writer.write("abcd");
    writer.write("efgh");
    writer.close();

    CHECK(writer.bytes_written() == 8);
    CHECK(read_file(path) == "abcdefgh");
}

TEST_CASE("BoundedFileWriter: fails before writing the chunk that crosses the limit", "[bounded_writer]") {
    const ScratchWorkspace ws("test");
    const auto path = ws.path() / "out.bin";

    BoundedFileWriter writer(path, 8);
    writer.write("abcdef");
    try {
        writer.write("ghi");
        FAIL("expected PayloadTooLarge");
    } catch (const IngestError& e) {
        CHECK(e.kind() == ErrorKind::PayloadTooLarge);
        CHECK(std::string(e.what()) == "Zip exceeds allowed size");
    }
    CHECK(writer.bytes_written() == 6);
    // still refuses afterwards
    CHECK_THROWS_AS(writer.write("xyz"), IngestError);
}

TEST_CASE("BoundedFileWriter: copy_from streams in chunks", "[bounded_writer]") {
    const ScratchWorkspace ws("test");
    const auto path = ws.path() / "out.bin";
    const std::string payload(10000, 'z');

    std::istringstream in(payload);
    BoundedFileWriter writer(path, payload.size());
    writer.copy_from(in, 333);
    writer.close();
    CHECK(read_file(path) == payload);

    std::istringstream too_big(payload + "!");
    BoundedFileWriter small(ws.path() / "small.bin", payload.size());
    CHECK_THROWS_AS(small.copy_from(too_big, 4096), IngestError);
}
