#include "../../include/bounded_writer.hpp"
#include "../../include/ingest_error.hpp"
#include "../../include/logger.hpp"

#include <string>
#include <vector>

namespace unroll {

BoundedFileWriter::BoundedFileWriter(const std::filesystem::path& path, const std::uintmax_t max_bytes)
    : path_(path), out_(path, std::ios::binary | std::ios::trunc), max_bytes_(max_bytes) {
    if (!out_) {
        throw IngestError(ErrorKind::Internal, "open for write failed: " + path.string());
    }
}

void BoundedFileWriter::write(const std::string_view chunk) {
    if (chunk.size() > max_bytes_ - total_) {
        Logger::log(LogLevel::Warning,
            "Upload exceeds " + std::to_string(max_bytes_) + " bytes, aborting stream", "BoundedFileWriter");
        throw IngestError(ErrorKind::PayloadTooLarge, "Zip exceeds allowed size");
    }
    if (chunk.empty())
        return;
    out_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    if (!out_) {
        throw IngestError(ErrorKind::Internal, "write failed: " + path_.string());
    }
    total_ += chunk.size();
}

void BoundedFileWriter::copy_from(std::istream& in, const std::size_t chunk_size) {
    std::vector<char> buffer(chunk_size);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = in.gcount();
        if (got > 0) {
            write(std::string_view(buffer.data(), static_cast<std::size_t>(got)));
        }
    }
    if (in.bad()) {
        throw IngestError(ErrorKind::Internal, "read failed while copying upload");
    }
}

void BoundedFileWriter::close() {
    out_.flush();
    if (!out_) {
        throw IngestError(ErrorKind::Internal, "flush failed: " + path_.string());
    }
    out_.close();
}

} // namespace unroll
