/**
 * @file bounded_writer.hpp
 * @brief File writer that fails as soon as a byte ceiling is crossed.
 */

#ifndef UNROLL_BOUNDED_WRITER_HPP
#define UNROLL_BOUNDED_WRITER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <string_view>

namespace unroll {

/**
 * @brief Streams chunks to a file while enforcing a total size limit.
 *
 * @details The running total is checked before each chunk is written, so a
 * chunk that would cross the ceiling is never written and the caller learns
 * about it immediately (IngestError::PayloadTooLarge). The partially written
 * file is left for the owning workspace to remove.
 */
class BoundedFileWriter {
public:
    /**
     * @param path Destination file (truncated).
     * @param max_bytes Largest accepted total.
     * @throws IngestError (Internal) if the file cannot be opened.
     */
    BoundedFileWriter(const std::filesystem::path& path, std::uintmax_t max_bytes);

    /**
     * @brief Appends one chunk.
     * @throws IngestError (PayloadTooLarge) once the total exceeds the limit,
     *         IngestError (Internal) on a write error.
     */
    void write(std::string_view chunk);

    /**
     * @brief Copies an input stream in fixed-size chunks through write().
     * @param in Source stream, read until EOF.
     * @param chunk_size Bytes per read (default 1 MiB).
     */
    void copy_from(std::istream& in, std::size_t chunk_size = 1024 * 1024);

    /**
     * @brief Flushes and closes the file.
     * @throws IngestError (Internal) if the flush fails.
     */
    void close();

    [[nodiscard]] std::uintmax_t bytes_written() const noexcept { return total_; }
    [[nodiscard]] std::uintmax_t limit() const noexcept { return max_bytes_; }

private:
    std::filesystem::path path_;
    std::ofstream out_;
    std::uintmax_t max_bytes_;
    std::uintmax_t total_ = 0;
};

} // namespace unroll

#endif // UNROLL_BOUNDED_WRITER_HPP
