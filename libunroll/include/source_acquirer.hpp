/**
 * @file source_acquirer.hpp
 * @brief Materializes an untrusted source into a scratch directory.
 */

#ifndef UNROLL_SOURCE_ACQUIRER_HPP
#define UNROLL_SOURCE_ACQUIRER_HPP

#include "cloner.hpp"
#include "ingest_config.hpp"
#include "repo_url.hpp"
#include <filesystem>
#include <istream>
#include <memory>
#include <string>

namespace unroll {

/**
 * @brief An uploaded archive: client-supplied filename plus either its byte
 * stream or the path of a copy the caller already wrote to disk.
 */
struct ArchiveUpload {
    std::string filename;
    std::shared_ptr<std::istream> stream;
    std::filesystem::path staged_path; ///< Set when the bytes are already on disk

    /**
     * @brief Wraps an archive already staged by the caller; it is extracted
     * in place instead of being copied. The file must outlive the ingestion.
     */
    static ArchiveUpload staged(std::string filename, std::filesystem::path path);

    /**
     * @brief Opens a file on disk as an upload.
     * @throws IngestError (InvalidInput) if the file cannot be opened.
     */
    static ArchiveUpload from_file(const std::filesystem::path& path);
};

/**
 * @brief Fills a destination directory from a repository URL or an upload.
 *
 * @details Two mutually exclusive strategies; choosing between them is the
 * caller's job. Both leave only repository content in `destination`: the
 * clone strategy strips the `.git` directory, the upload strategy writes the
 * raw archive next to (not inside) the destination.
 */
class SourceAcquirer {
public:
    SourceAcquirer(const IngestConfig& config, ICloner& cloner);

    /**
     * @brief Bounded shallow clone into `destination` (must not exist).
     * @throws IngestError (AcquisitionFailed, AcquisitionTimeout).
     */
    void clone(const RepoUrl& url, const std::filesystem::path& destination) const;

    /**
     * @brief Streams the upload to `archive_path` under the zip ceiling, then
     * sanitizes and extracts it into `destination`. A staged upload is only
     * size-checked and extracted from where it lies; `archive_path` is unused.
     * @throws IngestError (InvalidInput, PayloadTooLarge, ArchiveRejected).
     */
    void receive_upload(const ArchiveUpload& upload,
                        const std::filesystem::path& archive_path,
                        const std::filesystem::path& destination) const;

private:
    const IngestConfig& config_;
    ICloner& cloner_;
};

} // namespace unroll

#endif // UNROLL_SOURCE_ACQUIRER_HPP
