#include "../../include/source_acquirer.hpp"
#include "../../include/archive_sanitizer.hpp"
#include "../../include/bounded_writer.hpp"
#include "../../include/ingest_error.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace unroll {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTag = "SourceAcquirer";

bool has_zip_extension(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name.ends_with(".zip");
}

} // namespace

ArchiveUpload ArchiveUpload::from_file(const fs::path& path) {
    auto in = std::make_shared<std::ifstream>(path, std::ios::binary);
    if (!*in) {
        throw IngestError(ErrorKind::InvalidInput, "Cannot open archive: " + path.string());
    }
    return ArchiveUpload{path.filename().string(), std::move(in)};
}

ArchiveUpload ArchiveUpload::staged(std::string filename, fs::path path) {
    return ArchiveUpload{std::move(filename), nullptr, std::move(path)};
}

SourceAcquirer::SourceAcquirer(const IngestConfig& config, ICloner& cloner)
    : config_(config), cloner_(cloner) {}

void SourceAcquirer::clone(const RepoUrl& url, const fs::path& destination) const {
    Logger::log(LogLevel::Info, "Cloning " + url.clone_url(), kTag);
    cloner_.clone(url, destination, config_.clone_timeout);

    std::error_code ec;
    if (!fs::is_directory(destination, ec)) {
        throw IngestError(ErrorKind::AcquisitionFailed, "Git clone produced no checkout");
    }

    // version-control internals never reach the collector
    const fs::path git_dir = destination / ".git";
    if (fs::exists(fs::symlink_status(git_dir, ec))) {
        fs::remove_all(git_dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error, "Can't strip " + git_dir.string() + " (" + ec.message() + ")", kTag);
            throw IngestError(ErrorKind::Internal, "Failed to strip repository metadata");
        }
    }
}

void SourceAcquirer::receive_upload(const ArchiveUpload& upload,
                                    const fs::path& archive_path,
                                    const fs::path& destination) const {
    if (!has_zip_extension(upload.filename)) {
        throw IngestError(ErrorKind::InvalidInput, "Upload a .zip archive");
    }
    fs::path archive = archive_path;
    if (!upload.staged_path.empty()) {
        std::error_code ec;
        const std::uintmax_t size = fs::file_size(upload.staged_path, ec);
        if (ec) {
            throw IngestError(ErrorKind::Internal, "Staged upload is unreadable: " + ec.message());
        }
        if (size > config_.max_zip_bytes) {
            throw IngestError(ErrorKind::PayloadTooLarge, "Zip exceeds allowed size");
        }
        archive = upload.staged_path;
        Logger::log(LogLevel::Info,
            "Received " + upload.filename + " (" + std::to_string(size) + " bytes, staged)", kTag);
    } else {
        if (!upload.stream) {
            throw IngestError(ErrorKind::InvalidInput, "Upload has no content");
        }
        BoundedFileWriter writer(archive_path, config_.max_zip_bytes);
        writer.copy_from(*upload.stream);
        writer.close();
        Logger::log(LogLevel::Info,
            "Received " + upload.filename + " (" + std::to_string(writer.bytes_written()) + " bytes)", kTag);
    }

    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        throw IngestError(ErrorKind::Internal, "Failed to create " + destination.string() + ": " + ec.message());
    }
    ArchiveSanitizer::extract(archive, destination, config_.max_extract_bytes);
}

} // namespace unroll
