#include "../../include/file_utils.hpp"
#include "../../include/ingest_error.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"
#include <cerrno>
#include <system_error>
#include <sys/stat.h>

namespace unroll {

    namespace fs = std::filesystem;

    bool cleanup_temp_dir(const fs::path& dir, const std::string_view tag) {
        std::error_code ec;
        fs::remove_all(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't remove temp dir: " + dir.string() + " (" + ec.message() + ")", tag);
            return false;
        }
        Logger::log(LogLevel::Debug, "Removed temp dir: " + dir.string(), tag);
        return true;
    }

    ScratchWorkspace::ScratchWorkspace(const std::string& prefix, const fs::path& base) {
        std::error_code ec;
        fs::path parent = base;
        if (parent.empty()) {
            parent = fs::temp_directory_path(ec);
            if (ec) {
                throw IngestError(ErrorKind::Internal, "No temp directory available: " + ec.message());
            }
        }

        // mkdir fails with EEXIST for an existing name: retry with a new suffix.
        // The mode is applied at creation, never widened afterwards.
        for (int attempt = 0; attempt < 8; ++attempt) {
            fs::path candidate = parent / ("unroll-" + prefix + "-" + RandomUtils::random_suffix());
            if (::mkdir(candidate.c_str(), S_IRWXU) == 0) {
                path_ = std::move(candidate);
                Logger::log(LogLevel::Debug, "Created workspace: " + path_.string(), "workspace");
                return;
            }
            if (errno != EEXIST) {
                ec.assign(errno, std::generic_category());
                Logger::log(LogLevel::Error,
                    "Failed to create temp dir: " + candidate.string() + " (" + ec.message() + ")",
                    "workspace");
                throw IngestError(ErrorKind::Internal, "Failed to create workspace: " + ec.message());
            }
        }
        throw IngestError(ErrorKind::Internal, "Failed to create a unique workspace");
    }

    ScratchWorkspace::~ScratchWorkspace() {
        if (!path_.empty()) {
            cleanup_temp_dir(path_, "workspace");
        }
    }

} // namespace unroll
