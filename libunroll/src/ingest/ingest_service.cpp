#include "../../include/ingest_service.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/ingest_error.hpp"
#include "../../include/logger.hpp"
#include "../../include/repo_url.hpp"

#include <chrono>

namespace unroll {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTag = "IngestService";

} // namespace

std::string IngestRequest::describe() const {
    if (repo_url && archive)
        return "<ambiguous>";
    if (repo_url)
        return *repo_url;
    if (archive)
        return archive->filename;
    return "<empty>";
}

IngestService::IngestService(const IngestConfig& config, ICloner& cloner)
    : config_(config), acquirer_(config, cloner), collector_(config) {}

IngestResult IngestService::ingest(const IngestRequest& request) const {
    if (request.repo_url && request.archive) {
        throw IngestError(ErrorKind::InvalidInput, "Provide either repoUrl or zipFile, not both");
    }
    if (!request.repo_url && !request.archive) {
        throw IngestError(ErrorKind::InvalidInput, "Provide repoUrl or zipFile");
    }

    const auto start = std::chrono::steady_clock::now();
    try {
        IngestResult result = run(request);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        Logger::log(LogLevel::Info,
            request.describe() + ": " + std::to_string(result.files.size()) + " files in "
            + std::to_string(elapsed.count()) + " ms", kTag);
        return result;
    } catch (const IngestError& e) {
        Logger::log(LogLevel::Warning,
            request.describe() + " rejected (" + std::string(error_kind_to_string(e.kind())) + "): " + e.what(),
            kTag);
        throw;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, request.describe() + ": unexpected failure: " + e.what(), kTag);
        throw IngestError(ErrorKind::Internal, "Internal error while ingesting repository");
    }
}

IngestResult IngestService::run(const IngestRequest& request) const {
    // URL validation happens before anything touches the filesystem
    std::optional<RepoUrl> url;
    if (request.repo_url) {
        url = RepoUrl::parse(*request.repo_url, config_.allowed_hosts);
    }

    const ScratchWorkspace workspace("ingest", config_.scratch_root);
    const fs::path project = workspace.path() / "project";

    if (url) {
        acquirer_.clone(*url, project);
    } else {
        acquirer_.receive_upload(*request.archive, workspace.path() / "upload.zip", project);
    }

    CollectResult collected = collector_.collect(project);
    return IngestResult{std::move(collected.tree), std::move(collected.files)};
}

} // namespace unroll
