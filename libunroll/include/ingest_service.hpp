/**
 * @file ingest_service.hpp
 * @brief Single entry point turning one untrusted source into an IngestResult.
 */

#ifndef UNROLL_INGEST_SERVICE_HPP
#define UNROLL_INGEST_SERVICE_HPP

#include "cloner.hpp"
#include "ingest_config.hpp"
#include "source_acquirer.hpp"
#include "tree_collector.hpp"
#include <optional>
#include <string>
#include <vector>

namespace unroll {

/**
 * @brief One ingestion request; exactly one source must be set.
 */
struct IngestRequest {
    std::optional<std::string> repo_url;
    std::optional<ArchiveUpload> archive;

    /// Short human-readable label of the source, used in logs and batch reports.
    [[nodiscard]] std::string describe() const;
};

struct IngestResult {
    std::vector<TreeNode> tree;
    std::vector<FileRecord> files;
};

/**
 * @brief Orchestrates validation, acquisition and collection.
 *
 * @details Every call works in its own ScratchWorkspace, removed before the
 * call returns or throws. The service keeps no per-request state, so one
 * instance can serve concurrent calls as long as the cloner is thread-safe.
 */
class IngestService {
public:
    IngestService(const IngestConfig& config, ICloner& cloner);

    /**
     * @brief Runs one ingestion to completion.
     * @throws IngestError with the kind describing the failure; unexpected
     *         exceptions are reported as ErrorKind::Internal.
     */
    [[nodiscard]] IngestResult ingest(const IngestRequest& request) const;

    [[nodiscard]] const IngestConfig& config() const noexcept { return config_; }

private:
    IngestResult run(const IngestRequest& request) const;

    const IngestConfig& config_;
    SourceAcquirer acquirer_;
    TreeCollector collector_;
};

} // namespace unroll

#endif // UNROLL_INGEST_SERVICE_HPP
