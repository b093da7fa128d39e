/**
 * @file tree_collector.hpp
 * @brief Walks a materialized repository into a tree and bounded file records.
 */

#ifndef UNROLL_TREE_COLLECTOR_HPP
#define UNROLL_TREE_COLLECTOR_HPP

#include "ingest_config.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unroll {

enum class NodeType { File, Directory };

/**
 * @brief One entry of the navigable hierarchy.
 *
 * `path` is POSIX-style and relative to the walked root; only directories
 * carry children.
 */
struct TreeNode {
    std::string name;
    std::string path;
    NodeType type = NodeType::File;
    std::vector<TreeNode> children;
};

enum class OmitReason { Binary, Large };

std::string_view omit_reason_to_string(OmitReason reason);

/**
 * @brief Flat description of one collected file.
 *
 * Exactly one of `content` and `omitted_reason` is set; build records through
 * text() and skipped() to keep it that way.
 */
struct FileRecord {
    std::string path;
    std::uintmax_t size = 0;
    std::optional<OmitReason> omitted_reason;
    std::optional<std::string> content;

    [[nodiscard]] bool omitted() const noexcept { return !content.has_value(); }

    static FileRecord text(std::string path, std::uintmax_t size, std::string content);
    static FileRecord skipped(std::string path, std::uintmax_t size, OmitReason reason);
};

struct CollectResult {
    std::vector<TreeNode> tree;    ///< Top-level nodes, in walk order
    std::vector<FileRecord> files; ///< Every file, sorted by path
};

/**
 * @brief Deterministic, bounded walk of a directory.
 *
 * @details Children are visited in ASCII case-insensitive name order (ties by
 * raw name). Names in the configured skip-set are pruned with their subtree;
 * symlinks and other non-regular entries are ignored and never followed.
 * Each regular file is classified:
 * - binary: NUL byte in the leading sample, or too many non-text bytes;
 * - large: above the per-file ceiling;
 * - text: content decoded as UTF-8, invalid sequences replaced by U+FFFD.
 * Only the sample is read for binary and large files.
 *
 * The walk uses an explicit stack, and directories below `max_depth` are
 * listed as empty nodes instead of being descended.
 */
class TreeCollector {
public:
    explicit TreeCollector(const IngestConfig& config);

    [[nodiscard]] CollectResult collect(const std::filesystem::path& root) const;

    /**
     * @brief Binary heuristic over a leading sample.
     * An empty sample is text.
     */
    static bool looks_binary(std::string_view sample, double threshold);

    /**
     * @brief Decodes bytes as UTF-8, replacing each maximal invalid subpart with U+FFFD.
     */
    static std::string decode_utf8_lossy(std::string_view bytes);

private:
    FileRecord read_file(const std::filesystem::path& file, std::string rel_path, std::uintmax_t size) const;

    const IngestConfig& config_;
};

} // namespace unroll

#endif // UNROLL_TREE_COLLECTOR_HPP
