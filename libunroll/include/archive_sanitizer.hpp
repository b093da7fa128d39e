/**
 * @file archive_sanitizer.hpp
 * @brief Validates and extracts untrusted zip archives with libarchive.
 */

#ifndef UNROLL_ARCHIVE_SANITIZER_HPP
#define UNROLL_ARCHIVE_SANITIZER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unroll {

/**
 * @brief File type of an archive member, as declared by the archive.
 */
enum class MemberType {
    Regular,
    Directory,
    Symlink, ///< Decoded from the file-type bits of the zip external attributes
    Other    ///< Hard links, devices, fifos, ...
};

/**
 * @brief One entry of an uploaded archive, read from its metadata only.
 */
struct ArchiveMember {
    std::string path;                          ///< Member name as stored
    std::optional<std::int64_t> declared_size; ///< Uncompressed size, if the archive records one
    MemberType type = MemberType::Regular;
};

/**
 * @brief Rejects hostile zip archives before a single byte is extracted.
 *
 * @details Every member is checked for symlinks, paths escaping the
 * destination root, missing or negative sizes, and a running total of
 * declared sizes above the ceiling. Extraction only starts once the whole
 * member list passed, and while extracting the actual bytes are held to the
 * declared sizes and the same ceiling. Any failure throws
 * IngestError(ArchiveRejected); whatever was written stays inside the
 * destination and is removed with the owning workspace.
 */
class ArchiveSanitizer {
public:
    /**
     * @brief Enumerates the members of a zip archive without extracting.
     * @throws IngestError (ArchiveRejected) for unreadable or non-zip input.
     */
    static std::vector<ArchiveMember> list_members(const std::filesystem::path& archive_path);

    /**
     * @brief Checks a member list against the destination and size ceiling.
     * @throws IngestError (ArchiveRejected) on the first offending member.
     */
    static void validate(const std::vector<ArchiveMember>& members,
                         const std::filesystem::path& destination_root,
                         std::uintmax_t max_total_bytes);

    /**
     * @brief list_members() + validate(), then extraction into destination_root.
     * @throws IngestError (ArchiveRejected) on any violation or corrupt data.
     */
    static void extract(const std::filesystem::path& archive_path,
                        const std::filesystem::path& destination_root,
                        std::uintmax_t max_total_bytes);

    /**
     * @brief Lexically resolves a member name under a root.
     *
     * Backslashes count as separators. Empty names, embedded NUL, absolute
     * paths and anything that normalizes outside the root yield std::nullopt.
     * @return The absolute, normalized destination path.
     */
    static std::optional<std::filesystem::path> resolve_member_path(std::string_view name,
                                                                    const std::filesystem::path& destination_root);
};

} // namespace unroll

#endif // UNROLL_ARCHIVE_SANITIZER_HPP
