#include "../../include/archive_sanitizer.hpp"
#include "../../include/ingest_error.hpp"
#include "../../include/logger.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <system_error>

namespace unroll {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTag = "ArchiveSanitizer";

using ArchiveReader = std::unique_ptr<archive, int (*)(archive*)>;

[[noreturn]] void reject(const std::string& reason, const std::string& member = {}) {
    Logger::log(LogLevel::Warning,
        member.empty() ? "Archive rejected: " + reason : "Archive rejected: " + reason + " (" + member + ")", kTag);
    throw IngestError(ErrorKind::ArchiveRejected, reason);
}

std::string error_string(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

ArchiveReader open_zip(const fs::path& archive_path) {
    ArchiveReader a(archive_read_new(), archive_read_free);
    if (!a) {
        throw IngestError(ErrorKind::Internal, "archive_read_new failed");
    }
    // only zip is accepted; no other format or compression filter is registered
    archive_read_support_format_zip(a.get());

    const int r = archive_read_open_filename(a.get(), archive_path.string().c_str(), 10240);
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_string(a.get()), kTag);
    } else if (r != ARCHIVE_OK) {
        reject("Invalid zip archive: " + error_string(a.get()));
    }
    return a;
}

// ARCHIVE_EOF ends the iteration, ARCHIVE_OK/WARN yield an entry, anything else is corruption
bool next_entry(archive* a, archive_entry** entry) {
    const int r = archive_read_next_header(a, entry);
    if (r == ARCHIVE_EOF)
        return false;
    if (r == ARCHIVE_WARN) {
        Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + error_string(a), kTag);
        return true;
    }
    if (r != ARCHIVE_OK) {
        reject("Invalid zip archive: " + error_string(a));
    }
    return true;
}

ArchiveMember describe(archive_entry* entry) {
    ArchiveMember member;
    const char* name = archive_entry_pathname(entry);
    member.path = name ? name : "";
    if (archive_entry_size_is_set(entry)) {
        member.declared_size = static_cast<std::int64_t>(archive_entry_size(entry));
    }
    switch (archive_entry_filetype(entry)) {
        case AE_IFREG:
            member.type = archive_entry_hardlink(entry) ? MemberType::Other : MemberType::Regular;
            break;
        case AE_IFDIR: member.type = MemberType::Directory; break;
        case AE_IFLNK: member.type = MemberType::Symlink; break;
        default:       member.type = MemberType::Other; break;
    }
    if (member.type != MemberType::Symlink && archive_entry_symlink(entry) != nullptr) {
        member.type = MemberType::Symlink;
    }
    return member;
}

fs::path normalized_root(const fs::path& root) {
    fs::path base = fs::absolute(root).lexically_normal();
    if (!base.has_filename() && base != base.root_path())
        base = base.parent_path();
    return base;
}

// per-member checks shared by validate() and the extraction pass
fs::path check_member(const ArchiveMember& member, const fs::path& root) {
    if (member.type == MemberType::Symlink)
        reject("Zip contains symlinks", member.path);
    if (member.type == MemberType::Other)
        reject("Zip contains unsupported entry types", member.path);

    const auto target = ArchiveSanitizer::resolve_member_path(member.path, root);
    if (!target)
        reject("Zip contains invalid paths", member.path);
    if (member.type == MemberType::Regular && *target == normalized_root(root))
        reject("Zip contains invalid paths", member.path);

    if (!member.declared_size || *member.declared_size < 0)
        reject("Zip contains invalid file size", member.path);
    return *target;
}

void make_dirs(const fs::path& dir, const std::string& member) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        reject("Zip contains conflicting paths", member);
    }
}

} // namespace

std::optional<fs::path> ArchiveSanitizer::resolve_member_path(const std::string_view name,
                                                              const fs::path& destination_root) {
    if (name.empty() || name.find('\0') != std::string_view::npos)
        return std::nullopt;

    std::string s(name);
    std::replace(s.begin(), s.end(), '\\', '/');
    const fs::path relative(s);
    if (relative.has_root_path())
        return std::nullopt;

    const fs::path base = normalized_root(destination_root);
    fs::path candidate = (base / relative).lexically_normal();
    if (!candidate.has_filename() && candidate.has_parent_path())
        candidate = candidate.parent_path();

    // component-wise prefix test: "/tmp/a" must not accept "/tmp/ab"
    const auto [base_it, cand_it] = std::mismatch(base.begin(), base.end(), candidate.begin(), candidate.end());
    if (base_it != base.end())
        return std::nullopt;
    for (auto it = cand_it; it != candidate.end(); ++it) {
        if (*it == "..")
            return std::nullopt;
    }
    return candidate;
}

std::vector<ArchiveMember> ArchiveSanitizer::list_members(const fs::path& archive_path) {
    const ArchiveReader a = open_zip(archive_path);
    std::vector<ArchiveMember> members;
    archive_entry* entry = nullptr;
    while (next_entry(a.get(), &entry)) {
        members.push_back(describe(entry));
        if (archive_read_data_skip(a.get()) != ARCHIVE_OK) {
            reject("Invalid zip archive: " + error_string(a.get()), members.back().path);
        }
    }
    Logger::log(LogLevel::Debug, "Archive lists " + std::to_string(members.size()) + " members", kTag);
    return members;
}

void ArchiveSanitizer::validate(const std::vector<ArchiveMember>& members,
                                const fs::path& destination_root,
                                const std::uintmax_t max_total_bytes) {
    std::uintmax_t total = 0;
    for (const auto& member : members) {
        check_member(member, destination_root);
        const auto size = static_cast<std::uintmax_t>(*member.declared_size);
        if (size > max_total_bytes - total)
            reject("Zip exceeds allowed total size", member.path);
        total += size;
    }
    Logger::log(LogLevel::Debug, "Archive declares " + std::to_string(total) + " bytes", kTag);
}

void ArchiveSanitizer::extract(const fs::path& archive_path,
                               const fs::path& destination_root,
                               const std::uintmax_t max_total_bytes) {
    validate(list_members(archive_path), destination_root, max_total_bytes);

    const ArchiveReader a = open_zip(archive_path);
    archive_entry* entry = nullptr;
    std::vector<char> buffer(64 * 1024);
    std::uintmax_t total = 0;
    std::size_t files = 0;

    while (next_entry(a.get(), &entry)) {
        const ArchiveMember member = describe(entry);
        const fs::path out_path = check_member(member, destination_root);

        if (member.type == MemberType::Directory) {
            make_dirs(out_path, member.path);
            continue;
        }

        make_dirs(out_path.parent_path(), member.path);
        std::ofstream ofs(out_path, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            reject("Zip contains conflicting paths", member.path);
        }

        const auto declared = static_cast<std::uintmax_t>(*member.declared_size);
        std::uintmax_t written = 0;
        la_ssize_t size_read = 0;
        while ((size_read = archive_read_data(a.get(), buffer.data(), buffer.size())) > 0) {
            const auto n = static_cast<std::uintmax_t>(size_read);
            written += n;
            if (written > declared)
                reject("Zip member exceeds its declared size", member.path);
            if (n > max_total_bytes - total)
                reject("Zip exceeds allowed total size", member.path);
            total += n;
            ofs.write(buffer.data(), static_cast<std::streamsize>(size_read));
            if (!ofs) {
                throw IngestError(ErrorKind::Internal, "write failed: " + out_path.string());
            }
        }
        if (size_read < 0) {
            reject("Invalid zip archive: " + error_string(a.get()), member.path);
        }
        ++files;
    }

    Logger::log(LogLevel::Info,
        "Extracted " + std::to_string(files) + " files (" + std::to_string(total) + " bytes)", kTag);
}

} // namespace unroll
