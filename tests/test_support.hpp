#ifndef UNROLL_TEST_SUPPORT_HPP
#define UNROLL_TEST_SUPPORT_HPP

#include "file_utils.hpp"
#include "cloner.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace test_support {

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

inline std::size_t count_entries(const fs::path& dir) {
    std::size_t n = 0;
    for ([[maybe_unused]] const auto& e : fs::recursive_directory_iterator(dir)) ++n;
    return n;
}

enum class ZipKind { File, Directory, Symlink };

struct ZipEntry {
    std::string name;
    std::string data;          // file content, or symlink target
    ZipKind kind = ZipKind::File;
};

inline ZipEntry zip_file(std::string name, std::string data) {
    return ZipEntry{std::move(name), std::move(data), ZipKind::File};
}

inline ZipEntry zip_dir(std::string name) {
    return ZipEntry{std::move(name), {}, ZipKind::Directory};
}

inline ZipEntry zip_symlink(std::string name, std::string target) {
    return ZipEntry{std::move(name), std::move(target), ZipKind::Symlink};
}

/// Writes a zip with libarchive; `deflate` compresses file data.
inline void write_zip(const fs::path& path, const std::vector<ZipEntry>& entries, const bool deflate = false) {
    archive* a = archive_write_new();
    archive_write_set_format_zip(a);
    if (deflate) {
        archive_write_zip_set_compression_deflate(a);
    } else {
        archive_write_zip_set_compression_store(a);
    }
    if (archive_write_open_filename(a, path.string().c_str()) != ARCHIVE_OK) {
        const std::string err = archive_error_string(a) ? archive_error_string(a) : "open failed";
        archive_write_free(a);
        throw std::runtime_error("write_zip: " + err);
    }

    for (const auto& item : entries) {
        archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, item.name.c_str());
        switch (item.kind) {
            case ZipKind::File:
                archive_entry_set_filetype(e, AE_IFREG);
                archive_entry_set_perm(e, 0644);
                archive_entry_set_size(e, static_cast<la_int64_t>(item.data.size()));
                break;
            case ZipKind::Directory:
                archive_entry_set_filetype(e, AE_IFDIR);
                archive_entry_set_perm(e, 0755);
                archive_entry_set_size(e, 0);
                break;
            case ZipKind::Symlink:
                archive_entry_set_filetype(e, AE_IFLNK);
                archive_entry_set_perm(e, 0777);
                archive_entry_set_symlink(e, item.data.c_str());
                archive_entry_set_size(e, 0);
                break;
        }
        archive_write_header(a, e);
        if (item.kind == ZipKind::File && !item.data.empty()) {
            archive_write_data(a, item.data.data(), item.data.size());
        }
        archive_entry_free(e);
    }
    archive_write_close(a);
    archive_write_free(a);
}

/// ICloner stand-in that fills the destination through a callback.
class FakeCloner final : public unroll::ICloner {
public:
    explicit FakeCloner(std::function<void(const fs::path&)> populate)
        : populate_(std::move(populate)) {}

    void clone(const unroll::RepoUrl& url, const fs::path& destination, std::chrono::seconds) override {
        {
            std::lock_guard lock(mtx_);
            urls_.push_back(url.clone_url());
        }
        fs::create_directories(destination);
        populate_(destination);
    }

    [[nodiscard]] std::vector<std::string> urls() const {
        std::lock_guard lock(mtx_);
        return urls_;
    }

private:
    std::function<void(const fs::path&)> populate_;
    mutable std::mutex mtx_;
    std::vector<std::string> urls_;
};

} // namespace test_support

#endif // UNROLL_TEST_SUPPORT_HPP
