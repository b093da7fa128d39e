#include "../../include/tree_collector.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>

namespace unroll {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTag = "TreeCollector";
constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

std::string fold(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

struct Entry {
    fs::directory_entry entry;
    std::string name;
    std::string key;
};

std::vector<Entry> list_sorted(const fs::path& dir) {
    std::vector<Entry> entries;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        std::string key = fold(name);
        entries.push_back(Entry{*it, std::move(name), std::move(key)});
    }
    if (ec) {
        Logger::log(LogLevel::Warning, "Can't list " + dir.string() + " (" + ec.message() + ")", kTag);
    }
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return a.key != b.key ? a.key < b.key : a.name < b.name;
    });
    return entries;
}

struct Frame {
    std::vector<Entry> entries;
    std::size_t next = 0;
    std::string rel;
    std::vector<TreeNode>* out = nullptr;
    std::size_t depth = 0;
};

bool is_text_byte(const unsigned char b) {
    return (b >= 32 && b <= 126) || b == 9 || b == 10 || b == 13;
}

} // namespace

std::string_view omit_reason_to_string(const OmitReason reason) {
    switch (reason) {
        case OmitReason::Binary: return "binary";
        case OmitReason::Large:  return "large";
    }
    return "binary";
}

FileRecord FileRecord::text(std::string path, const std::uintmax_t size, std::string content) {
    return FileRecord{std::move(path), size, std::nullopt, std::move(content)};
}

FileRecord FileRecord::skipped(std::string path, const std::uintmax_t size, const OmitReason reason) {
    return FileRecord{std::move(path), size, reason, std::nullopt};
}

TreeCollector::TreeCollector(const IngestConfig& config) : config_(config) {}

bool TreeCollector::looks_binary(const std::string_view sample, const double threshold) {
    if (sample.empty())
        return false;
    if (sample.find('\0') != std::string_view::npos)
        return true;
    const auto non_text = std::count_if(sample.begin(), sample.end(), [](const char c) {
        return !is_text_byte(static_cast<unsigned char>(c));
    });
    return static_cast<double>(non_text) / static_cast<double>(sample.size()) > threshold;
}

std::string TreeCollector::decode_utf8_lossy(const std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    const std::size_t n = bytes.size();
    std::size_t i = 0;
    while (i < n) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        std::size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF; // allowed range of the second byte
        if (lead >= 0xC2 && lead <= 0xDF) {
            len = 2;
        } else if (lead == 0xE0) {
            len = 3; lo = 0xA0;
        } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
            len = 3;
        } else if (lead == 0xED) {
            len = 3; hi = 0x9F; // no surrogates
        } else if (lead == 0xF0) {
            len = 4; lo = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            len = 4;
        } else if (lead == 0xF4) {
            len = 4; hi = 0x8F;
        } else {
            out.append(kReplacement);
            ++i;
            continue;
        }

        std::size_t j = 1;
        for (; j < len && i + j < n; ++j) {
            const auto b = static_cast<unsigned char>(bytes[i + j]);
            const bool ok = j == 1 ? (b >= lo && b <= hi) : (b >= 0x80 && b <= 0xBF);
            if (!ok)
                break;
        }
        if (j == len) {
            out.append(bytes.substr(i, len));
        } else {
            out.append(kReplacement);
        }
        i += j;
    }
    return out;
}

FileRecord TreeCollector::read_file(const fs::path& file, std::string rel_path, const std::uintmax_t size) const {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        Logger::log(LogLevel::Warning, "Can't open " + rel_path + ", treated as binary", kTag);
        return FileRecord::skipped(std::move(rel_path), size, OmitReason::Binary);
    }

    std::string sample(config_.binary_sample_bytes, '\0');
    in.read(sample.data(), static_cast<std::streamsize>(sample.size()));
    sample.resize(static_cast<std::size_t>(in.gcount()));
    if (in.bad() || looks_binary(sample, config_.binary_threshold)) {
        return FileRecord::skipped(std::move(rel_path), size, OmitReason::Binary);
    }
    if (size > config_.max_file_bytes) {
        return FileRecord::skipped(std::move(rel_path), size, OmitReason::Large);
    }

    // read at most one byte past the ceiling in case the file grew since stat
    std::string bytes = std::move(sample);
    if (in) {
        const std::size_t limit = static_cast<std::size_t>(config_.max_file_bytes) + 1;
        std::string rest(limit - std::min(limit, bytes.size()), '\0');
        in.read(rest.data(), static_cast<std::streamsize>(rest.size()));
        rest.resize(static_cast<std::size_t>(in.gcount()));
        bytes += rest;
    }
    if (bytes.size() > config_.max_file_bytes) {
        return FileRecord::skipped(std::move(rel_path), size, OmitReason::Large);
    }
    return FileRecord::text(std::move(rel_path), size, decode_utf8_lossy(bytes));
}

CollectResult TreeCollector::collect(const fs::path& root) const {
    CollectResult result;
    std::vector<Frame> stack;
    stack.push_back(Frame{list_sorted(root), 0, {}, &result.tree, 0});

    while (!stack.empty()) {
        Frame& frame = stack.back();
        if (frame.next == frame.entries.size()) {
            stack.pop_back();
            continue;
        }
        const Entry& item = frame.entries[frame.next++];

        if (config_.skip_names.contains(item.name)) {
            Logger::log(LogLevel::Debug, "Pruned " + item.name, kTag);
            continue;
        }
        std::string rel = frame.rel.empty() ? item.name : frame.rel + "/" + item.name;

        std::error_code ec;
        const fs::file_status status = item.entry.symlink_status(ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't stat " + rel + " (" + ec.message() + ")", kTag);
            continue;
        }
        if (fs::is_symlink(status)) {
            Logger::log(LogLevel::Debug, "Skipped symlink " + rel, kTag);
            continue;
        }

        if (fs::is_directory(status)) {
            frame.out->push_back(TreeNode{item.name, rel, NodeType::Directory, {}});
            const std::size_t depth = frame.depth + 1;
            if (depth > config_.max_depth) {
                Logger::log(LogLevel::Warning, "Depth limit reached, not descending into " + rel, kTag);
                continue;
            }
            // the parent vector is not touched again until this frame is popped,
            // so the pointer to the new node's children stays valid
            std::vector<TreeNode>* children = &frame.out->back().children;
            std::vector<Entry> entries = list_sorted(item.entry.path());
            stack.push_back(Frame{std::move(entries), 0, std::move(rel), children, depth});
            continue;
        }

        if (!fs::is_regular_file(status)) {
            Logger::log(LogLevel::Debug, "Skipped special file " + rel, kTag);
            continue;
        }

        const std::uintmax_t size = fs::file_size(item.entry.path(), ec);
        if (ec) {
            Logger::log(LogLevel::Warning, "Can't size " + rel + " (" + ec.message() + ")", kTag);
            continue;
        }
        frame.out->push_back(TreeNode{item.name, rel, NodeType::File, {}});
        result.files.push_back(read_file(item.entry.path(), std::move(rel), size));
    }

    std::sort(result.files.begin(), result.files.end(), [](const FileRecord& a, const FileRecord& b) {
        return a.path < b.path;
    });
    Logger::log(LogLevel::Info, "Collected " + std::to_string(result.files.size()) + " files", kTag);
    return result;
}

} // namespace unroll
