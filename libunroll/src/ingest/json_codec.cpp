#include "../../include/json_codec.hpp"

namespace unroll {

using nlohmann::json;

void to_json(json& j, const TreeNode& node) {
    j = json{
        {"name", node.name},
        {"path", node.path},
        {"type", node.type == NodeType::Directory ? "directory" : "file"},
    };
    if (node.type == NodeType::Directory) {
        j["children"] = node.children;
    }
}

void to_json(json& j, const FileRecord& record) {
    j = json{
        {"path", record.path},
        {"size", record.size},
        {"omitted", record.omitted()},
        {"omittedReason", nullptr},
        {"content", nullptr},
    };
    if (record.omitted_reason) {
        j["omittedReason"] = std::string(omit_reason_to_string(*record.omitted_reason));
    }
    if (record.content) {
        j["content"] = *record.content;
    }
}

void to_json(json& j, const IngestResult& result) {
    j = json{
        {"files", result.files},
        {"tree", result.tree},
    };
}

json error_to_json(const ErrorKind kind, const std::string& message) {
    return json{
        {"detail", message},
        {"kind", std::string(error_kind_to_string(kind))},
    };
}

std::string dump_json(const json& j, const int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace unroll
