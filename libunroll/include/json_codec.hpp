/**
 * @file json_codec.hpp
 * @brief nlohmann::json mappings for the ingestion result types.
 *
 * Field names follow the wire format of the HTTP API (camelCase, explicit
 * nulls for absent content).
 */

#ifndef UNROLL_JSON_CODEC_HPP
#define UNROLL_JSON_CODEC_HPP

#include "ingest_error.hpp"
#include "ingest_service.hpp"
#include "tree_collector.hpp"
#include <nlohmann/json.hpp>

namespace unroll {

void to_json(nlohmann::json& j, const TreeNode& node);
void to_json(nlohmann::json& j, const FileRecord& record);
void to_json(nlohmann::json& j, const IngestResult& result);

/**
 * @brief Error body: {"detail": message, "kind": "<error kind>"}.
 */
nlohmann::json error_to_json(ErrorKind kind, const std::string& message);

/**
 * @brief Serializes `j`; invalid UTF-8 (possible in file names) becomes U+FFFD.
 * @param indent -1 for compact output.
 */
std::string dump_json(const nlohmann::json& j, int indent = -1);

} // namespace unroll

#endif // UNROLL_JSON_CODEC_HPP
