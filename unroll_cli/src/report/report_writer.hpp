#ifndef UNROLL_REPORT_WRITER_HPP
#define UNROLL_REPORT_WRITER_HPP

#include "../../../libunroll/include/batch_executor.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <vector>

/**
 * @brief Builds the CLI report for a finished batch.
 *
 * A single successful source yields its `{files, tree}` object directly;
 * anything else yields an array of `{source, ok, result}` or
 * `{source, ok, error}` entries in input order.
 */
nlohmann::json build_report(const std::vector<unroll::IngestOutcome>& outcomes);

/**
 * @brief Writes `report` to `output_path`, or to stdout when the path is empty.
 * @param indent Pretty-print with two spaces per level.
 * @throws std::runtime_error if the output file cannot be written.
 */
void write_report(const nlohmann::json& report, const std::filesystem::path& output_path, bool indent);

#endif // UNROLL_REPORT_WRITER_HPP
