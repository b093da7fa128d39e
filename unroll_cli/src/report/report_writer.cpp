#include "report_writer.hpp"
#include "../../../libunroll/include/json_codec.hpp"
#include "../../../libunroll/include/logger.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

using nlohmann::json;

json build_report(const std::vector<unroll::IngestOutcome>& outcomes) {
    if (outcomes.size() == 1 && outcomes.front().ok()) {
        return json(*outcomes.front().result);
    }

    json report = json::array();
    for (const auto& outcome : outcomes) {
        json entry{
            {"source", outcome.source},
            {"ok", outcome.ok()},
        };
        if (outcome.ok()) {
            entry["result"] = *outcome.result;
        } else {
            entry["error"] = unroll::error_to_json(outcome.error_kind, outcome.error_message);
        }
        report.push_back(std::move(entry));
    }
    return report;
}

void write_report(const json& report, const std::filesystem::path& output_path, const bool indent) {
    const std::string text = unroll::dump_json(report, indent ? 2 : -1);

    if (output_path.empty()) {
        std::cout << text << std::endl;
        return;
    }

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open report file: " + output_path.string());
    }
    out << text << '\n';
    if (!out) {
        throw std::runtime_error("Failed to write report file: " + output_path.string());
    }
    Logger::log(LogLevel::Info, "Report written to " + output_path.string(), "report");
}
