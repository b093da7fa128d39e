#include "../../include/ingest_config.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace unroll {

namespace {

std::string trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return std::string(sv);
}

} // namespace

std::set<std::string> IngestConfig::parse_host_list(const std::string& csv) {
    std::set<std::string> hosts;
    std::istringstream iss(csv);
    std::string item;
    while (std::getline(iss, item, ',')) {
        std::string host = trim(item);
        if (host.empty())
            continue;
        std::transform(host.begin(), host.end(), host.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        hosts.insert(std::move(host));
    }
    return hosts;
}

void IngestConfig::validate() const {
    if (allowed_hosts.empty())
        throw std::invalid_argument("allowed git host list is empty");
    for (const auto& host : allowed_hosts) {
        if (host.find_first_of(":/@ ") != std::string::npos)
            throw std::invalid_argument("invalid allowed host: " + host);
    }
    if (max_zip_bytes == 0)
        throw std::invalid_argument("max zip bytes must be positive");
    if (max_extract_bytes == 0)
        throw std::invalid_argument("max extract bytes must be positive");
    if (max_file_bytes == 0)
        throw std::invalid_argument("max file bytes must be positive");
    if (clone_timeout.count() <= 0)
        throw std::invalid_argument("clone timeout must be positive");
    if (binary_sample_bytes == 0)
        throw std::invalid_argument("binary sample size must be positive");
    if (!(binary_threshold > 0.0 && binary_threshold <= 1.0))
        throw std::invalid_argument("binary threshold must be in (0, 1]");
    if (max_depth == 0)
        throw std::invalid_argument("max depth must be positive");
    if (git_binary.empty())
        throw std::invalid_argument("git binary must not be empty");
}

} // namespace unroll
