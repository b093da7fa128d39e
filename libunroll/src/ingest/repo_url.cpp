#include "../../include/repo_url.hpp"
#include "../../include/ingest_error.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace unroll {

namespace {

constexpr std::string_view kTag = "RepoUrl";

[[noreturn]] void reject(const std::string& reason) {
    Logger::log(LogLevel::Debug, "Rejected repo URL: " + reason, kTag);
    throw IngestError(ErrorKind::InvalidInput, reason);
}

std::string to_lower_copy(std::string_view sv) {
    std::string s(sv);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> parts;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        const auto slash = path.find('/', pos);
        const auto end = slash == std::string_view::npos ? path.size() : slash;
        if (end > pos)
            parts.emplace_back(path.substr(pos, end - pos));
        if (slash == std::string_view::npos)
            break;
        pos = slash + 1;
    }
    return parts;
}

} // namespace

RepoUrl::RepoUrl(std::string host, std::string owner, std::string repo)
    : host_(std::move(host)), owner_(std::move(owner)), repo_(std::move(repo)) {}

RepoUrl RepoUrl::parse(const std::string_view raw, const std::set<std::string>& allowed_hosts) {
    if (raw.size() > kMaxLength)
        reject("Repo URL is too long");
    if (raw.empty())
        reject("Repo URL is empty");

    for (const char c : raw) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f || c == '\\')
            reject("Repo URL contains invalid characters");
    }

    const auto colon = raw.find(':');
    if (colon == std::string_view::npos)
        reject("Only http/https repo URLs are allowed");
    const std::string scheme = to_lower_copy(raw.substr(0, colon));
    if (scheme != "http" && scheme != "https")
        reject("Only http/https repo URLs are allowed");

    std::string_view rest = raw.substr(colon + 1);
    if (rest.substr(0, 2) != "//")
        reject("Repo URL must include a host");
    rest.remove_prefix(2);

    if (rest.find_first_of("?#") != std::string_view::npos)
        reject("Repo URL contains unsupported credentials or query params");

    const auto path_start = rest.find('/');
    const std::string_view authority = rest.substr(0, path_start);
    const std::string_view path = path_start == std::string_view::npos
                                      ? std::string_view{}
                                      : rest.substr(path_start);

    if (authority.find('@') != std::string_view::npos)
        reject("Repo URL contains unsupported credentials or query params");

    const std::string host = to_lower_copy(authority.substr(0, authority.find(':')));
    if (host.empty() || !allowed_hosts.contains(host))
        reject("Repo host is not allowed");

    const auto parts = split_path(path);
    if (parts.size() < 2)
        reject("Repo URL must include owner/repo");

    std::string owner = parts[0];
    std::string repo = parts[1];
    if (repo.ends_with(".git"))
        repo.erase(repo.size() - 4);
    if (owner.empty() || repo.empty() || owner == "." || owner == ".." || repo == "." || repo == "..")
        reject("Repo URL must include owner/repo");

    return RepoUrl(host, std::move(owner), std::move(repo));
}

std::string RepoUrl::clone_url() const {
    return "https://" + host_ + "/" + owner_ + "/" + repo_ + ".git";
}

} // namespace unroll
