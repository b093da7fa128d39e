/**
 * @file repo_url.hpp
 * @brief Validated, canonical repository URL.
 */

#ifndef UNROLL_REPO_URL_HPP
#define UNROLL_REPO_URL_HPP

#include <set>
#include <string>
#include <string_view>

namespace unroll {

/**
 * @brief A repository URL that passed every check before any network action.
 *
 * @details The only way to obtain a RepoUrl is RepoUrl::parse(), so holding
 * one means the URL:
 * - is at most kMaxLength characters, without whitespace or control chars;
 * - uses http or https;
 * - carries no credentials, query string or fragment;
 * - names a host (lowercased, port stripped) from the allow-list;
 * - has an owner and a repository path segment.
 *
 * The canonical clone URL is always `https://{host}/{owner}/{repo}.git`, with a
 * single trailing `.git` removed from the supplied repository segment first.
 */
class RepoUrl {
public:
    static constexpr std::size_t kMaxLength = 2048;

    /**
     * @brief Validates and canonicalizes a raw URL.
     * @param raw URL as supplied by the client.
     * @param allowed_hosts Lowercase host names without ports.
     * @throws IngestError (InvalidInput) on any violation.
     */
    static RepoUrl parse(std::string_view raw, const std::set<std::string>& allowed_hosts);

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& owner() const noexcept { return owner_; }
    [[nodiscard]] const std::string& repo() const noexcept { return repo_; }

    /**
     * @brief The canonical URL handed to the cloner.
     */
    [[nodiscard]] std::string clone_url() const;

private:
    RepoUrl(std::string host, std::string owner, std::string repo);

    std::string host_;
    std::string owner_;
    std::string repo_;
};

} // namespace unroll

#endif // UNROLL_REPO_URL_HPP
