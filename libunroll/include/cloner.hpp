/**
 * @file cloner.hpp
 * @brief Capability interface for materializing a remote repository.
 */

#ifndef UNROLL_CLONER_HPP
#define UNROLL_CLONER_HPP

#include "repo_url.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace unroll {

/**
 * @brief Fetches the latest snapshot of a repository into a directory.
 *
 * Implementations must be safe to call from several threads at once.
 */
struct ICloner {
    virtual ~ICloner() = default;

    /**
     * @brief Clones `url` into `destination` (which must not exist yet).
     * @throws IngestError (AcquisitionFailed) with the diagnostic output on failure,
     *         IngestError (AcquisitionTimeout) when `timeout` elapses first.
     */
    virtual void clone(const RepoUrl& url,
                       const std::filesystem::path& destination,
                       std::chrono::seconds timeout) = 0;
};

/**
 * @brief ICloner backed by a `git clone --depth 1` subprocess.
 *
 * @details The process is spawned without a shell, in its own process group,
 * with stdin on /dev/null and an environment that forbids every form of
 * interactive or ambient credential use (GIT_TERMINAL_PROMPT=0,
 * GIT_ASKPASS=echo, GIT_SSH_COMMAND="ssh -oBatchMode=yes"). When the timeout
 * expires the whole group is killed with SIGKILL and reaped.
 */
class GitCloner final : public ICloner {
public:
    /**
     * @param git_binary Executable name (looked up in PATH) or absolute path.
     */
    explicit GitCloner(std::string git_binary = "git");

    void clone(const RepoUrl& url,
               const std::filesystem::path& destination,
               std::chrono::seconds timeout) override;

    /**
     * @brief Runs the git binary with `clone --depth 1 --quiet -- <url> <dest>`.
     *
     * Exposed separately so the subprocess handling can be exercised without
     * going through RepoUrl validation.
     */
    void run_clone(const std::string& url,
                   const std::filesystem::path& destination,
                   std::chrono::seconds timeout) const;

    /**
     * @brief The hardened environment (inherited variables plus overrides).
     */
    static std::vector<std::string> hardened_environment();

private:
    std::string git_binary_;
};

} // namespace unroll

#endif // UNROLL_CLONER_HPP
