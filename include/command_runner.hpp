#ifndef COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include "git_utils.hpp"

/// Outcome of a version-control command; `value` carries its output.
using GitResult = git::TextResult;

/**
 * @brief Version-control operations the scanner and monitor depend on.
 *
 * Failures are returned as values and never thrown. "No changes" is a
 * successful result with `value == false`.
 */
class CommandRunner {
  public:
    virtual ~CommandRunner() = default;
    virtual bool is_repository(const std::filesystem::path& path) = 0;
    virtual git::FlagResult has_changes(const std::filesystem::path& path) = 0;
    virtual GitResult diff(const std::filesystem::path& path) = 0;
    virtual GitResult commit(const std::filesystem::path& path, const std::string& message) = 0;
    /// An empty @p remote means the runner's default push target.
    virtual GitResult push(const std::filesystem::path& path,
                           const std::optional<std::string>& remote) = 0;
    virtual GitResult add_submodule(const std::filesystem::path& parent,
                                    const std::filesystem::path& child) = 0;
};

struct GitRunnerOptions {
    std::string default_remote = "origin";
    git::CredentialOptions credentials;
    git::SignatureFallback signature;
};

/**
 * @brief CommandRunner on top of libgit2.
 *
 * libgit2 must be initialized (git::GitInitGuard) for as long as the runner
 * is used.
 */
class GitCommandRunner : public CommandRunner {
  public:
    explicit GitCommandRunner(GitRunnerOptions opts = {}) : opts_(std::move(opts)) {}

    bool is_repository(const std::filesystem::path& path) override;
    git::FlagResult has_changes(const std::filesystem::path& path) override;
    GitResult diff(const std::filesystem::path& path) override;
    GitResult commit(const std::filesystem::path& path, const std::string& message) override;
    GitResult push(const std::filesystem::path& path,
                   const std::optional<std::string>& remote) override;
    GitResult add_submodule(const std::filesystem::path& parent,
                            const std::filesystem::path& child) override;

    const GitRunnerOptions& options() const { return opts_; }

  private:
    GitRunnerOptions opts_;
};

#endif // COMMAND_RUNNER_HPP
