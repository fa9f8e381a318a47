#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using reference_ptr = GitHandle<git_reference, git_reference_free>;
using status_list_ptr = GitHandle<git_status_list, git_status_list_free>;
using index_ptr = GitHandle<git_index, git_index_free>;
using tree_ptr = GitHandle<git_tree, git_tree_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;
using diff_ptr = GitHandle<git_diff, git_diff_free>;
using signature_ptr = GitHandle<git_signature, git_signature_free>;
using submodule_ptr = GitHandle<git_submodule, git_submodule_free>;

/**
 * @brief Outcome of a git operation.
 *
 * Failures are carried as values so callers can keep going after a single
 * repository misbehaves. `error` holds the libgit2 message on failure.
 */
template <typename T> struct Result {
    bool ok = false;
    T value{};
    std::string error;

    static Result success(T v = T{}) {
        Result r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }
    static Result failure(std::string e) {
        Result r;
        r.error = std::move(e);
        return r;
    }
    explicit operator bool() const { return ok; }
};

using TextResult = Result<std::string>;
using FlagResult = Result<bool>;

/** Credential sources consulted by the push credential callback. */
struct CredentialOptions {
    fs::path ssh_public_key;
    fs::path ssh_private_key;
    fs::path credential_file;
};

/** Identity used when the repository has no `user.name`/`user.email`. */
struct SignatureFallback {
    std::string name = "autogitpush";
    std::string email = "autogitpush@localhost";
};

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Determine whether the given path is a Git repository root.
 *
 * @param p Filesystem path to check.
 * @return `true` if a `.git` directory exists inside @a p.
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Retrieve the currently checked out branch name.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Branch name or `std::nullopt` if it cannot be determined.
 */
std::optional<std::string> get_current_branch(const fs::path& repo, std::string* error = nullptr);

/**
 * @brief Obtain the URL of the specified remote.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Remote URL as a string or `std::nullopt` on failure.
 */
std::optional<std::string> get_remote_url(const fs::path& repo, const std::string& remote,
                                          std::string* error = nullptr);

/**
 * @brief Check for staged, unstaged or untracked changes.
 *
 * Dirty state inside registered submodules is not reported for the parent.
 *
 * @return `value == true` when the working tree differs from HEAD.
 */
FlagResult has_uncommitted_changes(const fs::path& repo);

/**
 * @brief Produce a unified patch of HEAD against the working tree.
 *
 * Untracked files are included with their contents. An unborn HEAD is
 * diffed against the empty tree.
 */
TextResult diff_workdir(const fs::path& repo);

/**
 * @brief Stage every change (like `git add -A`) and commit it on HEAD.
 *
 * @param repo     Path to a Git repository.
 * @param message  Commit message.
 * @param fallback Signature used when the repository config has none.
 * @return Hex id of the new commit, or `"nothing to commit"` when the staged
 *         tree equals the HEAD tree.
 */
TextResult commit_all(const fs::path& repo, const std::string& message,
                      const SignatureFallback& fallback = {});

/**
 * @brief Push the current branch to a remote.
 *
 * When @p remote is empty the branch's upstream remote is used, then
 * @p default_remote.
 *
 * @return Name of the remote pushed to.
 */
TextResult push_current_branch(const fs::path& repo, const std::optional<std::string>& remote,
                               const std::string& default_remote,
                               const CredentialOptions& creds = {});

/**
 * @brief Register an existing nested repository as a submodule of @p parent.
 *
 * Writes the `.gitmodules` entry and the gitlink into the parent's index.
 * The URL is the child's `origin` URL, or `./<relative path>` without one.
 * A child that is already a registered submodule is left untouched.
 */
TextResult add_submodule(const fs::path& parent, const fs::path& child);

} // namespace git

#endif // GIT_UTILS_HPP
