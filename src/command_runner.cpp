#include "command_runner.hpp"

namespace fs = std::filesystem;

bool GitCommandRunner::is_repository(const fs::path& path) { return git::is_git_repo(path); }

git::FlagResult GitCommandRunner::has_changes(const fs::path& path) {
    return git::has_uncommitted_changes(path);
}

GitResult GitCommandRunner::diff(const fs::path& path) { return git::diff_workdir(path); }

GitResult GitCommandRunner::commit(const fs::path& path, const std::string& message) {
    return git::commit_all(path, message, opts_.signature);
}

GitResult GitCommandRunner::push(const fs::path& path, const std::optional<std::string>& remote) {
    return git::push_current_branch(path, remote, opts_.default_remote, opts_.credentials);
}

GitResult GitCommandRunner::add_submodule(const fs::path& parent, const fs::path& child) {
    return git::add_submodule(parent, child);
}
