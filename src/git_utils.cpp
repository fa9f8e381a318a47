#include "git_utils.hpp"
#include <cstdlib>
#include <fstream>
#include <string>
#include <system_error>

using namespace std;

namespace git {

/**
 * @brief Read credentials from a file.
 *
 * The file is expected to contain the username on the first line and the
 * password on the second line.
 *
 * @param path Path to the credential file.
 * @param user Output parameter receiving the username.
 * @param pass Output parameter receiving the password.
 * @return True if both username and password were read.
 */
static bool read_credential_file(const fs::path& path, std::string& user, std::string& pass) {
    std::ifstream ifs(path);
    if (!ifs)
        return false;
    std::getline(ifs, user);
    std::getline(ifs, pass);
    return !user.empty() && !pass.empty();
}

static std::optional<std::string> safe_getenv(const char* name) {
    const char* v = std::getenv(name);
    if (v)
        return std::string(v);
    return std::nullopt;
}

/**
 * @brief State shared by the push callbacks.
 *
 * libgit2 hands every remote callback the same payload pointer.
 */
struct PushContext {
    const CredentialOptions* creds = nullptr;
    std::string rejection;
};

/**
 * @brief libgit2 credential callback implementing precedence rules.
 *
 * Credentials are chosen in the following order:
 *  1. Explicit SSH key provided via options.
 *  2. Username only.
 *  3. SSH agent.
 *  4. Username/password from file.
 *  5. Username/password from environment variables.
 *  6. Default credential helper.
 */
static int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                         unsigned int allowed_types, void* payload) {
    (void)url;
    const auto* ctx = static_cast<const PushContext*>(payload);
    const CredentialOptions* opts = ctx ? ctx->creds : nullptr;
    auto env_user = safe_getenv("GIT_USERNAME");
    auto env_pass = safe_getenv("GIT_PASSWORD");
    std::string file_user;
    std::string file_pass;
    if (opts && !opts->credential_file.empty())
        read_credential_file(opts->credential_file, file_user, file_pass);
    const char* user =
        username_from_url
            ? username_from_url
            : (!file_user.empty() ? file_user.c_str() : (env_user ? env_user->c_str() : nullptr));
    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && opts && !opts->ssh_private_key.empty() &&
        user) {
        const char* pub = nullptr;
        std::string pub_buf;
        if (!opts->ssh_public_key.empty()) {
            pub_buf = opts->ssh_public_key.string();
            pub = pub_buf.c_str();
        }
        if (git_credential_ssh_key_new(out, user, pub, opts->ssh_private_key.string().c_str(),
                                       "") == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_USERNAME) && user) {
        if (git_credential_username_new(out, user) == 0)
            return 0;
    }
    if ((allowed_types & GIT_CREDENTIAL_SSH_KEY) && user) {
        if (git_credential_ssh_key_from_agent(out, user) == 0)
            return 0;
    }
    if (allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT) {
        if (!file_user.empty() && !file_pass.empty())
            return git_credential_userpass_plaintext_new(out, file_user.c_str(),
                                                         file_pass.c_str());
        if (env_user && env_pass)
            return git_credential_userpass_plaintext_new(out, env_user->c_str(),
                                                         env_pass->c_str());
    }
    return git_credential_default_new(out);
}

// Records the server's verdict for each pushed ref; a non-null status is a rejection.
static int push_update_reference_cb(const char* refname, const char* status, void* payload) {
    auto* ctx = static_cast<PushContext*>(payload);
    if (status && ctx) {
        if (!ctx->rejection.empty())
            ctx->rejection += "; ";
        ctx->rejection += string(refname) + ": " + status;
    }
    return 0;
}

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p / ".git", ec);
}

/**
 * @brief Last libgit2 error message, or a generic one.
 */
static string last_error(const string& context) {
    const git_error* e = git_error_last();
    if (e && e->message)
        return context + ": " + e->message;
    return context + ": unknown libgit2 error";
}

static void set_error(std::string* error, const string& context) {
    if (error)
        *error = last_error(context);
}

static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

optional<string> get_current_branch(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error, "open");
        return nullopt;
    }
    repo_ptr r(raw);
    git_reference* head = nullptr;
    if (git_repository_head(&head, r.get()) != 0) {
        set_error(error, "head");
        return nullopt;
    }
    reference_ptr ref(head);
    const char* name = git_reference_shorthand(ref.get());
    string branch = name ? name : "";
    if (branch.empty() || git_repository_head_detached(r.get()) == 1) {
        if (error)
            *error = "HEAD is detached";
        return nullopt;
    }
    return branch;
}

optional<string> get_remote_url(const fs::path& repo, const string& remote, string* error) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0) {
        set_error(error, "open");
        return nullopt;
    }
    repo_ptr r(raw_repo);
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error, "remote lookup");
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);
    const char* url = git_remote_url(remote_handle.get());
    if (!url) {
        if (error)
            *error = "remote " + remote + " has no URL";
        return nullopt;
    }
    return string(url);
}

FlagResult has_uncommitted_changes(const fs::path& repo) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0)
        return FlagResult::failure(last_error("open"));
    repo_ptr r(raw_repo);
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX |
                 GIT_STATUS_OPT_EXCLUDE_SUBMODULES;
    git_status_list* raw_list = nullptr;
    if (git_status_list_new(&raw_list, r.get(), &opts) != 0)
        return FlagResult::failure(last_error("status"));
    status_list_ptr list(raw_list);
    return FlagResult::success(git_status_list_entrycount(list.get()) > 0);
}

static int append_patch_line(const git_diff_delta* delta, const git_diff_hunk* hunk,
                             const git_diff_line* line, void* payload) {
    (void)delta;
    (void)hunk;
    auto* out = static_cast<string*>(payload);
    if (line->origin == GIT_DIFF_LINE_CONTEXT || line->origin == GIT_DIFF_LINE_ADDITION ||
        line->origin == GIT_DIFF_LINE_DELETION)
        out->push_back(line->origin);
    out->append(line->content, line->content_len);
    return 0;
}

TextResult diff_workdir(const fs::path& repo) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0)
        return TextResult::failure(last_error("open"));
    repo_ptr r(raw_repo);

    // Unborn HEAD leaves the tree null, which libgit2 treats as the empty tree.
    git_tree* raw_tree = nullptr;
    git_object* head_tree = nullptr;
    int err = git_revparse_single(&head_tree, r.get(), "HEAD^{tree}");
    if (err == 0) {
        raw_tree = reinterpret_cast<git_tree*>(head_tree);
    } else if (err != GIT_ENOTFOUND && err != GIT_EUNBORNBRANCH) {
        return TextResult::failure(last_error("resolve HEAD"));
    }
    tree_ptr tree(raw_tree);

    git_diff_options opts = GIT_DIFF_OPTIONS_INIT;
    opts.flags = GIT_DIFF_INCLUDE_UNTRACKED | GIT_DIFF_RECURSE_UNTRACKED_DIRS |
                 GIT_DIFF_SHOW_UNTRACKED_CONTENT;
    opts.ignore_submodules = GIT_SUBMODULE_IGNORE_DIRTY;
    git_diff* raw_diff = nullptr;
    if (git_diff_tree_to_workdir_with_index(&raw_diff, r.get(), tree.get(), &opts) != 0)
        return TextResult::failure(last_error("diff"));
    diff_ptr diff(raw_diff);
    string patch;
    if (git_diff_print(diff.get(), GIT_DIFF_FORMAT_PATCH, append_patch_line, &patch) != 0)
        return TextResult::failure(last_error("diff print"));
    return TextResult::success(patch);
}

TextResult commit_all(const fs::path& repo, const string& message,
                      const SignatureFallback& fallback) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0)
        return TextResult::failure(last_error("open"));
    repo_ptr r(raw_repo);

    git_index* raw_index = nullptr;
    if (git_repository_index(&raw_index, r.get()) != 0)
        return TextResult::failure(last_error("index"));
    index_ptr index(raw_index);
    char pattern[] = "*";
    char* patterns[] = {pattern};
    git_strarray paths = {patterns, 1};
    if (git_index_add_all(index.get(), &paths, GIT_INDEX_ADD_DEFAULT, nullptr, nullptr) != 0)
        return TextResult::failure(last_error("stage"));
    if (git_index_update_all(index.get(), &paths, nullptr, nullptr) != 0)
        return TextResult::failure(last_error("stage removals"));
    if (git_index_write(index.get()) != 0)
        return TextResult::failure(last_error("write index"));

    git_oid tree_id;
    if (git_index_write_tree(&tree_id, index.get()) != 0)
        return TextResult::failure(last_error("write tree"));
    git_tree* raw_tree = nullptr;
    if (git_tree_lookup(&raw_tree, r.get(), &tree_id) != 0)
        return TextResult::failure(last_error("tree lookup"));
    tree_ptr tree(raw_tree);

    git_commit* raw_parent = nullptr;
    git_oid parent_id;
    if (git_reference_name_to_id(&parent_id, r.get(), "HEAD") == 0) {
        if (git_commit_lookup(&raw_parent, r.get(), &parent_id) != 0)
            return TextResult::failure(last_error("parent lookup"));
    }
    commit_ptr parent(raw_parent);
    if (parent.get() && git_oid_equal(git_commit_tree_id(parent.get()), &tree_id))
        return TextResult::success("nothing to commit");

    git_signature* raw_sig = nullptr;
    if (git_signature_default(&raw_sig, r.get()) != 0 &&
        git_signature_now(&raw_sig, fallback.name.c_str(), fallback.email.c_str()) != 0)
        return TextResult::failure(last_error("signature"));
    signature_ptr sig(raw_sig);

    git_oid commit_id;
    int err = git_commit_create_v(&commit_id, r.get(), "HEAD", sig.get(), sig.get(), nullptr,
                                  message.c_str(), tree.get(), parent.get() ? 1 : 0,
                                  static_cast<const git_commit*>(parent.get()));
    if (err != 0)
        return TextResult::failure(last_error("commit"));
    return TextResult::success(oid_to_hex(commit_id));
}

/**
 * @brief Resolve the remote a branch pushes to when none was requested.
 */
static string upstream_remote_or(git_repository* repo, const string& branch,
                                 const string& default_remote) {
    string refname = "refs/heads/" + branch;
    git_buf buf = GIT_BUF_INIT;
    string name = default_remote;
    if (git_branch_upstream_remote(&buf, repo, refname.c_str()) == 0 && buf.ptr)
        name.assign(buf.ptr, buf.size);
    git_buf_dispose(&buf);
    return name;
}

TextResult push_current_branch(const fs::path& repo, const optional<string>& remote,
                               const string& default_remote, const CredentialOptions& creds) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0)
        return TextResult::failure(last_error("open"));
    repo_ptr r(raw_repo);
    string branch_err;
    auto branch = get_current_branch(repo, &branch_err);
    if (!branch)
        return TextResult::failure("branch: " + branch_err);

    string remote_name = remote && !remote->empty()
                             ? *remote
                             : upstream_remote_or(r.get(), *branch, default_remote);
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote_name.c_str()) != 0)
        return TextResult::failure(last_error("remote " + remote_name));
    remote_ptr remote_handle(raw_remote);

    PushContext ctx;
    ctx.creds = &creds;
    git_push_options opts = GIT_PUSH_OPTIONS_INIT;
    opts.callbacks.credentials = credential_cb;
    opts.callbacks.push_update_reference = push_update_reference_cb;
    opts.callbacks.payload = &ctx;

    string spec = "refs/heads/" + *branch + ":refs/heads/" + *branch;
    char* specs[] = {&spec[0]};
    git_strarray refspecs = {specs, 1};
    if (git_remote_push(remote_handle.get(), &refspecs, &opts) != 0)
        return TextResult::failure(last_error("push to " + remote_name));
    if (!ctx.rejection.empty())
        return TextResult::failure("push to " + remote_name + " rejected: " + ctx.rejection);
    return TextResult::success(remote_name);
}

TextResult add_submodule(const fs::path& parent, const fs::path& child) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, parent.string().c_str()) != 0)
        return TextResult::failure(last_error("open"));
    repo_ptr r(raw_repo);

    std::error_code ec;
    fs::path rel = fs::relative(child, parent, ec);
    if (ec || rel.empty())
        return TextResult::failure("cannot relate " + child.string() + " to " + parent.string());
    string rel_str = rel.generic_string();

    git_submodule* raw_existing = nullptr;
    if (git_submodule_lookup(&raw_existing, r.get(), rel_str.c_str()) == 0) {
        submodule_ptr existing(raw_existing);
        return TextResult::success("already registered");
    }

    string url = get_remote_url(child, "origin").value_or("./" + rel_str);
    git_submodule* raw_sm = nullptr;
    if (git_submodule_add_setup(&raw_sm, r.get(), url.c_str(), rel_str.c_str(), 0) != 0)
        return TextResult::failure(last_error("submodule setup"));
    submodule_ptr sm(raw_sm);
    if (git_submodule_add_finalize(sm.get()) != 0)
        return TextResult::failure(last_error("submodule finalize"));
    return TextResult::success(url);
}

} // namespace git
