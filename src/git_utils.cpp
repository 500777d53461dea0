#include "git_utils.hpp"
#include <string>

using namespace std;

namespace git {

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

/**
 * @brief Populate an error string with the last libgit2 error message.
 *
 * @param error Output string receiving the error description.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

static string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

/**
 * @brief Open the repository whose working directory is exactly @p repo.
 *
 * @return Raw repository for the caller to wrap in @ref repo_ptr, or `nullptr`
 *         with @p error set.
 */
static git_repository* open_repo(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open_ext(&raw, repo.string().c_str(), GIT_REPOSITORY_OPEN_NO_SEARCH,
                                nullptr) != 0) {
        set_error(error);
        return nullptr;
    }
    return raw;
}

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    if (!fs::exists(p / ".git", ec))
        return false;
    repo_ptr r(open_repo(p, nullptr));
    return r.get() != nullptr;
}

bool init_repo(const fs::path& path, const string& initial_branch, string* error) {
    git_repository_init_options opts = GIT_REPOSITORY_INIT_OPTIONS_INIT;
    opts.flags = GIT_REPOSITORY_INIT_MKPATH;
    opts.initial_head = initial_branch.c_str();
    git_repository* raw = nullptr;
    if (git_repository_init_ext(&raw, path.string().c_str(), &opts) != 0) {
        set_error(error);
        return false;
    }
    repo_ptr r(raw);
    return true;
}

optional<string> get_local_hash(const fs::path& repo, string* error) {
    return get_ref_hash(repo, "HEAD", error);
}

optional<string> get_ref_hash(const fs::path& repo, const string& refname, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), refname.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    return oid_to_hex(oid);
}

optional<string> get_current_branch(const fs::path& repo, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_reference* head = nullptr;
    int rc = git_repository_head(&head, r.get());
    if (rc == 0) {
        reference_ptr ref(head);
        if (!git_reference_is_branch(ref.get())) {
            if (error)
                *error = "HEAD is detached";
            return nullopt;
        }
        const char* name = git_reference_shorthand(ref.get());
        if (name && *name)
            return string(name);
        set_error(error);
        return nullopt;
    }
    if (rc != GIT_EUNBORNBRANCH) {
        set_error(error);
        return nullopt;
    }
    // Unborn HEAD: read the symbolic target directly.
    git_reference* sym = nullptr;
    if (git_reference_lookup(&sym, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr ref(sym);
    const char* target = git_reference_symbolic_target(ref.get());
    string t = target ? target : "";
    const string prefix = "refs/heads/";
    if (t.rfind(prefix, 0) != 0) {
        if (error)
            *error = "HEAD does not point to a branch";
        return nullopt;
    }
    return t.substr(prefix.size());
}

bool local_branch_exists(const fs::path& repo, const string& branch) {
    repo_ptr r(open_repo(repo, nullptr));
    if (!r.get())
        return false;
    git_reference* raw = nullptr;
    if (git_branch_lookup(&raw, r.get(), branch.c_str(), GIT_BRANCH_LOCAL) != 0)
        return false;
    reference_ptr ref(raw);
    return true;
}

optional<string> get_remote_url(const fs::path& repo, const string& remote, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    remote_ptr rem(raw_remote);
    const char* url = git_remote_url(rem.get());
    if (!url) {
        set_error(error);
        return nullopt;
    }
    return string(url);
}

bool set_remote_url(const fs::path& repo, const string& remote, const string& url,
                    string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) == 0) {
        remote_ptr existing(raw_remote);
        if (git_remote_set_url(r.get(), remote.c_str(), url.c_str()) != 0) {
            set_error(error);
            return false;
        }
        return true;
    }
    if (git_remote_create(&raw_remote, r.get(), remote.c_str(), url.c_str()) != 0) {
        set_error(error);
        return false;
    }
    remote_ptr created(raw_remote);
    return true;
}

optional<string> get_config_value(const fs::path& repo, const string& key, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_config* raw_cfg = nullptr;
    if (git_repository_config_snapshot(&raw_cfg, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    config_ptr cfg(raw_cfg);
    const char* value = nullptr;
    if (git_config_get_string(&value, cfg.get(), key.c_str()) != 0 || !value) {
        set_error(error);
        return nullopt;
    }
    return string(value);
}

bool set_config_value(const fs::path& repo, const string& key, const string& value,
                      string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    git_config* raw_cfg = nullptr;
    if (git_repository_config(&raw_cfg, r.get()) != 0) {
        set_error(error);
        return false;
    }
    config_ptr cfg(raw_cfg);
    git_config* raw_local = nullptr;
    if (git_config_open_level(&raw_local, cfg.get(), GIT_CONFIG_LEVEL_LOCAL) != 0) {
        set_error(error);
        return false;
    }
    config_ptr local(raw_local);
    if (git_config_set_string(local.get(), key.c_str(), value.c_str()) != 0) {
        set_error(error);
        return false;
    }
    return true;
}

bool has_upstream(const fs::path& repo, const string& branch) {
    return get_config_value(repo, "branch." + branch + ".remote").has_value() &&
           get_config_value(repo, "branch." + branch + ".merge").has_value();
}

bool set_upstream(const fs::path& repo, const string& branch, const string& remote,
                  string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    git_reference* raw = nullptr;
    if (git_branch_lookup(&raw, r.get(), branch.c_str(), GIT_BRANCH_LOCAL) != 0) {
        set_error(error);
        return false;
    }
    reference_ptr ref(raw);
    const string upstream = remote + "/" + branch;
    if (git_branch_set_upstream(ref.get(), upstream.c_str()) != 0) {
        set_error(error);
        return false;
    }
    return true;
}

bool has_uncommitted_changes(const fs::path& repo) {
    repo_ptr r(open_repo(repo, nullptr));
    if (!r.get())
        return false;
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED | GIT_STATUS_OPT_RENAMES_HEAD_TO_INDEX;
    git_status_list* raw_list = nullptr;
    if (git_status_list_new(&raw_list, r.get(), &opts) != 0)
        return false;
    status_list_ptr list(raw_list);
    return git_status_list_entrycount(list.get()) > 0;
}

bool ahead_behind(const fs::path& repo, const string& refname, size_t& ahead, size_t& behind,
                  string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    git_oid local;
    git_oid upstream;
    if (git_reference_name_to_id(&local, r.get(), "HEAD") != 0 ||
        git_reference_name_to_id(&upstream, r.get(), refname.c_str()) != 0) {
        set_error(error);
        return false;
    }
    if (git_graph_ahead_behind(&ahead, &behind, r.get(), &local, &upstream) != 0) {
        set_error(error);
        return false;
    }
    return true;
}

} // namespace git
