#include "gita/repo.h"
#include "gita/error.h"

#include <git2.h>

#include <string>
#include <system_error>

namespace gita {

// ---------------------------------------------------------------------------
// libgit2 lifecycle: initialise once per process
// ---------------------------------------------------------------------------

namespace {
struct LibGit2Init {
    LibGit2Init()  { git_libgit2_init(); }
    ~LibGit2Init() { git_libgit2_shutdown(); }
};
static LibGit2Init s_libgit2;

[[noreturn]] void throw_git(const std::string& ctx) {
    const git_error* e = git_error_last();
    std::string msg = ctx;
    if (e && e->message) { msg += ": "; msg += e->message; }
    throw GitError(msg);
}

/// Owns a git_repository* for the duration of one inspection.
struct RepoHandle {
    git_repository* repo = nullptr;
    RepoHandle() = default;
    ~RepoHandle() { if (repo) git_repository_free(repo); }
    RepoHandle(const RepoHandle&) = delete;
    RepoHandle& operator=(const RepoHandle&) = delete;
};

void read_head(git_repository* repo, RepoState& st) {
    git_reference* head = nullptr;
    int rc = git_repository_head(&head, repo);
    if (rc == GIT_EUNBORNBRANCH || rc == GIT_ENOTFOUND) {
        st.unborn = true;
        git_reference* sym = nullptr;
        if (git_reference_lookup(&sym, repo, "HEAD") == 0) {
            const char* target = git_reference_symbolic_target(sym);
            std::string t = target ? target : "";
            const std::string prefix = "refs/heads/";
            st.branch = t.compare(0, prefix.size(), prefix) == 0
                            ? t.substr(prefix.size()) : t;
            git_reference_free(sym);
        }
        return;
    }
    if (rc != 0) throw_git("git_repository_head");

    st.detached = git_repository_head_detached(repo) == 1;
    if (st.detached) {
        char buf[8];
        git_oid_tostr(buf, sizeof(buf), git_reference_target(head));
        st.branch = buf;
    } else {
        st.branch = git_reference_shorthand(head);
    }

    git_object* obj = nullptr;
    if (git_reference_peel(&obj, head, GIT_OBJECT_COMMIT) == 0) {
        const char* s = git_commit_summary(reinterpret_cast<git_commit*>(obj));
        st.summary = s ? s : "";
        git_object_free(obj);
    }

    if (!st.detached) {
        git_reference* upstream = nullptr;
        if (git_branch_upstream(&upstream, head) == 0) {
            const git_oid* local  = git_reference_target(head);
            git_reference* resolved = nullptr;
            if (local && git_reference_resolve(&resolved, upstream) == 0) {
                const git_oid* remote = git_reference_target(resolved);
                if (remote &&
                    git_graph_ahead_behind(&st.ahead, &st.behind,
                                           repo, local, remote) == 0) {
                    if (st.ahead && st.behind)  st.tracking = Tracking::Diverged;
                    else if (st.ahead)          st.tracking = Tracking::Ahead;
                    else if (st.behind)         st.tracking = Tracking::Behind;
                    else                        st.tracking = Tracking::InSync;
                }
                git_reference_free(resolved);
            }
            git_reference_free(upstream);
        }
    }
    git_reference_free(head);
}

void read_status(git_repository* repo, RepoState& st) {
    git_status_options opts = GIT_STATUS_OPTIONS_INIT;
    opts.show  = GIT_STATUS_SHOW_INDEX_AND_WORKDIR;
    opts.flags = GIT_STATUS_OPT_INCLUDE_UNTRACKED |
                 GIT_STATUS_OPT_EXCLUDE_SUBMODULES;

    git_status_list* list = nullptr;
    if (git_status_list_new(&list, repo, &opts) != 0)
        throw_git("git_status_list_new");

    const unsigned staged_mask =
        GIT_STATUS_INDEX_NEW | GIT_STATUS_INDEX_MODIFIED |
        GIT_STATUS_INDEX_DELETED | GIT_STATUS_INDEX_RENAMED |
        GIT_STATUS_INDEX_TYPECHANGE;
    const unsigned unstaged_mask =
        GIT_STATUS_WT_MODIFIED | GIT_STATUS_WT_DELETED |
        GIT_STATUS_WT_RENAMED | GIT_STATUS_WT_TYPECHANGE;

    size_t n = git_status_list_entrycount(list);
    for (size_t i = 0; i < n; ++i) {
        const git_status_entry* e = git_status_byindex(list, i);
        if (!e) continue;
        if (e->status & staged_mask)          st.staged = true;
        if (e->status & unstaged_mask)        st.unstaged = true;
        if (e->status & GIT_STATUS_WT_NEW)    st.untracked = true;
    }
    git_status_list_free(list);
}

void open_repo(RepoHandle& h, const std::filesystem::path& path) {
    if (git_repository_open_ext(&h.repo, path.string().c_str(),
                                GIT_REPOSITORY_OPEN_NO_SEARCH, nullptr) != 0)
        throw_git("git_repository_open_ext(" + path.string() + ")");
}

} // anonymous namespace

bool is_repository(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) return false;
    return std::filesystem::exists(path / ".git", ec);
}

RepoState inspect_head(const std::filesystem::path& path) {
    RepoHandle h;
    open_repo(h, path);

    RepoState st;
    read_head(h.repo, st);
    return st;
}

RepoState inspect(const std::filesystem::path& path) {
    RepoHandle h;
    open_repo(h, path);

    RepoState st;
    read_head(h.repo, st);
    if (!git_repository_is_bare(h.repo)) read_status(h.repo, st);
    return st;
}

} // namespace gita
