#pragma once

/// @file repo.h
/// Repository detection and read-only inspection (libgit2).

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace gita {

/// True if `path` is a directory containing a `.git` marker.
///
/// The marker is a directory for ordinary clones and a file for worktrees
/// and submodules; both count.
bool is_repository(const std::filesystem::path& path);

/// Relation of the current branch to its upstream.
enum class Tracking {
    NoUpstream, ///< Branch has no remote-tracking branch (or HEAD is detached).
    InSync,     ///< Same commit as upstream.
    Ahead,      ///< Local has commits the upstream lacks.
    Behind,     ///< Upstream has commits the local branch lacks.
    Diverged,   ///< Both sides have unique commits.
};

/// Snapshot of a working directory's state.
struct RepoState {
    std::string branch;            ///< Branch shorthand, or short HEAD id when detached.
    bool        detached  = false;
    bool        unborn    = false; ///< HEAD points at a branch with no commits.
    Tracking    tracking  = Tracking::NoUpstream;
    size_t      ahead     = 0;
    size_t      behind    = 0;
    bool        staged    = false; ///< Index differs from HEAD.
    bool        unstaged  = false; ///< Work tree differs from index (tracked files).
    bool        untracked = false; ///< Untracked, non-ignored files exist.
    std::string summary;           ///< First line of the HEAD commit message.
};

/// Inspect the repository at `path`.
/// @throws GitError if libgit2 cannot open or read it.
RepoState inspect(const std::filesystem::path& path);

/// Like inspect(), but reads HEAD only: `staged`, `unstaged` and
/// `untracked` stay false and the work tree is not scanned.
/// @throws GitError if libgit2 cannot open or read it.
RepoState inspect_head(const std::filesystem::path& path);

} // namespace gita
