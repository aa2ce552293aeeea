#pragma once

/// @file dispatcher.h
/// Run one external command across many repositories.

#include "process.h"
#include "types.h"

#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace gita {

/// Restrict `registry` to `names`, in the given order.  An empty `names`
/// selects every repository in registry order.
/// @throws KeyNotFoundError for an unknown name.
RepoMap resolve_targets(const RepoMap& registry,
                        const std::vector<std::string>& names);

/// Build the CommandSpec for `argv` over the named targets.
///
/// `allow_concurrent` is false when argv[1] (the git verb) is in
/// `denylist`.
/// @throws KeyNotFoundError for an unknown name.
CommandSpec make_command(const RepoMap& registry,
                         const std::vector<std::string>& names,
                         std::vector<std::string> argv,
                         const std::set<std::string>& denylist);

/// Words of `gita super`: leading words that name registered repositories
/// select the targets, the rest is the git command line.
struct SuperArgs {
    std::vector<std::string> repos;
    std::vector<std::string> args;
};

SuperArgs split_super_args(const RepoMap& registry,
                           const std::vector<std::string>& words);

/// Number of commands allowed to run at once: at most 16, fewer when the
/// open-file limit cannot hold the pipes of that many captured runs.
size_t default_max_workers();

/// Executes a CommandSpec once per target.
///
/// A single target, or a command that may prompt (allow_concurrent ==
/// false), runs serially with the terminal attached.  Otherwise the
/// targets run concurrently, at most `max_workers` at a time, with stdin
/// closed and output captured; once all of them finished, the failed ones
/// are run again serially so the user can answer prompts.
class Dispatcher {
public:
    explicit Dispatcher(Runner& runner, std::ostream& out = std::cout,
                        size_t max_workers = default_max_workers());

    /// @throws SpawnError if a command cannot be started.  In the
    ///         concurrent phase every other target still runs first.
    DispatchResult run(const CommandSpec& cmd);

private:
    void run_serial(const RepoEntry& target,
                    const std::vector<std::string>& argv);

    /// Run every target on the worker pool, wait for all, return the
    /// failed ones.
    std::vector<RepoEntry> run_concurrent(const CommandSpec& cmd);

    void report(const RepoEntry& target, const CapturedRun& run);

    Runner&       runner_;
    std::ostream& out_;
    size_t        max_workers_;
    std::mutex    out_mutex_;
};

} // namespace gita
