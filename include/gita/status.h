#pragma once

/// @file status.h
/// One summary line per repository, built from an ordered list of probes.

#include "types.h"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace gita {

// ---------------------------------------------------------------------------
// Probe
// ---------------------------------------------------------------------------

/// Queries one aspect of a repository and renders it as a short token.
class Probe {
public:
    virtual ~Probe() = default;

    /// Identifier used by `gita info` (e.g. "branch").
    virtual std::string name() const = 0;

    /// Display token for the repository at `path`.
    /// @throws GitError if the repository cannot be read.
    virtual std::string describe(const std::filesystem::path& path) const = 0;
};

/// Branch name colored by upstream relation, followed by `*` (unstaged
/// changes), `+` (staged changes) and `_` (untracked files).
class BranchProbe : public Probe {
public:
    explicit BranchProbe(bool color = true) : color_(color) {}
    std::string name() const override { return "branch"; }
    std::string describe(const std::filesystem::path& path) const override;
private:
    bool color_;
};

/// Summary line of the HEAD commit.
class CommitMessageProbe : public Probe {
public:
    std::string name() const override { return "commit_msg"; }
    std::string describe(const std::filesystem::path& path) const override;
};

/// The repository path.
class PathProbe : public Probe {
public:
    std::string name() const override { return "path"; }
    std::string describe(const std::filesystem::path& path) const override;
};

/// Names of every built-in probe, in registration order.
std::vector<std::string> probe_names();

/// Names of the probes `gita ll` uses.
std::vector<std::string> default_probe_names();

/// Create the built-in probe called `name`.
/// @throws KeyNotFoundError for an unknown name.
std::unique_ptr<Probe> make_probe(const std::string& name, bool color = true);

// ---------------------------------------------------------------------------
// StatusAggregator
// ---------------------------------------------------------------------------

/// Runs every probe against every repository.
class StatusAggregator {
public:
    /// Pipeline of default_probe_names().
    explicit StatusAggregator(bool color = true);

    explicit StatusAggregator(std::vector<std::unique_ptr<Probe>> probes);

    /// Emit one line per repository, sorted by name, to `sink`.
    ///
    /// Each line is the name left-aligned to one more than the longest
    /// name, then every probe's token separated by single spaces.  Lines
    /// are produced one at a time; calling again starts over.
    void describe(const RepoMap& repos,
                  const std::function<void(const std::string&)>& sink) const;

    /// All lines of describe() at once.
    std::vector<std::string> describe(const RepoMap& repos) const;

    /// Names of the probes in this pipeline.
    std::vector<std::string> names() const;

private:
    std::vector<std::unique_ptr<Probe>> probes_;
};

} // namespace gita
