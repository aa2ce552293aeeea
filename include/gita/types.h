#pragma once

#include "error.h"

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace gita {

// ---------------------------------------------------------------------------
// RepoEntry
// ---------------------------------------------------------------------------

/// A registered repository.
struct RepoEntry {
    std::string           name; ///< Short name, unique within a RepoMap.
    std::filesystem::path path; ///< Absolute path of the working directory.

    bool operator==(const RepoEntry& o) const {
        return name == o.name && path == o.path;
    }
};

// ---------------------------------------------------------------------------
// RepoMap
// ---------------------------------------------------------------------------

/// Name → path mapping that keeps insertion order.
///
/// Iteration order is the order entries were inserted (for a loaded
/// registry: the order of lines in the store file).  Lookups are linear,
/// which is fine for the tens-to-hundreds of repositories a user registers.
class RepoMap {
public:
    using const_iterator = std::vector<RepoEntry>::const_iterator;

    RepoMap() = default;
    RepoMap(std::initializer_list<RepoEntry> entries) {
        for (auto& e : entries) insert(e.name, e.path);
    }

    /// Insert or overwrite `name`.  Overwriting keeps the original position.
    void insert(const std::string& name, const std::filesystem::path& path) {
        auto it = find_it(name);
        if (it != entries_.end()) {
            it->path = path;
            return;
        }
        entries_.push_back(RepoEntry{name, path});
    }

    /// Remove `name`.  Returns false when it was not present.
    bool erase(const std::string& name) {
        auto it = find_it(name);
        if (it == entries_.end()) return false;
        entries_.erase(it);
        return true;
    }

    bool contains(const std::string& name) const {
        return find(name) != nullptr;
    }

    /// Return the entry for `name`, or nullptr.
    const RepoEntry* find(const std::string& name) const {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const RepoEntry& e) { return e.name == name; });
        return it == entries_.end() ? nullptr : &*it;
    }

    /// Return the entry registered for `path`, or nullptr.
    const RepoEntry* find_path(const std::filesystem::path& path) const {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const RepoEntry& e) { return e.path == path; });
        return it == entries_.end() ? nullptr : &*it;
    }

    /// Path for `name`.
    /// @throws KeyNotFoundError if `name` is absent.
    const std::filesystem::path& at(const std::string& name) const {
        auto* e = find(name);
        if (!e) throw KeyNotFoundError(name);
        return e->path;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (auto& e : entries_) out.push_back(e.name);
        return out;
    }

    size_t size()  const { return entries_.size(); }
    bool   empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end()   const { return entries_.end(); }

    bool operator==(const RepoMap& o) const { return entries_ == o.entries_; }

private:
    std::vector<RepoEntry>::iterator find_it(const std::string& name) {
        return std::find_if(entries_.begin(), entries_.end(),
                            [&](const RepoEntry& e) { return e.name == name; });
    }

    std::vector<RepoEntry> entries_;
};

// ---------------------------------------------------------------------------
// AddReport
// ---------------------------------------------------------------------------

/// Outcome of Registry::add.
struct AddReport {
    std::vector<RepoEntry>   added;    ///< Entries appended to the store.
    std::vector<std::string> skipped;  ///< Candidates that were not repositories.

    size_t count() const { return added.size(); }

    /// One-line summary printed by the CLI.
    std::string summary() const {
        if (added.empty()) return "No new repos found!";
        return "Found " + std::to_string(added.size()) + " new repo(s).";
    }
};

// ---------------------------------------------------------------------------
// CommandSpec
// ---------------------------------------------------------------------------

/// A command to run once per target repository.
struct CommandSpec {
    std::vector<std::string> argv;    ///< Full argv, argv[0] is the executable.
    RepoMap                  targets; ///< Repositories to run in.
    bool                     allow_concurrent = true;

    /// The sub-command verb (argv[1]), or empty.
    std::string verb() const { return argv.size() > 1 ? argv[1] : std::string(); }
};

// ---------------------------------------------------------------------------
// DispatchResult
// ---------------------------------------------------------------------------

/// How a CommandSpec was executed.
enum class Strategy {
    Serial,      ///< One target at a time with inherited stdio.
    Concurrent,  ///< All targets at once, output captured.
};

/// Summary of a Dispatcher::run call.
struct DispatchResult {
    Strategy                 strategy = Strategy::Serial;
    std::vector<std::string> failed;       ///< Names that failed concurrently (then retried).
    size_t                   invocations = 0; ///< Subprocesses started in total.
};

} // namespace gita
