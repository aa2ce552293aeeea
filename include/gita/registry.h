#pragma once

/// @file registry.h
/// The validated, collision-resolved set of registered repositories.

#include "path_store.h"
#include "types.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gita {

/// Options for Registry.
struct RegistryOptions {
    /// Throw StoreCorruptError on a malformed store line instead of
    /// skipping it with a warning.
    bool strict = false;
};

/// Return the key under which `path` is registered when `name` may already
/// be taken in `repos`.
///
/// `name` itself if free; otherwise the parent directory name is
/// prepended (`parent/name`), then the grandparent, and so on.  Returns
/// nullopt when every ancestor-qualified key is taken.
std::optional<std::string> unique_key(const RepoMap& repos,
                                      const std::filesystem::path& path,
                                      const std::string& name);

/// Registry of repositories for one run.
///
/// The first load() reads the PathStore and caches the result for the
/// lifetime of the object; later calls return the cached mapping even if
/// the file changed.  Mutations update the cache together with the file.
///
/// Usage:
/// @code
///     gita::Registry reg(gita::PathStore(gita::config::repo_path_file()));
///     for (auto& e : reg.load()) std::cout << e.name << "\n";
/// @endcode
class Registry {
public:
    explicit Registry(PathStore store, RegistryOptions opts = {});

    /// Return the name → path mapping, reading the store on first use.
    ///
    /// Lines that are malformed, not a repository, a duplicate path, or
    /// without a free name are left out of the mapping but stay in the
    /// file across rename() and remove().  Name collisions are resolved
    /// with unique_key().
    /// @throws StoreCorruptError in strict mode.
    /// @throws IoError if the store cannot be read.
    const RepoMap& load();

    /// Register every repository in `paths` that is not registered yet.
    ///
    /// Paths are made absolute; the name is the last path segment.
    /// @return AddReport listing the appended entries.
    /// @throws InvalidNameError if a path contains ',' or a line break.
    /// @throws IoError on write failures.
    AddReport add(const std::vector<std::string>& paths);

    /// Rename `old_name` to `new_name` and rewrite the store.
    /// @throws KeyNotFoundError if `old_name` is not registered.
    /// @throws KeyExistsError if `new_name` is already registered.
    /// @throws InvalidNameError if `new_name` cannot be stored.
    void rename(const std::string& old_name, const std::string& new_name);

    /// Unregister `names` and rewrite the store.  No-op when the store
    /// file does not exist.
    /// @return number of repositories removed.
    /// @throws KeyNotFoundError if any name is not registered (nothing is
    ///         written in that case).
    size_t remove(const std::vector<std::string>& names);

    /// Problems found while loading (malformed lines, dropped duplicates).
    const std::vector<std::string>& warnings() const { return warnings_; }

    const PathStore& store() const { return store_; }

private:
    RepoMap& snapshot();
    void warn(const std::string& msg);

    PathStore              store_;
    RegistryOptions        opts_;
    std::optional<RepoMap> cache_;
    std::vector<StoreRecord> kept_; ///< Stored lines left out of the active view.
    std::vector<std::string> warnings_;
};

} // namespace gita
