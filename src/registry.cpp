#include "gita/registry.h"
#include "gita/error.h"
#include "gita/log.h"
#include "gita/repo.h"

#include <set>
#include <system_error>

namespace gita {

namespace {

/// Absolute, lexically normal, without a trailing separator.
std::filesystem::path normalize_candidate(const std::string& p) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(p, ec);
    if (ec) throw IoError("cannot resolve " + p + ": " + ec.message());
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() &&
        abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

} // anonymous namespace

std::optional<std::string> unique_key(const RepoMap& repos,
                                      const std::filesystem::path& path,
                                      const std::string& name) {
    if (!repos.contains(name)) return name;

    std::string key = name;
    auto dir = path.parent_path();
    while (dir.has_filename()) {
        key = dir.filename().string() + "/" + key;
        if (!repos.contains(key)) return key;
        dir = dir.parent_path();
    }
    return std::nullopt;
}

Registry::Registry(PathStore store, RegistryOptions opts)
    : store_(std::move(store)), opts_(opts) {}

void Registry::warn(const std::string& msg) {
    GITA_LOG_WARN(msg);
    warnings_.push_back(msg);
}

const RepoMap& Registry::load() {
    return snapshot();
}

RepoMap& Registry::snapshot() {
    if (cache_) return *cache_;

    RepoMap repos;
    for (auto& rec : store_.read()) {
        if (rec.malformed) {
            if (opts_.strict)
                throw StoreCorruptError(store_.file().string(), rec.line_no);
            warn("skipping malformed entry in " + store_.file().string() +
                 " at line " + std::to_string(rec.line_no));
            kept_.push_back(rec);
            continue;
        }

        std::filesystem::path path(rec.path);
        if (!is_repository(path)) {
            GITA_LOG_DEBUG("not a repository, ignored: " + rec.path);
            kept_.push_back(rec);
            continue;
        }

        if (auto* dup = repos.find_path(path)) {
            warn("duplicate entry for " + rec.path + " at line " +
                 std::to_string(rec.line_no) + " ignored (registered as '" +
                 dup->name + "')");
            kept_.push_back(rec);
            continue;
        }

        auto key = unique_key(repos, path, rec.name);
        if (!key) {
            warn("cannot find a unique name for " + rec.path + " at line " +
                 std::to_string(rec.line_no) + ", ignored");
            kept_.push_back(rec);
            continue;
        }
        if (*key != rec.name) {
            GITA_LOG_DEBUG("name collision: " + rec.path + " registered as '" +
                           *key + "'");
        }
        repos.insert(*key, path);
    }

    cache_ = std::move(repos);
    return *cache_;
}

AddReport Registry::add(const std::vector<std::string>& paths) {
    auto& repos = snapshot();

    AddReport report;
    std::set<std::filesystem::path> seen;
    for (auto& p : paths) {
        auto abs = normalize_candidate(p);
        if (!is_repository(abs)) {
            report.skipped.push_back(p);
            continue;
        }
        if (repos.find_path(abs) || !seen.insert(abs).second) continue;

        RepoEntry entry{abs.filename().string(), abs};
        PathStore::validate(entry);
        report.added.push_back(std::move(entry));
    }

    store_.append(report.added);

    for (auto& e : report.added) {
        if (auto key = unique_key(repos, e.path, e.name)) {
            repos.insert(*key, e.path);
        } else {
            warn("cannot find a unique name for " + e.path.string() +
                 ", not active until one is free");
            kept_.push_back(PathStore::parse_line(
                e.path.string() + "," + e.name, 0));
        }
    }
    return report;
}

void Registry::rename(const std::string& old_name, const std::string& new_name) {
    auto& repos = snapshot();

    auto path = repos.at(old_name);
    if (new_name == old_name) return;
    if (repos.contains(new_name)) throw KeyExistsError(new_name);
    PathStore::validate(RepoEntry{new_name, path});

    RepoMap updated = repos;
    updated.erase(old_name);
    updated.insert(new_name, path);
    store_.rewrite(updated, kept_);
    repos = std::move(updated);
}

size_t Registry::remove(const std::vector<std::string>& names) {
    if (!store_.exists()) return 0;

    auto& repos = snapshot();
    for (auto& n : names) {
        if (!repos.contains(n)) throw KeyNotFoundError(n);
    }

    RepoMap updated = repos;
    std::set<std::string> removed_paths;
    size_t removed = 0;
    for (auto& n : names) {
        auto* e = updated.find(n);
        if (!e) continue;
        removed_paths.insert(e->path.string());
        updated.erase(n);
        ++removed;
    }

    // Duplicate lines of a removed path go with it.
    std::vector<StoreRecord> kept;
    for (auto& r : kept_) {
        if (r.malformed || !removed_paths.count(r.path)) kept.push_back(r);
    }
    store_.rewrite(updated, kept);
    kept_ = std::move(kept);
    repos = std::move(updated);
    return removed;
}

} // namespace gita
