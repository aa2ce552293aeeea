#include "gita/status.h"
#include "gita/error.h"
#include "gita/log.h"
#include "gita/repo.h"

#include <algorithm>

namespace gita {

namespace {

namespace color {
constexpr const char* white  = "\x1b[37m";
constexpr const char* red    = "\x1b[31m";
constexpr const char* green  = "\x1b[32m";
constexpr const char* yellow = "\x1b[33m";
constexpr const char* purple = "\x1b[35m";
constexpr const char* end    = "\x1b[0m";
} // namespace color

const char* tracking_color(Tracking t) {
    switch (t) {
        case Tracking::NoUpstream: return color::white;
        case Tracking::InSync:     return color::green;
        case Tracking::Ahead:      return color::purple;
        case Tracking::Behind:     return color::yellow;
        case Tracking::Diverged:   return color::red;
    }
    return color::white; // unreachable
}

/// Width in UTF-8 code points (continuation bytes are not counted).
size_t display_width(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string pad_right(std::string s, size_t width) {
    size_t w = display_width(s);
    if (w < width) s.append(width - w, ' ');
    return s;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Probes
// ---------------------------------------------------------------------------

std::string BranchProbe::describe(const std::filesystem::path& path) const {
    RepoState st = inspect(path);

    std::string symbols;
    if (st.unstaged)  symbols += '*';
    if (st.staged)    symbols += '+';
    if (st.untracked) symbols += '_';

    std::string token = pad_right(st.branch + " " + symbols, 10);
    if (!color_) return token;
    return tracking_color(st.tracking) + token + color::end;
}

std::string CommitMessageProbe::describe(const std::filesystem::path& path) const {
    return inspect_head(path).summary;
}

std::string PathProbe::describe(const std::filesystem::path& path) const {
    return path.string();
}

std::vector<std::string> probe_names() {
    return {"branch", "commit_msg", "path"};
}

std::vector<std::string> default_probe_names() {
    return {"branch", "commit_msg"};
}

std::unique_ptr<Probe> make_probe(const std::string& name, bool color) {
    if (name == "branch")     return std::make_unique<BranchProbe>(color);
    if (name == "commit_msg") return std::make_unique<CommitMessageProbe>();
    if (name == "path")       return std::make_unique<PathProbe>();
    throw KeyNotFoundError(name);
}

// ---------------------------------------------------------------------------
// StatusAggregator
// ---------------------------------------------------------------------------

StatusAggregator::StatusAggregator(bool color) {
    for (auto& n : default_probe_names()) probes_.push_back(make_probe(n, color));
}

StatusAggregator::StatusAggregator(std::vector<std::unique_ptr<Probe>> probes)
    : probes_(std::move(probes)) {}

void StatusAggregator::describe(
        const RepoMap& repos,
        const std::function<void(const std::string&)>& sink) const {
    if (repos.empty()) return;

    std::vector<const RepoEntry*> sorted;
    sorted.reserve(repos.size());
    size_t width = 0;
    for (auto& e : repos) {
        sorted.push_back(&e);
        width = std::max(width, display_width(e.name));
    }
    width += 1;
    std::sort(sorted.begin(), sorted.end(),
              [](const RepoEntry* a, const RepoEntry* b) { return a->name < b->name; });

    for (auto* e : sorted) {
        std::string line = pad_right(e->name, width);
        for (size_t i = 0; i < probes_.size(); ++i) {
            if (i > 0) line += ' ';
            try {
                line += probes_[i]->describe(e->path);
            } catch (const GitError& err) {
                GITA_LOG_WARN(e->name + ": " + probes_[i]->name() + ": " + err.what());
                line += '?';
            }
        }
        sink(line);
    }
}

std::vector<std::string> StatusAggregator::describe(const RepoMap& repos) const {
    std::vector<std::string> out;
    describe(repos, [&out](const std::string& line) { out.push_back(line); });
    return out;
}

std::vector<std::string> StatusAggregator::names() const {
    std::vector<std::string> out;
    out.reserve(probes_.size());
    for (auto& p : probes_) out.push_back(p->name());
    return out;
}

} // namespace gita
