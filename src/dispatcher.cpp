#include "gita/dispatcher.h"
#include "gita/error.h"
#include "gita/log.h"

#include <algorithm>
#include <exception>
#include <future>
#include <system_error>

#include <sys/resource.h>

namespace gita {

namespace {

constexpr size_t kMaxWorkers   = 16;
constexpr size_t kFdsPerRun    = 6;  // status, stdout and stderr pipes
constexpr size_t kReservedFds  = 32;

void write_block(std::ostream& os, const std::string& text) {
    os << text;
    if (!text.empty() && text.back() != '\n') os << '\n';
}

} // anonymous namespace

size_t default_max_workers() {
    struct rlimit lim;
    if (::getrlimit(RLIMIT_NOFILE, &lim) != 0 || lim.rlim_cur == RLIM_INFINITY)
        return kMaxWorkers;
    auto soft = static_cast<size_t>(lim.rlim_cur);
    if (soft < kReservedFds + kFdsPerRun) return 1;
    return std::min(kMaxWorkers, (soft - kReservedFds) / kFdsPerRun);
}

RepoMap resolve_targets(const RepoMap& registry,
                        const std::vector<std::string>& names) {
    if (names.empty()) return registry;

    RepoMap out;
    for (auto& n : names) out.insert(n, registry.at(n));
    return out;
}

CommandSpec make_command(const RepoMap& registry,
                         const std::vector<std::string>& names,
                         std::vector<std::string> argv,
                         const std::set<std::string>& denylist) {
    CommandSpec cmd;
    cmd.targets = resolve_targets(registry, names);
    cmd.argv    = std::move(argv);
    cmd.allow_concurrent = denylist.count(cmd.verb()) == 0;
    return cmd;
}

SuperArgs split_super_args(const RepoMap& registry,
                           const std::vector<std::string>& words) {
    SuperArgs out;
    size_t i = 0;
    for (; i < words.size() && registry.contains(words[i]); ++i) {
        out.repos.push_back(words[i]);
    }
    out.args.assign(words.begin() + static_cast<std::ptrdiff_t>(i), words.end());
    return out;
}

Dispatcher::Dispatcher(Runner& runner, std::ostream& out, size_t max_workers)
    : runner_(runner), out_(out), max_workers_(std::max<size_t>(1, max_workers)) {}

DispatchResult Dispatcher::run(const CommandSpec& cmd) {
    DispatchResult result;
    if (cmd.targets.empty()) return result;

    if (cmd.targets.size() == 1 || !cmd.allow_concurrent) {
        result.strategy = Strategy::Serial;
        for (auto& t : cmd.targets) {
            run_serial(t, cmd.argv);
            ++result.invocations;
        }
        return result;
    }

    result.strategy = Strategy::Concurrent;
    auto failed = run_concurrent(cmd);
    result.invocations = cmd.targets.size();

    // Reconciliation: only after every concurrent run has finished.
    for (auto& t : failed) {
        GITA_LOG_DEBUG("retrying " + t.name + " attached to the terminal");
        run_serial(t, cmd.argv);
        ++result.invocations;
        result.failed.push_back(t.name);
    }
    return result;
}

void Dispatcher::run_serial(const RepoEntry& target,
                            const std::vector<std::string>& argv) {
    {
        std::lock_guard<std::mutex> lk(out_mutex_);
        out_ << target.path.string() << std::endl;
    }
    int rc = runner_.run_attached(argv, target.path);
    if (rc != 0) {
        GITA_LOG_DEBUG(target.name + ": exit status " + std::to_string(rc));
    }
}

std::vector<RepoEntry> Dispatcher::run_concurrent(const CommandSpec& cmd) {
    std::vector<RepoEntry> targets(cmd.targets.begin(), cmd.targets.end());
    std::vector<char> failed_flags(targets.size(), 0);
    std::vector<std::exception_ptr> errors(targets.size());

    std::mutex next_mutex;
    size_t next = 0;
    auto worker = [&]() {
        for (;;) {
            size_t i;
            {
                std::lock_guard<std::mutex> lk(next_mutex);
                if (next == targets.size()) return;
                i = next++;
            }
            try {
                CapturedRun run = runner_.run_captured(cmd.argv, targets[i].path);
                report(targets[i], run);
                failed_flags[i] = run.exit_code != 0;
            } catch (const std::exception&) {
                errors[i] = std::current_exception();
            }
        }
    };

    size_t n = std::min(max_workers_, targets.size());
    std::vector<std::future<void>> workers;
    workers.reserve(n);
    for (size_t w = 0; w < n; ++w) {
        try {
            workers.push_back(std::async(std::launch::async, worker));
        } catch (const std::system_error& e) {
            GITA_LOG_WARN("started " + std::to_string(workers.size()) + " of " +
                          std::to_string(n) + " workers: " + e.what());
            break;
        }
    }
    if (workers.empty()) worker();

    // Barrier: every target has been run before any result is looked at.
    for (auto& f : workers) f.wait();
    for (auto& f : workers) f.get();
    for (auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    std::vector<RepoEntry> failed;
    for (size_t i = 0; i < targets.size(); ++i) {
        if (failed_flags[i]) failed.push_back(targets[i]);
    }
    return failed;
}

void Dispatcher::report(const RepoEntry& target, const CapturedRun& run) {
    std::lock_guard<std::mutex> lk(out_mutex_);
    out_ << target.path.string() << "\n";
    write_block(out_, run.out);
    write_block(out_, run.err);
    out_.flush();
}

} // namespace gita
