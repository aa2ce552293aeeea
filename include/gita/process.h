#pragma once

/// @file process.h
/// Running external commands in a repository directory.

#include <filesystem>
#include <string>
#include <vector>

namespace gita {

/// Exit status and captured output of a detached run.
struct CapturedRun {
    int         exit_code = 0; ///< Exit status; 128 + signal number if killed.
    std::string out;           ///< Everything written to stdout.
    std::string err;           ///< Everything written to stderr.
};

/// Starts external commands.  Dispatcher talks to this interface so the
/// process layer can be replaced (tests use a recording fake).
class Runner {
public:
    virtual ~Runner() = default;

    /// Run `argv` in `cwd` with the caller's stdin/stdout/stderr and wait.
    /// @return the exit status.
    /// @throws SpawnError if the command cannot be started.
    virtual int run_attached(const std::vector<std::string>& argv,
                             const std::filesystem::path& cwd) = 0;

    /// Run `argv` in `cwd` in a new session with stdin on /dev/null and
    /// stdout/stderr captured, and wait.
    /// @throws SpawnError if the command cannot be started.
    virtual CapturedRun run_captured(const std::vector<std::string>& argv,
                                     const std::filesystem::path& cwd) = 0;
};

/// fork/exec implementation of Runner.  Safe to call from several threads
/// at once; every descriptor it creates is close-on-exec.
class PosixRunner : public Runner {
public:
    int run_attached(const std::vector<std::string>& argv,
                     const std::filesystem::path& cwd) override;

    CapturedRun run_captured(const std::vector<std::string>& argv,
                             const std::filesystem::path& cwd) override;
};

} // namespace gita
