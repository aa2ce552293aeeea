#include "gita/process.h"
#include "gita/error.h"
#include "gita/log.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gita {

namespace {

/// RAII file descriptor.
struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    ~Fd() { reset(); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    void reset() {
        if (fd >= 0) ::close(fd);
        fd = -1;
    }
};

/// Pipes are part of starting `program`; failing to make one means the
/// command cannot be started.
void make_pipe(Fd& rd, Fd& wr, const std::string& program) {
    int p[2];
    if (::pipe2(p, O_CLOEXEC) != 0) {
        throw SpawnError(program, std::string("pipe failed: ") +
                                      std::strerror(errno));
    }
    rd.fd = p[0];
    wr.fd = p[1];
}

int wait_child(pid_t pid) {
    int st = 0;
    pid_t r;
    do {
        r = ::waitpid(pid, &st, 0);
    } while (r == -1 && errno == EINTR);

    if (r == -1) return -1;
    if (WIFEXITED(st)) return WEXITSTATUS(st);
    if (WIFSIGNALED(st)) return 128 + WTERMSIG(st);
    return -1;
}

/// Child-side failure: report errno on the status pipe and exit.
[[noreturn]] void child_fail(int status_fd) {
    int e = errno;
    ssize_t ignored = ::write(status_fd, &e, sizeof(e));
    (void)ignored;
    ::_exit(127);
}

struct SpawnSpec {
    bool detached = false; ///< new session, stdin from /dev/null, output to pipes
    int  out_fd   = -1;    ///< write end for stdout when detached
    int  err_fd   = -1;    ///< write end for stderr when detached
};

/// fork + exec `argv` in `cwd`.  Throws SpawnError if chdir or exec fails
/// in the child (reported back through a close-on-exec pipe).
pid_t spawn(const std::vector<std::string>& argv,
            const std::filesystem::path& cwd,
            const SpawnSpec& opts) {
    if (argv.empty()) throw SpawnError("", "empty command");

    std::vector<char*> av;
    av.reserve(argv.size() + 1);
    for (auto& a : argv) av.push_back(const_cast<char*>(a.c_str()));
    av.push_back(nullptr);
    std::string dir = cwd.string();

    Fd status_rd, status_wr;
    make_pipe(status_rd, status_wr, argv[0]);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw SpawnError(argv[0], std::string("fork failed: ") +
                                      std::strerror(errno));
    }

    if (pid == 0) {
        if (opts.detached) {
            ::setsid();
            int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            if (devnull < 0 || ::dup2(devnull, STDIN_FILENO) < 0)
                child_fail(status_wr.fd);
            if (::dup2(opts.out_fd, STDOUT_FILENO) < 0 ||
                ::dup2(opts.err_fd, STDERR_FILENO) < 0)
                child_fail(status_wr.fd);
        }
        if (!dir.empty() && ::chdir(dir.c_str()) != 0)
            child_fail(status_wr.fd);

        ::signal(SIGPIPE, SIG_DFL);
        ::signal(SIGCHLD, SIG_DFL);
        ::execvp(av[0], av.data());
        child_fail(status_wr.fd);
    }

    status_wr.reset();
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_rd.fd, &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        wait_child(pid);
        throw SpawnError(argv[0], std::strerror(child_errno) +
                                      std::string(" (in ") + dir + ")");
    }
    return pid;
}

/// Read `out` and `err` until both reach EOF.
void drain(int out_fd, int err_fd, std::string& out, std::string& err) {
    struct pollfd fds[2] = {
        {out_fd, POLLIN, 0},
        {err_fd, POLLIN, 0},
    };
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;
    char buf[4096];

    while (open_count > 0) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw IoError(std::string("poll failed: ") + std::strerror(errno));
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
            if (r > 0) {
                sinks[i]->append(buf, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                fds[i].fd = -1; // EOF or error: stop polling this one
                --open_count;
            }
        }
    }
}

} // anonymous namespace

int PosixRunner::run_attached(const std::vector<std::string>& argv,
                              const std::filesystem::path& cwd) {
    pid_t pid = spawn(argv, cwd, SpawnSpec{});
    int rc = wait_child(pid);
    GITA_LOG_DEBUG(argv[0] + " in " + cwd.string() + " exited with " +
                   std::to_string(rc));
    return rc;
}

CapturedRun PosixRunner::run_captured(const std::vector<std::string>& argv,
                                      const std::filesystem::path& cwd) {
    if (argv.empty()) throw SpawnError("", "empty command");

    Fd out_rd, out_wr, err_rd, err_wr;
    make_pipe(out_rd, out_wr, argv[0]);
    make_pipe(err_rd, err_wr, argv[0]);

    SpawnSpec opts;
    opts.detached = true;
    opts.out_fd   = out_wr.fd;
    opts.err_fd   = err_wr.fd;
    pid_t pid = spawn(argv, cwd, opts);

    out_wr.reset();
    err_wr.reset();

    CapturedRun run;
    try {
        drain(out_rd.fd, err_rd.fd, run.out, run.err);
    } catch (...) {
        wait_child(pid);
        throw;
    }
    run.exit_code = wait_child(pid);
    GITA_LOG_DEBUG(argv[0] + " in " + cwd.string() + " exited with " +
                   std::to_string(run.exit_code));
    return run;
}

} // namespace gita
