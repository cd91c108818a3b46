#include <stencil/git.hpp>
#include <stencil/log.hpp>

#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace stencil {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

namespace {

// Owns one end of a pipe
struct Fd {
    int fd = -1;
    Fd() = default;
    explicit Fd(int f) : fd(f) {}
    ~Fd() { reset(); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    void reset() {
        if (fd >= 0) close(fd);
        fd = -1;
    }
};

struct Pipe {
    Fd read_end;
    Fd write_end;
};

Status open_pipe(Pipe& p) {
    int fds[2];
    if (pipe(fds) != 0) {
        return StencilError{StencilError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    p.read_end.fd = fds[0];
    p.write_end.fd = fds[1];
    return ok_status();
}

// Reads what is available; returns false once the writer has closed
bool read_available(int fd, std::string& out) {
    char buf[4096];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        out.append(buf, static_cast<size_t>(n));
        return true;
    }
    return n < 0 && (errno == EINTR || errno == EAGAIN);
}

[[noreturn]] void exec_child(const std::vector<const char*>& argv,
                             Pipe& out, Pipe& err,
                             const std::string& working_dir,
                             const EnvVars& env) {
    dup2(out.write_end.fd, STDOUT_FILENO);
    dup2(err.write_end.fd, STDERR_FILENO);
    close(out.read_end.fd);
    close(err.read_end.fd);
    close(out.write_end.fd);
    close(err.write_end.fd);

    // No stdin: a prompting child would otherwise hang until the timeout
    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        close(devnull);
    }

    for (const auto& [key, value] : env) {
        setenv(key.c_str(), value.c_str(), 1);
    }

    if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
        _exit(127);
    }

    execvp(argv[0], const_cast<char* const*>(argv.data()));
    _exit(127);
}

} // namespace

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds,
                                  const EnvVars& env) {
    if (args.empty()) {
        return StencilError{StencilError::InvalidArg, "run_command: empty args"};
    }

    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    Pipe out, err;
    STENCIL_TRY(open_pipe(out));
    STENCIL_TRY(open_pipe(err));

    pid_t pid = fork();
    if (pid < 0) {
        return StencilError{StencilError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }
    if (pid == 0) {
        exec_child(argv, out, err, working_dir, env);
    }

    out.write_end.reset();
    err.write_end.reset();

    std::string out_buf, err_buf;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);

    // Read both streams until the child closes them or the deadline passes
    while (out.read_end.fd >= 0 || err.read_end.fd >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            return StencilError{StencilError::IO,
                "command timed out after " + std::to_string(timeout_seconds) + "s"};
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        Fd* owners[2];
        std::string* sinks[2];
        if (out.read_end.fd >= 0) {
            fds[nfds] = {out.read_end.fd, POLLIN, 0};
            owners[nfds] = &out.read_end;
            sinks[nfds++] = &out_buf;
        }
        if (err.read_end.fd >= 0) {
            fds[nfds] = {err.read_end.fd, POLLIN, 0};
            owners[nfds] = &err.read_end;
            sinks[nfds++] = &err_buf;
        }

        int ready = poll(fds, nfds, static_cast<int>(remaining));
        if (ready < 0) {
            if (errno == EINTR) continue;
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            return StencilError{StencilError::IO,
                std::string("poll() failed: ") + strerror(errno)};
        }

        for (nfds_t i = 0; i < nfds; ++i) {
            if (fds[i].revents == 0) continue;
            if (!read_available(fds[i].fd, *sinks[i])) owners[i]->reset();
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return StencilError{StencilError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return Result<CommandResult>::ok(
        CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
}

static std::string trim_trailing_newlines(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

// ---------------------------------------------------------------------------
// GitCli
// ---------------------------------------------------------------------------

Result<std::string> GitCli::check_version() {
    auto r = run_command({"git", "--version"}, "", timeout_seconds_);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return StencilError{StencilError::NotFound,
            "git not found or failed", "install git >= 2.20"};
    }

    std::string out = trim_trailing_newlines(cmd.stdout_str);

    auto pos = out.find("git version ");
    if (pos == std::string::npos) {
        return StencilError{StencilError::Parse,
            "unexpected git --version output: " + out};
    }
    std::string ver_str = out.substr(pos + 12);

    int major = 0, minor = 0;
    if (sscanf(ver_str.c_str(), "%d.%d", &major, &minor) < 2) {
        return StencilError{StencilError::Parse,
            "cannot parse git version: " + ver_str};
    }

    if (major < 2 || (major == 2 && minor < 20)) {
        return StencilError{StencilError::NotFound,
            "git version " + ver_str + " too old",
            "upgrade to git >= 2.20"};
    }

    return Result<std::string>::ok(std::move(ver_str));
}

Status GitCli::clone(const std::string& url,
                     const std::optional<std::string>& branch,
                     const std::string& dest) {
    if (offline_) {
        return StencilError{StencilError::Network,
            "cannot clone in offline mode", "run without --offline"};
    }

    std::string source = url;
    if (source.rfind("~/", 0) == 0) {
        const char* home = std::getenv("HOME");
        if (home) source = std::string(home) + source.substr(1);
    }

    std::vector<std::string> args = {"git", "clone", "--depth", "1"};
    if (branch && !branch->empty()) {
        args.push_back("--branch");
        args.push_back(*branch);
    }
    // "--" keeps a hostile url from being read as an option
    args.push_back("--");
    args.push_back(source);
    args.push_back(dest);

    stencil::log::debug("git clone --depth 1 %s%s %s",
                        branch ? ("--branch " + *branch + " ").c_str() : "",
                        source.c_str(), dest.c_str());
    auto r = run_command(args, "", timeout_seconds_, {{"GIT_TERMINAL_PROMPT", "0"}});
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        return StencilError{StencilError::Network,
            "git clone failed: " + trim_trailing_newlines(cmd.stderr_str),
            "verify the repository exists and the branch is spelled correctly"};
    }

    return ok_status();
}

} // namespace stencil
