#pragma once

#include <stencil/result.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stencil {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

using EnvVars = std::vector<std::pair<std::string, std::string>>;

// Run an external command, capturing stdout and stderr. `env` entries are
// set in the child on top of the inherited environment.
// Returns error on fork/exec failure or timeout.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60,
                                  const EnvVars& env = {});

// Fetches a repository into a directory that does not exist yet.
// branch == nullopt means the remote's default branch.
class Cloner {
public:
    virtual ~Cloner() = default;

    virtual Status clone(const std::string& url,
                         const std::optional<std::string>& branch,
                         const std::string& dest) = 0;
};

// Wrapper around git CLI operations
class GitCli : public Cloner {
public:
    // Check git is available and version >= 2.20
    Result<std::string> check_version();

    // Shallow clone: `git clone --depth 1 [--branch <b>] <url> <dest>`
    // A leading "~/" in url is expanded from $HOME.
    Status clone(const std::string& url,
                 const std::optional<std::string>& branch,
                 const std::string& dest) override;

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    void set_offline(bool offline) { offline_ = offline; }
    bool is_offline() const { return offline_; }

private:
    int timeout_seconds_ = 60;
    bool offline_ = false;
};

} // namespace stencil
