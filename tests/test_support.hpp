#pragma once

#include <stencil/git.hpp>
#include <stencil/op_log.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

namespace stencil_test {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// RAII temp directory
// ---------------------------------------------------------------------------

struct TempDir {
    fs::path path;

    explicit TempDir(const std::string& prefix = "stencil_test_") {
        static std::atomic<int> counter{0};
        path = fs::temp_directory_path() /
               (prefix + std::to_string(getpid()) + "_" +
                std::to_string(counter++) + "_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    void write_file(const std::string& rel, const std::string& content) const {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }

    std::string str() const { return path.string(); }
};

inline std::string read_file(const fs::path& p) {
    std::ifstream in(p);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// ---------------------------------------------------------------------------
// Cloner that writes a fixed file set instead of running git
// ---------------------------------------------------------------------------

struct CloneCall {
    std::string url;
    std::optional<std::string> branch;
    std::string dest;
};

class FakeCloner : public stencil::Cloner {
public:
    // Files written into every clone, relative path -> content
    std::vector<std::pair<std::string, std::string>> files = {
        {"README.md", "# template\n"},
    };
    bool fail = false;
    std::chrono::milliseconds delay{0};
    // When non-zero, each clone waits until this many clones have started
    size_t rendezvous = 0;
    std::chrono::milliseconds rendezvous_wait{5000};

    stencil::Status clone(const std::string& url,
                          const std::optional<std::string>& branch,
                          const std::string& dest) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back({url, branch, dest});
        }
        if (rendezvous > 0) {
            std::unique_lock<std::mutex> lock(mutex_);
            ++started_;
            started_cv_.notify_all();
            if (!started_cv_.wait_for(lock, rendezvous_wait,
                                      [this] { return started_ >= rendezvous; })) {
                ++rendezvous_timeouts_;
            }
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (fail) {
            return stencil::StencilError{stencil::StencilError::Network,
                "fatal: repository '" + url + "' not found"};
        }

        fs::create_directories(dest);
        for (const auto& [rel, content] : files) {
            fs::path full = fs::path(dest) / rel;
            fs::create_directories(full.parent_path());
            std::ofstream f(full);
            f << content;
        }
        return stencil::ok_status();
    }

    size_t call_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    std::vector<CloneCall> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    // Clones that gave up waiting for the others to start
    size_t rendezvous_timeouts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rendezvous_timeouts_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<CloneCall> calls_;
    std::condition_variable started_cv_;
    size_t started_ = 0;
    size_t rendezvous_timeouts_ = 0;
};

// ---------------------------------------------------------------------------
// Logger that records events
// ---------------------------------------------------------------------------

class RecordingLogger : public stencil::OperationLogger {
public:
    std::vector<std::pair<std::string, nlohmann::json>> operations;
    std::vector<std::string> warnings;

    void log_operation(const std::string& operation,
                       const nlohmann::json& details) override {
        std::lock_guard<std::mutex> lock(mutex_);
        operations.emplace_back(operation, details);
    }

    void warn(const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        warnings.push_back(message);
    }

    size_t count(const std::string& operation) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& op : operations) {
            if (op.first == operation) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
};

} // namespace stencil_test
