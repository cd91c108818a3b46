#pragma once

#include <stencil/result.hpp>
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

namespace stencil {

// Structured event sink for cache and resolution events
// (cache_hit, cache_miss, ...).
class OperationLogger {
public:
    virtual ~OperationLogger() = default;

    virtual void log_operation(const std::string& operation,
                               const nlohmann::json& details) = 0;
    virtual void warn(const std::string& message) = 0;
};

// Forwards events to stencil::log at debug level
class DiagnosticLogger : public OperationLogger {
public:
    void log_operation(const std::string& operation,
                       const nlohmann::json& details) override;
    void warn(const std::string& message) override;
};

// Appends one JSON object per line:
//   {"timestamp": ISO-8601, "operation": name, "details": {...}}
// Values under sensitive keys (password, token, secret, auth, ...) are
// replaced with "[REDACTED]".
class JsonLinesLogger : public OperationLogger {
public:
    explicit JsonLinesLogger(std::string path);

    void log_operation(const std::string& operation,
                       const nlohmann::json& details) override;
    void warn(const std::string& message) override;

    // Status of the most recent write; the interface itself cannot fail
    const Status& last_status() const { return last_status_; }
    const std::string& path() const { return path_; }

    static nlohmann::json redact(const nlohmann::json& details);

private:
    Status append(const nlohmann::json& entry);

    std::string path_;
    std::mutex mutex_;
    Status last_status_ = ok_status();
};

} // namespace stencil
