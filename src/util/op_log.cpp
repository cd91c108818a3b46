#include <stencil/op_log.hpp>
#include <stencil/timestamp.hpp>
#include <stencil/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace stencil {

// ---------------------------------------------------------------------------
// DiagnosticLogger
// ---------------------------------------------------------------------------

void DiagnosticLogger::log_operation(const std::string& operation,
                                     const nlohmann::json& details) {
    if (!stencil::log::enabled(stencil::log::Debug)) return;
    stencil::log::debug("%s %s", operation.c_str(), details.dump().c_str());
}

void DiagnosticLogger::warn(const std::string& message) {
    stencil::log::warn("%s", message.c_str());
}

// ---------------------------------------------------------------------------
// JsonLinesLogger
// ---------------------------------------------------------------------------

static bool is_sensitive_key(const std::string& key) {
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const char* const fragments[] = {
        "password", "token", "apikey", "api_key", "authorization",
        "secret", "auth", "credential", "pass"
    };
    for (const char* f : fragments) {
        if (lower.find(f) != std::string::npos) return true;
    }
    return false;
}

JsonLinesLogger::JsonLinesLogger(std::string path)
    : path_(std::move(path)) {}

nlohmann::json JsonLinesLogger::redact(const nlohmann::json& details) {
    if (details.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : details) out.push_back(redact(item));
        return out;
    }
    if (!details.is_object()) return details;

    nlohmann::json out = nlohmann::json::object();
    for (auto it = details.begin(); it != details.end(); ++it) {
        if (is_sensitive_key(it.key())) {
            out[it.key()] = "[REDACTED]";
        } else {
            out[it.key()] = redact(it.value());
        }
    }
    return out;
}

Status JsonLinesLogger::append(const nlohmann::json& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            last_status_ = StencilError{StencilError::IO,
                "cannot create log directory " + parent.string() + ": " + ec.message()};
            return last_status_;
        }
    }

    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        last_status_ = StencilError{StencilError::IO, "cannot open log file: " + path_};
        return last_status_;
    }
    out << entry.dump() << '\n';
    if (!out) {
        last_status_ = StencilError{StencilError::IO, "failed to write log entry: " + path_};
        return last_status_;
    }

    last_status_ = ok_status();
    return last_status_;
}

void JsonLinesLogger::log_operation(const std::string& operation,
                                    const nlohmann::json& details) {
    nlohmann::json entry = {
        {"timestamp", format_timestamp(std::chrono::system_clock::now())},
        {"operation", operation},
        {"details", redact(details)},
    };
    auto st = append(entry);
    if (st.is_err()) {
        stencil::log::warn("%s", st.error().message.c_str());
    }
}

void JsonLinesLogger::warn(const std::string& message) {
    log_operation("warning", {{"message", message}});
}

} // namespace stencil
