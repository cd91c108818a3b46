#include <stencil/cache.hpp>
#include <stencil/log.hpp>
#include <stencil/op_log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

namespace fs = std::filesystem;

namespace stencil {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string strip_git_suffix(const std::string& s) {
    return ends_with(s, ".git") ? s.substr(0, s.size() - 4) : s;
}

static bool is_path_like(const std::string& url) {
    return starts_with(url, "/") || starts_with(url, ".") || starts_with(url, "~");
}

// Anything outside [A-Za-z0-9._-] becomes '-'
static std::string sanitize_segment(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '_' && c != '-') {
            c = '-';
        }
    }
    if (out.empty() || out == "." || out == "..") return "repo";
    return out;
}

static bool is_default_branch(const std::optional<std::string>& branch) {
    return !branch || branch->empty() || *branch == "main" || *branch == "master";
}

// 16 hex chars from /dev/urandom, falling back to mt19937_64
static std::string random_token() {
    unsigned char bytes[8] = {};
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    bool filled = false;
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(bytes), sizeof(bytes));
        filled = urandom.gcount() == static_cast<std::streamsize>(sizeof(bytes));
    }
    if (!filled) {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        uint64_t v = gen();
        for (size_t i = 0; i < sizeof(bytes); ++i) {
            bytes[i] = static_cast<unsigned char>(v >> (i * 8));
        }
    }

    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(16);
    for (unsigned char b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0F];
    }
    return out;
}

static Status write_file_atomic(const fs::path& path, const std::string& content) {
    fs::path tmp = path;
    tmp += ".tmp-" + random_token();

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return StencilError{StencilError::IO, "cannot write " + tmp.string()};
        }
        out << content;
        out.flush();
        if (!out) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return StencilError{StencilError::IO, "failed writing " + tmp.string()};
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return StencilError{StencilError::IO,
            "cannot move " + tmp.string() + " into place: " + ec.message()};
    }
    return ok_status();
}

static void remove_quietly(const fs::path& p) {
    std::error_code ec;
    fs::remove_all(p, ec);
    if (ec) {
        stencil::log::warn("could not remove %s: %s", p.string().c_str(), ec.message().c_str());
    }
}

// ---------------------------------------------------------------------------
// CacheMetadata
// ---------------------------------------------------------------------------

nlohmann::json CacheMetadata::to_json() const {
    return nlohmann::json{
        {"repoUrl", repo_url},
        {"branchName", branch_name},
        {"lastUpdated", last_updated},
        {"ttlHours", ttl_hours},
    };
}

Result<CacheMetadata> CacheMetadata::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return StencilError{StencilError::Parse, "cache metadata is not a JSON object"};
    }

    for (const char* key : {"repoUrl", "branchName", "lastUpdated"}) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
            return StencilError{StencilError::Parse,
                std::string("cache metadata is missing '") + key + "'"};
        }
    }

    CacheMetadata md;
    md.repo_url = j["repoUrl"].get<std::string>();
    md.branch_name = j["branchName"].get<std::string>();
    md.last_updated = j["lastUpdated"].get<std::string>();

    auto ttl = j.find("ttlHours");
    if (ttl != j.end()) {
        if (!ttl->is_number() || ttl->get<double>() < 0) {
            return StencilError{StencilError::Parse,
                "cache metadata 'ttlHours' must be a non-negative number"};
        }
        md.ttl_hours = ttl->get<double>();
    }

    return Result<CacheMetadata>::ok(std::move(md));
}

// ---------------------------------------------------------------------------
// Naming
// ---------------------------------------------------------------------------

CacheManager::CacheManager(std::string cache_dir, Cloner& cloner)
    : boundary_(cache_dir),
      cache_dir_(boundary_.allowed_root()),
      cloner_(cloner) {}

std::string CacheManager::default_cache_root() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return std::string(home) + "/.stencil/cache";
}

std::string CacheManager::normalize_repo_url(const std::string& repo_url) {
    if (is_path_like(repo_url)) return repo_url;
    if (repo_url.find("://") != std::string::npos) return repo_url;
    if (starts_with(repo_url, "git@")) return repo_url;

    // HTTPS avoids SSH key prompts for public repositories
    if (repo_url.find('/') != std::string::npos) {
        return "https://github.com/" + strip_git_suffix(repo_url) + ".git";
    }
    return "git@github.com:" + strip_git_suffix(repo_url) + ".git";
}

std::string CacheManager::get_protocol_from_url(const std::string& normalized_url) {
    if (is_path_like(normalized_url)) return "local";
    if (starts_with(normalized_url, "git@")) return "git";

    auto sep = normalized_url.find("://");
    if (sep != std::string::npos && sep > 0) {
        std::string scheme = normalized_url.substr(0, sep);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return sanitize_segment(scheme);
    }
    return "unknown";
}

std::string CacheManager::get_repo_name_from_url(const std::string& normalized_url) {
    if (is_path_like(normalized_url)) {
        std::string p = normalized_url;
        while (p.size() > 1 && p.back() == '/') p.pop_back();
        return sanitize_segment(strip_git_suffix(fs::path(p).filename().string()));
    }

    std::string path;
    if (starts_with(normalized_url, "git@")) {
        // git@host:owner/repo.git
        auto colon = normalized_url.find(':');
        path = colon == std::string::npos ? normalized_url : normalized_url.substr(colon + 1);
    } else if (auto sep = normalized_url.find("://"); sep != std::string::npos) {
        std::string rest = normalized_url.substr(sep + 3);
        rest = rest.substr(0, rest.find_first_of("?#"));
        auto slash = rest.find('/');
        path = slash == std::string::npos ? "" : rest.substr(slash);
    } else {
        path = normalized_url;
    }

    while (starts_with(path, "/")) path = path.substr(1);
    while (ends_with(path, "/")) path.pop_back();
    path = strip_git_suffix(path);
    std::replace(path.begin(), path.end(), '/', '-');
    return sanitize_segment(path);
}

RepoLocation CacheManager::resolve_repo_directory(const std::string& repo_url,
                                                  const std::optional<std::string>& branch) const {
    std::string normalized = normalize_repo_url(repo_url);
    std::string protocol = get_protocol_from_url(normalized);
    std::string name = get_repo_name_from_url(normalized);
    if (!is_default_branch(branch)) {
        name += "-" + sanitize_segment(*branch);
    }

    RepoLocation loc;
    loc.repo_hash = protocol + "/" + name;
    loc.repo_dir = (fs::path(cache_dir_) / protocol / name).string();
    return loc;
}

std::string CacheManager::generate_repo_hash(const std::string& repo_url,
                                             const std::optional<std::string>& branch) const {
    return resolve_repo_directory(repo_url, branch).repo_hash;
}

Result<std::string> CacheManager::entry_path(const std::string& repo_hash) const {
    auto r = boundary_.validate_path(repo_hash, "cache_entry");
    if (r.is_err()) return std::move(r).error();
    if (r.value() == cache_dir_) {
        return StencilError{StencilError::InvalidArg,
            "repo hash '" + repo_hash + "' does not name a cache entry"};
    }
    return r;
}

std::shared_ptr<std::mutex> CacheManager::lock_for(const std::string& repo_hash) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    auto& slot = repo_locks_[repo_hash];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

void CacheManager::release_lock(const std::string& repo_hash,
                                std::shared_ptr<std::mutex>& held) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    held.reset();
    auto it = repo_locks_.find(repo_hash);
    if (it != repo_locks_.end() && it->second.use_count() == 1) {
        repo_locks_.erase(it);
    }
}

size_t CacheManager::lock_table_size() const {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    return repo_locks_.size();
}

CacheManager::EntryLock::EntryLock(CacheManager& owner, std::string repo_hash)
    : owner_(owner), repo_hash_(std::move(repo_hash)),
      mutex_(owner_.lock_for(repo_hash_)) {
    mutex_->lock();
}

CacheManager::EntryLock::~EntryLock() {
    mutex_->unlock();
    owner_.release_lock(repo_hash_, mutex_);
}

// ---------------------------------------------------------------------------
// Expiry and corruption
// ---------------------------------------------------------------------------

bool CacheManager::is_expired(const std::optional<CacheMetadata>& metadata,
                              std::optional<double> ttl_override) {
    return is_expired(metadata, ttl_override, std::chrono::system_clock::now());
}

bool CacheManager::is_expired(const std::optional<CacheMetadata>& metadata,
                              std::optional<double> ttl_override,
                              Timestamp now) {
    if (!metadata || metadata->last_updated.empty()) return true;

    auto last = parse_timestamp(metadata->last_updated);
    if (last.is_err()) return true;

    double ttl = ttl_override ? *ttl_override : metadata->ttl_hours;
    std::chrono::duration<double, std::ratio<3600>> age = now - last.value();
    return age.count() >= ttl;
}

Result<std::optional<CacheMetadata>> CacheManager::get_cache_metadata(
        const std::string& repo_hash) const {
    auto dir = entry_path(repo_hash);
    if (dir.is_err()) return std::move(dir).error();

    fs::path file = fs::path(dir.value()) / "metadata.json";
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return Result<std::optional<CacheMetadata>>::ok(std::nullopt);
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        return StencilError{StencilError::IO, "cannot read " + file.string()};
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return StencilError{StencilError::Parse,
            "invalid cache metadata " + file.string() + ": " + e.what()};
    }

    auto md = CacheMetadata::from_json(j);
    if (md.is_err()) return std::move(md).error();
    return Result<std::optional<CacheMetadata>>::ok(std::move(md).value());
}

Status CacheManager::update_cache_metadata(const std::string& repo_hash,
                                           const CacheMetadata& metadata) {
    STENCIL_TRY(ensure_repo_directory(repo_hash));
    auto dir = entry_path(repo_hash);
    if (dir.is_err()) return std::move(dir).error();
    return write_file_atomic(fs::path(dir.value()) / "metadata.json",
                             metadata.to_json().dump(2) + "\n");
}

bool CacheManager::detect_cache_corruption(const std::string& repo_hash) const {
    auto dir = entry_path(repo_hash);
    if (dir.is_err()) return true;

    std::error_code ec;
    if (!fs::is_directory(dir.value(), ec)) return true;

    auto md = get_cache_metadata(repo_hash);
    return md.is_err() || !md.value().has_value();
}

Status CacheManager::handle_cache_corruption(const std::string& repo_hash) {
    auto dir = entry_path(repo_hash);
    if (dir.is_err()) return std::move(dir).error();

    std::error_code ec;
    fs::remove_all(dir.value(), ec);
    if (ec) {
        return StencilError{StencilError::IO,
            "failed to remove cache entry " + repo_hash + ": " + ec.message()};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Directories
// ---------------------------------------------------------------------------

Status CacheManager::ensure_cache_directory() {
    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (ec) {
        return StencilError{StencilError::IO,
            "cannot create cache directory " + cache_dir_ + ": " + ec.message()};
    }
    return ok_status();
}

Status CacheManager::ensure_repo_directory(const std::string& repo_hash) {
    STENCIL_TRY(ensure_cache_directory());
    auto dir = entry_path(repo_hash);
    if (dir.is_err()) return std::move(dir).error();

    std::error_code ec;
    fs::create_directories(dir.value(), ec);
    if (ec) {
        return StencilError{StencilError::IO,
            "cannot create repository directory " + dir.value() + ": " + ec.message()};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Population
// ---------------------------------------------------------------------------

Result<std::string> CacheManager::populate_locked(const std::string& repo_url,
                                                  const std::optional<std::string>& branch,
                                                  const CacheOptions& options) {
    RepoLocation loc = resolve_repo_directory(repo_url, branch);
    std::string normalized = normalize_repo_url(repo_url);
    std::optional<std::string> clone_branch;
    if (branch && !branch->empty()) clone_branch = branch;

    STENCIL_TRY(ensure_cache_directory());

    std::optional<CacheMetadata> existing;
    if (auto md = get_cache_metadata(loc.repo_hash); md.is_ok()) {
        existing = md.value();
    }

    fs::path staging_root = fs::path(cache_dir_) / ".staging";
    fs::path trash_root = fs::path(cache_dir_) / ".trash";
    std::error_code ec;
    fs::create_directories(staging_root, ec);
    if (ec) {
        return StencilError{StencilError::IO,
            "cannot create staging directory: " + ec.message()};
    }

    std::string token = random_token();
    std::string flat_hash = loc.repo_hash;
    std::replace(flat_hash.begin(), flat_hash.end(), '/', '-');
    fs::path staging = staging_root / (flat_hash + "-" + token);

    stencil::log::info("cloning %s%s%s", normalized.c_str(),
                       clone_branch ? " @ " : "",
                       clone_branch ? clone_branch->c_str() : "");

    auto cloned = cloner_.clone(normalized, clone_branch, staging.string());
    if (cloned.is_err()) {
        remove_quietly(staging);
        StencilError err = std::move(cloned).error();
        err.with("repo_url", repo_url)
           .with("branch", clone_branch ? *clone_branch : std::string(kDefaultBranch));
        return err;
    }

    // Strictly after the previous lastUpdated even within one clock tick
    Timestamp now = std::chrono::system_clock::now();
    if (existing) {
        auto prev = parse_timestamp(existing->last_updated);
        if (prev.is_ok() && prev.value() >= now) {
            now = prev.value() + std::chrono::milliseconds(1);
        }
    }

    CacheMetadata md;
    md.repo_url = repo_url;
    md.branch_name = clone_branch ? *clone_branch : kDefaultBranch;
    md.last_updated = format_timestamp(now);
    md.ttl_hours = options.ttl_hours ? *options.ttl_hours
                 : existing ? existing->ttl_hours
                 : kDefaultTtlHours;

    auto written = write_file_atomic(staging / "metadata.json", md.to_json().dump(2) + "\n");
    if (written.is_err()) {
        remove_quietly(staging);
        return std::move(written).error();
    }

    fs::path target(loc.repo_dir);
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        remove_quietly(staging);
        return StencilError{StencilError::IO,
            "cannot create " + target.parent_path().string() + ": " + ec.message()};
    }

    // rename() will not replace a non-empty directory, so an existing entry
    // is moved aside first. Another process may swap its own clone in at any
    // point; when that leaves a complete entry in place, it is used as-is.
    fs::path trashed;
    for (int attempt = 0;; ++attempt) {
        if (fs::exists(target, ec)) {
            fs::create_directories(trash_root, ec);
            fs::path aside = trash_root /
                (flat_hash + "-" + token + "-" + std::to_string(attempt));
            fs::rename(target, aside, ec);
            if (!ec) {
                if (!trashed.empty()) remove_quietly(trashed);
                trashed = aside;
            } else if (std::error_code exists_ec; fs::exists(target, exists_ec)) {
                if (attempt + 1 < kSwapAttempts) continue;
                std::string reason = ec.message();
                remove_quietly(staging);
                if (!trashed.empty()) remove_quietly(trashed);
                return StencilError{StencilError::IO,
                    "cannot replace cache entry " + loc.repo_hash + ": " + reason};
            }
        }

        fs::rename(staging, target, ec);
        if (!ec) break;

        if (!detect_cache_corruption(loc.repo_hash)) {
            stencil::log::debug("%s was populated concurrently, keeping that copy",
                                loc.repo_hash.c_str());
            remove_quietly(staging);
            if (!trashed.empty()) remove_quietly(trashed);
            return Result<std::string>::ok(loc.repo_dir);
        }

        if (attempt + 1 >= kSwapAttempts) {
            std::string reason = ec.message();
            remove_quietly(staging);
            if (!trashed.empty()) {
                std::error_code restore_ec;
                fs::rename(trashed, target, restore_ec);
                if (restore_ec) remove_quietly(trashed);
            }
            return StencilError{StencilError::IO,
                "cannot move clone into " + loc.repo_dir + ": " + reason};
        }
    }

    if (!trashed.empty()) remove_quietly(trashed);

    stencil::log::debug("cached %s -> %s", repo_url.c_str(), loc.repo_dir.c_str());
    return Result<std::string>::ok(loc.repo_dir);
}

Result<std::string> CacheManager::populate_cache(const std::string& repo_url,
                                                 const std::optional<std::string>& branch,
                                                 const CacheOptions& options) {
    EntryLock lock(*this, generate_repo_hash(repo_url, branch));
    return populate_locked(repo_url, branch, options);
}

std::optional<std::string> CacheManager::get_cached_repo(const std::string& repo_url,
                                                         const std::optional<std::string>& branch,
                                                         const CacheOptions& options) const {
    if (options.no_cache) return std::nullopt;

    RepoLocation loc = resolve_repo_directory(repo_url, branch);
    if (detect_cache_corruption(loc.repo_hash)) return std::nullopt;

    auto md = get_cache_metadata(loc.repo_hash);
    if (md.is_err() || is_expired(md.value())) return std::nullopt;

    return loc.repo_dir;
}

static nlohmann::json branch_json(const std::optional<std::string>& branch) {
    return branch ? nlohmann::json(*branch) : nlohmann::json(nullptr);
}

Result<std::string> CacheManager::ensure_repository_cached(const std::string& repo_url,
                                                           const std::optional<std::string>& branch,
                                                           const CacheOptions& options,
                                                           OperationLogger* logger) {
    EntryLock lock(*this, generate_repo_hash(repo_url, branch));

    if (auto cached = get_cached_repo(repo_url, branch, options)) {
        if (logger) {
            logger->log_operation("cache_hit", {
                {"repoUrl", repo_url},
                {"branchName", branch_json(branch)},
                {"path", *cached},
            });
        }
        return Result<std::string>::ok(*cached);
    }

    if (logger) {
        logger->log_operation("cache_miss", {
            {"repoUrl", repo_url},
            {"branchName", branch_json(branch)},
        });
    }
    return populate_locked(repo_url, branch, options);
}

Result<std::string> CacheManager::refresh_cache(const std::string& repo_url,
                                                const std::optional<std::string>& branch) {
    RepoLocation loc = resolve_repo_directory(repo_url, branch);
    EntryLock lock(*this, loc.repo_hash);

    CacheOptions options;
    if (auto md = get_cache_metadata(loc.repo_hash); md.is_ok() && md.value()) {
        options.ttl_hours = md.value()->ttl_hours;
    }
    return populate_locked(repo_url, branch, options);
}

// ---------------------------------------------------------------------------
// Eviction
// ---------------------------------------------------------------------------

static std::vector<fs::path> list_subdirectories(const fs::path& dir, std::error_code& ec) {
    std::vector<fs::path> out;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) continue;
        std::string name = it->path().filename().string();
        if (starts_with(name, ".")) continue;
        out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

size_t CacheManager::purge_leftovers() {
    size_t purged = 0;
    std::error_code ec;

    fs::path trash_root = fs::path(cache_dir_) / ".trash";
    for (fs::directory_iterator it(trash_root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code rm_ec;
        fs::remove_all(it->path(), rm_ec);
        if (rm_ec) {
            stencil::log::warn("cannot remove %s: %s",
                               it->path().string().c_str(), rm_ec.message().c_str());
            continue;
        }
        ++purged;
    }

    auto cutoff = fs::file_time_type::clock::now() - kStagingGrace;
    fs::path staging_root = fs::path(cache_dir_) / ".staging";
    ec.clear();
    for (fs::directory_iterator it(staging_root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code time_ec;
        auto mtime = fs::last_write_time(it->path(), time_ec);
        if (time_ec || mtime > cutoff) continue;

        std::error_code rm_ec;
        fs::remove_all(it->path(), rm_ec);
        if (rm_ec) {
            stencil::log::warn("cannot remove %s: %s",
                               it->path().string().c_str(), rm_ec.message().c_str());
            continue;
        }
        ++purged;
    }
    return purged;
}

Result<SweepResult> CacheManager::clear_expired_entries() {
    SweepResult result;

    std::error_code ec;
    if (!fs::exists(cache_dir_, ec)) {
        return Result<SweepResult>::ok(result);
    }

    auto protocols = list_subdirectories(cache_dir_, ec);
    if (ec) {
        return StencilError{StencilError::IO,
            "cannot read cache directory " + cache_dir_ + ": " + ec.message()};
    }

    for (const auto& protocol_dir : protocols) {
        std::error_code list_ec;
        auto entries = list_subdirectories(protocol_dir, list_ec);
        if (list_ec) {
            stencil::log::warn("cannot read %s: %s",
                               protocol_dir.string().c_str(), list_ec.message().c_str());
            ++result.failed;
            continue;
        }

        for (const auto& entry : entries) {
            std::string repo_hash = protocol_dir.filename().string() + "/" +
                                    entry.filename().string();
            EntryLock lock(*this, repo_hash);

            bool stale = detect_cache_corruption(repo_hash);
            if (!stale) {
                auto md = get_cache_metadata(repo_hash);
                stale = md.is_err() || is_expired(md.value());
            }
            if (!stale) continue;

            auto removed = handle_cache_corruption(repo_hash);
            if (removed.is_err()) {
                stencil::log::warn("%s", removed.error().message.c_str());
                ++result.failed;
                continue;
            }
            stencil::log::debug("evicted %s", repo_hash.c_str());
            ++result.removed;
        }
    }

    result.purged = purge_leftovers();
    if (result.purged > 0) {
        stencil::log::debug("purged %zu leftover directories", result.purged);
    }
    return Result<SweepResult>::ok(result);
}

} // namespace stencil
