#pragma once

#include <stencil/result.hpp>
#include <stencil/boundary.hpp>
#include <stencil/git.hpp>
#include <stencil/timestamp.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace stencil {

class OperationLogger;

// Contents of <entry>/metadata.json
struct CacheMetadata {
    std::string repo_url;
    std::string branch_name;
    std::string last_updated;   // ISO-8601
    double ttl_hours = 24.0;

    nlohmann::json to_json() const;

    // Shape check: repoUrl, branchName and lastUpdated must be present
    // strings; ttlHours, when present, a non-negative number.
    static Result<CacheMetadata> from_json(const nlohmann::json& j);
};

struct RepoLocation {
    std::string repo_hash;   // <protocol>/<name>[-<branch>]
    std::string repo_dir;    // <cache_dir>/<repo_hash>
};

struct CacheOptions {
    std::optional<double> ttl_hours;   // populate: TTL recorded in metadata
    bool no_cache = false;             // lookups always miss
};

struct SweepResult {
    size_t removed = 0;
    size_t failed = 0;     // entries that should have gone but could not be removed
    size_t purged = 0;     // leftovers cleared from .trash and .staging
};

// Local clones of template repositories.
//
// Layout:
//   <cache_dir>/<protocol>/<name>[-<branch>]/                clone
//   <cache_dir>/<protocol>/<name>[-<branch>]/metadata.json   sidecar
//   <cache_dir>/.staging/   clones in progress
//   <cache_dir>/.trash/     replaced entries awaiting deletion
//
// An entry is either absent or complete: clones land in .staging and are
// renamed into place together with their metadata. Population of one
// repo hash is serialized in-process; different hashes never contend.
// Writers in other processes are not serialized, but a writer that loses
// the final rename to a complete entry adopts it.
class CacheManager {
public:
    static constexpr double kDefaultTtlHours = 24.0;
    static constexpr const char* kDefaultBranch = "main";
    static constexpr int kSwapAttempts = 5;
    // Staging directories younger than this may belong to a live clone
    static constexpr std::chrono::hours kStagingGrace{1};

    CacheManager(std::string cache_dir, Cloner& cloner);
    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    // Default: ~/.stencil/cache
    static std::string default_cache_root();

    // owner/repo[.git] -> https://github.com/owner/repo.git; paths and
    // URLs are returned unchanged
    static std::string normalize_repo_url(const std::string& repo_url);
    static std::string get_protocol_from_url(const std::string& normalized_url);
    static std::string get_repo_name_from_url(const std::string& normalized_url);

    // Deterministic; no suffix for nullopt, "", "main" or "master"
    RepoLocation resolve_repo_directory(const std::string& repo_url,
                                        const std::optional<std::string>& branch) const;
    std::string generate_repo_hash(const std::string& repo_url,
                                   const std::optional<std::string>& branch) const;

    // Missing metadata or an unparseable lastUpdated counts as expired.
    // An age equal to the TTL is expired.
    static bool is_expired(const std::optional<CacheMetadata>& metadata,
                           std::optional<double> ttl_override = std::nullopt);
    static bool is_expired(const std::optional<CacheMetadata>& metadata,
                           std::optional<double> ttl_override,
                           Timestamp now);

    bool detect_cache_corruption(const std::string& repo_hash) const;

    // ok(nullopt) when metadata.json does not exist; Parse error when it
    // exists but is malformed
    Result<std::optional<CacheMetadata>> get_cache_metadata(const std::string& repo_hash) const;
    Status update_cache_metadata(const std::string& repo_hash,
                                 const CacheMetadata& metadata);

    // Clone into the entry slot, replacing any previous content
    Result<std::string> populate_cache(const std::string& repo_url,
                                       const std::optional<std::string>& branch,
                                       const CacheOptions& options = {});

    // Path of a present, fresh, intact entry; never fails
    std::optional<std::string> get_cached_repo(const std::string& repo_url,
                                               const std::optional<std::string>& branch,
                                               const CacheOptions& options = {}) const;

    // Lookup, then populate on miss. Emits cache_hit / cache_miss to logger
    // when one is given.
    Result<std::string> ensure_repository_cached(const std::string& repo_url,
                                                 const std::optional<std::string>& branch,
                                                 const CacheOptions& options = {},
                                                 OperationLogger* logger = nullptr);

    // Re-clone, keeping the entry's ttlHours
    Result<std::string> refresh_cache(const std::string& repo_url,
                                      const std::optional<std::string>& branch);

    // Remove every expired or corrupt entry, everything in .trash and
    // staging directories older than kStagingGrace
    Result<SweepResult> clear_expired_entries();

    Status handle_cache_corruption(const std::string& repo_hash);

    Status ensure_cache_directory();
    Status ensure_repo_directory(const std::string& repo_hash);

    const std::string& cache_dir() const { return cache_dir_; }

    // Number of per-hash locks currently held or waited on
    size_t lock_table_size() const;

private:
    // <cache_dir>/<repo_hash>, refusing hashes that leave the cache root
    Result<std::string> entry_path(const std::string& repo_hash) const;

    // Holds the per-hash mutex; the table slot is dropped by the last holder
    class EntryLock {
    public:
        EntryLock(CacheManager& owner, std::string repo_hash);
        ~EntryLock();
        EntryLock(const EntryLock&) = delete;
        EntryLock& operator=(const EntryLock&) = delete;

    private:
        CacheManager& owner_;
        std::string repo_hash_;
        std::shared_ptr<std::mutex> mutex_;
    };

    std::shared_ptr<std::mutex> lock_for(const std::string& repo_hash);
    void release_lock(const std::string& repo_hash, std::shared_ptr<std::mutex>& held);

    // Clears .trash and old .staging leftovers; returns the number removed
    size_t purge_leftovers();

    Result<std::string> populate_locked(const std::string& repo_url,
                                        const std::optional<std::string>& branch,
                                        const CacheOptions& options);

    BoundaryValidator boundary_;
    std::string cache_dir_;
    Cloner& cloner_;

    mutable std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> repo_locks_;
};

} // namespace stencil
