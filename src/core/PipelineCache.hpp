/**
 * @file PipelineCache.hpp
 * @brief Per-phase cache entries keyed by input fingerprint, with artifact verification
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "rf_profile_generator.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace rfprof {

/**
 * @brief Record of one completed phase
 */
struct CacheEntry {
    Phase phase = Phase::SETUP;
    std::string fingerprint;
    std::string artifact_path;
    std::string artifact_digest;  ///< SHA-256 of the artifact at record time
    std::string created;          ///< ISO-8601 UTC
};

struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t invalidated = 0;  ///< entries whose artifact was missing or altered
    size_t writes = 0;

    double hit_rate() const {
        size_t total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

/**
 * @brief Another process holds the cache directory lock
 */
class CacheLockedError : public std::runtime_error {
public:
    explicit CacheLockedError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief File backed store of phase cache entries
 *
 * Layout: <root>/<Phase>.entry.json plus <root>/artifacts/. Entries are
 * replaced by write-to-temp and rename. An advisory flock on <root>/.lock
 * keeps two runs from interleaving on the same cache.
 */
class PipelineCache {
public:
    explicit PipelineCache(std::filesystem::path root);
    ~PipelineCache();

    PipelineCache(const PipelineCache&) = delete;
    PipelineCache& operator=(const PipelineCache&) = delete;

    /// @throws CacheLockedError if another holder has the lock
    void acquire_lock();
    void release_lock();
    bool is_locked() const { return lock_fd_ >= 0; }

    /**
     * @brief Entry for phase when its fingerprint matches and its artifact is intact
     *
     * A matching entry whose artifact is missing or whose digest changed is
     * counted as invalidated and reported as a miss.
     */
    std::optional<CacheEntry> lookup(Phase phase, const std::string& fingerprint);

    /// Raw stored entry regardless of validity
    std::optional<CacheEntry> read_entry(Phase phase) const;

    /// Digest the artifact and atomically replace the phase's entry
    CacheEntry record(Phase phase, const std::string& fingerprint, const std::filesystem::path& artifact);

    void invalidate(Phase phase);

    std::filesystem::path entry_path(Phase phase) const;
    std::filesystem::path artifacts_dir() const { return root_ / "artifacts"; }
    const std::filesystem::path& root() const { return root_; }

    CacheStats get_stats() const;

    static bool verify_artifact(const CacheEntry& entry);

private:
    std::filesystem::path root_;
    int lock_fd_ = -1;

    mutable std::mutex cache_mutex_;
    CacheStats stats_;
    Logger logger_{"PipelineCache"};

    static std::string current_timestamp();
};

} // namespace rfprof
