/**
 * @file PipelineCache.cpp
 * @brief Implementation of the phase cache store
 */

#include "PipelineCache.hpp"
#include "Digest.hpp"
#include "JsonSerialization.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <iomanip>
#include <sstream>
#include <sys/file.h>
#include <unistd.h>

namespace rfprof {

using json = nlohmann::json;

PipelineCache::PipelineCache(std::filesystem::path root) : root_(std::move(root)) {
    std::filesystem::create_directories(artifacts_dir());
}

PipelineCache::~PipelineCache() {
    release_lock();
}

void PipelineCache::acquire_lock() {
    if (lock_fd_ >= 0) {
        return;
    }

    auto lock_path = root_ / ".lock";
    int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT, 0644);
    if (fd < 0) {
        throw CacheLockedError("cannot open cache lock " + lock_path.string() + ": " + std::strerror(errno));
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        int err = errno;
        ::close(fd);
        if (err == EWOULDBLOCK) {
            throw CacheLockedError("cache " + root_.string() + " is in use by another run");
        }
        throw CacheLockedError("cannot lock cache " + root_.string() + ": " + std::strerror(err));
    }
    lock_fd_ = fd;
    logger_.debug("Acquired cache lock " + lock_path.string());
}

void PipelineCache::release_lock() {
    if (lock_fd_ < 0) {
        return;
    }
    ::flock(lock_fd_, LOCK_UN);
    ::close(lock_fd_);
    lock_fd_ = -1;
}

std::filesystem::path PipelineCache::entry_path(Phase phase) const {
    return root_ / (phase_name(phase) + ".entry.json");
}

std::string PipelineCache::current_timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<CacheEntry> PipelineCache::read_entry(Phase phase) const {
    auto path = entry_path(phase);
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    try {
        json j = read_json(path);
        CacheEntry entry;
        entry.phase = phase;
        entry.fingerprint = j.at("fingerprint").get<std::string>();
        entry.artifact_path = j.at("artifact_path").get<std::string>();
        entry.artifact_digest = j.at("artifact_digest").get<std::string>();
        entry.created = j.value("created", std::string());
        return entry;
    } catch (const std::exception& e) {
        logger_.warning("Ignoring unreadable cache entry " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool PipelineCache::verify_artifact(const CacheEntry& entry) {
    if (!std::filesystem::exists(entry.artifact_path)) {
        return false;
    }
    auto digest = sha256_file(entry.artifact_path);
    return digest.has_value() && *digest == entry.artifact_digest;
}

std::optional<CacheEntry> PipelineCache::lookup(Phase phase, const std::string& fingerprint) {
    auto entry = read_entry(phase);

    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (!entry) {
        stats_.misses++;
        logger_.debug("Cache MISS: " + phase_name(phase) + " has no entry");
        return std::nullopt;
    }

    if (entry->fingerprint != fingerprint) {
        stats_.misses++;
        logger_.detailed("Cache MISS: " + phase_name(phase) + " inputs changed");
        return std::nullopt;
    }

    if (!verify_artifact(*entry)) {
        stats_.misses++;
        stats_.invalidated++;
        logger_.warning("Cache entry for " + phase_name(phase) + " references a missing or altered artifact (" +
                        entry->artifact_path + "); re-running phase");
        return std::nullopt;
    }

    stats_.hits++;
    logger_.debug("Cache HIT: " + phase_name(phase) + " -> " + entry->artifact_path);
    return entry;
}

CacheEntry PipelineCache::record(Phase phase, const std::string& fingerprint, const std::filesystem::path& artifact) {
    auto digest = sha256_file(artifact);
    if (!digest) {
        throw std::runtime_error("cannot digest artifact " + artifact.string());
    }

    CacheEntry entry;
    entry.phase = phase;
    entry.fingerprint = fingerprint;
    entry.artifact_path = std::filesystem::absolute(artifact).string();
    entry.artifact_digest = *digest;
    entry.created = current_timestamp();

    json j = {
        {"phase", phase_name(phase)},
        {"fingerprint", entry.fingerprint},
        {"artifact_path", entry.artifact_path},
        {"artifact_digest", entry.artifact_digest},
        {"created", entry.created},
    };
    write_json_atomic(entry_path(phase), j);

    std::lock_guard<std::mutex> lock(cache_mutex_);
    stats_.writes++;
    return entry;
}

void PipelineCache::invalidate(Phase phase) {
    std::error_code ec;
    if (std::filesystem::remove(entry_path(phase), ec)) {
        logger_.detailed("Invalidated cache entry for " + phase_name(phase));
    }
}

CacheStats PipelineCache::get_stats() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return stats_;
}

} // namespace rfprof
