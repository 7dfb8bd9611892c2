/**
 * @file RunTracker.cpp
 * @brief Implementation of run tracking
 */

#include "RunTracker.hpp"
#include "JsonSerialization.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace rfprof {

RunTracker::RunTracker() : tracking_start_time_(std::chrono::steady_clock::now()) {}

PhaseRecord* RunTracker::findPhase(Phase phase) {
    // Latest attempt wins
    auto it = std::find_if(phases_.rbegin(), phases_.rend(),
                           [phase](const PhaseRecord& record) { return record.phase == phase; });
    return (it != phases_.rend()) ? &(*it) : nullptr;
}

std::vector<const PhaseRecord*> RunTracker::recordsByPhase() const {
    std::vector<const PhaseRecord*> records;
    records.reserve(phases_.size());
    for (const auto& record : phases_) {
        records.push_back(&record);
    }
    std::stable_sort(records.begin(), records.end(),
                     [](const PhaseRecord* a, const PhaseRecord* b) { return a->phase < b->phase; });
    return records;
}

void RunTracker::startPhase(Phase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    phases_.emplace_back(phase);
    logger_.detailed("[PHASE START] " + phase_name(phase));
}

void RunTracker::completePhase(Phase phase, bool from_cache, const std::string& fingerprint,
                               const std::string& artifact) {
    std::lock_guard<std::mutex> lock(mutex_);
    PhaseRecord* record = findPhase(phase);
    if (!record) return;

    record->end_time = std::chrono::steady_clock::now();
    record->completed = true;
    record->successful = true;
    record->from_cache = from_cache;
    record->fingerprint = fingerprint;
    record->artifact = artifact;

    logger_.info(phase_name(phase) + (from_cache ? " reused from cache" : " completed") +
                 " (" + formatDuration(record->duration()) + ")");
}

void RunTracker::failPhase(Phase phase, const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    PhaseRecord* record = findPhase(phase);
    if (!record) return;

    record->end_time = std::chrono::steady_clock::now();
    record->completed = true;
    record->successful = false;
    record->error_message = error;
    logger_.error(phase_name(phase) + " failed: " + error);
}

void RunTracker::addPhaseData(Phase phase, const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    PhaseRecord* record = findPhase(phase);
    if (record) {
        record->phase_data[key] = value;
    }
}

void RunTracker::trackOutputFile(const std::string& filename, const std::string& format) {
    OutputFileInfo info(filename, format);
    std::error_code ec;
    if (std::filesystem::exists(filename, ec)) {
        info.exists = true;
        info.file_size_bytes = static_cast<size_t>(std::filesystem::file_size(filename, ec));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tracked_files_.push_back(info);
    logger_.detailed("[FILE TRACKED] " + filename + " (format: " + format + ")");
}

std::vector<PhaseOutcome> RunTracker::getOutcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PhaseOutcome> outcomes;
    for (const PhaseRecord* record : recordsByPhase()) {
        if (!record->completed || !record->successful) continue;
        PhaseOutcome outcome;
        outcome.phase = record->phase;
        outcome.from_cache = record->from_cache;
        outcome.fingerprint = record->fingerprint;
        outcome.artifact = record->artifact;
        outcome.duration_ms = record->duration().count();
        outcomes.push_back(outcome);
    }
    return outcomes;
}

std::vector<std::string> RunTracker::getOutputFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    for (const auto& file : tracked_files_) {
        if (file.exists) {
            files.push_back(file.filename);
        }
    }
    return files;
}

size_t RunTracker::getCompletedPhaseCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(phases_.begin(), phases_.end(),
                                             [](const PhaseRecord& r) { return r.completed && r.successful; }));
}

std::string RunTracker::getPipelineStatus() const {
    size_t completed = getCompletedPhaseCount();

    std::lock_guard<std::mutex> lock(mutex_);
    size_t cached = static_cast<size_t>(std::count_if(phases_.begin(), phases_.end(),
                                                      [](const PhaseRecord& r) { return r.successful && r.from_cache; }));
    std::ostringstream oss;
    oss << "Pipeline: " << completed << "/" << std::size(ALL_PHASES) << " phases completed ("
        << cached << " from cache)";

    for (const PhaseRecord* record : recordsByPhase()) {
        if (record->completed && !record->successful) {
            oss << ", " << phase_name(record->phase) << " FAILED";
        }
    }
    return oss.str();
}

std::string RunTracker::getTimingReport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - tracking_start_time_);

    std::ostringstream oss;
    oss << "Total time: " << formatDuration(total_time);
    for (const PhaseRecord* record : recordsByPhase()) {
        if (record->completed) {
            oss << "\n  " << std::left << std::setw(16) << phase_name(record->phase)
                << formatDuration(record->duration());
            if (record->from_cache) oss << " (cached)";
        }
    }
    return oss.str();
}

std::string RunTracker::getFileTrackingSummary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t written = 0;
    size_t total_size = 0;
    for (const auto& file : tracked_files_) {
        if (file.exists) {
            written++;
            total_size += file.file_size_bytes;
        }
    }
    std::ostringstream oss;
    oss << "Files: " << written << "/" << tracked_files_.size() << " written, "
        << formatFileSize(total_size) << " total";
    return oss.str();
}

void RunTracker::printSummary() const {
    std::ostringstream summary;
    summary << "\n=== Run Summary ===\n";
    summary << getPipelineStatus() << "\n";
    summary << getTimingReport() << "\n";
    summary << getFileTrackingSummary() << "\n";
    for (const auto& file : getOutputFiles()) {
        summary << "  " << file << "\n";
    }
    summary << "===================";
    logger_.info(summary.str());
}

void RunTracker::exportTrackingData(const std::string& filename) const {
    nlohmann::json phases = nlohmann::json::array();
    nlohmann::json files = nlohmann::json::array();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const PhaseRecord* record : recordsByPhase()) {
            phases.push_back(nlohmann::json{
                {"phase", phase_name(record->phase)},
                {"completed", record->completed},
                {"successful", record->successful},
                {"from_cache", record->from_cache},
                {"duration_ms", record->duration().count()},
                {"fingerprint", record->fingerprint},
                {"artifact", record->artifact},
                {"error", record->error_message},
                {"data", record->phase_data},
            });
        }
        for (const auto& file : tracked_files_) {
            files.push_back(nlohmann::json{
                {"filename", file.filename},
                {"format", file.format},
                {"size_bytes", file.file_size_bytes},
                {"exists", file.exists},
            });
        }
    }

    write_json_atomic(filename, nlohmann::json{{"phases", phases}, {"files", files}});
    logger_.detailed("[EXPORT] Tracking data exported to: " + filename);
}

std::string RunTracker::formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    std::ostringstream oss;
    if (ms < 1000) {
        oss << ms << "ms";
    } else if (ms < 60000) {
        oss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        oss << (ms / 60000) << "m" << ((ms % 60000) / 1000) << "s";
    }
    return oss.str();
}

std::string RunTracker::formatFileSize(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    int unit = 0;

    while (size >= 1024 && unit < 3) {
        size /= 1024;
        unit++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    return oss.str();
}

} // namespace rfprof
