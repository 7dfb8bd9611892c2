/**
 * @file RunTracker.hpp
 * @brief Phase timing, cache outcome and output file tracking for one pipeline run
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "rf_profile_generator.hpp"
#include "Logger.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace rfprof {

/**
 * @brief Information about a written output file
 */
struct OutputFileInfo {
    std::string filename;
    std::string format;
    size_t file_size_bytes = 0;
    bool exists = false;

    OutputFileInfo(const std::string& fname, const std::string& fmt) : filename(fname), format(fmt) {}
};

/**
 * @brief State of one phase within a run
 */
struct PhaseRecord {
    Phase phase;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;
    bool successful = false;
    bool from_cache = false;
    std::string fingerprint;
    std::string artifact;
    std::string error_message;
    std::map<std::string, std::string> phase_data;

    explicit PhaseRecord(Phase p) : phase(p), start_time(std::chrono::steady_clock::now()) {}

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

/**
 * @brief Thread-safe tracker; DataPrep and PointGeneration report concurrently
 */
class RunTracker {
public:
    RunTracker();

    void startPhase(Phase phase);
    void completePhase(Phase phase, bool from_cache, const std::string& fingerprint, const std::string& artifact);
    void failPhase(Phase phase, const std::string& error);
    void addPhaseData(Phase phase, const std::string& key, const std::string& value);

    void trackOutputFile(const std::string& filename, const std::string& format);

    std::vector<PhaseOutcome> getOutcomes() const;
    std::vector<std::string> getOutputFiles() const;
    size_t getCompletedPhaseCount() const;

    std::string getPipelineStatus() const;
    std::string getTimingReport() const;
    std::string getFileTrackingSummary() const;

    void printSummary() const;

    /// Write phases and files as JSON
    void exportTrackingData(const std::string& filename) const;

private:
    mutable std::mutex mutex_;
    std::vector<PhaseRecord> phases_;
    std::vector<OutputFileInfo> tracked_files_;
    std::chrono::steady_clock::time_point tracking_start_time_;
    Logger logger_{"RunTracker"};

    PhaseRecord* findPhase(Phase phase);
    // Records in phase order, attempts of one phase in start order. Caller holds mutex_.
    std::vector<const PhaseRecord*> recordsByPhase() const;

    static std::string formatDuration(std::chrono::milliseconds duration);
    static std::string formatFileSize(size_t bytes);
};

} // namespace rfprof
