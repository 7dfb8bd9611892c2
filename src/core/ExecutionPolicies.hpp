#pragma once

/**
 * @file ExecutionPolicies.hpp
 * @brief Execution policy tags selecting sequential or threaded batch extraction
 */

#include <algorithm>
#include <thread>

namespace rfprof {

struct SequentialPolicy {};

/**
 * @brief Fan work out over worker threads; 0 threads means hardware concurrency
 */
struct ParallelPolicy {
    unsigned num_threads = 0;

    unsigned resolved_threads() const {
        unsigned hw = std::max(1u, std::thread::hardware_concurrency());
        return num_threads == 0 ? hw : num_threads;
    }
};

} // namespace rfprof
