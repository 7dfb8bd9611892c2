/**
 * @file Extractor.hpp
 * @brief Batch enrichment of receiver points with elevation, land cover and zone
 */

#pragma once

#include "rf_profile_generator.hpp"
#include "ExecutionPolicies.hpp"
#include "RasterSource.hpp"
#include "ZoneResolver.hpp"
#include <vector>

namespace rfprof {

/**
 * @brief Admissible elevation range and the value substituted outside it
 */
struct ElevationPolicy {
    double min_m = -500.0;
    double max_m = 9000.0;
    double fallback_m = 0.0;

    static ElevationPolicy from_config(const ElevationConfig& config) {
        return {config.min_m, config.max_m, config.fallback_m};
    }
};

enum class ElevationStatus { SAMPLED, MISSING, OUT_OF_RANGE };

/**
 * @brief Samples every raster once per batch and applies the fallback rules
 *
 * Rasters are passed in already resident; a null raster is treated as
 * absent everywhere. Output order always equals input order.
 */
class Extractor {
public:
    struct Result {
        std::vector<EnrichedPoint> points;
        ExtractionReport report;
    };

    Extractor(const ElevationPolicy& elevation, LandCoverTables tables, int nodata_code);

    Result extract(SequentialPolicy, const std::vector<ReceiverPoint>& points,
                   const RasterSource* elevation, const RasterSource* land_cover,
                   const ZoneResolver& zones) const;

    /// Splits the batch by azimuth group over worker threads and merges in input order
    Result extract(const ParallelPolicy& policy, const std::vector<ReceiverPoint>& points,
                   const RasterSource* elevation, const RasterSource* land_cover,
                   const ZoneResolver& zones) const;

    /// Pure fallback rule: sampled in-range values pass through, everything else becomes the fallback
    static double apply_elevation_fallback(double value, bool valid, const ElevationPolicy& policy,
                                           ElevationStatus* status = nullptr);

    /// Contiguous [begin, end) ranges of equal azimuth; the transmitter joins the first range
    static std::vector<std::pair<size_t, size_t>> azimuth_groups(const std::vector<ReceiverPoint>& points);

    const ElevationPolicy& elevation_policy() const { return elevation_; }
    const LandCoverTables& tables() const { return tables_; }
    int nodata_code() const { return nodata_code_; }

private:
    ElevationPolicy elevation_;
    LandCoverTables tables_;
    int nodata_code_;
};

} // namespace rfprof
