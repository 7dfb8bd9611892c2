/**
 * @file Extractor.cpp
 * @brief Implementation of batch point enrichment
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Extractor.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cmath>
#include <future>
#include <iterator>

namespace rfprof {

Extractor::Extractor(const ElevationPolicy& elevation, LandCoverTables tables, int nodata_code)
    : elevation_(elevation), tables_(std::move(tables)), nodata_code_(nodata_code) {}

double Extractor::apply_elevation_fallback(double value, bool valid, const ElevationPolicy& policy,
                                           ElevationStatus* status) {
    ElevationStatus result = ElevationStatus::SAMPLED;
    if (!valid || !std::isfinite(value)) {
        result = ElevationStatus::MISSING;
    } else if (value < policy.min_m || value > policy.max_m) {
        result = ElevationStatus::OUT_OF_RANGE;
    }
    if (status) {
        *status = result;
    }
    return result == ElevationStatus::SAMPLED ? value : policy.fallback_m;
}

std::vector<std::pair<size_t, size_t>> Extractor::azimuth_groups(const std::vector<ReceiverPoint>& points) {
    std::vector<std::pair<size_t, size_t>> groups;
    size_t begin = 0;
    while (begin < points.size()) {
        size_t end = begin;
        // Leading transmitter rows ride along with the first azimuth
        while (end < points.size() && points[end].is_transmitter()) {
            ++end;
        }
        if (end < points.size()) {
            double azimuth = points[end].azimuth_deg;
            while (end < points.size() && !points[end].is_transmitter() && points[end].azimuth_deg == azimuth) {
                ++end;
            }
        }
        groups.emplace_back(begin, end);
        begin = end;
    }
    return groups;
}

Extractor::Result Extractor::extract(SequentialPolicy, const std::vector<ReceiverPoint>& points,
                                     const RasterSource* elevation, const RasterSource* land_cover,
                                     const ZoneResolver& zones) const {
    const size_t n = points.size();
    std::vector<GeoPoint> positions;
    positions.reserve(n);
    for (const auto& p : points) {
        positions.push_back(p.position);
    }

    Result result;
    result.report.total_points = n;

    // One vectorized gather per raster
    RasterSource::Samples elevation_samples;
    if (elevation) {
        elevation_samples = elevation->sample(positions);
    } else {
        elevation_samples.values.assign(n, 0.0);
        elevation_samples.valid.assign(n, 0);
    }

    RasterSource::Samples land_cover_samples;
    if (land_cover) {
        land_cover_samples = land_cover->sample(positions);
    } else {
        land_cover_samples.values.assign(n, 0.0);
        land_cover_samples.valid.assign(n, 0);
    }

    ZoneResolver::Resolution resolution = zones.resolve(positions);
    result.report.zone_fallbacks = resolution.nearest;
    result.report.zone_defaults = resolution.defaulted;

    result.points.resize(n);
    for (size_t i = 0; i < n; ++i) {
        EnrichedPoint& out = result.points[i];
        out.point = points[i];

        ElevationStatus status;
        out.elevation_m = apply_elevation_fallback(elevation_samples.values[i], elevation_samples.valid[i] != 0,
                                                   elevation_, &status);
        out.elevation_fallback = status != ElevationStatus::SAMPLED;
        if (status == ElevationStatus::MISSING) {
            result.report.elevation_missing++;
        } else if (status == ElevationStatus::OUT_OF_RANGE) {
            result.report.elevation_out_of_range++;
        }

        if (land_cover_samples.valid[i]) {
            out.land_cover_code = static_cast<int>(std::lround(land_cover_samples.values[i]));
        } else {
            out.land_cover_code = nodata_code_;
            out.land_cover_fallback = true;
            result.report.land_cover_missing++;
        }

        bool mapped = true;
        out.category = tables_.category_for(out.land_cover_code, &mapped);
        // Nodata codes are counted as missing, not as unmapped
        if (!mapped && !out.land_cover_fallback) {
            out.land_cover_fallback = true;
            result.report.land_cover_unmapped++;
        }
        out.roughness_m = tables_.roughness_for(out.category);

        out.zone = resolution.zones[i];
        out.zone_fallback = resolution.fallback[i] != 0;
    }

    return result;
}

Extractor::Result Extractor::extract(const ParallelPolicy& policy, const std::vector<ReceiverPoint>& points,
                                     const RasterSource* elevation, const RasterSource* land_cover,
                                     const ZoneResolver& zones) const {
    const unsigned threads = policy.resolved_threads();
    auto groups = azimuth_groups(points);
    if (threads <= 1 || groups.size() <= 1) {
        return extract(SequentialPolicy{}, points, elevation, land_cover, zones);
    }

    // Whole azimuth groups per worker, contiguous so the merge is a concatenation
    const size_t workers = std::min<size_t>(threads, groups.size());
    const size_t per_worker = (groups.size() + workers - 1) / workers;

    std::vector<std::future<Result>> futures;
    for (size_t w = 0; w < workers; ++w) {
        size_t first_group = w * per_worker;
        if (first_group >= groups.size()) break;
        size_t last_group = std::min(groups.size(), first_group + per_worker) - 1;
        size_t begin = groups[first_group].first;
        size_t end = groups[last_group].second;

        futures.push_back(std::async(std::launch::async, [this, &points, begin, end, elevation, land_cover, &zones]() {
            std::vector<ReceiverPoint> slice(points.begin() + static_cast<std::ptrdiff_t>(begin),
                                             points.begin() + static_cast<std::ptrdiff_t>(end));
            return extract(SequentialPolicy{}, slice, elevation, land_cover, zones);
        }));
    }

    Logger logger("Extractor");
    logger.detailed("Extracting " + std::to_string(points.size()) + " points in " +
                    std::to_string(futures.size()) + " azimuth partitions");

    Result merged;
    merged.points.reserve(points.size());
    for (auto& future : futures) {
        Result part = future.get();
        merged.points.insert(merged.points.end(),
                             std::make_move_iterator(part.points.begin()),
                             std::make_move_iterator(part.points.end()));
        merged.report += part.report;
    }
    return merged;
}

} // namespace rfprof
