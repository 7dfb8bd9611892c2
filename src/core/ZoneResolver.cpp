/**
 * @file ZoneResolver.cpp
 * @brief Zone polygon loading (OGR), grid index, containment and nearest-polygon lookup
 */

#include "ZoneResolver.hpp"
#include "Logger.hpp"
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <ogr_spatialref.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>

namespace rfprof {

namespace {
    constexpr double METERS_PER_DEGREE = 111320.0;
    constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;
    constexpr double MIN_CELL_SIZE_DEG = 0.01;
    constexpr int MAX_CELLS_PER_AXIS = 128;
    constexpr double TIE_EPSILON_M = 1e-9;

    struct GDALDatasetDeleter {
        void operator()(GDALDataset* dataset) const {
            if (dataset) GDALClose(dataset);
        }
    };
    using GDALDatasetPtr = std::unique_ptr<GDALDataset, GDALDatasetDeleter>;

    struct CoordinateTransformationDeleter {
        void operator()(OGRCoordinateTransformation* ct) const {
            OGRCoordinateTransformation::DestroyCT(ct);
        }
    };
    using CoordinateTransformationPtr =
        std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter>;

    // Distance from the origin to segment (ax,ay)-(bx,by)
    double origin_segment_distance(double ax, double ay, double bx, double by) {
        double dx = bx - ax;
        double dy = by - ay;
        double length_sq = dx * dx + dy * dy;
        double t = 0.0;
        if (length_sq > 0.0) {
            t = std::clamp(-(ax * dx + ay * dy) / length_sq, 0.0, 1.0);
        }
        double px = ax + t * dx;
        double py = ay + t * dy;
        return std::sqrt(px * px + py * py);
    }

    std::vector<GeoPoint> read_ring(const OGRLinearRing* ring) {
        std::vector<GeoPoint> points;
        if (!ring) return points;
        points.reserve(static_cast<size_t>(ring->getNumPoints()));
        for (int i = 0; i < ring->getNumPoints(); ++i) {
            points.emplace_back(ring->getX(i), ring->getY(i));
        }
        return points;
    }

    std::vector<std::vector<GeoPoint>> read_polygon(const OGRPolygon* polygon) {
        std::vector<std::vector<GeoPoint>> rings;
        rings.push_back(read_ring(polygon->getExteriorRing()));
        for (int i = 0; i < polygon->getNumInteriorRings(); ++i) {
            rings.push_back(read_ring(polygon->getInteriorRing(i)));
        }
        return rings;
    }

    bool reproject_rings(OGRCoordinateTransformation* ct, std::vector<std::vector<GeoPoint>>& rings) {
        for (auto& ring : rings) {
            std::vector<double> xs, ys;
            xs.reserve(ring.size());
            ys.reserve(ring.size());
            for (const auto& p : ring) {
                xs.push_back(p.lon);
                ys.push_back(p.lat);
            }
            if (!ring.empty() && !ct->Transform(ring.size(), xs.data(), ys.data())) {
                return false;
            }
            for (size_t i = 0; i < ring.size(); ++i) {
                ring[i] = GeoPoint(xs[i], ys[i]);
            }
        }
        return true;
    }
}

ZonePolygon::ZonePolygon(int zone, std::vector<std::vector<GeoPoint>> polygon_rings)
    : zone_id(zone), rings(std::move(polygon_rings)) {
    bool first = true;
    for (const auto& ring : rings) {
        for (const auto& p : ring) {
            if (first) {
                envelope = BoundingBox(p.lon, p.lat, p.lon, p.lat);
                first = false;
            } else {
                envelope.expand(p);
            }
        }
    }
}

// ============================================================================
// Construction and indexing
// ============================================================================

ZoneResolver::ZoneResolver(std::vector<ZonePolygon> polygons, int default_zone)
    : polygons_(std::move(polygons)), default_zone_(default_zone) {
    // Polygons without an exterior ring can never match
    polygons_.erase(std::remove_if(polygons_.begin(), polygons_.end(),
                                   [](const ZonePolygon& p) { return p.rings.empty() || p.rings.front().empty(); }),
                    polygons_.end());
    build_index();
}

void ZoneResolver::build_index() {
    grid_.clear();
    if (polygons_.empty()) {
        return;
    }

    grid_extent_ = polygons_.front().envelope;
    for (const auto& polygon : polygons_) {
        grid_extent_.expand(GeoPoint(polygon.envelope.min_x, polygon.envelope.min_y));
        grid_extent_.expand(GeoPoint(polygon.envelope.max_x, polygon.envelope.max_y));
    }

    double span = std::max(grid_extent_.width(), grid_extent_.height());
    cell_size_deg_ = std::max(MIN_CELL_SIZE_DEG, span / MAX_CELLS_PER_AXIS);
    grid_cols_ = static_cast<int>(std::floor(grid_extent_.width() / cell_size_deg_)) + 1;
    grid_rows_ = static_cast<int>(std::floor(grid_extent_.height() / cell_size_deg_)) + 1;

    for (size_t index = 0; index < polygons_.size(); ++index) {
        const auto& env = polygons_[index].envelope;
        auto [col_min, row_min] = cell_of(GeoPoint(env.min_x, env.min_y));
        auto [col_max, row_max] = cell_of(GeoPoint(env.max_x, env.max_y));
        for (int row = row_min; row <= row_max; ++row) {
            for (int col = col_min; col <= col_max; ++col) {
                grid_[{col, row}].push_back(index);
            }
        }
    }
}

std::pair<int, int> ZoneResolver::cell_of(const GeoPoint& point) const {
    return {static_cast<int>(std::floor((point.lon - grid_extent_.min_x) / cell_size_deg_)),
            static_cast<int>(std::floor((point.lat - grid_extent_.min_y) / cell_size_deg_))};
}

const std::vector<size_t>* ZoneResolver::polygons_in_cell(int col, int row) const {
    if (col < 0 || row < 0 || col >= grid_cols_ || row >= grid_rows_) {
        return nullptr;
    }
    auto it = grid_.find({col, row});
    return it != grid_.end() ? &it->second : nullptr;
}

// ============================================================================
// Geometry
// ============================================================================

bool ZoneResolver::polygon_contains(const ZonePolygon& polygon, const GeoPoint& point) {
    if (!polygon.envelope.contains(point)) {
        return false;
    }

    // Even-odd rule over all rings, so holes are excluded
    bool inside = false;
    for (const auto& ring : polygon.rings) {
        const size_t n = ring.size();
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            const auto& a = ring[i];
            const auto& b = ring[j];
            if ((a.lat > point.lat) != (b.lat > point.lat)) {
                double x_cross = (b.lon - a.lon) * (point.lat - a.lat) / (b.lat - a.lat) + a.lon;
                if (point.lon < x_cross) {
                    inside = !inside;
                }
            }
        }
    }
    return inside;
}

double ZoneResolver::distance_to_polygon_m(const GeoPoint& point, const ZonePolygon& polygon) {
    if (polygon_contains(polygon, point)) {
        return 0.0;
    }

    const double lat_scale = METERS_PER_DEGREE;
    const double lon_scale = METERS_PER_DEGREE * std::cos(point.lat * DEG_TO_RAD);

    double best = std::numeric_limits<double>::infinity();
    for (const auto& ring : polygon.rings) {
        const size_t n = ring.size();
        if (n == 1) {
            best = std::min(best, origin_segment_distance(
                (ring[0].lon - point.lon) * lon_scale, (ring[0].lat - point.lat) * lat_scale,
                (ring[0].lon - point.lon) * lon_scale, (ring[0].lat - point.lat) * lat_scale));
            continue;
        }
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            double ax = (ring[j].lon - point.lon) * lon_scale;
            double ay = (ring[j].lat - point.lat) * lat_scale;
            double bx = (ring[i].lon - point.lon) * lon_scale;
            double by = (ring[i].lat - point.lat) * lat_scale;
            best = std::min(best, origin_segment_distance(ax, ay, bx, by));
        }
    }
    return best;
}

// ============================================================================
// Queries
// ============================================================================

std::optional<size_t> ZoneResolver::containing_polygon(const GeoPoint& point) const {
    if (polygons_.empty()) {
        return std::nullopt;
    }
    auto [col, row] = cell_of(point);
    const auto* candidates = polygons_in_cell(col, row);
    if (!candidates) {
        return std::nullopt;
    }
    for (size_t index : *candidates) {
        if (polygon_contains(polygons_[index], point)) {
            return index;
        }
    }
    return std::nullopt;
}

std::pair<size_t, double> ZoneResolver::nearest_polygon(const GeoPoint& point) const {
    auto [ci, cj] = cell_of(point);

    const double lon_scale = METERS_PER_DEGREE * std::cos(point.lat * DEG_TO_RAD);
    const double ring_width_m = cell_size_deg_ * std::min(METERS_PER_DEGREE, lon_scale);

    // Rings closer than r_first contain no grid cell; rings beyond r_last are empty too
    const int r_first = std::max({0, -ci, ci - (grid_cols_ - 1), -cj, cj - (grid_rows_ - 1)});
    const int r_last = std::max({std::abs(ci), std::abs(ci - (grid_cols_ - 1)),
                                 std::abs(cj), std::abs(cj - (grid_rows_ - 1))});

    std::vector<char> visited(polygons_.size(), 0);
    size_t best_index = polygons_.size();
    double best_distance = std::numeric_limits<double>::infinity();

    auto visit = [&](int col, int row) {
        const auto* candidates = polygons_in_cell(col, row);
        if (!candidates) return;
        for (size_t index : *candidates) {
            if (visited[index]) continue;
            visited[index] = 1;
            double d = distance_to_polygon_m(point, polygons_[index]);
            bool closer = d < best_distance - TIE_EPSILON_M;
            bool tie = std::abs(d - best_distance) <= TIE_EPSILON_M && index < best_index;
            if (closer || tie) {
                best_distance = d;
                best_index = index;
            }
        }
    };

    for (int r = r_first; r <= r_last; ++r) {
        if (r == 0) {
            visit(ci, cj);
        } else {
            int col_lo = std::max(ci - r, 0);
            int col_hi = std::min(ci + r, grid_cols_ - 1);
            for (int col = col_lo; col <= col_hi; ++col) {
                visit(col, cj - r);
                visit(col, cj + r);
            }
            int row_lo = std::max(cj - r + 1, 0);
            int row_hi = std::min(cj + r - 1, grid_rows_ - 1);
            for (int row = row_lo; row <= row_hi; ++row) {
                visit(ci - r, row);
                visit(ci + r, row);
            }
        }

        // Unvisited polygons lie in rings >= r + 1, at least r cell widths away
        if (best_index < polygons_.size() && best_distance + TIE_EPSILON_M < r * ring_width_m) {
            break;
        }
    }

    return {best_index, best_distance};
}

ZoneResolver::Resolution ZoneResolver::resolve(const std::vector<GeoPoint>& points) const {
    Resolution resolution;
    resolution.zones.assign(points.size(), default_zone_);
    resolution.fallback.assign(points.size(), 0);

    if (polygons_.empty()) {
        resolution.defaulted = points.size();
        return resolution;
    }

    // Containment pass
    std::vector<size_t> unmatched;
    for (size_t i = 0; i < points.size(); ++i) {
        auto index = containing_polygon(points[i]);
        if (index.has_value()) {
            resolution.zones[i] = polygons_[*index].zone_id;
            resolution.contained++;
        } else {
            unmatched.push_back(i);
        }
    }

    // Fallback pass over the residual only
    for (size_t i : unmatched) {
        auto [index, distance] = nearest_polygon(points[i]);
        resolution.zones[i] = polygons_[index].zone_id;
        resolution.fallback[i] = 1;
        resolution.nearest++;
    }
    return resolution;
}

// ============================================================================
// Loading
// ============================================================================

ZoneResolver ZoneResolver::from_file(const std::string& path, const std::string& id_field, int default_zone) {
    Logger logger("ZoneResolver");
    GDALAllRegister();

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset) {
        throw DataUnavailableError("cannot open zone polygons " + path);
    }

    OGRSpatialReference wgs84;
    wgs84.SetWellKnownGeogCS("WGS84");
    wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    std::vector<ZonePolygon> polygons;
    size_t skipped = 0;

    for (int layer_index = 0; layer_index < dataset->GetLayerCount(); ++layer_index) {
        OGRLayer* layer = dataset->GetLayer(layer_index);
        if (!layer) continue;

        int field = layer->GetLayerDefn()->GetFieldIndex(id_field.c_str());
        if (field < 0) {
            throw DataUnavailableError("layer " + std::string(layer->GetName()) + " of " + path +
                                       " has no field '" + id_field + "'");
        }

        CoordinateTransformationPtr to_wgs84;
        if (const OGRSpatialReference* layer_srs = layer->GetSpatialRef()) {
            OGRSpatialReference source(*layer_srs);
            source.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
            if (!source.IsSame(&wgs84)) {
                to_wgs84.reset(OGRCreateCoordinateTransformation(&source, &wgs84));
                if (!to_wgs84) {
                    throw DataUnavailableError("cannot reproject zone layer " + std::string(layer->GetName()) + " to WGS84");
                }
                logger.detailed("Reprojecting zone layer " + std::string(layer->GetName()) + " to WGS84");
            }
        }

        layer->ResetReading();
        while (true) {
            OGRFeatureUniquePtr feature(layer->GetNextFeature());
            if (!feature) break;

            const OGRGeometry* geometry = feature->GetGeometryRef();
            if (!geometry || !feature->IsFieldSetAndNotNull(field)) {
                skipped++;
                continue;
            }
            int zone = feature->GetFieldAsInteger(field);

            std::vector<std::vector<std::vector<GeoPoint>>> parts;
            auto type = wkbFlatten(geometry->getGeometryType());
            if (type == wkbPolygon) {
                parts.push_back(read_polygon(geometry->toPolygon()));
            } else if (type == wkbMultiPolygon) {
                const OGRMultiPolygon* multi = geometry->toMultiPolygon();
                for (int i = 0; i < multi->getNumGeometries(); ++i) {
                    parts.push_back(read_polygon(multi->getGeometryRef(i)->toPolygon()));
                }
            } else {
                skipped++;
                continue;
            }

            for (auto& rings : parts) {
                if (to_wgs84 && !reproject_rings(to_wgs84.get(), rings)) {
                    skipped++;
                    continue;
                }
                polygons.emplace_back(zone, std::move(rings));
            }
        }
    }

    if (skipped > 0) {
        logger.warning("Skipped " + std::to_string(skipped) + " zone features without polygon geometry or '" +
                       id_field + "' value in " + path);
    }
    logger.info("Loaded " + std::to_string(polygons.size()) + " zone polygons from " + path);

    return ZoneResolver(std::move(polygons), default_zone);
}

} // namespace rfprof
