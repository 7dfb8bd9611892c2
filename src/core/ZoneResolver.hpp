#pragma once

/**
 * @file ZoneResolver.hpp
 * @brief Radio-climatic zone assignment by polygon containment with nearest-polygon fallback
 */

#include "rf_profile_generator.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rfprof {

/**
 * @brief One polygon part with its zone id
 *
 * rings[0] is the exterior ring, further rings are holes. Rings need not be closed.
 */
struct ZonePolygon {
    int zone_id = 0;
    std::vector<std::vector<GeoPoint>> rings;
    BoundingBox envelope;

    ZonePolygon() = default;
    ZonePolygon(int zone, std::vector<std::vector<GeoPoint>> polygon_rings);
};

/**
 * @brief Assigns exactly one zone id to every point
 *
 * Containment is tested against the polygons registered in the point's grid
 * cell in ascending polygon order, so overlaps resolve to the lowest polygon
 * index. Points contained by no polygon take the zone of the nearest polygon
 * boundary; equal distances resolve to the lowest polygon index. With no
 * polygons at all every point receives the default zone.
 */
class ZoneResolver {
public:
    struct Resolution {
        std::vector<int> zones;
        std::vector<std::uint8_t> fallback;  ///< 1 where the nearest-polygon rule was used
        size_t contained = 0;
        size_t nearest = 0;
        size_t defaulted = 0;
    };

    ZoneResolver(std::vector<ZonePolygon> polygons, int default_zone);

    /**
     * @brief Load polygons from any OGR vector source
     *
     * Polygon and multipolygon features of every layer are read in file order and
     * reprojected to WGS84 when the layer carries another spatial reference.
     *
     * @throws DataUnavailableError if the file cannot be opened or lacks the id field
     */
    static ZoneResolver from_file(const std::string& path, const std::string& id_field, int default_zone);

    Resolution resolve(const std::vector<GeoPoint>& points) const;

    std::optional<size_t> containing_polygon(const GeoPoint& point) const;

    /// Nearest polygon index and its boundary distance in metres; requires !empty()
    std::pair<size_t, double> nearest_polygon(const GeoPoint& point) const;

    /// Boundary distance in metres using an equirectangular frame at the point latitude
    static double distance_to_polygon_m(const GeoPoint& point, const ZonePolygon& polygon);

    static bool polygon_contains(const ZonePolygon& polygon, const GeoPoint& point);

    bool empty() const { return polygons_.empty(); }
    size_t size() const { return polygons_.size(); }
    int default_zone() const { return default_zone_; }
    const std::vector<ZonePolygon>& polygons() const { return polygons_; }

private:
    std::vector<ZonePolygon> polygons_;
    int default_zone_;

    // Uniform grid over polygon envelopes; cell -> ascending polygon indices
    BoundingBox grid_extent_;
    double cell_size_deg_ = 1.0;
    int grid_cols_ = 0;
    int grid_rows_ = 0;
    std::map<std::pair<int, int>, std::vector<size_t>> grid_;

    void build_index();
    std::pair<int, int> cell_of(const GeoPoint& point) const;
    const std::vector<size_t>* polygons_in_cell(int col, int row) const;
};

} // namespace rfprof
