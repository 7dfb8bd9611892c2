/**
 * @file PointGenerator.cpp
 * @brief Receiver point generation in a transmitter-local UTM projection
 */

#include "PointGenerator.hpp"
#include "Logger.hpp"
#include <ogr_spatialref.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <set>
#include <sstream>

namespace rfprof {

namespace {
    constexpr double DEG_TO_RAD = 3.14159265358979323846 / 180.0;
    constexpr double STEP_TOLERANCE = 1e-9;

    struct CoordinateTransformationDeleter {
        void operator()(OGRCoordinateTransformation* ct) const {
            OGRCoordinateTransformation::DestroyCT(ct);
        }
    };
    using CoordinateTransformationPtr =
        std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter>;
}

PointGenerator::Parameters PointGenerator::Parameters::from_config(const ReceiverGenerationConfig& config) {
    Parameters params;
    params.max_distance_km = config.max_distance_km;
    params.distance_step_km = config.distance_step_km;
    params.azimuths_deg = config.resolved_azimuths();
    return params;
}

PointGenerator::PointGenerator(const Transmitter& transmitter) : transmitter_(transmitter) {}

int PointGenerator::utm_zone(double longitude) {
    int zone = static_cast<int>(std::floor((longitude + 180.0) / 6.0)) + 1;
    return std::clamp(zone, 1, 60);
}

std::vector<double> PointGenerator::distance_steps(double max_distance_km, double step_km) {
    std::vector<double> distances;
    if (step_km <= 0.0 || max_distance_km < step_km) {
        return distances;
    }

    auto count = static_cast<size_t>(std::floor(max_distance_km / step_km + STEP_TOLERANCE));
    distances.reserve(count);
    for (size_t k = 1; k <= count; ++k) {
        distances.push_back(std::round(static_cast<double>(k) * step_km * 1e12) / 1e12);
    }
    return distances;
}

std::vector<double> PointGenerator::equally_spaced_azimuths(int count) {
    ReceiverGenerationConfig config;
    config.num_azimuths = count;
    return config.resolved_azimuths();
}

size_t PointGenerator::expected_count(const Parameters& params) {
    return params.azimuths_deg.size() *
           distance_steps(params.max_distance_km, params.distance_step_km).size() + 1;
}

void PointGenerator::validate(const Transmitter& transmitter, const Parameters& params) {
    std::vector<std::string> problems;

    if (!std::isfinite(transmitter.latitude) || std::abs(transmitter.latitude) > 84.0) {
        problems.push_back("transmitter latitude must be finite and within UTM coverage (|lat| <= 84)");
    }
    if (!std::isfinite(transmitter.longitude) || std::abs(transmitter.longitude) > 180.0) {
        problems.push_back("transmitter longitude must be within [-180, 180]");
    }
    if (!(params.distance_step_km > 0.0)) {
        problems.push_back("distance_step_km must be > 0");
    } else if (!(params.max_distance_km >= params.distance_step_km)) {
        problems.push_back("max_distance_km must be >= distance_step_km");
    }
    if (params.azimuths_deg.empty()) {
        problems.push_back("azimuth list is empty");
    }

    std::set<double> seen;
    for (double azimuth : params.azimuths_deg) {
        if (!std::isfinite(azimuth) || azimuth < 0.0 || azimuth >= 360.0) {
            std::ostringstream oss;
            oss << "azimuth " << azimuth << " is outside [0, 360)";
            problems.push_back(oss.str());
        } else if (!seen.insert(azimuth).second) {
            std::ostringstream oss;
            oss << "azimuth " << azimuth << " is listed twice";
            problems.push_back(oss.str());
        }
    }

    if (!problems.empty()) {
        std::string message = "invalid receiver generation parameters:";
        for (const auto& problem : problems) {
            message += "\n  - " + problem;
        }
        throw ConfigurationError(message);
    }
}

std::vector<ReceiverPoint> PointGenerator::generate(const Parameters& params) const {
    Logger logger("PointGenerator");
    validate(transmitter_, params);

    const auto distances = distance_steps(params.max_distance_km, params.distance_step_km);
    const size_t total = params.azimuths_deg.size() * distances.size();

    int zone = utm_zone(transmitter_.longitude);
    bool north = transmitter_.latitude >= 0.0;

    OGRSpatialReference wgs84;
    wgs84.SetWellKnownGeogCS("WGS84");
    wgs84.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    OGRSpatialReference utm;
    utm.SetProjCS("UTM");
    utm.SetWellKnownGeogCS("WGS84");
    utm.SetUTM(zone, north ? TRUE : FALSE);
    utm.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

    CoordinateTransformationPtr to_utm(OGRCreateCoordinateTransformation(&wgs84, &utm));
    CoordinateTransformationPtr to_geo(OGRCreateCoordinateTransformation(&utm, &wgs84));
    if (!to_utm || !to_geo) {
        throw ConfigurationError("cannot build WGS84 <-> UTM zone " + std::to_string(zone) + " transformation");
    }

    double tx_x = transmitter_.longitude;
    double tx_y = transmitter_.latitude;
    if (!to_utm->Transform(1, &tx_x, &tx_y)) {
        throw ConfigurationError("transmitter position cannot be projected to UTM");
    }

    // Forward bearing offsets for every ray, then one inverse projection
    std::vector<double> xs(total);
    std::vector<double> ys(total);
    size_t index = 0;
    for (double azimuth : params.azimuths_deg) {
        double sin_az = std::sin(azimuth * DEG_TO_RAD);
        double cos_az = std::cos(azimuth * DEG_TO_RAD);
        for (double distance_km : distances) {
            double d_m = distance_km * 1000.0;
            xs[index] = tx_x + d_m * sin_az;
            ys[index] = tx_y + d_m * cos_az;
            ++index;
        }
    }

    std::vector<int> success(total, 0);
    if (total > 0 && !to_geo->Transform(total, xs.data(), ys.data(), nullptr, success.data())) {
        auto failed = static_cast<size_t>(std::count(success.begin(), success.end(), 0));
        throw ConfigurationError(std::to_string(failed) + " receiver points could not be projected back to WGS84");
    }

    std::vector<ReceiverPoint> points;
    points.reserve(total + 1);

    ReceiverPoint tx_point;
    tx_point.id = 0;
    tx_point.position = transmitter_.position();
    points.push_back(tx_point);

    index = 0;
    for (double azimuth : params.azimuths_deg) {
        for (double distance_km : distances) {
            ReceiverPoint point;
            point.id = static_cast<int>(points.size());
            point.distance_km = distance_km;
            point.azimuth_deg = azimuth;
            point.has_azimuth = true;
            point.position = GeoPoint(xs[index], ys[index]);
            points.push_back(point);
            ++index;
        }
    }

    std::ostringstream msg;
    msg << "Generated " << points.size() << " points (" << params.azimuths_deg.size()
        << " azimuths x " << distances.size() << " distances + transmitter) in UTM zone "
        << zone << (north ? "N" : "S");
    logger.info(msg.str());

    return points;
}

} // namespace rfprof
