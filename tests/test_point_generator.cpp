/**
 * @file test_point_generator.cpp
 * @brief Receiver point layout, ordering and parameter validation
 */

#include "TestSupport.hpp"
#include "core/PointGenerator.hpp"
#include <cmath>
#include <set>

using namespace rfprof;

namespace {

constexpr double PI = 3.14159265358979323846;

Transmitter reference_transmitter() {
    Transmitter tx;
    tx.latitude = 9.345;
    tx.longitude = -13.40694;
    return tx;
}

PointGenerator::Parameters four_rays(double max_km, double step_km) {
    PointGenerator::Parameters params;
    params.max_distance_km = max_km;
    params.distance_step_km = step_km;
    params.azimuths_deg = {0.0, 90.0, 180.0, 270.0};
    return params;
}

// Haversine distance, good to a few metres at these ranges
double great_circle_km(const GeoPoint& a, const GeoPoint& b) {
    const double r = 6371.0088;
    double phi1 = a.lat * PI / 180.0;
    double phi2 = b.lat * PI / 180.0;
    double dphi = (b.lat - a.lat) * PI / 180.0;
    double dlam = (b.lon - a.lon) * PI / 180.0;
    double h = std::sin(dphi / 2) * std::sin(dphi / 2) +
               std::cos(phi1) * std::cos(phi2) * std::sin(dlam / 2) * std::sin(dlam / 2);
    return 2 * r * std::asin(std::sqrt(h));
}

bool nine_point_scenario() {
    auto points = PointGenerator(reference_transmitter()).generate(four_rays(1.0, 0.5));

    RFPROF_CHECK(points.size() == 9);
    RFPROF_CHECK(points[0].is_transmitter());
    RFPROF_CHECK(points[0].id == 0);
    RFPROF_CHECK(points[0].distance_km == 0.0);
    RFPROF_CHECK(points[0].position == GeoPoint(-13.40694, 9.345));

    // Azimuth 0 group is exactly [0.5, 1.0]
    RFPROF_CHECK(points[1].azimuth_deg == 0.0 && points[2].azimuth_deg == 0.0);
    RFPROF_CHECK_NEAR(points[1].distance_km, 0.5, 1e-12);
    RFPROF_CHECK_NEAR(points[2].distance_km, 1.0, 1e-12);
    RFPROF_CHECK(points[3].azimuth_deg == 90.0);

    for (size_t i = 0; i < points.size(); ++i) {
        RFPROF_CHECK(points[i].id == static_cast<int>(i));
    }
    return true;
}

bool count_matches_formula() {
    PointGenerator::Parameters params;
    params.max_distance_km = 11.0;
    params.distance_step_km = 0.03;
    params.azimuths_deg = PointGenerator::equally_spaced_azimuths(36);

    auto points = PointGenerator(reference_transmitter()).generate(params);

    // floor(11 / 0.03) = 366 steps per azimuth
    RFPROF_CHECK(points.size() == 36 * 366 + 1);
    RFPROF_CHECK(points.size() == PointGenerator::expected_count(params));
    RFPROF_CHECK_NEAR(points.back().distance_km, 10.98, 1e-9);
    return true;
}

bool step_tolerance_absorbs_rounding() {
    // 0.3 / 0.1 evaluates to 2.9999999999999996
    auto distances = PointGenerator::distance_steps(0.3, 0.1);
    RFPROF_CHECK(distances.size() == 3);
    RFPROF_CHECK_NEAR(distances.back(), 0.3, 1e-12);

    RFPROF_CHECK(PointGenerator::distance_steps(1.0, 0.4).size() == 2);
    RFPROF_CHECK(PointGenerator::distance_steps(0.2, 0.5).empty());
    return true;
}

bool groups_ordered_and_increasing() {
    PointGenerator::Parameters params;
    params.max_distance_km = 2.0;
    params.distance_step_km = 0.25;
    params.azimuths_deg = {270.0, 45.0, 180.0};

    auto points = PointGenerator(reference_transmitter()).generate(params);

    // Azimuth-list order, not sorted order
    std::vector<double> seen_order;
    double last_distance = 0.0;
    for (size_t i = 1; i < points.size(); ++i) {
        const auto& p = points[i];
        RFPROF_CHECK(!p.is_transmitter());
        if (seen_order.empty() || seen_order.back() != p.azimuth_deg) {
            seen_order.push_back(p.azimuth_deg);
            last_distance = 0.0;
        }
        RFPROF_CHECK(p.distance_km > last_distance);
        last_distance = p.distance_km;
    }
    RFPROF_CHECK((seen_order == std::vector<double>{270.0, 45.0, 180.0}));
    return true;
}

bool offsets_follow_bearing() {
    Transmitter tx = reference_transmitter();
    auto points = PointGenerator(tx).generate(four_rays(10.0, 5.0));

    for (const auto& p : points) {
        if (p.is_transmitter()) continue;
        RFPROF_CHECK_NEAR(great_circle_km(tx.position(), p.position), p.distance_km, 0.05 * p.distance_km);
    }

    // North moves latitude only (within grid convergence), east moves longitude
    const auto& north = points[2];
    const auto& east = points[4];
    RFPROF_CHECK(north.azimuth_deg == 0.0 && north.distance_km == 10.0);
    RFPROF_CHECK(north.position.lat > tx.latitude);
    RFPROF_CHECK_NEAR(north.position.lon, tx.longitude, 0.01);
    RFPROF_CHECK(east.azimuth_deg == 90.0 && east.distance_km == 10.0);
    RFPROF_CHECK(east.position.lon > tx.longitude);
    RFPROF_CHECK_NEAR(east.position.lat, tx.latitude, 0.01);
    return true;
}

bool utm_zone_from_longitude() {
    RFPROF_CHECK(PointGenerator::utm_zone(-13.40694) == 28);
    RFPROF_CHECK(PointGenerator::utm_zone(-180.0) == 1);
    RFPROF_CHECK(PointGenerator::utm_zone(0.0) == 31);
    RFPROF_CHECK(PointGenerator::utm_zone(180.0) == 60);
    return true;
}

bool equally_spaced_azimuths() {
    auto azimuths = PointGenerator::equally_spaced_azimuths(8);
    RFPROF_CHECK(azimuths.size() == 8);
    RFPROF_CHECK(azimuths[0] == 0.0);
    RFPROF_CHECK_NEAR(azimuths[3], 135.0, 1e-12);
    RFPROF_CHECK(PointGenerator::equally_spaced_azimuths(0).empty());
    return true;
}

bool rejects_invalid_parameters() {
    Transmitter tx = reference_transmitter();
    PointGenerator generator(tx);

    auto params = four_rays(1.0, 0.0);
    RFPROF_CHECK_THROWS(generator.generate(params), ConfigurationError);

    params = four_rays(0.2, 0.5);
    RFPROF_CHECK_THROWS(generator.generate(params), ConfigurationError);

    params = four_rays(1.0, 0.5);
    params.azimuths_deg.clear();
    RFPROF_CHECK_THROWS(generator.generate(params), ConfigurationError);

    params = four_rays(1.0, 0.5);
    params.azimuths_deg.push_back(360.0);
    RFPROF_CHECK_THROWS(generator.generate(params), ConfigurationError);

    params = four_rays(1.0, 0.5);
    params.azimuths_deg.push_back(90.0);
    RFPROF_CHECK_THROWS(generator.generate(params), ConfigurationError);

    Transmitter bad = tx;
    bad.latitude = std::nan("");
    RFPROF_CHECK_THROWS(PointGenerator(bad).generate(four_rays(1.0, 0.5)), ConfigurationError);
    return true;
}

bool explicit_list_wins_over_count() {
    ReceiverGenerationConfig config;
    config.num_azimuths = 36;
    config.azimuths_deg = {10.0, 20.0};
    auto params = PointGenerator::Parameters::from_config(config);
    RFPROF_CHECK((params.azimuths_deg == std::vector<double>{10.0, 20.0}));
    return true;
}

} // anonymous namespace

int main() {
    test::TestRunner runner;
    runner.run("nine_point_scenario", nine_point_scenario);
    runner.run("count_matches_formula", count_matches_formula);
    runner.run("step_tolerance_absorbs_rounding", step_tolerance_absorbs_rounding);
    runner.run("groups_ordered_and_increasing", groups_ordered_and_increasing);
    runner.run("offsets_follow_bearing", offsets_follow_bearing);
    runner.run("utm_zone_from_longitude", utm_zone_from_longitude);
    runner.run("equally_spaced_azimuths", equally_spaced_azimuths);
    runner.run("rejects_invalid_parameters", rejects_invalid_parameters);
    runner.run("explicit_list_wins_over_count", explicit_list_wins_over_count);
    return runner.result();
}
