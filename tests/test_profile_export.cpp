/**
 * @file test_profile_export.cpp
 * @brief Per-azimuth profile assembly and the CSV / GeoJSON writers
 */

#include "TestSupport.hpp"
#include "export/GeoJSONExporter.hpp"
#include "export/ProfileBuilder.hpp"
#include "export/ProfileCsvExporter.hpp"
#include <nlohmann/json.hpp>

using namespace rfprof;
using json = nlohmann::json;

namespace {

Transmitter site() {
    Transmitter tx;
    tx.id = "TX_0001";
    tx.longitude = -13.40694;
    tx.latitude = 9.345;
    tx.antenna_height_m = 25.0;
    tx.receiver_height_m = 1.5;
    tx.frequency_ghz = 0.9;
    tx.polarization = 2;
    tx.time_percentage = 50.0;
    return tx;
}

EnrichedPoint sample(int id, double azimuth, double distance, double elevation, int category,
                     double roughness, int zone) {
    EnrichedPoint p;
    p.point.id = id;
    p.point.has_azimuth = id != 0;
    p.point.azimuth_deg = id != 0 ? azimuth : 0.0;
    p.point.distance_km = distance;
    p.point.position = GeoPoint(-13.40694 + 0.001 * id, 9.345 + 0.002 * id);
    p.elevation_m = elevation;
    p.land_cover_code = category == 3 ? 50 : 30;
    p.category = category;
    p.roughness_m = roughness;
    p.zone = zone;
    return p;
}

// Transmitter plus two azimuths of two samples each
std::vector<EnrichedPoint> two_rays() {
    return {
        sample(0, 0.0, 0.0, 12.4, 3, 10.0, 1),
        sample(1, 0.0, 0.5, 20.6, 2, 0.0, 1),
        sample(2, 0.0, 1.0, 31.5, 2, 0.0, 3),
        sample(3, 90.0, 0.5, 15.0, 4, 15.0, 1),
        sample(4, 90.0, 1.0, 17.49, 3, 10.0, 4)
    };
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

bool one_profile_per_azimuth() {
    auto profiles = ProfileBuilder(site(), ProfileBuilder::Options{true}).build(two_rays());
    RFPROF_CHECK(profiles.size() == 2);

    const Profile& north = profiles[0];
    RFPROF_CHECK(north.azimuth_deg == 0.0);
    RFPROF_CHECK(north.size() == 3);
    RFPROF_CHECK((north.distances_km == std::vector<double>{0.0, 0.5, 1.0}));
    RFPROF_CHECK((north.heights_m == std::vector<int>{12, 21, 32}));
    RFPROF_CHECK((north.categories == std::vector<int>{3, 2, 2}));
    RFPROF_CHECK((north.zones == std::vector<int>{1, 1, 3}));
    RFPROF_CHECK(north.roughness_m.size() == north.size());

    RFPROF_CHECK(north.frequency_ghz == 0.9);
    RFPROF_CHECK(north.tx_height_m == 25.0 && north.rx_height_m == 1.5);
    RFPROF_CHECK(north.polarization == 2);
    RFPROF_CHECK(north.phi_t == 9.345 && north.lam_t == -13.40694);

    // Receiver end is the farthest sample of the ray
    RFPROF_CHECK_NEAR(north.phi_r, 9.345 + 0.004, 1e-12);
    RFPROF_CHECK_NEAR(north.lam_r, -13.40694 + 0.002, 1e-12);

    const Profile& east = profiles[1];
    RFPROF_CHECK(east.azimuth_deg == 90.0);
    RFPROF_CHECK((east.heights_m == std::vector<int>{12, 15, 17}));
    return true;
}

bool transmitter_can_be_excluded() {
    auto profiles = ProfileBuilder(site(), ProfileBuilder::Options{false}).build(two_rays());
    RFPROF_CHECK(profiles.size() == 2);
    RFPROF_CHECK((profiles[0].distances_km == std::vector<double>{0.5, 1.0}));

    // Without the transmitter sample a d = 0 entry cannot be prepended
    auto all = two_rays();
    std::vector<EnrichedPoint> no_tx(all.begin() + 1, all.end());
    RFPROF_CHECK(ProfileBuilder(site(), ProfileBuilder::Options{false}).build(no_tx).size() == 2);
    RFPROF_CHECK_THROWS(ProfileBuilder(site(), ProfileBuilder::Options{true}).build(no_tx), std::runtime_error);
    return true;
}

bool ordering_violations_throw() {
    auto shuffled = two_rays();
    std::swap(shuffled[1], shuffled[2]);
    RFPROF_CHECK_THROWS(ProfileBuilder(site(), ProfileBuilder::Options{true}).build(shuffled), std::runtime_error);

    auto interleaved = two_rays();
    std::swap(interleaved[2], interleaved[3]);
    RFPROF_CHECK_THROWS(ProfileBuilder(site(), ProfileBuilder::Options{true}).build(interleaved), std::runtime_error);
    return true;
}

bool csv_has_header_and_array_cells() {
    auto profiles = ProfileBuilder(site(), ProfileBuilder::Options{true}).build(two_rays());
    std::string csv = ProfileCsvExporter().to_csv_string(profiles);

    auto lines = split(csv, '\n');
    RFPROF_CHECK(lines.size() == 3);
    RFPROF_CHECK(lines[0] == "f;p;d;h;R;Ct;zone;htg;hrg;pol;phi_t;phi_r;lam_t;lam_r;azimuth");

    auto cells = split(lines[1], ';');
    RFPROF_CHECK(cells.size() == ProfileCsvExporter::columns().size());
    RFPROF_CHECK(cells[0] == "0.9");
    RFPROF_CHECK(cells[1] == "50");
    RFPROF_CHECK(cells[2] == "[0, 0.5, 1]");
    RFPROF_CHECK(cells[3] == "[12, 21, 32]");
    RFPROF_CHECK(cells[4] == "[10, 0, 0]");
    RFPROF_CHECK(cells[5] == "[3, 2, 2]");
    RFPROF_CHECK(cells[6] == "[1, 1, 3]");
    RFPROF_CHECK(cells[7] == "25");
    RFPROF_CHECK(cells[8] == "1.5");
    RFPROF_CHECK(cells[9] == "2");
    RFPROF_CHECK(cells[10] == "9.345");
    RFPROF_CHECK(cells[12] == "-13.40694");
    RFPROF_CHECK(cells[14] == "0");
    RFPROF_CHECK(split(lines[2], ';')[14] == "90");
    return true;
}

bool csv_written_to_disk() {
    test::TempDir dir("rfprof_export");
    std::string path = dir.file("out/profiles.csv");
    std::filesystem::create_directories(dir.path() / "out");

    auto profiles = ProfileBuilder(site(), ProfileBuilder::Options{true}).build(two_rays());
    ProfileCsvExporter exporter;
    exporter.export_csv(profiles, path);
    RFPROF_CHECK(test::read_text(path) == exporter.to_csv_string(profiles));

    // Empty batch still carries the header
    RFPROF_CHECK(exporter.to_csv_string({}) == "f;p;d;h;R;Ct;zone;htg;hrg;pol;phi_t;phi_r;lam_t;lam_r;azimuth\n");
    return true;
}

bool geojson_features_carry_attributes() {
    auto points = two_rays();
    points[3].zone_fallback = true;
    points[4].elevation_fallback = true;

    json document = json::parse(GeoJSONExporter().to_geojson_string(points));
    RFPROF_CHECK(document["type"] == "FeatureCollection");
    RFPROF_CHECK(document["crs"]["properties"]["name"] == "EPSG:4326");
    RFPROF_CHECK(document["features"].size() == points.size());

    const json& tx = document["features"][0];
    RFPROF_CHECK(tx["geometry"]["type"] == "Point");
    RFPROF_CHECK(tx["properties"]["rx_id"] == 0);
    RFPROF_CHECK(tx["properties"]["azimuth_deg"].is_null());
    RFPROF_CHECK_NEAR(tx["geometry"]["coordinates"][0].get<double>(), -13.40694, 1e-8);
    RFPROF_CHECK_NEAR(tx["geometry"]["coordinates"][1].get<double>(), 9.345, 1e-8);

    const json& last = document["features"][4];
    RFPROF_CHECK(last["properties"]["azimuth_deg"] == 90.0);
    RFPROF_CHECK(last["properties"]["distance_km"] == 1.0);
    RFPROF_CHECK(last["properties"]["Ct"] == 3);
    RFPROF_CHECK(last["properties"]["lc_code"] == 50);
    RFPROF_CHECK(last["properties"]["zone"] == 4);
    RFPROF_CHECK(last["properties"]["elevation_fallback"] == true);
    RFPROF_CHECK(last["properties"]["zone_fallback"] == false);
    RFPROF_CHECK(document["features"][3]["properties"]["zone_fallback"] == true);
    return true;
}

bool geojson_options_and_non_finite_values() {
    auto points = two_rays();
    points[1].elevation_m = std::nan("");

    GeoJSONExporter::Options options;
    options.pretty_print = true;
    options.include_crs = false;
    options.include_fallback_flags = false;
    json document = json::parse(GeoJSONExporter(options).to_geojson_string(points));
    RFPROF_CHECK(!document.contains("crs"));
    RFPROF_CHECK(document["features"][1]["properties"]["h"].is_null());
    RFPROF_CHECK(!document["features"][1]["properties"].contains("zone_fallback"));

    test::TempDir dir("rfprof_export");
    GeoJSONExporter exporter;
    RFPROF_CHECK(exporter.export_geojson(points, dir.file("points.geojson")));

    // Parent path is a regular file
    test::write_text(dir.file("blocker"), "");
    RFPROF_CHECK(!exporter.export_geojson(points, dir.file("blocker/points.geojson")));
    return true;
}

} // anonymous namespace

int main() {
    test::TestRunner runner;
    runner.run("one_profile_per_azimuth", one_profile_per_azimuth);
    runner.run("transmitter_can_be_excluded", transmitter_can_be_excluded);
    runner.run("ordering_violations_throw", ordering_violations_throw);
    runner.run("csv_has_header_and_array_cells", csv_has_header_and_array_cells);
    runner.run("csv_written_to_disk", csv_written_to_disk);
    runner.run("geojson_features_carry_attributes", geojson_features_carry_attributes);
    runner.run("geojson_options_and_non_finite_values", geojson_options_and_non_finite_values);
    return runner.result();
}
