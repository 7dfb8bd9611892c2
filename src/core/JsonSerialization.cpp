/**
 * @file JsonSerialization.cpp
 * @brief Implementation of JSON conversions and atomic file helpers
 */

#include "JsonSerialization.hpp"
#include <fstream>
#include <stdexcept>

namespace rfprof {

using json = nlohmann::json;

void to_json(json& j, const GeoPoint& p) {
    j = json{{"lon", p.lon}, {"lat", p.lat}};
}

void from_json(const json& j, GeoPoint& p) {
    j.at("lon").get_to(p.lon);
    j.at("lat").get_to(p.lat);
}

void to_json(json& j, const BoundingBox& b) {
    j = json::array({b.min_x, b.min_y, b.max_x, b.max_y});
}

void from_json(const json& j, BoundingBox& b) {
    b = BoundingBox(j.at(0).get<double>(), j.at(1).get<double>(),
                    j.at(2).get<double>(), j.at(3).get<double>());
}

void to_json(json& j, const Transmitter& t) {
    j = json{
        {"tx_id", t.id},
        {"longitude", t.longitude},
        {"latitude", t.latitude},
        {"antenna_height_tx", t.antenna_height_m},
        {"antenna_height_rx", t.receiver_height_m},
        {"frequency_ghz", t.frequency_ghz},
        {"polarization", t.polarization},
        {"time_percentage", t.time_percentage},
    };
}

void from_json(const json& j, Transmitter& t) {
    Transmitter defaults;
    t.id = j.value("tx_id", defaults.id);
    t.longitude = j.value("longitude", defaults.longitude);
    t.latitude = j.value("latitude", defaults.latitude);
    t.antenna_height_m = j.value("antenna_height_tx", defaults.antenna_height_m);
    t.receiver_height_m = j.value("antenna_height_rx", defaults.receiver_height_m);
    t.frequency_ghz = j.value("frequency_ghz", defaults.frequency_ghz);
    t.polarization = j.value("polarization", defaults.polarization);
    t.time_percentage = j.value("time_percentage", defaults.time_percentage);
}

void to_json(json& j, const ReceiverPoint& p) {
    j = json{
        {"rx_id", p.id},
        {"distance_km", p.distance_km},
        {"azimuth_deg", p.has_azimuth ? json(p.azimuth_deg) : json(nullptr)},
        {"lon", p.position.lon},
        {"lat", p.position.lat},
    };
}

void from_json(const json& j, ReceiverPoint& p) {
    j.at("rx_id").get_to(p.id);
    j.at("distance_km").get_to(p.distance_km);
    const auto& azimuth = j.at("azimuth_deg");
    p.has_azimuth = !azimuth.is_null();
    p.azimuth_deg = p.has_azimuth ? azimuth.get<double>() : 0.0;
    j.at("lon").get_to(p.position.lon);
    j.at("lat").get_to(p.position.lat);
}

void to_json(json& j, const EnrichedPoint& p) {
    to_json(j, p.point);
    j["h"] = p.elevation_m;
    j["lc_code"] = p.land_cover_code;
    j["Ct"] = p.category;
    j["R"] = p.roughness_m;
    j["zone"] = p.zone;
    j["elevation_fallback"] = p.elevation_fallback;
    j["land_cover_fallback"] = p.land_cover_fallback;
    j["zone_fallback"] = p.zone_fallback;
}

void from_json(const json& j, EnrichedPoint& p) {
    from_json(j, p.point);
    j.at("h").get_to(p.elevation_m);
    j.at("lc_code").get_to(p.land_cover_code);
    j.at("Ct").get_to(p.category);
    j.at("R").get_to(p.roughness_m);
    j.at("zone").get_to(p.zone);
    p.elevation_fallback = j.value("elevation_fallback", false);
    p.land_cover_fallback = j.value("land_cover_fallback", false);
    p.zone_fallback = j.value("zone_fallback", false);
}

void to_json(json& j, const ExtractionReport& r) {
    j = json{
        {"total_points", r.total_points},
        {"elevation_missing", r.elevation_missing},
        {"elevation_out_of_range", r.elevation_out_of_range},
        {"land_cover_missing", r.land_cover_missing},
        {"land_cover_unmapped", r.land_cover_unmapped},
        {"zone_fallbacks", r.zone_fallbacks},
        {"zone_defaults", r.zone_defaults},
    };
}

void from_json(const json& j, ExtractionReport& r) {
    r.total_points = j.value("total_points", size_t{0});
    r.elevation_missing = j.value("elevation_missing", size_t{0});
    r.elevation_out_of_range = j.value("elevation_out_of_range", size_t{0});
    r.land_cover_missing = j.value("land_cover_missing", size_t{0});
    r.land_cover_unmapped = j.value("land_cover_unmapped", size_t{0});
    r.zone_fallbacks = j.value("zone_fallbacks", size_t{0});
    r.zone_defaults = j.value("zone_defaults", size_t{0});
}

void write_text_atomic(const std::filesystem::path& path, const std::string& text) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    auto temp = path;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("cannot open " + temp.string() + " for writing");
        }
        file << text;
        file.flush();
        if (!file) {
            throw std::runtime_error("failed writing " + temp.string());
        }
    }
    std::filesystem::rename(temp, path);
}

void write_json_atomic(const std::filesystem::path& path, const json& data, int indent) {
    write_text_atomic(path, data.dump(indent) + "\n");
}

json read_json(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DataUnavailableError("cannot open " + path.string());
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw DataUnavailableError("malformed JSON in " + path.string() + ": " + e.what());
    }
}

} // namespace rfprof
