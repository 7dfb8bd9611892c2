/**
 * @file ConfigurationManager.cpp
 * @brief JSON configuration management for rf-profile-gen
 */

#include "ConfigurationManager.hpp"
#include "../core/JsonSerialization.hpp"
#include <fstream>
#include <set>

using json = nlohmann::json;

namespace rfprof {

namespace {

const std::set<std::string> KNOWN_SECTIONS = {
    "transmitter", "propagation", "receiver_generation", "elevation",
    "landcover", "land_cover_tables", "zones", "pipeline"
};

const json& section_or_empty(const json& document, const std::string& name) {
    static const json empty = json::object();
    auto it = document.find(name);
    if (it == document.end() || it->is_null()) {
        return empty;
    }
    if (!it->is_object()) {
        throw ConfigurationError("section '" + name + "' must be a JSON object");
    }
    return *it;
}

std::map<int, int> read_int_map(const json& object, const std::string& name) {
    std::map<int, int> result;
    for (const auto& [key, value] : object.items()) {
        try {
            result[std::stoi(key)] = value.get<int>();
        } catch (const std::exception&) {
            throw ConfigurationError(name + ": entry '" + key + "' is not an integer mapping");
        }
    }
    return result;
}

std::map<int, double> read_double_map(const json& object, const std::string& name) {
    std::map<int, double> result;
    for (const auto& [key, value] : object.items()) {
        try {
            result[std::stoi(key)] = value.get<double>();
        } catch (const std::exception&) {
            throw ConfigurationError(name + ": entry '" + key + "' is not a numeric mapping");
        }
    }
    return result;
}

} // anonymous namespace

void ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("could not open config file: " + filename);
    }

    json document;
    try {
        file >> document;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("could not parse " + filename + ": " + e.what());
    }

    load_from_json(document);
    config_.config_file = filename;
    logger_.detailed("Loaded configuration from " + filename);
}

void ConfigurationManager::load_from_json(const json& document) {
    if (!document.is_object()) {
        throw ConfigurationError("configuration root must be a JSON object");
    }

    for (const auto& [key, value] : document.items()) {
        if (!KNOWN_SECTIONS.count(key)) {
            logger_.warning("Ignoring unknown configuration section '" + key + "'");
        }
    }

    try {
        read_transmitter(section_or_empty(document, "transmitter"),
                         section_or_empty(document, "propagation"));
        read_generation(section_or_empty(document, "receiver_generation"));
        read_elevation(section_or_empty(document, "elevation"));
        read_land_cover(section_or_empty(document, "landcover"));
        read_tables(section_or_empty(document, "land_cover_tables"));
        read_zones(section_or_empty(document, "zones"));
        read_pipeline(section_or_empty(document, "pipeline"));
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("invalid value: ") + e.what());
    }
}

int ConfigurationManager::parse_polarization(const json& value) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        if (text == "horizontal" || text == "h") return 1;
        if (text == "vertical" || text == "v") return 2;
    }
    throw ConfigurationError("polarization must be 1, 2, \"horizontal\" or \"vertical\"");
}

void ConfigurationManager::read_transmitter(const json& section, const json& propagation) {
    auto& tx = config_.transmitter;
    tx.id = section.value("id", tx.id);
    tx.longitude = section.value("longitude", tx.longitude);
    tx.latitude = section.value("latitude", tx.latitude);
    tx.antenna_height_m = section.value("antenna_height_tx", tx.antenna_height_m);
    tx.receiver_height_m = section.value("antenna_height_rx", tx.receiver_height_m);

    tx.frequency_ghz = propagation.value("frequency_ghz", tx.frequency_ghz);
    tx.time_percentage = propagation.value("time_percentage", tx.time_percentage);
    if (propagation.contains("polarization")) {
        tx.polarization = parse_polarization(propagation["polarization"]);
    }
}

void ConfigurationManager::read_generation(const json& section) {
    auto& gen = config_.generation;
    gen.max_distance_km = section.value("max_distance_km", gen.max_distance_km);
    gen.distance_step_km = section.value("distance_step_km", gen.distance_step_km);
    gen.num_azimuths = section.value("num_azimuths", gen.num_azimuths);
    if (section.contains("azimuths_deg") && !section["azimuths_deg"].is_null()) {
        gen.azimuths_deg = section["azimuths_deg"].get<std::vector<double>>();
    }
}

void ConfigurationManager::read_elevation(const json& section) {
    auto& elev = config_.elevation;
    elev.tile_cache_dir = section.value("tile_cache_dir", elev.tile_cache_dir);
    elev.min_m = section.value("min_m", elev.min_m);
    elev.max_m = section.value("max_m", elev.max_m);
    elev.fallback_m = section.value("fallback_m", elev.fallback_m);
    elev.margin_km = section.value("margin_km", elev.margin_km);
    elev.download_missing = section.value("download", elev.download_missing);
    elev.base_url = section.value("base_url", elev.base_url);
    elev.timeout_seconds = section.value("timeout_seconds", elev.timeout_seconds);
}

void ConfigurationManager::read_land_cover(const json& section) {
    auto& lc = config_.landcover;
    lc.provider = section.value("provider", lc.provider);
    lc.path = section.value("path", lc.path);
    lc.cache_dir = section.value("cache_dir", lc.cache_dir);
    lc.year = section.value("year", lc.year);
    lc.buffer_m = section.value("buffer_m", lc.buffer_m);
    lc.chip_px = section.value("chip_px", lc.chip_px);
    lc.nodata_code = section.value("nodata_code", lc.nodata_code);
    lc.required = section.value("required", lc.required);
    lc.token_url = section.value("token_url", lc.token_url);
    lc.process_url = section.value("process_url", lc.process_url);
    lc.collection_id = section.value("collection_id", lc.collection_id);
    lc.client_id_env = section.value("client_id_env", lc.client_id_env);
    lc.client_secret_env = section.value("client_secret_env", lc.client_secret_env);
    lc.timeout_seconds = section.value("timeout_seconds", lc.timeout_seconds);
}

void ConfigurationManager::read_tables(const json& section) {
    auto& tables = config_.tables;
    if (section.contains("code_to_category")) {
        tables.code_to_category = read_int_map(section["code_to_category"], "code_to_category");
    }
    if (section.contains("category_to_roughness")) {
        tables.category_to_roughness = read_double_map(section["category_to_roughness"], "category_to_roughness");
    }
    tables.default_category = section.value("default_category", tables.default_category);
    tables.default_roughness = section.value("default_roughness", tables.default_roughness);
}

void ConfigurationManager::read_zones(const json& section) {
    auto& zones = config_.zones;
    zones.path = section.value("path", zones.path);
    zones.id_field = section.value("id_field", zones.id_field);
    zones.default_zone = section.value("default_zone", zones.default_zone);
}

void ConfigurationManager::read_pipeline(const json& section) {
    auto& p = config_.pipeline;
    p.project_root = section.value("project_root", p.project_root);
    p.cache_dir = section.value("cache_dir", p.cache_dir);
    p.output_dir = section.value("output_dir", p.output_dir);
    p.base_name = section.value("base_name", p.base_name);
    p.num_threads = section.value("num_threads", p.num_threads);
    p.include_transmitter_in_profiles =
        section.value("include_transmitter_in_profiles", p.include_transmitter_in_profiles);
    p.max_retries = section.value("max_retries", p.max_retries);
    p.log_level = section.value("log_level", p.log_level);

    if (section.contains("log_file") && !section["log_file"].is_null()) {
        p.log_file = section["log_file"].get<std::string>();
    }

    if (section.contains("force_refresh")) {
        p.force_refresh.clear();
        for (const auto& name : section["force_refresh"].get<std::vector<std::string>>()) {
            auto phase = parse_phase(name);
            if (!phase) {
                throw ConfigurationError("force_refresh: unknown phase '" + name + "'");
            }
            p.force_refresh.insert(*phase);
        }
    }

    if (section.contains("run_until") && !section["run_until"].is_null()) {
        std::string name = section["run_until"].get<std::string>();
        auto phase = parse_phase(name);
        if (!phase) {
            throw ConfigurationError("run_until: unknown phase '" + name + "'");
        }
        p.run_until = phase;
    }
}

json ConfigurationManager::to_json() const {
    const auto& tx = config_.transmitter;
    const auto& gen = config_.generation;
    const auto& elev = config_.elevation;
    const auto& lc = config_.landcover;
    const auto& tables = config_.tables;
    const auto& p = config_.pipeline;

    json code_to_category = json::object();
    for (const auto& [code, category] : tables.code_to_category) {
        code_to_category[std::to_string(code)] = category;
    }
    json category_to_roughness = json::object();
    for (const auto& [category, roughness] : tables.category_to_roughness) {
        category_to_roughness[std::to_string(category)] = roughness;
    }

    json force_refresh = json::array();
    for (Phase phase : p.force_refresh) {
        force_refresh.push_back(phase_name(phase));
    }

    return json{
        {"transmitter", {
            {"id", tx.id},
            {"longitude", tx.longitude},
            {"latitude", tx.latitude},
            {"antenna_height_tx", tx.antenna_height_m},
            {"antenna_height_rx", tx.receiver_height_m}
        }},
        {"propagation", {
            {"frequency_ghz", tx.frequency_ghz},
            {"polarization", tx.polarization},
            {"time_percentage", tx.time_percentage}
        }},
        {"receiver_generation", {
            {"max_distance_km", gen.max_distance_km},
            {"distance_step_km", gen.distance_step_km},
            {"num_azimuths", gen.num_azimuths},
            {"azimuths_deg", gen.azimuths_deg}
        }},
        {"elevation", {
            {"tile_cache_dir", elev.tile_cache_dir},
            {"min_m", elev.min_m},
            {"max_m", elev.max_m},
            {"fallback_m", elev.fallback_m},
            {"margin_km", elev.margin_km},
            {"download", elev.download_missing},
            {"base_url", elev.base_url},
            {"timeout_seconds", elev.timeout_seconds}
        }},
        {"landcover", {
            {"provider", lc.provider},
            {"path", lc.path},
            {"cache_dir", lc.cache_dir},
            {"year", lc.year},
            {"buffer_m", lc.buffer_m},
            {"chip_px", lc.chip_px},
            {"nodata_code", lc.nodata_code},
            {"required", lc.required},
            {"token_url", lc.token_url},
            {"process_url", lc.process_url},
            {"collection_id", lc.collection_id},
            {"client_id_env", lc.client_id_env},
            {"client_secret_env", lc.client_secret_env},
            {"timeout_seconds", lc.timeout_seconds}
        }},
        {"land_cover_tables", {
            {"code_to_category", code_to_category},
            {"category_to_roughness", category_to_roughness},
            {"default_category", tables.default_category},
            {"default_roughness", tables.default_roughness}
        }},
        {"zones", {
            {"path", config_.zones.path},
            {"id_field", config_.zones.id_field},
            {"default_zone", config_.zones.default_zone}
        }},
        {"pipeline", {
            {"project_root", p.project_root},
            {"cache_dir", p.cache_dir},
            {"output_dir", p.output_dir},
            {"base_name", p.base_name},
            {"num_threads", p.num_threads},
            {"include_transmitter_in_profiles", p.include_transmitter_in_profiles},
            {"max_retries", p.max_retries},
            {"force_refresh", force_refresh},
            {"run_until", p.run_until ? json(phase_name(*p.run_until)) : json(nullptr)},
            {"log_level", p.log_level},
            {"log_file", p.log_file ? json(*p.log_file) : json(nullptr)}
        }}
    };
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    try {
        write_json_atomic(filename, to_json());
        return true;
    } catch (const std::exception& e) {
        logger_.error("Could not write configuration " + filename + ": " + e.what());
        return false;
    }
}

json ConfigurationManager::default_document() {
    ConfigurationManager manager;
    return manager.to_json();
}

} // namespace rfprof
