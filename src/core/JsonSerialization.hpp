/**
 * @file JsonSerialization.hpp
 * @brief nlohmann::json conversions for run entities and atomic JSON file helpers
 */

#pragma once

#include "rf_profile_generator.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>

namespace rfprof {

void to_json(nlohmann::json& j, const GeoPoint& p);
void from_json(const nlohmann::json& j, GeoPoint& p);

void to_json(nlohmann::json& j, const BoundingBox& b);
void from_json(const nlohmann::json& j, BoundingBox& b);

void to_json(nlohmann::json& j, const Transmitter& t);
void from_json(const nlohmann::json& j, Transmitter& t);

void to_json(nlohmann::json& j, const ReceiverPoint& p);
void from_json(const nlohmann::json& j, ReceiverPoint& p);

void to_json(nlohmann::json& j, const EnrichedPoint& p);
void from_json(const nlohmann::json& j, EnrichedPoint& p);

void to_json(nlohmann::json& j, const ExtractionReport& r);
void from_json(const nlohmann::json& j, ExtractionReport& r);

/**
 * @brief Write JSON through a temporary file and rename, so readers never see a partial file
 * @throws std::runtime_error on I/O failure
 */
void write_json_atomic(const std::filesystem::path& path, const nlohmann::json& data, int indent = 2);

/**
 * @brief Parse a JSON file
 * @throws DataUnavailableError if missing or malformed
 */
nlohmann::json read_json(const std::filesystem::path& path);

/// Write text through a temporary file and rename
void write_text_atomic(const std::filesystem::path& path, const std::string& text);

} // namespace rfprof
