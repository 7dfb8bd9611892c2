/**
 * @file Digest.hpp
 * @brief SHA-256 digests of strings and files, and phase input fingerprints
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rfprof {

/// Lower-case hex SHA-256 of a byte string
std::string sha256_hex(const std::string& data);

/// Streaming SHA-256 of a file, nullopt when it cannot be read
std::optional<std::string> sha256_file(const std::filesystem::path& path);

/**
 * @brief Canonical key=value rendering of a phase's effective inputs
 *
 * Keys are emitted in sorted order, so insertion order never changes the
 * fingerprint. Doubles are rendered with round-trip precision.
 */
class FingerprintBuilder {
public:
    FingerprintBuilder& add(const std::string& key, const std::string& value);
    FingerprintBuilder& add(const std::string& key, const char* value);
    FingerprintBuilder& add(const std::string& key, double value);
    FingerprintBuilder& add(const std::string& key, int value);
    FingerprintBuilder& add(const std::string& key, bool value);
    FingerprintBuilder& add(const std::string& key, const std::vector<double>& values);

    std::string canonical() const;
    std::string finish() const { return sha256_hex(canonical()); }

private:
    std::map<std::string, std::string> entries_;
};

} // namespace rfprof
