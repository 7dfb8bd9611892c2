/**
 * @file Digest.cpp
 * @brief OpenSSL EVP backed digests
 */

#include "Digest.hpp"
#include <fstream>
#include <iomanip>
#include <limits>
#include <memory>
#include <sstream>
#include <openssl/evp.h>

namespace rfprof {

namespace {
    struct EvpContextDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    using EvpContextPtr = std::unique_ptr<EVP_MD_CTX, EvpContextDeleter>;

    std::string to_hex(const unsigned char* bytes, unsigned int length) {
        std::ostringstream sstream;
        sstream << std::hex << std::setfill('0');
        for (unsigned int i = 0; i < length; ++i) {
            sstream << std::setw(2) << static_cast<unsigned>(bytes[i]);
        }
        return sstream.str();
    }

    std::string format_double(double value) {
        std::ostringstream oss;
        oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
        return oss.str();
    }
}

std::string sha256_hex(const std::string& data) {
    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int result_len = 0;
    EVP_Digest(reinterpret_cast<const unsigned char*>(data.data()), data.size(),
               result, &result_len, EVP_sha256(), nullptr);
    return to_hex(result, result_len);
}

std::optional<std::string> sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    EvpContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::nullopt;
    }

    char buffer[65536];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            return std::nullopt;
        }
        if (file.eof()) break;
    }
    if (file.bad()) {
        return std::nullopt;
    }

    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int result_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), result, &result_len) != 1) {
        return std::nullopt;
    }
    return to_hex(result, result_len);
}

// ============================================================================
// FingerprintBuilder
// ============================================================================

FingerprintBuilder& FingerprintBuilder::add(const std::string& key, const std::string& value) {
    entries_[key] = value;
    return *this;
}

FingerprintBuilder& FingerprintBuilder::add(const std::string& key, const char* value) {
    return add(key, std::string(value));
}

FingerprintBuilder& FingerprintBuilder::add(const std::string& key, double value) {
    return add(key, format_double(value));
}

FingerprintBuilder& FingerprintBuilder::add(const std::string& key, int value) {
    return add(key, std::to_string(value));
}

FingerprintBuilder& FingerprintBuilder::add(const std::string& key, bool value) {
    return add(key, std::string(value ? "true" : "false"));
}

FingerprintBuilder& FingerprintBuilder::add(const std::string& key, const std::vector<double>& values) {
    std::string joined;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) joined += ",";
        joined += format_double(values[i]);
    }
    return add(key, joined);
}

std::string FingerprintBuilder::canonical() const {
    std::string text;
    for (const auto& [key, value] : entries_) {
        text += key;
        text += "=";
        text += value;
        text += "\n";
    }
    return text;
}

} // namespace rfprof
