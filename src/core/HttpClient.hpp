/**
 * @file HttpClient.hpp
 * @brief Minimal libcurl client with bounded retries and exponential backoff
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Logger.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace rfprof {

/**
 * @brief Blocking HTTP GET/POST used for DEM tiles and land-cover requests
 *
 * Each request is attempted at most max_retries times, sleeping 1 s, 2 s, 4 s ...
 * between attempts. HTTP 4xx responses other than 408 and 429 are not retried.
 */
class HttpClient {
public:
    struct Config {
        int timeout_seconds = 60;
        int max_retries = 3;
        int initial_backoff_ms = 1000;
        std::string user_agent = "rf-profile-gen/1.0";
    };

    struct Response {
        long status = 0;
        std::string body;

        bool ok() const { return status >= 200 && status < 300; }
    };

    HttpClient();
    explicit HttpClient(const Config& config);

    /**
     * @brief Download url into path, replacing it only on success
     * @return true when the server answered 2xx and the body was written
     */
    bool download_to_file(const std::string& url, const std::filesystem::path& path) const;

    /// POST a raw body; returns the last response (status 0 on transport failure)
    Response post(const std::string& url, const std::string& body,
                  const std::vector<std::string>& headers) const;

    /// POST application/x-www-form-urlencoded fields
    Response post_form(const std::string& url, const std::map<std::string, std::string>& fields) const;

    /// Percent-encode one form value
    static std::string url_encode(const std::string& value);

    const Config& config() const { return config_; }

private:
    Config config_;
    Logger logger_{"HttpClient"};

    static void ensure_global_init();
    static bool is_retryable(long status);
    void backoff(int attempt) const;
};

} // namespace rfprof
