/**
 * @file HttpClient.cpp
 * @brief Implementation of the libcurl HTTP client
 */

#include "HttpClient.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <thread>

namespace rfprof {

namespace {
    size_t write_file_callback(void* contents, size_t size, size_t nmemb, void* userp) {
        size_t total_size = size * nmemb;
        auto* file = static_cast<std::ofstream*>(userp);
        file->write(static_cast<char*>(contents), static_cast<std::streamsize>(total_size));
        return file->good() ? total_size : 0;
    }

    size_t write_string_callback(void* contents, size_t size, size_t nmemb, void* userp) {
        size_t total_size = size * nmemb;
        static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    struct CurlDeleter {
        void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
    };
    using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

    struct SlistDeleter {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };
    using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;
}

HttpClient::HttpClient() : config_() {
    ensure_global_init();
}

HttpClient::HttpClient(const Config& config) : config_(config) {
    ensure_global_init();
}

void HttpClient::ensure_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

bool HttpClient::is_retryable(long status) {
    if (status == 0 || status == 408 || status == 429) {
        return true;
    }
    return status >= 500;
}

void HttpClient::backoff(int attempt) const {
    // 1s, 2s, 4s, ...
    int delay_ms = config_.initial_backoff_ms * (1 << (attempt - 1));
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
}

bool HttpClient::download_to_file(const std::string& url, const std::filesystem::path& path) const {
    std::filesystem::create_directories(path.parent_path().empty() ? "." : path.parent_path());
    auto partial = path;
    partial += ".part";

    const int attempts = std::max(1, config_.max_retries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (attempt > 1) {
            logger_.debug("Retry " + std::to_string(attempt) + "/" + std::to_string(attempts) + " for " + url);
        }

        CurlPtr curl(curl_easy_init());
        if (!curl) {
            logger_.error("Failed to initialize curl");
            return false;
        }

        long response_code = 0;
        CURLcode res;
        {
            std::ofstream file(partial, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                logger_.error("Failed to open output file: " + partial.string());
                return false;
            }

            curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_file_callback);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &file);
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
            curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());

            res = curl_easy_perform(curl.get());
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
        }

        if (res == CURLE_OK && response_code >= 200 && response_code < 300) {
            std::filesystem::rename(partial, path);
            return true;
        }

        std::error_code ec;
        std::filesystem::remove(partial, ec);

        if (res != CURLE_OK) {
            logger_.warning("Request to " + url + " failed: " + std::string(curl_easy_strerror(res)));
        } else {
            logger_.warning("HTTP error " + std::to_string(response_code) + " for URL: " + url);
            if (!is_retryable(response_code)) {
                return false;
            }
        }

        if (attempt < attempts) {
            backoff(attempt);
        }
    }
    return false;
}

HttpClient::Response HttpClient::post(const std::string& url, const std::string& body,
                                      const std::vector<std::string>& headers) const {
    Response response;
    const int attempts = std::max(1, config_.max_retries);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        CurlPtr curl(curl_easy_init());
        if (!curl) {
            logger_.error("Failed to initialize curl");
            return response;
        }

        SlistPtr header_list;
        for (const auto& header : headers) {
            curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
            if (appended) {
                header_list.release();
                header_list.reset(appended);
            }
        }

        response = Response{};
        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_string_callback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());

        CURLcode res = curl_easy_perform(curl.get());
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

        if (res != CURLE_OK) {
            logger_.warning("POST to " + url + " failed: " + std::string(curl_easy_strerror(res)));
            response.status = 0;
        } else if (response.ok()) {
            return response;
        } else {
            logger_.warning("HTTP error " + std::to_string(response.status) + " for POST " + url);
            if (!is_retryable(response.status)) {
                return response;
            }
        }

        if (attempt < attempts) {
            backoff(attempt);
        }
    }
    return response;
}

HttpClient::Response HttpClient::post_form(const std::string& url,
                                           const std::map<std::string, std::string>& fields) const {
    std::string body;
    for (const auto& [key, value] : fields) {
        if (!body.empty()) body += '&';
        body += url_encode(key) + "=" + url_encode(value);
    }
    return post(url, body, {"Content-Type: application/x-www-form-urlencoded"});
}

std::string HttpClient::url_encode(const std::string& value) {
    ensure_global_init();
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        return value;
    }
    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return value;
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

} // namespace rfprof
