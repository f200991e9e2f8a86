//
// Created by cv2 on 10/19/26.
//

#include "libam/http.h"

#include <curl/curl.h>

namespace am {

    namespace {
        constexpr long kConnectTimeoutSeconds = 15;
        constexpr long kTimeoutSeconds = 60;
        constexpr const char* kUserAgent = "aurman/1.0";
    }

// --- libcurl Callbacks ---

// Appends each received chunk to the std::string passed as userdata.
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* body = static_cast<std::string*>(userdata);
        body->append(ptr, size * nmemb);
        return size * nmemb;
    }

// --- PIMPL Implementation ---
    struct CurlHttpClient::Impl {
        CURL* easy_handle = nullptr;

        Impl() {
            curl_global_init(CURL_GLOBAL_ALL);
            easy_handle = curl_easy_init();
        }

        ~Impl() {
            if (easy_handle) {
                curl_easy_cleanup(easy_handle);
            }
            curl_global_cleanup();
        }

        std::expected<HttpResponse, HttpError> get(const std::string& url) {
            if (!easy_handle) {
                return std::unexpected(HttpError{"curl_easy_init failed"});
            }

            HttpResponse response;
            char error_buffer[CURL_ERROR_SIZE] = {};

            curl_easy_reset(easy_handle);
            curl_easy_setopt(easy_handle, CURLOPT_URL, url.c_str());
            curl_easy_setopt(easy_handle, CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(easy_handle, CURLOPT_WRITEDATA, &response.body);
            curl_easy_setopt(easy_handle, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(easy_handle, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
            curl_easy_setopt(easy_handle, CURLOPT_TIMEOUT, kTimeoutSeconds);
            curl_easy_setopt(easy_handle, CURLOPT_USERAGENT, kUserAgent);
            curl_easy_setopt(easy_handle, CURLOPT_ERRORBUFFER, error_buffer);

            CURLcode rc = curl_easy_perform(easy_handle);
            if (rc != CURLE_OK) {
                std::string message = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
                return std::unexpected(HttpError{message});
            }

            curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &response.status_code);
            return response;
        }
    };

// --- Public Class Implementation ---
    CurlHttpClient::CurlHttpClient() : pimpl(std::make_unique<Impl>()) {}
    CurlHttpClient::~CurlHttpClient() = default;

    std::expected<HttpResponse, HttpError> CurlHttpClient::get(const std::string& url) {
        return pimpl->get(url);
    }

} // namespace am
