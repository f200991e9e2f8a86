//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <expected>
#include <memory>
#include <string>

namespace am {

    struct HttpResponse {
        long status_code = 0;
        std::string body;

        bool is_success() const { return status_code >= 200 && status_code < 300; }
    };

    // Transport-level failure (DNS, TLS, connection reset...), with curl's message.
    struct HttpError {
        std::string message;
    };

    class HttpClient {
    public:
        virtual ~HttpClient() = default;

        // Performs a blocking GET and returns the full body in memory.
        virtual std::expected<HttpResponse, HttpError> get(const std::string& url) = 0;
    };

    // libcurl-backed client. One easy handle is reused across requests.
    class CurlHttpClient : public HttpClient {
    public:
        CurlHttpClient();
        ~CurlHttpClient() override;

        std::expected<HttpResponse, HttpError> get(const std::string& url) override;

    private:
        struct Impl;
        std::unique_ptr<Impl> pimpl;
    };

} // namespace am
