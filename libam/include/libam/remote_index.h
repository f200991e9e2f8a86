//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "config.h"
#include "http.h"
#include "package.h"

#include <cstddef>
#include <expected>
#include <set>
#include <string>
#include <vector>

namespace am {

    enum class RemoteError {
        ConnectionFailed, // Transport failure or non-2xx status
        InvalidResponse   // Unparseable body or an RPC error reply
    };

    // The remote package metadata service.
    class RemoteIndex {
    public:
        virtual ~RemoteIndex() = default;

        // Zero matches is an empty vector, not an error.
        virtual std::expected<std::vector<PackageMetadata>, RemoteError> search(const std::string& term) = 0;

        // Names unknown to the index are simply absent from the result.
        // Result order is unspecified.
        virtual std::expected<std::vector<PackageMetadata>, RemoteError> batch_info(const std::set<std::string>& names) = 0;
    };

    // AUR RPC v5 client.
    class AurRpcClient : public RemoteIndex {
    public:
        // Requests are split so the query string stays within the server's limits.
        static constexpr std::size_t kInfoChunkSize = 200;

        AurRpcClient(const Config& config, HttpClient& http);

        std::expected<std::vector<PackageMetadata>, RemoteError> search(const std::string& term) override;
        std::expected<std::vector<PackageMetadata>, RemoteError> batch_info(const std::set<std::string>& names) override;

        std::string search_url(const std::string& term) const;
        std::string info_url(const std::vector<std::string>& names) const;

    private:
        std::expected<std::vector<PackageMetadata>, RemoteError> fetch(const std::string& url);

        const Config& m_config;
        HttpClient& m_http;
    };

    // Percent-encodes everything outside RFC 3986's unreserved set.
    std::string url_encode(const std::string& value);

} // namespace am
