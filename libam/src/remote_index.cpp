//
// Created by cv2 on 10/19/26.
//

#include "libam/remote_index.h"
#include "libam/logging.h"
#include "libam/parser.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace am {

    std::string url_encode(const std::string& value) {
        std::ostringstream escaped;
        escaped.fill('0');
        escaped << std::hex << std::uppercase;
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                escaped << c;
            } else {
                escaped << '%' << std::setw(2) << static_cast<int>(c);
            }
        }
        return escaped.str();
    }

    AurRpcClient::AurRpcClient(const Config& config, HttpClient& http) : m_config(config), m_http(http) {}

    std::string AurRpcClient::search_url(const std::string& term) const {
        return m_config.rpc_url + "?v=5&type=search&arg=" + url_encode(term);
    }

    std::string AurRpcClient::info_url(const std::vector<std::string>& names) const {
        std::string url = m_config.rpc_url + "?v=5&type=info";
        for (const auto& name : names) {
            url += "&arg[]=" + url_encode(name);
        }
        return url;
    }

    std::expected<std::vector<PackageMetadata>, RemoteError> AurRpcClient::fetch(const std::string& url) {
        auto response = m_http.get(url);
        if (!response) {
            log::error("Could not connect to AUR: " + response.error().message);
            return std::unexpected(RemoteError::ConnectionFailed);
        }
        if (!response->is_success()) {
            log::error("Could not connect to AUR: HTTP status " + std::to_string(response->status_code));
            return std::unexpected(RemoteError::ConnectionFailed);
        }

        auto parsed = Parser::parse_rpc_response(response->body);
        if (!parsed) {
            return std::unexpected(RemoteError::InvalidResponse);
        }
        return std::move(*parsed);
    }

    std::expected<std::vector<PackageMetadata>, RemoteError> AurRpcClient::search(const std::string& term) {
        return fetch(search_url(term));
    }

    std::expected<std::vector<PackageMetadata>, RemoteError> AurRpcClient::batch_info(const std::set<std::string>& names) {
        std::vector<PackageMetadata> all_results;
        if (names.empty()) {
            return all_results;
        }

        std::vector<std::string> chunk;
        chunk.reserve(kInfoChunkSize);

        auto flush_chunk = [&]() -> std::expected<void, RemoteError> {
            auto result = fetch(info_url(chunk));
            chunk.clear();
            if (!result) {
                return std::unexpected(result.error());
            }
            all_results.insert(all_results.end(),
                               std::make_move_iterator(result->begin()),
                               std::make_move_iterator(result->end()));
            return {};
        };

        for (const auto& name : names) {
            chunk.push_back(name);
            if (chunk.size() == kInfoChunkSize) {
                if (auto flushed = flush_chunk(); !flushed) {
                    return std::unexpected(flushed.error());
                }
            }
        }
        if (!chunk.empty()) {
            if (auto flushed = flush_chunk(); !flushed) {
                return std::unexpected(flushed.error());
            }
        }

        return all_results;
    }

} // namespace am
