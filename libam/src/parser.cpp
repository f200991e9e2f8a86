//
// Created by cv2 on 10/19/26.
//

#include "libam/parser.h"
#include "libam/logging.h"

#include <nlohmann/json.hpp>

namespace am {

    using json = nlohmann::json;

    static std::string get_optional_string(const json& node, const std::string& key) {
        auto it = node.find(key);
        if (it != node.end() && it->is_string()) {
            return it->get<std::string>();
        }
        return "";
    }

    static std::vector<std::string> get_optional_sequence(const json& node, const std::string& key) {
        std::vector<std::string> result;
        auto it = node.find(key);
        if (it != node.end() && it->is_array()) {
            for (const auto& item : *it) {
                if (item.is_string()) {
                    result.push_back(item.get<std::string>());
                }
            }
        }
        return result;
    }

    static std::expected<PackageMetadata, ParseError> parse_package_node(const json& node) {
        if (!node.is_object()) {
            return std::unexpected(ParseError::InvalidFormat);
        }

        PackageMetadata pkg;

        pkg.name = get_optional_string(node, "Name");
        pkg.version = get_optional_string(node, "Version");
        if (pkg.name.empty() || pkg.version.empty()) {
            log::error("RPC result is missing its Name or Version.");
            return std::unexpected(ParseError::MissingRequiredField);
        }

        if (auto it = node.find("ID"); it != node.end() && it->is_number_integer()) {
            pkg.id = it->get<int64_t>();
        }
        if (auto it = node.find("Popularity"); it != node.end() && it->is_number()) {
            pkg.popularity = it->get<double>();
        }
        if (auto it = node.find("OutOfDate"); it != node.end() && it->is_number_integer()) {
            pkg.out_of_date = it->get<int64_t>();
        }

        pkg.description = get_optional_string(node, "Description");
        pkg.maintainer = get_optional_string(node, "Maintainer");
        pkg.package_base = get_optional_string(node, "PackageBase");
        pkg.url = get_optional_string(node, "URL");

        pkg.depends = get_optional_sequence(node, "Depends");
        pkg.make_depends = get_optional_sequence(node, "MakeDepends");
        pkg.opt_depends = get_optional_sequence(node, "OptDepends");
        pkg.check_depends = get_optional_sequence(node, "CheckDepends");

        return pkg;
    }

    std::expected<std::vector<PackageMetadata>, ParseError> Parser::parse_rpc_response(const std::string& body) {
        json root;
        try {
            root = json::parse(body);
        } catch (const json::parse_error& e) {
            log::error(std::string("Failed to parse RPC response: ") + e.what());
            return std::unexpected(ParseError::InvalidFormat);
        }

        if (!root.is_object()) {
            log::error("RPC response is not a JSON object.");
            return std::unexpected(ParseError::InvalidFormat);
        }

        if (get_optional_string(root, "type") == "error") {
            log::error("RPC error: " + get_optional_string(root, "error"));
            return std::unexpected(ParseError::ErrorReply);
        }

        auto count_it = root.find("resultcount");
        if (count_it != root.end() && count_it->is_number_integer() && count_it->get<int64_t>() == 0) {
            return std::vector<PackageMetadata>{};
        }

        auto results_it = root.find("results");
        if (results_it == root.end() || !results_it->is_array()) {
            log::error("RPC response has no 'results' array.");
            return std::unexpected(ParseError::InvalidFormat);
        }

        std::vector<PackageMetadata> packages;
        packages.reserve(results_it->size());
        for (const auto& node : *results_it) {
            auto pkg_result = parse_package_node(node);
            if (pkg_result) {
                packages.push_back(std::move(*pkg_result));
            } else {
                // A single broken record should not hide the rest of the reply.
                log::warn("Skipping invalid package record in RPC response.");
            }
        }
        return packages;
    }

} // namespace am
