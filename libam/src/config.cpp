//
// Created by cv2 on 10/19/26.
//

#include "libam/config.h"
#include "libam/logging.h"

#include <yaml-cpp/yaml.h>
#include <sstream>

namespace am {

    template<typename T>
    static void read_optional(const YAML::Node& section, const std::string& key, T& target) {
        if (section[key]) {
            target = section[key].as<T>();
        }
    }

    static void read_optional_path(const YAML::Node& section, const std::string& key, std::filesystem::path& target) {
        if (section[key]) {
            target = section[key].as<std::string>();
        }
    }

    static std::expected<Config, ConfigError> config_from_node(const YAML::Node& root) {
        Config config;
        if (!root || root.IsNull()) {
            return config; // Empty file
        }
        if (!root.IsMap()) {
            log::error("Configuration root must be a mapping.");
            return std::unexpected(ConfigError::InvalidFormat);
        }

        try {
            if (const auto general = root["general"]) {
                read_optional(general, "su_program", config.su_program);
                read_optional(general, "autorun", config.autorun);
                read_optional_path(general, "aurman_path", config.aurman_path);
                read_optional_path(general, "log_path", config.log_path);
                read_optional(general, "rpc_url", config.rpc_url);
                read_optional(general, "aur_url", config.aur_url);
            }
            if (const auto install = root["install"]) {
                read_optional(install, "review_pkgbuild", config.review_pkgbuild);
            }
        } catch (const YAML::Exception& e) {
            log::error(std::string("Invalid value in configuration: ") + e.what());
            return std::unexpected(ConfigError::InvalidFormat);
        }

        if (config.su_program.empty() || config.aurman_path.empty()) {
            log::error("Configuration values 'su_program' and 'aurman_path' must not be empty.");
            return std::unexpected(ConfigError::InvalidFormat);
        }

        return config;
    }

    std::expected<Config, ConfigError> Config::load(const std::filesystem::path& path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Config{};
        }

        YAML::Node root;
        try {
            root = YAML::LoadFile(path.string());
        } catch (const YAML::BadFile& e) {
            log::error("Could not read configuration file " + path.string() + ": " + e.what());
            return std::unexpected(ConfigError::FileUnreadable);
        } catch (const YAML::Exception& e) {
            log::error("Failed to parse configuration file " + path.string() + ": " + e.what());
            return std::unexpected(ConfigError::InvalidFormat);
        }
        return config_from_node(root);
    }

    std::expected<Config, ConfigError> Config::load_from_string(const std::string& content) {
        YAML::Node root;
        try {
            root = YAML::Load(content);
        } catch (const YAML::Exception& e) {
            log::error(std::string("Failed to parse configuration: ") + e.what());
            return std::unexpected(ConfigError::InvalidFormat);
        }
        return config_from_node(root);
    }

    std::string Config::describe() const {
        std::stringstream ss;
        ss << std::boolalpha
           << "[general]\n"
           << "  SU program:   " << su_program << "\n"
           << "  Autorun:      " << autorun << "\n"
           << "  AURMan path:  " << aurman_path.string() << "\n"
           << "  Log path:     " << log_path.string() << "\n"
           << "  RPC URL:      " << rpc_url << "\n"
           << "  AUR URL:      " << aur_url << "\n"
           << "[install]\n"
           << "  Review PKGBUILD: " << review_pkgbuild << "\n";
        return ss.str();
    }

} // namespace am
