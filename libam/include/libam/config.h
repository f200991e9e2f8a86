//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <expected>
#include <filesystem>
#include <string>

namespace am {

    enum class ConfigError {
        FileUnreadable,
        InvalidFormat
    };

    inline const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/aurman.conf";

    // Settings shared by the gateway, the installer and the upgrade planner.
    // Loaded once at startup and handed to their constructors.
    struct Config {
        // --- general ---
        std::string su_program = "sudo";          // Privilege escalation for native installs/removals
        bool autorun = false;                     // Never prompt, assume "yes"
        std::filesystem::path aurman_path = "/tmp/aurman"; // Scratch root for clone + build
        std::filesystem::path log_path = "/tmp/aurman.log";
        std::string rpc_url = "https://aur.archlinux.org/rpc";
        std::string aur_url = "https://aur.archlinux.org"; // Base for <PackageBase>.git clone URLs

        // --- install ---
        bool review_pkgbuild = false;             // Show the PKGBUILD and ask before building

        // A missing file yields the defaults.
        static std::expected<Config, ConfigError> load(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);
        static std::expected<Config, ConfigError> load_from_string(const std::string& content);

        // Human-readable dump used by --show-config.
        std::string describe() const;
    };

} // namespace am
