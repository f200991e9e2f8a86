//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "config.h"
#include "decisions.h"
#include "installer.h"
#include "native_gateway.h"
#include "remote_index.h"

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace am {

    enum class UpgradeError {
        NativeQueryFailed, // Could not list the installed foreign packages
        RemoteFailure,     // Could not fetch remote metadata; nothing was attempted
        SomeFailed         // At least one package failed to upgrade
    };

    struct UpgradeCandidate {
        std::string name;
        std::string installed_version;
        std::string remote_version;
    };

    // One line of the installed-packages listing.
    struct InstalledStatus {
        std::string name;
        std::string installed_version;
        std::optional<std::string> remote_version; // nullopt: not in the AUR
        bool outdated = false;
    };

    struct UpgradeReport {
        std::vector<std::string> upgraded;
        std::vector<std::string> declined;
        std::vector<std::pair<std::string, InstallError>> failed;
    };

    class UpgradePlanner {
    public:
        UpgradePlanner(const Config& config,
                       NativeGateway& native,
                       RemoteIndex& remote,
                       Installer& installer,
                       DecisionProvider& decisions);

        // Foreign packages whose installed version is older than the AUR's.
        std::expected<std::vector<UpgradeCandidate>, UpgradeError> plan();

        // Plans, reports, confirms and installs every candidate. A failure
        // does not stop the remaining upgrades; the result is an error if any failed.
        std::expected<UpgradeReport, UpgradeError> run();

        // Every foreign package with its AUR version, for the listing command.
        std::expected<std::vector<InstalledStatus>, UpgradeError> list_installed();

    private:
        const Config& m_config;
        NativeGateway& m_native;
        RemoteIndex& m_remote;
        Installer& m_installer;
        DecisionProvider& m_decisions;
    };

} // namespace am
