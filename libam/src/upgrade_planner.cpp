//
// Created by cv2 on 10/19/26.
//

#include "libam/upgrade_planner.h"
#include "libam/logging.h"
#include "libam/spinner.h"
#include "libam/version.h"

#include <map>
#include <set>

namespace am {

    UpgradePlanner::UpgradePlanner(const Config& config,
                                   NativeGateway& native,
                                   RemoteIndex& remote,
                                   Installer& installer,
                                   DecisionProvider& decisions)
            : m_config(config),
              m_native(native),
              m_remote(remote),
              m_installer(installer),
              m_decisions(decisions)
    {}

    static std::expected<std::map<std::string, std::string>, RemoteError> fetch_remote_versions(
            RemoteIndex& remote, const std::vector<InstalledRecord>& installed) {
        std::set<std::string> names;
        for (const auto& record : installed) {
            names.insert(record.name);
        }

        auto lookup = [&] {
            Spinner spinner("Fetching AUR metadata for " + std::to_string(names.size()) + " packages...");
            return remote.batch_info(names);
        }();
        if (!lookup) {
            return std::unexpected(lookup.error());
        }

        std::map<std::string, std::string> versions;
        for (const auto& meta : *lookup) {
            versions[meta.name] = meta.version;
        }
        return versions;
    }

    std::expected<std::vector<UpgradeCandidate>, UpgradeError> UpgradePlanner::plan() {
        const auto installed = m_native.list_foreign();
        if (!installed) {
            return std::unexpected(UpgradeError::NativeQueryFailed);
        }
        std::vector<UpgradeCandidate> candidates;
        if (installed->empty()) {
            return candidates;
        }

        auto remote_versions = fetch_remote_versions(m_remote, *installed);
        if (!remote_versions) {
            return std::unexpected(UpgradeError::RemoteFailure);
        }

        for (const auto& record : *installed) {
            auto it = remote_versions->find(record.name);
            if (it == remote_versions->end()) {
                continue; // Not an AUR package, or removed from the AUR
            }

            auto order = compare_versions(record.version, it->second);
            if (!order) {
                log::warn("Cannot compare versions of " + record.name + " ('" + record.version +
                          "' vs '" + it->second + "'). Skipping it.");
                continue;
            }
            if (*order == VersionOrder::Less) {
                candidates.push_back({record.name, record.version, it->second});
            }
        }
        return candidates;
    }

    std::expected<UpgradeReport, UpgradeError> UpgradePlanner::run() {
        log::info("Checking AUR packages for updates...");
        auto candidates = plan();
        if (!candidates) {
            log::error("Could not check for updates.");
            return std::unexpected(candidates.error());
        }

        UpgradeReport report;
        if (candidates->empty()) {
            log::ok("Nothing to do. All AUR packages are up to date.");
            return report;
        }

        log::info("Packages to upgrade (" + std::to_string(candidates->size()) + "):");
        for (const auto& candidate : *candidates) {
            log::info("  " + candidate.name + " " + candidate.installed_version + " -> " + candidate.remote_version);
        }

        if (!m_config.autorun && !m_decisions.confirm("Proceed with upgrade?")) {
            log::warn("Upgrade aborted by user.");
            for (const auto& candidate : *candidates) {
                report.declined.push_back(candidate.name);
            }
            return report;
        }

        InstallOptions options;
        options.confirmed = true;
        for (const auto& candidate : *candidates) {
            auto result = m_installer.install(candidate.name, options);
            if (result) {
                report.upgraded.push_back(candidate.name);
            } else if (result.error() == InstallError::Declined) {
                report.declined.push_back(candidate.name);
            } else {
                log::error("Upgrade of " + candidate.name + " failed. Continuing with the remaining packages.");
                report.failed.emplace_back(candidate.name, result.error());
            }
        }

        if (!report.failed.empty()) {
            log::error(std::to_string(report.failed.size()) + " of " + std::to_string(candidates->size()) +
                       " upgrades failed.");
            return std::unexpected(UpgradeError::SomeFailed);
        }

        log::ok("Upgraded " + std::to_string(report.upgraded.size()) + " package(s).");
        return report;
    }

    std::expected<std::vector<InstalledStatus>, UpgradeError> UpgradePlanner::list_installed() {
        const auto installed = m_native.list_foreign();
        if (!installed) {
            return std::unexpected(UpgradeError::NativeQueryFailed);
        }
        std::vector<InstalledStatus> statuses;
        if (installed->empty()) {
            return statuses;
        }

        auto remote_versions = fetch_remote_versions(m_remote, *installed);
        if (!remote_versions) {
            return std::unexpected(UpgradeError::RemoteFailure);
        }

        for (const auto& record : *installed) {
            InstalledStatus status{record.name, record.version, std::nullopt, false};
            if (auto it = remote_versions->find(record.name); it != remote_versions->end()) {
                status.remote_version = it->second;
                auto order = compare_versions(record.version, it->second);
                status.outdated = order && *order == VersionOrder::Less;
            }
            statuses.push_back(std::move(status));
        }
        return statuses;
    }

} // namespace am
