//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "build_tool.h"
#include "config.h"
#include "decisions.h"
#include "dependency_resolver.h"
#include "native_gateway.h"
#include "remote_index.h"

#include <expected>
#include <filesystem>
#include <set>
#include <string>

namespace am {

    enum class InstallError {
        // Lookup errors
        RemoteConnectionFailed,
        PackageNotFound,
        VersionParseFailed,
        ResolutionFailed,
        CircularDependency,
        DependencyFailed,
        // Execution errors
        NativeInstallFailed,
        NativeRemoveFailed,
        CloneFailed,
        BuildFailed,
        // The user answered "no"; nothing was changed
        Declined
    };

    struct InstallOptions {
        bool as_dependency = false; // Satisfying another package's dependency
        bool force = false;         // Rebuild even if the installed version is current
        bool confirmed = false;     // The caller already asked the user
    };

    // Drives one package (and its AUR dependencies) from lookup to installed:
    // native check, remote lookup, up-to-date check, dependencies, clone, build, cleanup.
    // Keeps a per-run record of what it already handled so a package reached
    // through several dependents is processed once.
    class Installer {
    public:
        Installer(const Config& config,
                  NativeGateway& native,
                  RemoteIndex& remote,
                  BuildTool& build_tool,
                  DecisionProvider& decisions);

        std::expected<void, InstallError> install(const std::string& package_name, const InstallOptions& options = {});

        std::expected<void, InstallError> remove(const std::string& package_name);

        // Packages installed or found up to date during this run.
        const std::set<std::string>& handled() const { return m_handled; }

        std::filesystem::path scratch_directory(const std::string& package_name) const;

    private:
        std::expected<void, InstallError> install_from_native(const std::string& package_name);
        std::expected<PackageDescriptor, InstallError> lookup_remote(const std::string& package_name);
        std::expected<PackageDescriptor, InstallError> search_fallback(const std::string& package_name);
        std::expected<bool, InstallError> is_up_to_date(const std::string& package_name, const std::string& remote_version);
        std::expected<void, InstallError> install_dependencies(const PackageDescriptor& descriptor);
        std::expected<void, InstallError> install_planned(const PackageDescriptor& descriptor, const InstallOptions& options);
        std::expected<void, InstallError> fetch_and_build(const PackageDescriptor& descriptor, const InstallOptions& options);

        // Asks unless autorun is configured.
        bool ask(const std::string& question);

        void print_package_info(const PackageMetadata& metadata) const;

        const Config& m_config;
        NativeGateway& m_native;
        RemoteIndex& m_remote;
        BuildTool& m_build_tool;
        DecisionProvider& m_decisions;
        DependencyResolver m_resolver;

        std::set<std::string> m_handled;     // Done in this run
        std::set<std::string> m_in_progress; // On the current call stack
    };

} // namespace am
