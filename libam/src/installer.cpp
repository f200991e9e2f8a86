//
// Created by cv2 on 10/19/26.
//

#include "libam/installer.h"
#include "libam/logging.h"
#include "libam/spinner.h"
#include "libam/version.h"

#include <system_error>
#include <utility>

namespace am {

    namespace {

        // The per-package clone + build directory. Any stale copy is removed
        // before use, and the directory is removed again when the guard goes
        // out of scope, whether the build succeeded, failed or threw.
        class ScratchDirectory {
        public:
            explicit ScratchDirectory(std::filesystem::path path) : m_path(std::move(path)) {}

            ~ScratchDirectory() {
                std::error_code ec;
                std::filesystem::remove_all(m_path, ec);
                if (ec) {
                    // Never escalated: the package itself is already installed or already failed.
                    log::error("Error removing build files at " + m_path.string() + ": " + ec.message());
                }
            }

            ScratchDirectory(const ScratchDirectory&) = delete;
            ScratchDirectory& operator=(const ScratchDirectory&) = delete;

            bool prepare() {
                std::error_code ec;
                std::filesystem::remove_all(m_path, ec);
                if (ec) {
                    log::error("Could not remove stale build directory " + m_path.string() + ": " + ec.message());
                    return false;
                }
                std::filesystem::create_directories(m_path.parent_path(), ec);
                if (ec) {
                    log::error("Could not create " + m_path.parent_path().string() + ": " + ec.message());
                    return false;
                }
                return true;
            }

        private:
            std::filesystem::path m_path;
        };

        // Marks a package as being on the install call stack for the guard's lifetime.
        class InProgressGuard {
        public:
            InProgressGuard(std::set<std::string>& set, std::string name) : m_set(set), m_name(std::move(name)) {
                m_set.insert(m_name);
            }
            ~InProgressGuard() { m_set.erase(m_name); }

            InProgressGuard(const InProgressGuard&) = delete;
            InProgressGuard& operator=(const InProgressGuard&) = delete;

        private:
            std::set<std::string>& m_set;
            std::string m_name;
        };

        InstallError to_install_error(ResolveError error) {
            switch (error) {
                case ResolveError::PackageNotFound: return InstallError::PackageNotFound;
                case ResolveError::RemoteFailure: return InstallError::RemoteConnectionFailed;
                case ResolveError::CircularDependency: return InstallError::CircularDependency;
            }
            return InstallError::ResolutionFailed;
        }

        std::string join(const std::vector<std::string>& items, const std::string& separator) {
            std::string out;
            for (const auto& item : items) {
                if (!out.empty()) out += separator;
                out += item;
            }
            return out;
        }

    } // namespace

    Installer::Installer(const Config& config,
                         NativeGateway& native,
                         RemoteIndex& remote,
                         BuildTool& build_tool,
                         DecisionProvider& decisions)
            : m_config(config),
              m_native(native),
              m_remote(remote),
              m_build_tool(build_tool),
              m_decisions(decisions),
              m_resolver(native, remote)
    {}

    std::filesystem::path Installer::scratch_directory(const std::string& package_name) const {
        return m_config.aurman_path / package_name;
    }

    bool Installer::ask(const std::string& question) {
        return m_config.autorun || m_decisions.confirm(question);
    }

    std::expected<void, InstallError> Installer::install(const std::string& package_name, const InstallOptions& options) {
        if (m_handled.count(package_name)) {
            return {};
        }
        if (m_in_progress.count(package_name)) {
            log::error("Package '" + package_name + "' ends up depending on itself.");
            return std::unexpected(InstallError::CircularDependency);
        }
        InProgressGuard guard(m_in_progress, package_name);

        // --- 1. Native repositories first ---
        if (m_native.is_available(package_name)) {
            if (options.as_dependency) {
                // pacman pulls it in (or already has it) when the parent is built.
                return {};
            }
            return install_from_native(package_name);
        }

        // --- 2. Remote metadata, dependencies left unresolved for now ---
        auto found = lookup_remote(package_name);
        if (!found) {
            return std::unexpected(found.error());
        }
        if (found->name() != package_name && m_handled.count(found->name())) {
            return {};
        }

        // --- 3. Skip if already current ---
        if (!options.force) {
            auto up_to_date = is_up_to_date(found->name(), found->version());
            if (!up_to_date) {
                return std::unexpected(up_to_date.error());
            }
            if (*up_to_date) {
                m_handled.insert(found->name());
                return {};
            }
        }

        print_package_info(found->metadata());

        // --- 4. Resolve the AUR dependency plan ---
        std::expected<PackageDescriptor, ResolveError> descriptor = [&] {
            Spinner spinner("Parsing dependencies of " + found->name() + "...");
            return m_resolver.describe(found->metadata(), ResolveMode::Eager);
        }();
        if (!descriptor) {
            log::error("Dependency resolution failed for '" + found->name() + "'.");
            return std::unexpected(to_install_error(descriptor.error()));
        }

        const auto plan = descriptor->aur_dependencies();
        const auto missing = descriptor->all_missing_dependencies();

        // --- 5. Confirm ---
        if (!options.as_dependency) {
            std::vector<std::string> dep_names;
            for (const auto& dep : plan) {
                dep_names.push_back(dep.name());
            }
            dep_names.insert(dep_names.end(), missing.begin(), missing.end());
            if (!dep_names.empty()) {
                log::info("AUR dependencies to build first: " + join(dep_names, ", "));
            }

            if (!options.confirmed && !ask("Continue installation of " + descriptor->name() + "?")) {
                log::warn("Installation of " + descriptor->name() + " aborted by user.");
                return std::unexpected(InstallError::Declined);
            }
        }

        // --- 6. Dependencies, leaf-first ---
        auto deps_result = install_dependencies(*descriptor);
        if (!deps_result) {
            return std::unexpected(deps_result.error());
        }

        // --- 7. Fetch, build, clean up ---
        return fetch_and_build(*descriptor, options);
    }

    std::expected<void, InstallError> Installer::install_from_native(const std::string& package_name) {
        if (!ask("The package " + package_name + " is in the native repositories. Install it from there?")) {
            log::warn("Installation of " + package_name + " aborted by user.");
            return std::unexpected(InstallError::Declined);
        }

        log::info("Installing " + package_name + " from the native repositories...");
        auto result = m_native.install(package_name, false, m_config.autorun);
        if (!result) {
            return std::unexpected(InstallError::NativeInstallFailed);
        }
        m_handled.insert(package_name);
        log::ok("Installed " + package_name + " from the native repositories.");
        return {};
    }

    std::expected<PackageDescriptor, InstallError> Installer::lookup_remote(const std::string& package_name) {
        auto found = m_resolver.resolve(package_name, ResolveMode::Deferred);
        if (found) {
            return std::move(*found);
        }
        if (found.error() != ResolveError::PackageNotFound) {
            return std::unexpected(to_install_error(found.error()));
        }
        return search_fallback(package_name);
    }

    std::expected<PackageDescriptor, InstallError> Installer::search_fallback(const std::string& package_name) {
        // Choosing among search results needs a human; autorun never guesses.
        if (m_config.autorun || !m_decisions.confirm("Search " + package_name + " on AUR?")) {
            return std::unexpected(InstallError::PackageNotFound);
        }

        auto results = m_remote.search(package_name);
        if (!results) {
            return std::unexpected(InstallError::RemoteConnectionFailed);
        }
        if (results->empty()) {
            log::error("No AUR packages match '" + package_name + "'.");
            return std::unexpected(InstallError::PackageNotFound);
        }
        sort_by_popularity(*results);

        auto selected = m_decisions.select_package(package_name, *results);
        if (!selected) {
            return std::unexpected(InstallError::PackageNotFound);
        }

        // Search results carry no dependency lists; fetch the full record.
        auto found = m_resolver.resolve(*selected, ResolveMode::Deferred);
        if (!found) {
            return std::unexpected(to_install_error(found.error()));
        }
        return std::move(*found);
    }

    std::expected<bool, InstallError> Installer::is_up_to_date(const std::string& package_name,
                                                               const std::string& remote_version) {
        auto installed = m_native.installed_version(package_name);
        if (!installed) {
            return false;
        }

        auto order = compare_versions(*installed, remote_version);
        if (!order) {
            log::error("Cannot compare versions of " + package_name + ": installed '" + *installed +
                       "', AUR '" + remote_version + "'.");
            return std::unexpected(InstallError::VersionParseFailed);
        }

        if (*order != VersionOrder::Less) {
            log::info("Skipping " + package_name + ": Already installed and updated (version " + *installed + ").");
            return true;
        }
        log::info("Upgrading " + package_name + ": " + *installed + " -> " + remote_version);
        return false;
    }

    std::expected<void, InstallError> Installer::install_dependencies(const PackageDescriptor& descriptor) {
        InstallOptions dep_options;
        dep_options.as_dependency = true;

        // Unknown names get the full lookup, including the search fallback.
        for (const auto& missing : descriptor.all_missing_dependencies()) {
            auto result = install(missing, dep_options);
            if (!result) {
                log::error("Could not install dependency '" + missing + "' of '" + descriptor.name() + "'.");
                return std::unexpected(InstallError::DependencyFailed);
            }
        }

        for (const auto& dep : descriptor.aur_dependencies()) {
            auto result = install_planned(dep, dep_options);
            if (!result) {
                log::error("Could not install dependency '" + dep.name() + "' of '" + descriptor.name() + "'.");
                return std::unexpected(InstallError::DependencyFailed);
            }
        }
        return {};
    }

    std::expected<void, InstallError> Installer::install_planned(const PackageDescriptor& descriptor,
                                                                 const InstallOptions& options) {
        if (m_handled.count(descriptor.name())) {
            return {};
        }
        if (m_in_progress.count(descriptor.name())) {
            log::error("Package '" + descriptor.name() + "' ends up depending on itself.");
            return std::unexpected(InstallError::CircularDependency);
        }
        InProgressGuard guard(m_in_progress, descriptor.name());

        if (!options.force) {
            auto up_to_date = is_up_to_date(descriptor.name(), descriptor.version());
            if (!up_to_date) {
                return std::unexpected(up_to_date.error());
            }
            if (*up_to_date) {
                m_handled.insert(descriptor.name());
                return {};
            }
        }

        // Its own AUR dependencies precede it in the plan.
        return fetch_and_build(descriptor, options);
    }

    std::expected<void, InstallError> Installer::fetch_and_build(const PackageDescriptor& descriptor,
                                                                 const InstallOptions& options) {
        const auto build_dir = scratch_directory(descriptor.name());
        ScratchDirectory scratch(build_dir);
        if (!scratch.prepare()) {
            return std::unexpected(InstallError::CloneFailed);
        }

        auto cloned = m_build_tool.clone(descriptor.base_name(), build_dir);
        if (!cloned) {
            return std::unexpected(InstallError::CloneFailed);
        }

        if (m_config.review_pkgbuild) {
            auto script = m_build_tool.build_script(build_dir);
            if (!script) {
                log::error("Cannot review the build script of " + descriptor.name() + ".");
                return std::unexpected(InstallError::BuildFailed);
            }
            m_decisions.show_build_script(descriptor.name(), *script);
            if (!ask("Proceed with building " + descriptor.name() + "?")) {
                log::warn("Build of " + descriptor.name() + " aborted by user.");
                return std::unexpected(InstallError::Declined);
            }
        }

        auto built = m_build_tool.build(build_dir, options.as_dependency, m_config.autorun);
        if (!built) {
            log::error("Failed to install package " + descriptor.name() + ". Cleaning up.");
            return std::unexpected(InstallError::BuildFailed);
        }

        m_handled.insert(descriptor.name());
        log::ok("Installed " + descriptor.name() + " " + descriptor.version() + ".");
        return {};
    }

    std::expected<void, InstallError> Installer::remove(const std::string& package_name) {
        if (!m_native.installed_version(package_name)) {
            log::error("Cannot remove '" + package_name + "': package is not installed.");
            return std::unexpected(InstallError::PackageNotFound);
        }
        auto result = m_native.remove(package_name);
        if (!result) {
            return std::unexpected(InstallError::NativeRemoveFailed);
        }
        log::ok("Removed " + package_name + ".");
        return {};
    }

    void Installer::print_package_info(const PackageMetadata& metadata) const {
        const auto& deps = metadata.depends;
        log::info("Package: " + metadata.name);
        log::info("  Description: " + metadata.description);
        log::info("  Version: " + metadata.version);
        log::info("  Maintainer: " + (metadata.maintainer.empty() ? std::string("(orphan)") : metadata.maintainer));
        log::info("  Dependencies: " + (deps.empty() ? std::string("None") : join(deps, ", ")));
        if (metadata.out_of_date) {
            log::warn("  " + metadata.name + " is flagged out of date on the AUR.");
        }
    }

} // namespace am
