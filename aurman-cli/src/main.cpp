#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <cxxopts.hpp>

// Our library and UI helpers
#include "ui_helpers.h"
#include <libam/build_tool.h>
#include <libam/config.h>
#include <libam/http.h>
#include <libam/installer.h>
#include <libam/logging.h>
#include <libam/native_gateway.h>
#include <libam/remote_index.h>
#include <libam/upgrade_planner.h>

std::string error_to_string(am::InstallError err) {
    switch (err) {
        case am::InstallError::RemoteConnectionFailed: return "Could not reach the AUR.";
        case am::InstallError::PackageNotFound: return "Package not found.";
        case am::InstallError::VersionParseFailed: return "Could not compare package versions.";
        case am::InstallError::ResolutionFailed: return "Could not resolve dependencies.";
        case am::InstallError::CircularDependency: return "Circular dependency detected.";
        case am::InstallError::DependencyFailed: return "A dependency failed to install.";
        case am::InstallError::NativeInstallFailed: return "The native package manager failed to install the package.";
        case am::InstallError::NativeRemoveFailed: return "The native package manager failed to remove the package.";
        case am::InstallError::CloneFailed: return "Could not clone the package repository.";
        case am::InstallError::BuildFailed: return "The package build failed.";
        case am::InstallError::Declined: return "Aborted by user.";
        default: return "An unknown installation error occurred.";
    }
}

std::string error_to_string(am::RemoteError err) {
    switch (err) {
        case am::RemoteError::ConnectionFailed: return "Could not reach the AUR.";
        case am::RemoteError::InvalidResponse: return "The AUR returned an invalid response.";
        default: return "An unknown remote error occurred.";
    }
}

std::string error_to_string(am::UpgradeError err) {
    switch (err) {
        case am::UpgradeError::NativeQueryFailed: return "Could not list the installed foreign packages.";
        case am::UpgradeError::RemoteFailure: return "Could not fetch package versions from the AUR.";
        case am::UpgradeError::SomeFailed: return "Some packages failed to upgrade.";
        default: return "An unknown upgrade error occurred.";
    }
}

std::string error_to_string(am::ConfigError err) {
    switch (err) {
        case am::ConfigError::FileUnreadable: return "The configuration file could not be read.";
        case am::ConfigError::InvalidFormat: return "The configuration file is malformed.";
        default: return "An unknown configuration error occurred.";
    }
}

// --- COMMAND HANDLERS ---

int do_install(am::Installer& installer, const std::vector<std::string>& packages, bool force) {
    if (force) ui::warning("Forcing reinstallation of up to date packages.");

    int status = 0;
    for (const auto& name : packages) {
        ui::action("Installing " + name + "...");
        am::InstallOptions options;
        options.force = force;

        auto result = installer.install(name, options);
        if (result) {
            continue;
        }
        if (result.error() == am::InstallError::Declined) {
            ui::warning("Installation of " + name + " aborted by user.");
            continue;
        }
        ui::error("Failed to install '" + name + "': " + error_to_string(result.error()));
        status = 1;
    }

    if (status == 0) {
        ui::header("Installation completed successfully.");
    }
    return status;
}

int do_search(am::RemoteIndex& remote, const std::vector<std::string>& terms) {
    int status = 0;
    for (const auto& term : terms) {
        ui::action("Searching the AUR for '" + term + "'...");
        auto results = remote.search(term);
        if (!results) {
            ui::error(error_to_string(results.error()));
            status = 1;
            continue;
        }
        if (results->empty()) {
            ui::error("Package " + term + " not found.");
            status = 1;
            continue;
        }

        am::sort_by_popularity(*results);
        ui::print_package_table(*results);
    }
    return status;
}

int do_list(am::UpgradePlanner& planner) {
    ui::action("Listing installed AUR packages...");
    auto statuses = planner.list_installed();
    if (!statuses) {
        ui::error(error_to_string(statuses.error()));
        return 1;
    }
    if (statuses->empty()) {
        ui::header("No foreign packages installed.");
        return 0;
    }

    for (const auto& status : *statuses) {
        std::string line = status.name + " " + status.installed_version;
        if (!status.remote_version) {
            line += std::string(" ") + ui::YELLOW + "(not in AUR)" + ui::RESET;
        } else if (status.outdated) {
            line += std::string(" ") + ui::RED + "-> " + *status.remote_version + ui::RESET;
        }
        ui::item(line);
    }
    return 0;
}

int do_upgrade(am::UpgradePlanner& planner) {
    ui::action("Starting AUR upgrade...");
    auto report = planner.run();
    if (report) {
        ui::header("Upgrade completed successfully.");
        return 0;
    }

    ui::error(error_to_string(report.error()) + " (see details above)");
    return 1;
}

int do_remove(am::Installer& installer, const std::vector<std::string>& packages) {
    int status = 0;
    for (const auto& name : packages) {
        ui::action("Removing " + name + "...");
        auto result = installer.remove(name);
        if (!result) {
            ui::error("Failed to remove '" + name + "': " + error_to_string(result.error()));
            status = 1;
        }
    }
    return status;
}

int do_show_config(const am::Config& config) {
    std::cout << config.describe();
    return 0;
}

// --- Main Function ---

int run(int argc, char* argv[]) {
    cxxopts::Options options("aurman", "AUR helper: builds and installs packages from the Arch User Repository");
    options.add_options()
            ("S,sync", "Install packages (and their AUR dependencies)")
            ("Q,search", "Search the AUR")
            ("L,list", "List installed AUR packages with their AUR versions")
            ("U,upgrade", "Upgrade all outdated AUR packages")
            ("R,remove", "Remove packages through the native package manager")
            ("show-config", "Print the effective configuration")
            ("force", "Reinstall even if the installed version is current")
            ("noconfirm", "Do not ask for confirmation")
            ("c,config", "Configuration file",
             cxxopts::value<std::string>()->default_value(am::DEFAULT_CONFIG_PATH.string()))
            ("h,help", "Print usage")
            ("targets", "Packages or search terms", cxxopts::value<std::vector<std::string>>())
            ;
    options.parse_positional({"targets"});
    options.positional_help("<package|term>...");

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        ui::error(e.what());
        std::cerr << options.help() << std::endl;
        return 1;
    }
    const cxxopts::ParseResult& result = *parsed;

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }

    const int commands = static_cast<int>(result.count("sync") + result.count("search") + result.count("list") +
                                          result.count("upgrade") + result.count("remove") +
                                          result.count("show-config"));
    if (commands != 1) {
        ui::error("Exactly one of -S, -Q, -L, -U, -R or --show-config is required.");
        std::cerr << options.help() << std::endl;
        return 1;
    }

    std::vector<std::string> targets;
    if (result.count("targets")) {
        targets = result["targets"].as<std::vector<std::string>>();
    }
    if ((result.count("sync") || result.count("search") || result.count("remove")) && targets.empty()) {
        ui::error("No targets specified.");
        return 1;
    }

    const std::string config_path = result["config"].as<std::string>();
    auto loaded = am::Config::load(config_path);
    if (!loaded) {
        ui::error(config_path + ": " + error_to_string(loaded.error()));
        return 1;
    }
    am::Config config = std::move(*loaded);
    if (result.count("noconfirm")) {
        config.autorun = true;
    }

    if (result.count("show-config")) {
        return do_show_config(config);
    }

    if (!am::log::set_log_file(config.log_path)) {
        ui::warning("Cannot open log file " + config.log_path.string() + "; logging to the terminal only.");
    }

    am::CurlHttpClient http;
    am::AurRpcClient remote(config, http);
    am::PacmanGateway native(config);
    am::MakepkgBuildTool build_tool(config);
    ui::TerminalDecisions decisions;
    am::Installer installer(config, native, remote, build_tool, decisions);
    am::UpgradePlanner planner(config, native, remote, installer, decisions);

    // Command dispatch.
    if (result.count("sync")) {
        return do_install(installer, targets, result.count("force") > 0);
    } else if (result.count("search")) {
        return do_search(remote, targets);
    } else if (result.count("list")) {
        return do_list(planner);
    } else if (result.count("upgrade")) {
        return do_upgrade(planner);
    } else {
        return do_remove(installer, targets);
    }
}

int main(int argc, char* argv[]) {
    try {
        return run(argc, argv);
    } catch (const am::UserAbort& e) {
        // A clean abort, not a failure.
        ui::warning(e.what());
        return 0;
    } catch (const std::exception& e) {
        am::log::error(std::string("Unexpected error: ") + e.what());
        ui::error("aurman stopped because of an unexpected error (see details above)");
        return 1;
    }
}
