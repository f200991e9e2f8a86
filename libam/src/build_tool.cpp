//
// Created by cv2 on 10/19/26.
//

#include "libam/build_tool.h"
#include "libam/logging.h"
#include "libam/process.h"

#include <fstream>
#include <sstream>

namespace am {

    MakepkgBuildTool::MakepkgBuildTool(const Config& config) : m_config(config) {}

    std::string MakepkgBuildTool::clone_url(const std::string& base_name) const {
        return m_config.aur_url + "/" + base_name + ".git";
    }

    std::expected<void, BuildError> MakepkgBuildTool::clone(const std::string& base_name,
                                                            const std::filesystem::path& destination) {
        std::vector<std::string> argv = {"git", "clone", clone_url(base_name), destination.string()};
        log::info("Running: " + join_command(argv));

        auto result = run_process(argv);
        if (result.exit_code != 0) {
            log::error("Could not clone " + base_name + " from git.");
            return std::unexpected(BuildError::CloneFailed);
        }
        return {};
    }

    std::expected<void, BuildError> MakepkgBuildTool::build(const std::filesystem::path& build_dir,
                                                            bool as_dependency, bool noconfirm) {
        std::vector<std::string> argv = {"makepkg", "-si", "--needed"};
        if (as_dependency) argv.emplace_back("--asdeps");
        if (noconfirm) argv.emplace_back("--noconfirm");

        ProcessOptions options;
        options.working_directory = build_dir;

        log::info("Running: " + join_command(argv) + " (in " + build_dir.string() + ")");
        auto result = run_process(argv, options);
        if (result.exit_code != 0) {
            log::error("makepkg exited with code " + std::to_string(result.exit_code) + ".");
            return std::unexpected(BuildError::BuildFailed);
        }
        return {};
    }

    std::expected<std::string, BuildError> MakepkgBuildTool::build_script(const std::filesystem::path& build_dir) {
        const auto pkgbuild = build_dir / "PKGBUILD";
        std::ifstream in(pkgbuild);
        if (!in) {
            log::error("Could not open " + pkgbuild.string());
            return std::unexpected(BuildError::ScriptUnreadable);
        }
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

} // namespace am
