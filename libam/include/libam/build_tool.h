//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "config.h"

#include <expected>
#include <filesystem>
#include <string>

namespace am {

    enum class BuildError {
        CloneFailed,
        BuildFailed,
        ScriptUnreadable
    };

    // Source control and package build steps for one package.
    class BuildTool {
    public:
        virtual ~BuildTool() = default;

        // Clones the build repository named base_name into destination.
        virtual std::expected<void, BuildError> clone(const std::string& base_name,
                                                      const std::filesystem::path& destination) = 0;

        // Builds and installs the package found in build_dir. The tool handles
        // its own privilege escalation and terminal output.
        virtual std::expected<void, BuildError> build(const std::filesystem::path& build_dir,
                                                      bool as_dependency, bool noconfirm) = 0;

        // Returns the build script (PKGBUILD) text for review.
        virtual std::expected<std::string, BuildError> build_script(const std::filesystem::path& build_dir) = 0;
    };

    // git + makepkg.
    class MakepkgBuildTool : public BuildTool {
    public:
        explicit MakepkgBuildTool(const Config& config);

        std::expected<void, BuildError> clone(const std::string& base_name,
                                              const std::filesystem::path& destination) override;
        std::expected<void, BuildError> build(const std::filesystem::path& build_dir,
                                              bool as_dependency, bool noconfirm) override;
        std::expected<std::string, BuildError> build_script(const std::filesystem::path& build_dir) override;

        std::string clone_url(const std::string& base_name) const;

    private:
        const Config& m_config;
    };

} // namespace am
