//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "config.h"
#include "package.h"

#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace am {

    enum class NativeError {
        InstallFailed,
        RemoveFailed,
        QueryFailed
    };

    // Queries and mutations against the system package manager.
    class NativeGateway {
    public:
        virtual ~NativeGateway() = default;

        // True if a native sync repository carries a package with exactly this name.
        virtual bool is_available(const std::string& name) = 0;

        // The installed version, or nullopt if the package is not installed.
        virtual std::optional<std::string> installed_version(const std::string& name) = 0;

        // Installs from the native repositories. as_dependency marks the package
        // as a dependency so the native manager can reclaim it as an orphan later.
        virtual std::expected<void, NativeError> install(const std::string& name, bool as_dependency, bool noconfirm) = 0;

        virtual std::expected<void, NativeError> remove(const std::string& name) = 0;

        // All installed packages not found in any sync repository.
        virtual std::expected<std::vector<InstalledRecord>, NativeError> list_foreign() = 0;
    };

    class PacmanGateway : public NativeGateway {
    public:
        explicit PacmanGateway(const Config& config);

        bool is_available(const std::string& name) override;
        std::optional<std::string> installed_version(const std::string& name) override;
        std::expected<void, NativeError> install(const std::string& name, bool as_dependency, bool noconfirm) override;
        std::expected<void, NativeError> remove(const std::string& name) override;
        std::expected<std::vector<InstalledRecord>, NativeError> list_foreign() override;

    private:
        const Config& m_config;
    };

    // Escapes regex metacharacters so a package name like "gtk+" can be matched exactly.
    std::string escape_regex(const std::string& text);

    // Parses "name version" lines as printed by `pacman -Q` / `pacman -Qm`.
    std::vector<InstalledRecord> parse_query_output(const std::string& output);

    // Interprets the result of `pacman -Qm`. Exit code 1 with no output means
    // there are no foreign packages; any other failure is QueryFailed.
    std::expected<std::vector<InstalledRecord>, NativeError> parse_foreign_query(int exit_code,
                                                                                 const std::string& output);

} // namespace am
