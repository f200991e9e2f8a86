//
// Created by cv2 on 10/19/26.
//

#include "libam/native_gateway.h"
#include "libam/logging.h"
#include "libam/process.h"

#include <sstream>

namespace am {

    std::string escape_regex(const std::string& text) {
        static const std::string metacharacters = R"(\^$.|?*+()[]{})";
        std::string escaped;
        escaped.reserve(text.size());
        for (char c : text) {
            if (metacharacters.find(c) != std::string::npos) {
                escaped += '\\';
            }
            escaped += c;
        }
        return escaped;
    }

    std::vector<InstalledRecord> parse_query_output(const std::string& output) {
        std::vector<InstalledRecord> records;
        std::istringstream stream(output);
        std::string line;
        while (std::getline(stream, line)) {
            std::istringstream fields(line);
            InstalledRecord record;
            if (fields >> record.name >> record.version) {
                records.push_back(std::move(record));
            }
        }
        return records;
    }

    std::expected<std::vector<InstalledRecord>, NativeError> parse_foreign_query(int exit_code,
                                                                                 const std::string& output) {
        if (exit_code == 0) {
            return parse_query_output(output);
        }
        if (exit_code == 1 && output.find_first_not_of(" \t\n") == std::string::npos) {
            return std::vector<InstalledRecord>{};
        }
        return std::unexpected(NativeError::QueryFailed);
    }

    PacmanGateway::PacmanGateway(const Config& config) : m_config(config) {}

    bool PacmanGateway::is_available(const std::string& name) {
        ProcessOptions options;
        options.discard_stdout = true;
        options.discard_stderr = true;
        auto result = run_process({"pacman", "-Ss", "^" + escape_regex(name) + "$"}, options);
        return result.exit_code == 0;
    }

    std::optional<std::string> PacmanGateway::installed_version(const std::string& name) {
        ProcessOptions options;
        options.capture_stdout = true;
        options.discard_stderr = true;
        auto result = run_process({"pacman", "-Q", name}, options);
        if (result.exit_code != 0) {
            return std::nullopt;
        }

        for (const auto& record : parse_query_output(result.stdout_output)) {
            if (record.name == name) {
                return record.version;
            }
        }
        return std::nullopt;
    }

    std::expected<void, NativeError> PacmanGateway::install(const std::string& name, bool as_dependency, bool noconfirm) {
        std::vector<std::string> argv = {m_config.su_program, "pacman", "-S", "--needed"};
        if (as_dependency) argv.emplace_back("--asdeps");
        if (noconfirm) argv.emplace_back("--noconfirm");
        argv.push_back(name);

        log::info("Running: " + join_command(argv));
        auto result = run_process(argv);
        if (result.exit_code != 0) {
            log::error("Error installing " + name + " from the native repositories (exit code " +
                       std::to_string(result.exit_code) + ").");
            return std::unexpected(NativeError::InstallFailed);
        }
        return {};
    }

    std::expected<void, NativeError> PacmanGateway::remove(const std::string& name) {
        std::vector<std::string> argv = {m_config.su_program, "pacman", "-R", name};

        log::info("Running: " + join_command(argv));
        auto result = run_process(argv);
        if (result.exit_code != 0) {
            log::error("Error removing " + name + " (exit code " + std::to_string(result.exit_code) + ").");
            return std::unexpected(NativeError::RemoveFailed);
        }
        return {};
    }

    std::expected<std::vector<InstalledRecord>, NativeError> PacmanGateway::list_foreign() {
        ProcessOptions options;
        options.capture_stdout = true;
        auto result = run_process({"pacman", "-Qm"}, options);
        auto records = parse_foreign_query(result.exit_code, result.stdout_output);
        if (!records) {
            log::error("Error listing foreign packages (pacman -Qm exit code " +
                       std::to_string(result.exit_code) + ").");
        }
        return records;
    }

} // namespace am
