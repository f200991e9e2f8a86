//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace am {

    struct ProcessResult {
        int exit_code = -1;        // -1 when the process could not be started or did not exit normally
        std::string stdout_output; // Only filled when capture_stdout is set
    };

    struct ProcessOptions {
        std::filesystem::path working_directory; // Empty: inherit
        bool capture_stdout = false;
        bool discard_stdout = false;             // Ignored when capture_stdout is set
        bool discard_stderr = false;
    };

    // Runs argv[0] (looked up in PATH) with the given arguments and waits for it.
    // No shell is involved, so arguments are passed through verbatim.
    ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options = {});

    // Renders argv for log messages.
    std::string join_command(const std::vector<std::string>& argv);

} // namespace am
