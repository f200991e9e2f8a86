//
// Created by cv2 on 10/19/26.
//

#include "libam/process.h"
#include "libam/logging.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace am {

    std::string join_command(const std::vector<std::string>& argv) {
        std::string out;
        for (const auto& arg : argv) {
            if (!out.empty()) out += ' ';
            out += arg;
        }
        return out;
    }

    static void redirect_to_devnull(int fd) {
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, fd);
            close(devnull);
        }
    }

    ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
        ProcessResult result;
        if (argv.empty()) {
            log::error("Refusing to run an empty command.");
            return result;
        }

        int stdout_pipe[2] = {-1, -1};
        if (options.capture_stdout && pipe(stdout_pipe) != 0) {
            log::error("Could not create pipe for '" + argv[0] + "': " + std::strerror(errno));
            return result;
        }

        // Build the C argv before forking; only async-signal-safe calls in the child.
        std::vector<char*> c_argv;
        c_argv.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            c_argv.push_back(const_cast<char*>(arg.c_str()));
        }
        c_argv.push_back(nullptr);
        const std::string cwd = options.working_directory.string();

        pid_t pid = fork();
        if (pid < 0) {
            log::error("Could not fork for '" + argv[0] + "': " + std::strerror(errno));
            if (options.capture_stdout) {
                close(stdout_pipe[0]);
                close(stdout_pipe[1]);
            }
            return result;
        }

        if (pid == 0) {
            // Child process
            if (options.capture_stdout) {
                close(stdout_pipe[0]);
                dup2(stdout_pipe[1], STDOUT_FILENO);
                close(stdout_pipe[1]);
            } else if (options.discard_stdout) {
                redirect_to_devnull(STDOUT_FILENO);
            }
            if (options.discard_stderr) {
                redirect_to_devnull(STDERR_FILENO);
            }
            if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
                _exit(126);
            }
            execvp(c_argv[0], c_argv.data());
            _exit(127);
        }

        // Parent process
        if (options.capture_stdout) {
            close(stdout_pipe[1]);
            std::array<char, 4096> buffer{};
            ssize_t n;
            while ((n = read(stdout_pipe[0], buffer.data(), buffer.size())) != 0) {
                if (n < 0) {
                    if (errno == EINTR) continue;
                    break;
                }
                result.stdout_output.append(buffer.data(), static_cast<size_t>(n));
            }
            close(stdout_pipe[0]);
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                log::error("waitpid failed for '" + argv[0] + "': " + std::strerror(errno));
                return result;
            }
        }

        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
            if (result.exit_code == 127) {
                log::warn("Command not found or not executable: " + argv[0]);
            }
        }
        return result;
    }

} // namespace am
