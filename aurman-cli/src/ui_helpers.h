//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <libam/decisions.h>
#include <libam/package.h>
#include <libam/prompt.h>

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace ui {

// --- ANSI Color Codes ---
    const char* const RESET = "\033[0m";
    const char* const BOLD = "\033[1m";
    const char* const BLUE = "\033[1;34m";
    const char* const GREEN = "\033[0;32m";
    const char* const RED = "\033[1;31m";
    const char* const YELLOW = "\033[1;33m";
    const char* const CYAN = "\033[0;36m";

// --- Formatted Printing Functions ---

    inline void action(const std::string& msg) {
        std::cout << BLUE << ":: " << RESET << BOLD << msg << RESET << std::endl;
    }

    inline void header(const std::string& msg) {
        std::cout << BOLD << msg << RESET << std::endl;
    }

    inline void item(const std::string& msg) {
        std::cout << " " << GREEN << "-" << RESET << " " << msg << std::endl;
    }

    inline void error(const std::string& msg) {
        std::cerr << RED << "error: " << RESET << msg << std::endl;
    }

    inline void warning(const std::string& msg) {
        std::cout << YELLOW << "warning: " << RESET << msg << std::endl;
    }

    // Prints search results as a table, most popular first.
    inline void print_package_table(const std::vector<am::PackageMetadata>& packages) {
        std::cout << BOLD
                  << std::left << std::setw(10) << "ID"
                  << std::setw(32) << "Package"
                  << std::setw(24) << "Version"
                  << std::setw(20) << "Maintainer"
                  << std::right << std::setw(10) << "Popularity"
                  << RESET << std::endl;

        for (const auto& pkg : packages) {
            std::ostringstream popularity;
            popularity << std::fixed << std::setprecision(2) << pkg.popularity;

            std::cout << std::left << std::setw(10) << pkg.id
                      << GREEN << std::setw(32) << pkg.name << RESET
                      << std::setw(24) << pkg.version
                      << std::setw(20) << (pkg.maintainer.empty() ? "(orphan)" : pkg.maintainer)
                      << std::right << std::setw(10) << popularity.str();
            if (pkg.out_of_date) {
                std::cout << RED << " (out of date)" << RESET;
            }
            std::cout << std::endl;
            if (!pkg.description.empty()) {
                std::cout << "    " << pkg.description << std::endl;
            }
        }
    }

// --- Prompting ---

    // Reads one line of input. End of input or Ctrl-C aborts the run.
    inline std::string read_answer() {
        try {
            return am::read_answer(std::cin);
        } catch (const am::UserAbort&) {
            std::cout << std::endl;
            throw;
        }
    }

    // Asks the user a "Yes/No" question.
    inline bool confirm(const std::string& question, bool default_yes = true) {
        std::cout << CYAN << ":: " << RESET << BOLD << question
                  << (default_yes ? " [Y/n] " : " [y/N] ") << RESET << std::flush;
        const std::string response = read_answer();
        if (response.empty()) {
            return default_yes;
        }
        return response[0] == 'y' || response[0] == 'Y';
    }

    // Answers the installer's questions on the terminal.
    class TerminalDecisions : public am::DecisionProvider {
    public:
        bool confirm(const std::string& question, bool default_yes = true) override {
            return ui::confirm(question, default_yes);
        }

        std::optional<std::string> select_package(const std::string& query,
                                                  const std::vector<am::PackageMetadata>& candidates) override {
            header("\nAUR packages matching '" + query + "':");
            print_package_table(candidates);

            while (true) {
                std::cout << CYAN << ":: " << RESET << BOLD
                          << "Package to install (empty to cancel): " << RESET << std::flush;
                const std::string answer = read_answer();
                if (answer.empty()) {
                    return std::nullopt;
                }
                for (const auto& pkg : candidates) {
                    if (pkg.name == answer) {
                        return answer;
                    }
                }
                warning("'" + answer + "' is not one of the listed packages.");
            }
        }

        void show_build_script(const std::string& package_name, const std::string& script) override {
            header("\n==> PKGBUILD of " + package_name);
            std::cout << script;
            if (!script.empty() && script.back() != '\n') {
                std::cout << '\n';
            }
            header("==> End of PKGBUILD\n");
        }
    };

} // namespace ui
