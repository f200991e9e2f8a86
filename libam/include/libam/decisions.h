//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "package.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace am {

    // Thrown by a DecisionProvider when the user interrupts a prompt
    // (Ctrl-C or end of input). Callers unwind and abort the whole run.
    class UserAbort : public std::runtime_error {
    public:
        UserAbort() : std::runtime_error("Aborted by user.") {}
    };

    // The points where the installer needs a human answer. The terminal
    // implementation lives in the CLI; tests script the answers.
    class DecisionProvider {
    public:
        virtual ~DecisionProvider() = default;

        // A yes/no question. default_yes is the answer to an empty reply.
        virtual bool confirm(const std::string& question, bool default_yes = true) = 0;

        // Picks one package out of search results for the given query.
        // nullopt means the user declined to choose.
        virtual std::optional<std::string> select_package(const std::string& query,
                                                          const std::vector<PackageMetadata>& candidates) = 0;

        // Shows a build script before it is executed.
        virtual void show_build_script(const std::string& package_name, const std::string& script) = 0;
    };

} // namespace am
