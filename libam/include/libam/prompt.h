//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <csignal>
#include <istream>
#include <string>

namespace am {

    // Routes SIGINT into a flag for as long as it lives, so a blocked prompt
    // read fails with EINTR instead of killing the process. The previous
    // disposition is restored on destruction; outside a prompt Ctrl-C keeps
    // its default behaviour.
    class InterruptGuard {
    public:
        InterruptGuard();
        ~InterruptGuard();

        InterruptGuard(const InterruptGuard&) = delete;
        InterruptGuard& operator=(const InterruptGuard&) = delete;

        // True if SIGINT arrived since this guard was armed.
        bool interrupted() const;

    private:
        struct sigaction m_previous{};
    };

    // Reads one line of an answer. End of input or Ctrl-C during the read
    // throws UserAbort.
    std::string read_answer(std::istream& in);

} // namespace am
