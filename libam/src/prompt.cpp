//
// Created by cv2 on 10/19/26.
//

#include "libam/prompt.h"
#include "libam/decisions.h"

namespace am {

    namespace {
        volatile std::sig_atomic_t g_interrupted = 0;

        void on_sigint(int) {
            g_interrupted = 1;
        }
    }

    InterruptGuard::InterruptGuard() {
        g_interrupted = 0;

        struct sigaction sa{};
        sa.sa_handler = on_sigint;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0; // no SA_RESTART
        sigaction(SIGINT, &sa, &m_previous);
    }

    InterruptGuard::~InterruptGuard() {
        sigaction(SIGINT, &m_previous, nullptr);
    }

    bool InterruptGuard::interrupted() const {
        return g_interrupted != 0;
    }

    std::string read_answer(std::istream& in) {
        InterruptGuard guard;
        std::string response;
        const bool got_line = static_cast<bool>(std::getline(in, response));
        if (!got_line || guard.interrupted()) {
            throw UserAbort();
        }
        return response;
    }

} // namespace am
