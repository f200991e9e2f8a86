//
// Created by cv2 on 10/19/26.
//

#include "libam/spinner.h"
#include "libam/logging.h"

#include <array>
#include <chrono>
#include <iostream>
#include <unistd.h>

namespace am {

    namespace {
        constexpr std::array<char, 4> kFrames = {'-', '\\', '|', '/'};
        constexpr auto kFrameDelay = std::chrono::milliseconds(100);

        std::atomic<int> g_active{0};

        bool stdout_is_terminal() {
            return isatty(STDOUT_FILENO) != 0;
        }
    }

    Spinner::Spinner(std::string message) : Spinner(std::move(message), stdout_is_terminal()) {}

    Spinner::Spinner(std::string message, bool animate) : m_message(std::move(message)) {
        if (!animate) {
            log::info(m_message);
            return;
        }

        m_running = true;
        ++g_active;
        m_thread = std::thread(&Spinner::run, this);
    }

    int Spinner::active_count() {
        return g_active.load();
    }

    Spinner::~Spinner() {
        stop();
    }

    void Spinner::stop() {
        {
            std::lock_guard lock(m_mutex);
            if (!m_running) return;
            m_running = false;
        }
        m_cv.notify_all();
        if (m_thread.joinable()) {
            m_thread.join();
            --g_active;
        }

        // Erase the spinner line entirely.
        std::lock_guard out_lock(log::output_mutex());
        std::cout << "\r\033[K" << std::flush;
        log::line_occupied() = false;
    }

    void Spinner::run() {
        size_t frame = 0;
        std::unique_lock lock(m_mutex);
        while (m_running) {
            {
                std::lock_guard out_lock(log::output_mutex());
                std::cout << "\r\033[K" << "\033[1;34m" << "[" << kFrames[frame % kFrames.size()] << "] > "
                          << "\033[0m" << m_message << std::flush;
                log::line_occupied() = true;
            }
            ++frame;
            m_cv.wait_for(lock, kFrameDelay, [this] { return !m_running.load(); });
        }
    }

} // namespace am
