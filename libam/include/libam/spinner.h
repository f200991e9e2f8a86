//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace am {

    // An indeterminate progress indicator drawn on its own thread while a
    // blocking operation runs. Only animates when stdout is a terminal.
    // The destructor always stops the thread and erases the indicator, so a
    // scope that throws leaves the terminal clean.
    class Spinner {
    public:
        explicit Spinner(std::string message);
        // Animates regardless of what stdout is connected to when animate is true.
        Spinner(std::string message, bool animate);
        ~Spinner();

        Spinner(const Spinner&) = delete;
        Spinner& operator=(const Spinner&) = delete;

        // Stops the animation early. Safe to call more than once.
        void stop();

        bool is_running() const { return m_running.load(); }

        // Number of spinner threads currently alive in the process.
        static int active_count();

    private:
        void run();

        std::string m_message;
        std::atomic<bool> m_running{false};
        std::mutex m_mutex;
        std::condition_variable m_cv;
        std::thread m_thread;
    };

} // namespace am
