//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <source_location> // C++20, but essential for good logging

namespace am::log {

    // Serializes everything written to the terminal, including the spinner.
    inline std::mutex& output_mutex() {
        static std::mutex mutex;
        return mutex;
    }

    // True while a spinner frame sits on the current terminal line.
    // Only touched with output_mutex() held.
    inline bool& line_occupied() {
        static bool occupied = false;
        return occupied;
    }

    inline std::ofstream& file_sink() {
        static std::ofstream sink;
        return sink;
    }

    // Mirrors every log line (without colors) into the given file, appending.
    // Returns false if the file could not be opened; console logging is unaffected.
    inline bool set_log_file(const std::filesystem::path& path) {
        std::lock_guard lock(output_mutex());
        auto& sink = file_sink();
        if (sink.is_open()) {
            sink.close();
        }
        sink.open(path, std::ios::app);
        return sink.is_open();
    }

    inline void write_to_file(const std::string& level, const std::string& msg) {
        auto& sink = file_sink();
        if (!sink.is_open()) return;

        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local_tm{};
        localtime_r(&now, &local_tm);
        sink << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << " [" << level << "] " << msg << '\n';
        sink.flush();
    }

    // Helper function to format the output consistently
    inline void print(const std::string& level, const std::string& color_code, const std::string& msg) {
        std::lock_guard lock(output_mutex());
        if (line_occupied()) {
            // Replace the spinner frame instead of appending to it
            std::cout << "\r\033[K";
            line_occupied() = false;
        }
        std::cout << color_code << "[  " << level << "  ] > " << "\033[0m" << msg << std::endl;
        write_to_file(level, msg);
    }

    inline void ok(const std::string& msg) {
        print("OKY", "\033[1;32m", msg); // Bold Green
    }

    inline void error(const std::string& msg, const std::source_location& loc = std::source_location::current()) {
        std::string full_msg = msg + " (at " + loc.file_name() + ":" + std::to_string(loc.line()) + ")";
        print("ERR", "\033[1;31m", full_msg); // Bold Red
    }

    inline void info(const std::string& msg) {
        print("LOG", "\033[1;34m", msg); // Bold Blue
    }

    inline void warn(const std::string& msg) {
        print("WRN", "\033[1;33m", msg); // Bold Yellow
    }

} // namespace am::log
