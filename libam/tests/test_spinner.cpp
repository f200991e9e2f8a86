//
// Created by cv2 on 10/19/26.
//

#include "libam/logging.h"
#include "libam/spinner.h"
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

// Sends std::cout into a buffer for the lifetime of the object.
class CapturedStdout {
public:
    CapturedStdout() : m_previous(std::cout.rdbuf(m_buffer.rdbuf())) {}
    ~CapturedStdout() { std::cout.rdbuf(m_previous); }

    std::string text() {
        std::lock_guard lock(am::log::output_mutex());
        return m_buffer.str();
    }

    // Waits until the spinner thread has drawn a frame showing the message.
    bool wait_for(const std::string& needle) {
        for (int i = 0; i < 200; ++i) {
            if (text().find(needle) != std::string::npos) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }

private:
    std::ostringstream m_buffer;
    std::streambuf* m_previous;
};

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void test_spinner_stops_on_exception() {
    am::log::info("Running test: Spinner stops when its scope throws...");

    std::string output;
    bool caught = false;
    {
        CapturedStdout captured;
        try {
            am::Spinner spinner("Resolving dependencies...", true);
            assert(spinner.is_running());
            assert(am::Spinner::active_count() == 1);
            assert(captured.wait_for("Resolving dependencies..."));
            throw std::runtime_error("lookup failed");
        } catch (const std::runtime_error&) {
            caught = true;
            assert(am::Spinner::active_count() == 0);
        }
        output = captured.text();
    }

    assert(caught);
    assert(am::Spinner::active_count() == 0);
    // The last thing written erases the indicator line
    assert(ends_with(output, "\r\033[K"));

    am::log::ok("Test Passed: Spinner stops when its scope throws");
}

void test_stop_is_idempotent() {
    am::log::info("Running test: Stopping a spinner twice...");

    {
        CapturedStdout captured;
        am::Spinner spinner("Working...", true);
        assert(captured.wait_for("Working..."));
        spinner.stop();
        assert(!spinner.is_running());
        assert(am::Spinner::active_count() == 0);
        spinner.stop();
        assert(!spinner.is_running());
    }

    // Without a terminal the message is logged once and no thread starts
    am::Spinner quiet("Not animated", false);
    assert(!quiet.is_running());
    assert(am::Spinner::active_count() == 0);
    quiet.stop();

    am::log::ok("Test Passed: Stopping a spinner twice");
}

void test_log_line_replaces_spinner_frame() {
    am::log::info("Running test: A log line replaces the spinner frame...");

    std::string output;
    {
        CapturedStdout captured;
        am::Spinner spinner("Fetching metadata...", true);
        assert(captured.wait_for("Fetching metadata..."));
        am::log::warn("mirror is slow");
        spinner.stop();
        output = captured.text();
    }

    const auto warning = output.find("\r\033[K\033[1;33m[  WRN  ] > \033[0mmirror is slow");
    assert(warning != std::string::npos);
    // The frame drawn before the warning is what got erased
    assert(output.rfind("Fetching metadata...", warning) != std::string::npos);

    am::log::ok("Test Passed: A log line replaces the spinner frame");
}

void test_plain_log_lines_untouched() {
    am::log::info("Running test: Log lines without a spinner...");

    std::string output;
    {
        CapturedStdout captured;
        am::log::ok("done");
        output = captured.text();
    }
    assert(output == "\033[1;32m[  OKY  ] > \033[0mdone\n");

    am::log::ok("Test Passed: Log lines without a spinner");
}

int main() {
    try {
        test_spinner_stops_on_exception();
        test_stop_is_idempotent();
        test_log_line_replaces_spinner_frame();
        test_plain_log_lines_untouched();
    } catch (const std::exception& e) {
        am::log::error(std::string("A spinner test failed: ") + e.what());
        return 1;
    }

    am::log::ok("All spinner tests completed successfully!");
    return 0;
}
