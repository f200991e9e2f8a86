//
// Created by cv2 on 10/19/26.
//

#include "libam/config.h"
#include "libam/logging.h"
#include <cassert>
#include <filesystem>
#include <fstream>

const std::filesystem::path TEST_CONFIG_PATH = std::filesystem::temp_directory_path() / "aurman_test.conf";

void test_defaults() {
    am::log::info("Running test: Defaults for a missing file...");
    std::filesystem::remove(TEST_CONFIG_PATH);

    auto result = am::Config::load(TEST_CONFIG_PATH);
    assert(result.has_value());
    assert(result->su_program == "sudo");
    assert(!result->autorun);
    assert(result->aurman_path == "/tmp/aurman");
    assert(result->log_path == "/tmp/aurman.log");
    assert(result->rpc_url == "https://aur.archlinux.org/rpc");
    assert(result->aur_url == "https://aur.archlinux.org");
    assert(!result->review_pkgbuild);

    am::log::ok("Test Passed: Defaults for a missing file");
}

void test_overrides_from_file() {
    am::log::info("Running test: Overrides from a file...");
    {
        std::ofstream file(TEST_CONFIG_PATH);
        file << "general:\n"
             << "  su_program: doas\n"
             << "  autorun: true\n"
             << "  aurman_path: /var/tmp/aurman-build\n"
             << "install:\n"
             << "  review_pkgbuild: true\n";
    }

    auto result = am::Config::load(TEST_CONFIG_PATH);
    assert(result.has_value());
    assert(result->su_program == "doas");
    assert(result->autorun);
    assert(result->aurman_path == "/var/tmp/aurman-build");
    assert(result->review_pkgbuild);
    // Keys left out keep their defaults
    assert(result->log_path == "/tmp/aurman.log");
    assert(result->rpc_url == "https://aur.archlinux.org/rpc");

    std::filesystem::remove(TEST_CONFIG_PATH);
    am::log::ok("Test Passed: Overrides from a file");
}

void test_invalid_configs() {
    am::log::info("Running test: Invalid configurations...");

    auto malformed = am::Config::load_from_string("general: [unclosed");
    assert(!malformed.has_value());
    assert(malformed.error() == am::ConfigError::InvalidFormat);

    auto wrong_type = am::Config::load_from_string("general:\n  autorun: maybe\n");
    assert(!wrong_type.has_value());
    assert(wrong_type.error() == am::ConfigError::InvalidFormat);

    auto empty_su = am::Config::load_from_string("general:\n  su_program: \"\"\n");
    assert(!empty_su.has_value());
    assert(empty_su.error() == am::ConfigError::InvalidFormat);

    auto not_a_map = am::Config::load_from_string("- just\n- a list\n");
    assert(!not_a_map.has_value());

    auto empty = am::Config::load_from_string("");
    assert(empty.has_value());
    assert(empty->su_program == "sudo");

    am::log::ok("Test Passed: Invalid configurations");
}

void test_describe() {
    am::log::info("Running test: Configuration dump...");
    am::Config config;
    config.su_program = "doas";

    const std::string text = config.describe();
    assert(text.find("doas") != std::string::npos);
    assert(text.find("https://aur.archlinux.org/rpc") != std::string::npos);
    assert(text.find("[install]") != std::string::npos);

    am::log::ok("Test Passed: Configuration dump");
}

int main() {
    try {
        test_defaults();
        test_overrides_from_file();
        test_invalid_configs();
        test_describe();
    } catch (const std::exception& e) {
        am::log::error(std::string("A config test failed: ") + e.what());
        std::filesystem::remove(TEST_CONFIG_PATH);
        return 1;
    }

    am::log::ok("All config tests completed successfully!");
    return 0;
}
