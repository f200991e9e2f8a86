//
// Created by cv2 on 10/19/26.
//

#include "fakes.h"
#include "libam/config.h"
#include "libam/installer.h"
#include "libam/logging.h"
#include <cassert>
#include <filesystem>
#include <vector>

const std::filesystem::path TEST_SCRATCH_ROOT = std::filesystem::temp_directory_path() / "aurman_installer_test";

// Everything an Installer needs, wired to fakes.
struct Harness {
    am::Config config;
    FakeNativeGateway native;
    FakeRemoteIndex remote;
    FakeBuildTool build_tool;
    ScriptedDecisions decisions;
    am::Installer installer;

    Harness() : installer(config, native, remote, build_tool, decisions) {
        config.aurman_path = TEST_SCRATCH_ROOT;
        std::filesystem::remove_all(TEST_SCRATCH_ROOT);
    }
};

void test_installs_dependencies_leaf_first() {
    am::log::info("Running test: Dependencies are built before their dependents");
    Harness h;
    h.native.repository = {"glibc"};
    h.remote.add(make_package("libA", "1.0-1", {"glibc"}));
    h.remote.add(make_package("libB", "1.0-1", {"libA"}));
    h.remote.add(make_package("app", "2.0-1", {"libB", "glibc"}));

    auto result = h.installer.install("app");
    assert(result.has_value());
    assert((h.build_tool.build_calls == std::vector<std::string>{"libA", "libB", "app"}));
    assert((h.build_tool.build_as_dependency == std::vector<bool>{true, true, false}));

    // One confirmation covers the root and its plan
    assert(h.decisions.questions.size() == 1);
    assert(h.installer.handled().count("libA") && h.installer.handled().count("app"));

    // Scratch directories are gone once the run is over
    for (const auto& dir : h.build_tool.build_dirs) {
        assert(!std::filesystem::exists(dir));
    }

    am::log::ok("Test Passed: Dependencies are built before their dependents");
}

void test_skips_up_to_date_package() {
    am::log::info("Running test: Installed version newer than the AUR's");
    Harness h;
    h.native.installed["p"] = "2.0-1";
    h.remote.add(make_package("p", "1.9-1", {"libp"}));
    h.remote.add(make_package("libp", "1.0-1"));

    auto result = h.installer.install("p");
    assert(result.has_value());
    assert(h.build_tool.clone_calls.empty());
    assert(h.build_tool.build_calls.empty());
    assert(h.decisions.questions.empty());
    // Only the package itself was looked up; its dependency tree never was
    assert(h.remote.info_requests.size() == 1);
    assert(!h.remote.was_requested("libp"));

    // --force rebuilds anyway
    am::InstallOptions force;
    force.force = true;
    am::Installer fresh(h.config, h.native, h.remote, h.build_tool, h.decisions);
    assert(fresh.install("p", force).has_value());
    assert((h.build_tool.build_calls == std::vector<std::string>{"libp", "p"}));

    am::log::ok("Test Passed: Installed version newer than the AUR's");
}

void test_build_failure_cleans_up() {
    am::log::info("Running test: Build failure");
    Harness h;
    h.remote.add(make_package("p", "1.0-1"));
    h.build_tool.failing_builds = {"p"};

    auto result = h.installer.install("p");
    assert(!result.has_value());
    assert(result.error() == am::InstallError::BuildFailed);

    assert(h.build_tool.clone_calls.size() == 1);
    assert(!std::filesystem::exists(h.installer.scratch_directory("p")));
    assert(h.native.install_calls.empty());
    assert(h.native.remove_calls.empty());
    assert(!h.installer.handled().count("p"));

    am::log::ok("Test Passed: Build failure");
}

void test_stale_scratch_directory_is_replaced() {
    am::log::info("Running test: Stale scratch directory");
    Harness h;
    h.remote.add(make_package("p", "1.0-1"));

    const auto stale = h.installer.scratch_directory("p");
    std::filesystem::create_directories(stale / "src");
    std::ofstream(stale / "leftover.tar") << "old";

    auto result = h.installer.install("p");
    assert(result.has_value());
    assert(!std::filesystem::exists(stale));

    am::log::ok("Test Passed: Stale scratch directory");
}

void test_failed_dependency_aborts_parent() {
    am::log::info("Running test: Unknown dependency with the search declined");
    Harness h;
    h.remote.add(make_package("p", "1.0-1", {"q"}));
    // Yes to "Continue installation of p?", no to "Search q on AUR?"
    h.decisions.answers = {true, false};

    auto result = h.installer.install("p");
    assert(!result.has_value());
    assert(result.error() == am::InstallError::DependencyFailed);
    assert(h.build_tool.clone_calls.empty());
    assert(h.decisions.selections_offered == 0);

    am::log::ok("Test Passed: Unknown dependency with the search declined");
}

void test_dependency_build_failure_aborts_parent() {
    am::log::info("Running test: Dependency build failure");
    Harness h;
    h.remote.add(make_package("dep", "1.0-1"));
    h.remote.add(make_package("p", "1.0-1", {"dep"}));
    h.build_tool.failing_builds = {"dep"};

    auto result = h.installer.install("p");
    assert(!result.has_value());
    assert(result.error() == am::InstallError::DependencyFailed);
    assert((h.build_tool.clone_calls == std::vector<std::string>{"dep"}));

    am::log::ok("Test Passed: Dependency build failure");
}

void test_native_root_never_queries_remote() {
    am::log::info("Running test: Natively available root");
    Harness h;
    h.native.repository = {"firefox"};

    auto result = h.installer.install("firefox");
    assert(result.has_value());
    assert((h.native.install_calls == std::vector<std::string>{"firefox"}));
    assert(h.remote.info_requests.empty());
    assert(h.remote.search_requests.empty());
    assert(h.build_tool.clone_calls.empty());

    am::log::ok("Test Passed: Natively available root");
}

void test_search_fallback_selects_package() {
    am::log::info("Running test: Search fallback");
    Harness h;
    auto pkg = make_package("spotify-launcher", "0.5-1", {"libX"});
    pkg.popularity = 10.0;
    h.remote.add(pkg);
    h.remote.add(make_package("libX", "1.0-1"));
    h.decisions.selection = "spotify-launcher";

    auto result = h.installer.install("spotify");
    assert(result.has_value());
    assert((h.remote.search_requests == std::vector<std::string>{"spotify"}));
    assert(h.decisions.selections_offered == 1);
    // The full record of the selection is fetched, so its dependencies are built too
    assert((h.build_tool.build_calls == std::vector<std::string>{"libX", "spotify-launcher"}));

    am::log::ok("Test Passed: Search fallback");
}

void test_autorun_never_searches() {
    am::log::info("Running test: Autorun and unknown packages");
    Harness h;
    h.config.autorun = true;
    h.remote.add(make_package("something-else", "1.0-1"));

    auto result = h.installer.install("something");
    assert(!result.has_value());
    assert(result.error() == am::InstallError::PackageNotFound);
    assert(h.remote.search_requests.empty());
    assert(h.decisions.questions.empty());

    am::log::ok("Test Passed: Autorun and unknown packages");
}

void test_declined_installation() {
    am::log::info("Running test: Declined installation");
    Harness h;
    h.remote.add(make_package("p", "1.0-1"));
    h.decisions.default_answer = false;

    auto result = h.installer.install("p");
    assert(!result.has_value());
    assert(result.error() == am::InstallError::Declined);
    assert(h.build_tool.clone_calls.empty());

    am::log::ok("Test Passed: Declined installation");
}

void test_review_build_script() {
    am::log::info("Running test: Build script review");
    Harness h;
    h.config.review_pkgbuild = true;
    h.remote.add(make_package("p", "1.0-1"));
    // Yes to the installation, no after reading the PKGBUILD
    h.decisions.answers = {true, false};

    auto result = h.installer.install("p");
    assert(!result.has_value());
    assert(result.error() == am::InstallError::Declined);
    assert((h.decisions.shown_scripts == std::vector<std::string>{"p"}));
    assert(h.build_tool.build_calls.empty());
    assert(!std::filesystem::exists(h.installer.scratch_directory("p")));

    am::log::ok("Test Passed: Build script review");
}

void test_interrupt_during_review_cleans_up() {
    am::log::info("Running test: Interrupt while reviewing the build script");
    Harness h;
    h.config.review_pkgbuild = true;
    h.remote.add(make_package("p", "1.0-1"));
    // Yes to the installation, then Ctrl-C at "Proceed with building?"
    h.decisions.answers = {true};
    h.decisions.abort_at_question = 2;

    bool aborted = false;
    try {
        auto result = h.installer.install("p");
        (void)result;
    } catch (const am::UserAbort&) {
        aborted = true;
    }
    assert(aborted);
    assert(h.decisions.questions.size() == 2);
    assert((h.build_tool.clone_calls == std::vector<std::string>{"p"}));
    assert(h.build_tool.build_calls.empty());
    assert(h.native.install_calls.empty());
    assert(!std::filesystem::exists(h.installer.scratch_directory("p")));
    assert(!h.installer.handled().count("p"));

    // The aborted attempt leaves nothing behind that blocks a retry
    h.decisions.abort_at_question = 0;
    auto retry = h.installer.install("p");
    assert(retry.has_value());
    assert((h.build_tool.build_calls == std::vector<std::string>{"p"}));

    am::log::ok("Test Passed: Interrupt while reviewing the build script");
}

void test_unparseable_installed_version() {
    am::log::info("Running test: Unparseable installed version");
    Harness h;
    h.native.installed["p"] = "not a version";
    h.remote.add(make_package("p", "1.0-1"));

    auto result = h.installer.install("p");
    assert(!result.has_value());
    assert(result.error() == am::InstallError::VersionParseFailed);
    assert(h.build_tool.clone_calls.empty());

    am::log::ok("Test Passed: Unparseable installed version");
}

void test_remote_failure() {
    am::log::info("Running test: Remote failure");
    Harness h;
    h.remote.fail = true;

    auto result = h.installer.install("p");
    assert(!result.has_value());
    assert(result.error() == am::InstallError::RemoteConnectionFailed);

    am::log::ok("Test Passed: Remote failure");
}

void test_remove() {
    am::log::info("Running test: Remove");
    Harness h;
    h.native.installed["p"] = "1.0-1";

    assert(h.installer.remove("p").has_value());
    assert((h.native.remove_calls == std::vector<std::string>{"p"}));

    auto missing = h.installer.remove("p");
    assert(!missing.has_value());
    assert(missing.error() == am::InstallError::PackageNotFound);
    assert(h.native.remove_calls.size() == 1);

    am::log::ok("Test Passed: Remove");
}

int main() {
    try {
        test_installs_dependencies_leaf_first();
        test_skips_up_to_date_package();
        test_build_failure_cleans_up();
        test_stale_scratch_directory_is_replaced();
        test_failed_dependency_aborts_parent();
        test_dependency_build_failure_aborts_parent();
        test_native_root_never_queries_remote();
        test_search_fallback_selects_package();
        test_autorun_never_searches();
        test_declined_installation();
        test_review_build_script();
        test_interrupt_during_review_cleans_up();
        test_unparseable_installed_version();
        test_remote_failure();
        test_remove();
    } catch (const std::exception& e) {
        am::log::error(std::string("An installer test failed: ") + e.what());
        std::filesystem::remove_all(TEST_SCRATCH_ROOT);
        return 1;
    }

    std::filesystem::remove_all(TEST_SCRATCH_ROOT);
    am::log::ok("All installer tests completed successfully!");
    return 0;
}
