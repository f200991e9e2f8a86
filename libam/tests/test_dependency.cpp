//
// Created by cv2 on 10/19/26.
//

#include "libam/dependency.h"
#include "libam/logging.h"
#include "libam/native_gateway.h"
#include <cassert>

void test_strip_constraint() {
    am::log::info("Running test: Strip version constraints...");

    assert(am::strip_version_constraint("foo>=1.2") == "foo");
    assert(am::strip_version_constraint("foo") == "foo");
    assert(am::strip_version_constraint("lib32-glibc<2.40") == "lib32-glibc");
    assert(am::strip_version_constraint("python=3.12") == "python");
    assert(am::strip_version_constraint("  gtk+ > 3  ") == "gtk+");

    am::log::ok("Test Passed: Strip version constraints");
}

void test_parse_constraint() {
    am::log::info("Running test: Parse constraints...");

    auto ge = am::parse_dependency_string("foo>=1.2");
    assert(ge.name == "foo");
    assert(ge.constraint == am::Constraint::Ge);
    assert(ge.version == "1.2");

    auto lt = am::parse_dependency_string("bar<2:1.0-1");
    assert(lt.constraint == am::Constraint::Lt);
    assert(lt.version == "2:1.0-1");

    auto eq = am::parse_dependency_string("baz=3");
    assert(eq.constraint == am::Constraint::Eq);

    auto any = am::parse_dependency_string("qux");
    assert(any.constraint == am::Constraint::Any);
    assert(any.version.empty());

    am::log::ok("Test Passed: Parse constraints");
}

void test_pacman_helpers() {
    am::log::info("Running test: pacman output helpers...");

    assert(am::escape_regex("gtk+") == "gtk\\+");
    assert(am::escape_regex("c++-utils") == "c\\+\\+-utils");
    assert(am::escape_regex("plain") == "plain");

    auto records = am::parse_query_output("yay 12.3.5-1\nparu-bin 2.0.3-1\n\nbroken\n");
    assert(records.size() == 2);
    assert(records[0].name == "yay");
    assert(records[0].version == "12.3.5-1");
    assert(records[1].name == "paru-bin");
    assert(records[1].version == "2.0.3-1");

    am::log::ok("Test Passed: pacman output helpers");
}

void test_foreign_query_results() {
    am::log::info("Running test: Interpreting pacman -Qm...");

    auto listed = am::parse_foreign_query(0, "yay 12.3.5-1\n");
    assert(listed.has_value());
    assert(listed->size() == 1);
    assert((*listed)[0].name == "yay");

    // pacman -Qm exits 1 without output when nothing is foreign
    auto none = am::parse_foreign_query(1, "");
    assert(none.has_value());
    assert(none->empty());

    // A locked or broken database is not "nothing installed"
    auto failed = am::parse_foreign_query(1, "yay 12.3.5-1\n");
    assert(!failed.has_value());
    assert(failed.error() == am::NativeError::QueryFailed);

    auto crashed = am::parse_foreign_query(127, "");
    assert(!crashed.has_value());
    assert(crashed.error() == am::NativeError::QueryFailed);

    am::log::ok("Test Passed: Interpreting pacman -Qm");
}

int main() {
    try {
        test_strip_constraint();
        test_parse_constraint();
        test_pacman_helpers();
        test_foreign_query_results();
    } catch (const std::exception& e) {
        am::log::error(std::string("A dependency string test failed: ") + e.what());
        return 1;
    }

    am::log::ok("All dependency string tests completed successfully!");
    return 0;
}
