//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace am {

    // One record as returned by the AUR RPC interface.
    struct PackageMetadata {
        int64_t id = 0;
        std::string name;
        std::string description;
        std::string version;
        std::string maintainer;   // Empty for orphaned packages
        double popularity = 0.0;
        std::string package_base; // Name of the git repository holding the PKGBUILD
        std::string url;
        std::optional<int64_t> out_of_date; // Epoch seconds when flagged

        // --- Dependencies (constraints still attached, e.g. "foo>=1.2") ---
        std::vector<std::string> depends;
        std::vector<std::string> make_depends;
        std::vector<std::string> opt_depends;
        std::vector<std::string> check_depends;
    };

    // A package installed on the system that does not come from a native repository.
    struct InstalledRecord {
        std::string name;
        std::string version;
    };

    // The resolvable unit handed to the installer. Built by the
    // DependencyResolver, read-only afterwards.
    class PackageDescriptor {
    public:
        explicit PackageDescriptor(const PackageMetadata& metadata);

        const std::string& name() const { return m_name; }
        const std::string& version() const { return m_version; }
        const std::string& base_name() const { return m_base_name; }

        // The record this descriptor was built from.
        const PackageMetadata& metadata() const { return m_metadata; }

        const std::vector<std::string>& run_dependencies() const { return m_run_dependencies; }
        const std::vector<std::string>& build_dependencies() const { return m_build_dependencies; }
        const std::vector<std::string>& check_dependencies() const { return m_check_dependencies; }

        // Direct dependencies that are not provided by the native repositories.
        const std::vector<PackageDescriptor>& resolved_aur_dependencies() const { return m_resolved_aur_dependencies; }

        // AUR-only dependency names the remote index did not know about.
        const std::vector<std::string>& missing_dependencies() const { return m_missing_dependencies; }

        bool is_resolved() const { return m_resolved; }

        // Run, build and check dependencies in declaration order.
        std::vector<std::string> all_dependencies() const;

        // The flattened installation plan for this package's AUR dependencies.
        // Leaf-first: each dependency is preceded by its own AUR dependencies.
        std::vector<PackageDescriptor> aur_dependencies() const;

        // Every missing name in the subtree, in plan order.
        std::vector<std::string> all_missing_dependencies() const;

    private:
        friend class DependencyResolver;

        PackageMetadata m_metadata;
        std::string m_name;
        std::string m_version;
        std::string m_base_name;
        std::vector<std::string> m_run_dependencies;
        std::vector<std::string> m_build_dependencies;
        std::vector<std::string> m_check_dependencies;

        std::vector<PackageDescriptor> m_resolved_aur_dependencies;
        std::vector<std::string> m_missing_dependencies;
        bool m_resolved = false;
    };

    // Most popular first, as search results are presented.
    void sort_by_popularity(std::vector<PackageMetadata>& packages);

} // namespace am
