//
// Created by cv2 on 10/19/26.
//

#include "libam/package.h"

#include <algorithm>

namespace am {

    PackageDescriptor::PackageDescriptor(const PackageMetadata& metadata)
            : m_metadata(metadata),
              m_name(metadata.name),
              m_version(metadata.version),
              m_base_name(metadata.package_base.empty() ? metadata.name : metadata.package_base),
              m_run_dependencies(metadata.depends),
              m_build_dependencies(metadata.make_depends),
              m_check_dependencies(metadata.check_depends)
    {}

    std::vector<std::string> PackageDescriptor::all_dependencies() const {
        std::vector<std::string> all;
        all.reserve(m_run_dependencies.size() + m_build_dependencies.size() + m_check_dependencies.size());
        all.insert(all.end(), m_run_dependencies.begin(), m_run_dependencies.end());
        all.insert(all.end(), m_build_dependencies.begin(), m_build_dependencies.end());
        all.insert(all.end(), m_check_dependencies.begin(), m_check_dependencies.end());
        return all;
    }

    std::vector<PackageDescriptor> PackageDescriptor::aur_dependencies() const {
        std::vector<PackageDescriptor> plan;
        for (const auto& dep : m_resolved_aur_dependencies) {
            auto nested = dep.aur_dependencies();
            plan.insert(plan.end(), std::make_move_iterator(nested.begin()), std::make_move_iterator(nested.end()));
            plan.push_back(dep);
        }
        return plan;
    }

    std::vector<std::string> PackageDescriptor::all_missing_dependencies() const {
        std::vector<std::string> missing;
        for (const auto& dep : m_resolved_aur_dependencies) {
            auto nested = dep.all_missing_dependencies();
            missing.insert(missing.end(), nested.begin(), nested.end());
        }
        missing.insert(missing.end(), m_missing_dependencies.begin(), m_missing_dependencies.end());
        return missing;
    }

    void sort_by_popularity(std::vector<PackageMetadata>& packages) {
        std::stable_sort(packages.begin(), packages.end(),
                         [](const auto& a, const auto& b) { return a.popularity > b.popularity; });
    }

} // namespace am
