//
// Created by cv2 on 10/19/26.
//

#include "libam/dependency_resolver.h"
#include "libam/dependency.h"
#include "libam/logging.h"

#include <algorithm>
#include <map>

namespace am {

    DependencyResolver::DependencyResolver(NativeGateway& native, RemoteIndex& remote)
            : m_native(native), m_remote(remote) {}

    std::expected<PackageDescriptor, ResolveError> DependencyResolver::resolve(const std::string& package_name,
                                                                               ResolveMode mode) {
        auto lookup = m_remote.batch_info({package_name});
        if (!lookup) {
            return std::unexpected(ResolveError::RemoteFailure);
        }

        auto it = std::find_if(lookup->begin(), lookup->end(),
                               [&](const auto& p) { return p.name == package_name; });
        if (it == lookup->end()) {
            log::warn("Package '" + package_name + "' was not found in the AUR.");
            return std::unexpected(ResolveError::PackageNotFound);
        }

        return describe(*it, mode);
    }

    std::expected<PackageDescriptor, ResolveError> DependencyResolver::describe(const PackageMetadata& metadata,
                                                                                ResolveMode mode) {
        PackageDescriptor root(metadata);
        if (mode == ResolveMode::Deferred) {
            return root;
        }

        m_last_cycle.clear();
        std::vector<std::string> path;  // Current DFS stack, for reporting cycles
        std::set<std::string> visiting; // Gray set: for detecting cycles
        std::set<std::string> visited;  // Black set: resolved once, never planned twice

        auto result = dfs_visit(root, path, visiting, visited);
        if (!result) {
            return std::unexpected(result.error());
        }
        return root;
    }

// The recursive DFS helper function.
    std::expected<void, ResolveError> DependencyResolver::dfs_visit(
            PackageDescriptor& node,
            std::vector<std::string>& path,
            std::set<std::string>& visiting,
            std::set<std::string>& visited)
    {
        visiting.insert(node.name());
        path.push_back(node.name());

        // --- STEP 1: Filter out what the native repositories already satisfy ---
        std::vector<std::string> aur_names;
        std::set<std::string> seen;
        for (const auto& depstring : node.all_dependencies()) {
            std::string dep_name = strip_version_constraint(depstring);
            if (dep_name.empty() || !seen.insert(dep_name).second) {
                continue;
            }
            if (visited.count(dep_name)) {
                continue; // Already resolved in another branch
            }
            if (m_native.is_available(dep_name)) {
                continue;
            }
            if (visiting.count(dep_name)) {
                m_last_cycle.assign(std::find(path.begin(), path.end(), dep_name), path.end());
                m_last_cycle.push_back(dep_name);
                std::string chain;
                for (const auto& n : m_last_cycle) {
                    chain += chain.empty() ? n : " -> " + n;
                }
                log::error("Circular dependency detected: " + chain);
                return std::unexpected(ResolveError::CircularDependency);
            }
            aur_names.push_back(std::move(dep_name));
        }

        // --- STEP 2: One batched lookup for the remaining names ---
        if (!aur_names.empty()) {
            auto lookup = m_remote.batch_info(std::set<std::string>(aur_names.begin(), aur_names.end()));
            if (!lookup) {
                return std::unexpected(ResolveError::RemoteFailure);
            }

            std::map<std::string, const PackageMetadata*> by_name;
            for (const auto& meta : *lookup) {
                by_name[meta.name] = &meta;
            }

            // --- STEP 3: Recurse, keeping declaration order ---
            for (const auto& dep_name : aur_names) {
                if (visited.count(dep_name)) {
                    continue; // Pulled in by an earlier sibling's subtree
                }

                auto found = by_name.find(dep_name);
                if (found == by_name.end()) {
                    log::warn("Dependency '" + dep_name + "' of '" + node.name() +
                              "' is neither in the native repositories nor in the AUR.");
                    node.m_missing_dependencies.push_back(dep_name);
                    continue;
                }

                PackageDescriptor child(*found->second);
                auto result = dfs_visit(child, path, visiting, visited);
                if (!result) {
                    return result;
                }
                node.m_resolved_aur_dependencies.push_back(std::move(child));
            }
        }

        node.m_resolved = true;
        path.pop_back();
        visiting.erase(node.name());
        visited.insert(node.name());
        return {};
    }

} // namespace am
