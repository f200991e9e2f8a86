//
// Created by cv2 on 10/19/26.
//

#pragma once

#include "native_gateway.h"
#include "package.h"
#include "remote_index.h"

#include <expected>
#include <set>
#include <string>
#include <vector>

namespace am {

    enum class ResolveError {
        PackageNotFound,
        RemoteFailure,
        CircularDependency
    };

    enum class ResolveMode {
        Eager,   // Resolve the whole AUR dependency subtree now
        Deferred // Metadata only, for search and list views
    };

    using ResolutionPlan = std::vector<PackageDescriptor>;

    class DependencyResolver {
    public:
        DependencyResolver(NativeGateway& native, RemoteIndex& remote);

        // Looks the package up by exact name and builds its descriptor.
        std::expected<PackageDescriptor, ResolveError> resolve(const std::string& package_name,
                                                               ResolveMode mode = ResolveMode::Eager);

        // Builds a descriptor from a record that was already fetched.
        std::expected<PackageDescriptor, ResolveError> describe(const PackageMetadata& metadata,
                                                                ResolveMode mode = ResolveMode::Eager);

        // Names forming the cycle reported by the last CircularDependency error.
        const std::vector<std::string>& last_cycle() const { return m_last_cycle; }

    private:
        std::expected<void, ResolveError> dfs_visit(
                PackageDescriptor& node,
                std::vector<std::string>& path,
                std::set<std::string>& visiting,
                std::set<std::string>& visited
        );

        NativeGateway& m_native;
        RemoteIndex& m_remote;
        std::vector<std::string> m_last_cycle;
    };

} // namespace am
