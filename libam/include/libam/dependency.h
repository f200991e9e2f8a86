//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <string>
#include <string_view>

namespace am {

    enum class Constraint {
        Any,
        Eq,
        Ge,
        Gt,
        Le,
        Lt
    };

    // A dependency string such as "foo>=1.2" split into its parts.
    // The constraint is only recorded; nothing enforces it.
    struct ParsedDependency {
        std::string name;
        Constraint constraint = Constraint::Any;
        std::string version;
    };

    ParsedDependency parse_dependency_string(std::string_view depstring);

    // The bare package name, e.g. "foo" for "foo>=1.2".
    std::string strip_version_constraint(std::string_view depstring);

} // namespace am
