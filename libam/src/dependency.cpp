//
// Created by cv2 on 10/19/26.
//

#include "libam/dependency.h"

namespace am {

    static std::string_view trim(std::string_view s) {
        const auto first = s.find_first_not_of(" \t");
        if (first == std::string_view::npos) return {};
        const auto last = s.find_last_not_of(" \t");
        return s.substr(first, last - first + 1);
    }

    ParsedDependency parse_dependency_string(std::string_view depstring) {
        depstring = trim(depstring);

        ParsedDependency parsed;
        const auto pos = depstring.find_first_of("<>=");
        if (pos == std::string_view::npos) {
            parsed.name = std::string(depstring);
            return parsed;
        }

        parsed.name = std::string(trim(depstring.substr(0, pos)));

        std::string_view op = depstring.substr(pos);
        if (op.starts_with(">=")) {
            parsed.constraint = Constraint::Ge;
            op.remove_prefix(2);
        } else if (op.starts_with("<=")) {
            parsed.constraint = Constraint::Le;
            op.remove_prefix(2);
        } else if (op.starts_with('>')) {
            parsed.constraint = Constraint::Gt;
            op.remove_prefix(1);
        } else if (op.starts_with('<')) {
            parsed.constraint = Constraint::Lt;
            op.remove_prefix(1);
        } else {
            parsed.constraint = Constraint::Eq;
            op.remove_prefix(1);
        }
        parsed.version = std::string(trim(op));
        return parsed;
    }

    std::string strip_version_constraint(std::string_view depstring) {
        return parse_dependency_string(depstring).name;
    }

} // namespace am
