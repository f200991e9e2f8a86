//
// Created by cv2 on 10/19/26.
//

#include "libam/version.h"

#include <algorithm>
#include <cctype>

namespace am {

    static bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }
    static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
    static bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }

    std::expected<Version, VersionError> Version::parse(std::string_view text) {
        if (text.empty()) {
            return std::unexpected(VersionError::ParseError);
        }
        for (char c : text) {
            auto uc = static_cast<unsigned char>(c);
            if (std::isspace(uc) || std::iscntrl(uc)) {
                return std::unexpected(VersionError::ParseError);
            }
        }

        Version version;
        std::string_view rest = text;

        // Epoch: leading digits terminated by ':'
        if (auto colon = rest.find(':'); colon != std::string_view::npos) {
            std::string_view epoch = rest.substr(0, colon);
            if (epoch.empty() || !std::all_of(epoch.begin(), epoch.end(), is_digit)) {
                return std::unexpected(VersionError::ParseError);
            }
            version.epoch = std::string(epoch);
            rest.remove_prefix(colon + 1);
            if (rest.find(':') != std::string_view::npos) {
                return std::unexpected(VersionError::ParseError);
            }
        }

        // Release: everything after the last '-'
        if (auto dash = rest.rfind('-'); dash != std::string_view::npos) {
            std::string_view rel = rest.substr(dash + 1);
            if (rel.empty()) {
                return std::unexpected(VersionError::ParseError);
            }
            version.pkgrel = std::string(rel);
            rest = rest.substr(0, dash);
        }

        if (rest.empty() || rest.find('-') != std::string_view::npos) {
            return std::unexpected(VersionError::ParseError);
        }
        version.pkgver = std::string(rest);
        return version;
    }

    int compare_segments(std::string_view a, std::string_view b) {
        if (a == b) return 0;

        size_t i = 0;
        size_t j = 0;
        while (i < a.size() && j < b.size()) {
            size_t sep_start_a = i;
            size_t sep_start_b = j;
            while (i < a.size() && !is_alnum(a[i])) ++i;
            while (j < b.size() && !is_alnum(b[j])) ++j;

            if (i >= a.size() || j >= b.size()) break;

            // Differing amounts of separators: the side with more is newer.
            if ((i - sep_start_a) != (j - sep_start_b)) {
                return (i - sep_start_a) < (j - sep_start_b) ? -1 : 1;
            }

            size_t seg_start_a = i;
            size_t seg_start_b = j;
            const bool numeric = is_digit(a[i]);
            if (numeric) {
                while (i < a.size() && is_digit(a[i])) ++i;
                while (j < b.size() && is_digit(b[j])) ++j;
            } else {
                while (i < a.size() && is_alpha(a[i])) ++i;
                while (j < b.size() && is_alpha(b[j])) ++j;
            }

            std::string_view seg_a = a.substr(seg_start_a, i - seg_start_a);
            std::string_view seg_b = b.substr(seg_start_b, j - seg_start_b);

            // Segments of different types: numeric is always newer than alpha.
            if (seg_b.empty()) {
                return numeric ? 1 : -1;
            }

            if (numeric) {
                seg_a.remove_prefix(std::min(seg_a.find_first_not_of('0'), seg_a.size()));
                seg_b.remove_prefix(std::min(seg_b.find_first_not_of('0'), seg_b.size()));
                if (seg_a.size() != seg_b.size()) {
                    return seg_a.size() > seg_b.size() ? 1 : -1;
                }
            }

            if (int rc = seg_a.compare(seg_b); rc != 0) {
                return rc < 0 ? -1 : 1;
            }
        }

        if (i >= a.size() && j >= b.size()) return 0;

        // A remaining alpha segment never beats an empty string:
        // "1.0rc1" < "1.0", but "1.0.1" > "1.0".
        const bool a_done = i >= a.size();
        if ((a_done && !is_alpha(b[j])) || (!a_done && is_alpha(a[i]))) {
            return -1;
        }
        return 1;
    }

    static VersionOrder to_order(int rc) {
        if (rc < 0) return VersionOrder::Less;
        if (rc > 0) return VersionOrder::Greater;
        return VersionOrder::Equal;
    }

    std::expected<VersionOrder, VersionError> compare_versions(std::string_view a, std::string_view b) {
        auto va = Version::parse(a);
        if (!va) return std::unexpected(va.error());
        auto vb = Version::parse(b);
        if (!vb) return std::unexpected(vb.error());

        if (int rc = compare_segments(va->epoch, vb->epoch); rc != 0) {
            return to_order(rc);
        }
        if (int rc = compare_segments(va->pkgver, vb->pkgver); rc != 0) {
            return to_order(rc);
        }
        if (va->pkgrel && vb->pkgrel) {
            return to_order(compare_segments(*va->pkgrel, *vb->pkgrel));
        }
        return VersionOrder::Equal;
    }

    const char* to_string(VersionOrder order) {
        switch (order) {
            case VersionOrder::Less: return "older";
            case VersionOrder::Equal: return "equal";
            case VersionOrder::Greater: return "newer";
        }
        return "unknown";
    }

} // namespace am
