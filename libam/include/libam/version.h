//
// Created by cv2 on 10/19/26.
//

#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace am {

    enum class VersionOrder {
        Less,
        Equal,
        Greater
    };

    enum class VersionError {
        ParseError
    };

    // A package version split as [epoch:]pkgver[-pkgrel].
    struct Version {
        std::string epoch = "0";
        std::string pkgver;
        std::optional<std::string> pkgrel;

        static std::expected<Version, VersionError> parse(std::string_view text);
    };

    // Compares two full version strings with pacman's vercmp ordering:
    // epoch, then pkgver segment by segment, then pkgrel when both have one.
    std::expected<VersionOrder, VersionError> compare_versions(std::string_view a, std::string_view b);

    // Segment comparison used for each EVR component. Returns -1, 0 or 1.
    int compare_segments(std::string_view a, std::string_view b);

    const char* to_string(VersionOrder order);

} // namespace am
