#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace linetrack {

/// Thrown for version strings that are not "major.minor.(patch|marker)"
class InvalidVersion : public std::invalid_argument {
public:
    explicit InvalidVersion(const std::string& version)
        : std::invalid_argument("Invalid git version: " + version) {}
};

/**
 * @brief Parsed "major.minor.patch" version used for feature gating
 *
 * A non-numeric third component (e.g. "2.20.GIT") is a development marker
 * and yields patch 0. Components after the third ("2.45.1.windows.1") are
 * ignored.
 */
struct Version {
    int major{0};
    int minor{0};
    int patch{0};

    /// Parse a version string; throws InvalidVersion on any other shape
    static Version parse(const std::string& version);

    /**
     * @brief Check "is at least min[0].min[1].min[2]"
     *
     * Comparison is lexicographic; components missing from `min` are
     * unconstrained, so {2} accepts any 2.x.y and {2,13} any 2.13.y or later.
     */
    bool atLeast(const std::vector<int>& min) const;

    std::string toString() const;
};

inline bool operator==(const Version& a, const Version& b) {
    return a.major == b.major && a.minor == b.minor && a.patch == b.patch;
}

}
