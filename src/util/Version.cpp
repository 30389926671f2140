#include "util/Version.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace linetrack {

namespace {

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

bool allAlnum(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](char c) { return std::isalnum(static_cast<unsigned char>(c)); });
}

int toInt(const std::string& s, const std::string& version) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        throw InvalidVersion(version);
    }
}

}

Version Version::parse(const std::string& version) {
    std::vector<std::string> parts;
    std::stringstream ss(version);
    std::string part;
    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }
    if (parts.size() < 3 || !allDigits(parts[0]) || !allDigits(parts[1]) || !allAlnum(parts[2])) {
        throw InvalidVersion(version);
    }

    Version v;
    v.major = toInt(parts[0], version);
    v.minor = toInt(parts[1], version);
    v.patch = allDigits(parts[2]) ? toInt(parts[2], version) : 0;
    return v;
}

bool Version::atLeast(const std::vector<int>& min) const {
    if (min.empty()) return true;
    if (major != min[0]) return major > min[0];
    if (min.size() < 2) return true;
    if (minor != min[1]) return minor > min[1];
    if (min.size() < 3) return true;
    return patch >= min[2];
}

std::string Version::toString() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

}
