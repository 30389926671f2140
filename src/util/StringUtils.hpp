#pragma once

#include <string>
#include <vector>

namespace linetrack {

namespace StringUtils {

/// Split on every occurrence of `sep`, keeping empty fields
std::vector<std::string> split(const std::string& s, char sep);

/// Split on runs of spaces/tabs, dropping empty fields
std::vector<std::string> splitWhitespace(const std::string& s);

bool startsWith(const std::string& s, const std::string& prefix);

std::string trim(const std::string& s);

}

}
