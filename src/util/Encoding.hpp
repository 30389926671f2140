#pragma once

#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace linetrack {

namespace Encoding {

/// Canonical text encoding of blob content handed to consumers
constexpr const char* UTF8 = "utf-8";

/// True for spellings of UTF-8 ("utf-8", "UTF8", ...)
bool isUtf8(const std::string& encoding);

/**
 * @brief Convert every line from `from` to UTF-8 using iconv
 * @return Converted lines, or EncodingError if the encoding is unknown or a
 *         line contains an invalid sequence
 */
Expected<std::vector<std::string>> toUtf8(const std::vector<std::string>& lines, const std::string& from);

}

}
