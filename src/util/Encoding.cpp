#include "util/Encoding.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include <iconv.h>

namespace linetrack {

namespace Encoding {

namespace {

/// Owns an iconv descriptor for the duration of a conversion
class IconvHandle {
public:
    IconvHandle(const char* to, const char* from) : cd(iconv_open(to, from)) {}
    ~IconvHandle() {
        if (valid()) iconv_close(cd);
    }
    IconvHandle(const IconvHandle&) = delete;
    IconvHandle& operator=(const IconvHandle&) = delete;

    bool valid() const { return cd != reinterpret_cast<iconv_t>(-1); }
    iconv_t get() const { return cd; }

private:
    iconv_t cd;
};

Expected<std::string> convertLine(const IconvHandle& handle, const std::string& line) {
    // Reset shift state between lines
    iconv(handle.get(), nullptr, nullptr, nullptr, nullptr);

    std::string out;
    std::vector<char> in(line.begin(), line.end());
    char* inPtr = in.data();
    size_t inLeft = in.size();
    char buf[1024];

    while (inLeft > 0) {
        char* outPtr = buf;
        size_t outLeft = sizeof(buf);
        size_t rc = iconv(handle.get(), &inPtr, &inLeft, &outPtr, &outLeft);
        out.append(buf, sizeof(buf) - outLeft);
        if (rc == static_cast<size_t>(-1) && errno != E2BIG) {
            return Error{ErrorCode::EncodingError, std::string("iconv: ") + std::strerror(errno)};
        }
    }
    return out;
}

}

bool isUtf8(const std::string& encoding) {
    std::string norm;
    for (char c : encoding) {
        if (c == '-' || c == '_') continue;
        norm += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return norm == "utf8";
}

Expected<std::vector<std::string>> toUtf8(const std::vector<std::string>& lines, const std::string& from) {
    IconvHandle handle("UTF-8", from.c_str());
    if (!handle.valid()) {
        return Error{ErrorCode::EncodingError, "Unsupported encoding: " + from};
    }

    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const auto& line : lines) {
        auto converted = convertLine(handle, line);
        if (!converted) return converted.error();
        out.push_back(std::move(converted.value()));
    }
    return out;
}

}

}
