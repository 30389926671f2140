#include "cli/CommandSupport.hpp"

#include <fstream>
#include <sstream>

#include "core/CommandRunner.hpp"
#include "util/Encoding.hpp"

namespace fs = std::filesystem;

namespace linetrack {

namespace CommandSupport {

Expected<FileObject> attachFile(const AppContext& ctx, const std::string& arg) {
    if (!ctx.repos) {
        return Error{ErrorCode::InternalError, "No repository cache configured"};
    }
    std::error_code ec;
    fs::path abs = fs::absolute(arg, ec);
    if (ec) {
        return Error{ErrorCode::InvalidArgs, "Invalid path: " + arg};
    }
    return FileObject::open(abs.lexically_normal(), Encoding::UTF8, *ctx.repos);
}

Expected<std::vector<std::string>> readLines(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Cannot read " + path.string()};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return splitOutputLines(buffer.str());
}

Expected<int> parseLineNumber(const std::string& arg) {
    size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(arg, &used);
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgs, "Invalid line number: " + arg};
    }
    if (used != arg.size() || n <= 0) {
        return Error{ErrorCode::InvalidArgs, "Invalid line number: " + arg};
    }
    return n;
}

}

}
