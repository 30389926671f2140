#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "cli/ICommand.hpp"
#include "core/FileObject.hpp"

namespace linetrack {

namespace CommandSupport {

/// Attach to the file named on the command line (relative to cwd)
Expected<FileObject> attachFile(const AppContext& ctx, const std::string& arg);

/// Read a file as lines, keeping CRs, without a trailing empty line
Expected<std::vector<std::string>> readLines(const std::filesystem::path& path);

/// Parse a positive line number argument
Expected<int> parseLineNumber(const std::string& arg);

}

}
