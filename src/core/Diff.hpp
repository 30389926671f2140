#pragma once

#include <string>
#include <vector>

#include "core/Git.hpp"
#include "core/Hunks.hpp"
#include "util/Expected.hpp"

namespace linetrack {

namespace Diff {

/**
 * @brief Compute zero-context hunks turning `oldLines` into `newLines`
 *
 * Both texts are written to temporary files and compared with
 * `git diff --no-index --patch-with-raw --unified=0`, honouring the
 * configured diff algorithm and indent heuristic.
 */
Expected<std::vector<Hunk>> run(const Git& git, const std::vector<std::string>& oldLines,
                                const std::vector<std::string>& newLines);

}

}
