#pragma once

#include <optional>
#include <string>
#include <vector>

namespace linetrack {

enum class HunkType { Add, Change, Delete };

/// One side of a hunk: 1-based start, line count and literal text
struct HunkRange {
    int start{0};
    int count{0};
    std::vector<std::string> lines;
};

/**
 * @brief Contiguous change between an old and a new text
 *
 * Positions follow zero-context unified diff conventions: a side with
 * count 0 has `start` pointing at the line after which the change sits.
 */
struct Hunk {
    HunkType type{HunkType::Change};
    std::string head;
    HunkRange removed;
    HunkRange added;
};

namespace Hunks {

/// Build a hunk, deriving its type from the counts
Hunk create(int oldStart, int oldCount, int newStart, int newCount);

/// Parse "@@ -a[,b] +c[,d] @@..." (omitted counts mean 1)
std::optional<Hunk> parseHeader(const std::string& line);

/**
 * @brief Collect hunks from `git diff --unified=0` output
 *
 * Lines before the first "@@" (raw and file headers) are ignored; inside a
 * hunk, '-' and '+' lines feed removed/added text.
 */
std::vector<Hunk> parseDiff(const std::vector<std::string>& lines);

/**
 * @brief Build a zero-context patch covering exactly `hunks`
 * @param relpath Path relative to the repository toplevel
 * @param hunks Hunks ordered by position, computed against the index copy
 * @param modeBits Index mode of the file (e.g. "100644")
 * @param invert Produce the patch undoing `hunks` once they are staged
 *
 * Forward mode patches the index copy into one containing the added lines.
 * Invert mode patches that result back, so a forward patch followed by the
 * inverted patch of the same hunks restores the original content.
 */
std::vector<std::string> createPatch(const std::string& relpath, const std::vector<Hunk>& hunks,
                                     const std::string& modeBits, bool invert = false);

/// Hunks whose new-side lines intersect [first, last] (1-based, inclusive)
std::vector<Hunk> filterByNewRange(const std::vector<Hunk>& hunks, int first, int last);

}

}
