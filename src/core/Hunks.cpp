#include "core/Hunks.hpp"

#include <algorithm>

#include "util/StringUtils.hpp"

namespace linetrack {

namespace Hunks {

namespace {

/// "-12,3" / "+7" -> {12, 3} / {7, 1}
bool parseRange(const std::string& token, char sign, int& start, int& count) {
    if (token.size() < 2 || token[0] != sign) return false;
    auto parts = StringUtils::split(token.substr(1), ',');
    try {
        start = std::stoi(parts[0]);
        count = parts.size() > 1 ? std::stoi(parts[1]) : 1;
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

/**
 * @brief Re-express `hunks` as changes against the index after they were staged
 *
 * The removed side of each inverted hunk is the added text at the position
 * it occupies once every preceding hunk of the set has been applied.
 */
std::vector<Hunk> invertHunks(const std::vector<Hunk>& hunks) {
    std::vector<Hunk> out;
    out.reserve(hunks.size());
    int offset = 0;
    for (const auto& h : hunks) {
        int start = h.removed.start + offset;
        if (h.type == HunkType::Delete) {
            start -= 1;
        } else if (h.type == HunkType::Add) {
            start += 1;
        }
        Hunk inv = create(start, h.added.count, h.removed.start, h.removed.count);
        inv.head = h.head;
        inv.removed.lines = h.added.lines;
        inv.added.lines = h.removed.lines;
        out.push_back(std::move(inv));
        offset += h.added.count - h.removed.count;
    }
    return out;
}

}

Hunk create(int oldStart, int oldCount, int newStart, int newCount) {
    Hunk h;
    h.removed.start = oldStart;
    h.removed.count = oldCount;
    h.added.start = newStart;
    h.added.count = newCount;
    if (newCount == 0) {
        h.type = HunkType::Delete;
    } else if (oldCount == 0) {
        h.type = HunkType::Add;
    } else {
        h.type = HunkType::Change;
    }
    return h;
}

std::optional<Hunk> parseHeader(const std::string& line) {
    if (!StringUtils::startsWith(line, "@@")) return std::nullopt;
    auto close = line.find("@@", 2);
    std::string key = StringUtils::trim(line.substr(2, close == std::string::npos ? std::string::npos : close - 2));
    auto tokens = StringUtils::splitWhitespace(key);
    if (tokens.size() < 2) return std::nullopt;

    int oldStart = 0, oldCount = 0, newStart = 0, newCount = 0;
    if (!parseRange(tokens[0], '-', oldStart, oldCount) || !parseRange(tokens[1], '+', newStart, newCount)) {
        return std::nullopt;
    }
    Hunk h = create(oldStart, oldCount, newStart, newCount);
    h.head = line;
    return h;
}

std::vector<Hunk> parseDiff(const std::vector<std::string>& lines) {
    std::vector<Hunk> hunks;
    for (const auto& line : lines) {
        if (StringUtils::startsWith(line, "@@")) {
            auto h = parseHeader(line);
            if (h) hunks.push_back(std::move(*h));
        } else if (!hunks.empty() && !line.empty()) {
            auto& h = hunks.back();
            if (line[0] == '-') {
                h.removed.lines.push_back(line.substr(1));
            } else if (line[0] == '+') {
                h.added.lines.push_back(line.substr(1));
            }
        }
    }
    return hunks;
}

std::vector<std::string> createPatch(const std::string& relpath, const std::vector<Hunk>& hunks,
                                     const std::string& modeBits, bool invert) {
    std::vector<std::string> patch = {
        "diff --git a/" + relpath + " b/" + relpath,
        "index 000000..000000 " + modeBits,
        "--- a/" + relpath,
        "+++ b/" + relpath,
    };

    const std::vector<Hunk> work = invert ? invertHunks(hunks) : hunks;

    int offset = 0;
    for (const auto& h : work) {
        int start = h.removed.start;
        const int preCount = h.removed.count;
        const int nowCount = h.added.count;
        // git apply places the fragment by its new-side position
        if (h.type == HunkType::Add) {
            start += 1;
        }
        patch.push_back("@@ -" + std::to_string(start) + "," + std::to_string(preCount) + " +" +
                        std::to_string(start + offset) + "," + std::to_string(nowCount) + " @@");
        for (const auto& l : h.removed.lines) patch.push_back("-" + l);
        for (const auto& l : h.added.lines) patch.push_back("+" + l);
        offset += nowCount - preCount;
    }
    return patch;
}

std::vector<Hunk> filterByNewRange(const std::vector<Hunk>& hunks, int first, int last) {
    std::vector<Hunk> out;
    for (const auto& h : hunks) {
        int hStart = std::max(h.added.start, 1);
        int hEnd = h.added.count == 0 ? hStart : h.added.start + h.added.count - 1;
        if (hStart <= last && hEnd >= first) {
            out.push_back(h);
        }
    }
    return out;
}

}

}
