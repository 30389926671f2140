#include "core/Blame.hpp"

#include <functional>
#include <unordered_map>

#include "core/Constants.hpp"
#include "util/StringUtils.hpp"

namespace linetrack {

namespace Blame {

namespace {

using FieldSetter = std::function<void(BlameInfo&, const std::string&)>;

int toInt(const std::string& s) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return 0;
    }
}

std::optional<int64_t> toInt64(const std::string& s) {
    try {
        return static_cast<int64_t>(std::stoll(s));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

const std::unordered_map<std::string, FieldSetter>& fieldSetters() {
    static const std::unordered_map<std::string, FieldSetter> setters = {
        {"author", [](BlameInfo& b, const std::string& v) { b.author = v; }},
        {"author_mail", [](BlameInfo& b, const std::string& v) { b.authorMail = v; }},
        {"author_time", [](BlameInfo& b, const std::string& v) { b.authorTime = toInt64(v); }},
        {"author_tz", [](BlameInfo& b, const std::string& v) { b.authorTz = v; }},
        {"committer", [](BlameInfo& b, const std::string& v) { b.committer = v; }},
        {"committer_mail", [](BlameInfo& b, const std::string& v) { b.committerMail = v; }},
        {"committer_time", [](BlameInfo& b, const std::string& v) { b.committerTime = toInt64(v); }},
        {"committer_tz", [](BlameInfo& b, const std::string& v) { b.committerTz = v; }},
        {"summary", [](BlameInfo& b, const std::string& v) { b.summary = v; }},
        {"filename", [](BlameInfo& b, const std::string& v) { b.filename = v; }},
        {"boundary", [](BlameInfo& b, const std::string&) { b.boundary = true; }},
        {"previous", [](BlameInfo& b, const std::string& v) {
             b.previous = v;
             auto tokens = StringUtils::split(v, ' ');
             if (!tokens.empty()) b.previousSha = tokens[0];
             if (tokens.size() > 1) b.previousFilename = tokens[1];
         }},
    };
    return setters;
}

}

std::optional<BlameInfo> parsePorcelain(const std::vector<std::string>& lines) {
    if (lines.empty()) return std::nullopt;

    BlameInfo info;
    auto header = StringUtils::split(lines.front(), ' ');
    info.sha = header[0];
    info.abbrevSha = info.sha.substr(0, Constants::ABBREV_SHA_LENGTH);
    if (header.size() > 1) info.origLnum = toInt(header[1]);
    if (header.size() > 2) info.finalLnum = toInt(header[2]);

    const auto& setters = fieldSetters();
    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (StringUtils::startsWith(line, "\t")) continue;

        auto sp = line.find(' ');
        std::string key = line.substr(0, sp);
        std::string value = sp == std::string::npos ? "" : line.substr(sp + 1);
        for (auto& c : key) {
            if (c == '-') c = '_';
        }

        auto it = setters.find(key);
        if (it != setters.end()) {
            it->second(info, value);
        } else {
            info.extra[key] = value;
        }
    }
    return info;
}

BlameInfo notCommitted(int lineNumber) {
    BlameInfo info;
    info.sha = Constants::NULL_SHA;
    info.abbrevSha = info.sha.substr(0, Constants::ABBREV_SHA_LENGTH);
    info.origLnum = lineNumber;
    info.finalLnum = lineNumber;
    info.author = Constants::NOT_COMMITTED_NAME;
    info.authorMail = Constants::NOT_COMMITTED_MAIL;
    info.committer = Constants::NOT_COMMITTED_NAME;
    info.committerMail = Constants::NOT_COMMITTED_MAIL;
    return info;
}

}

}
