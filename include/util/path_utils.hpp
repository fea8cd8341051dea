#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace arcnav {

inline bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Archive paths are always '/'-separated; Windows-style input is accepted.
inline std::string NormalizeSeparators(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        if (c == '\\') c = '/';
    }
    return out;
}

// Lexical normalization of a relative path:
// - drop empty and "." segments
// - collapse ".." against the previous segment
// - a ".." that cannot be collapsed is kept at the front
inline std::vector<std::string> NormalizeSegments(std::string_view path) {
    std::vector<std::string> out;
    while (!path.empty()) {
        const auto pos = path.find('/');
        const auto seg = path.substr(0, pos);
        if (seg.empty() || seg == ".") {
            // skip
        } else if (seg == "..") {
            if (!out.empty() && out.back() != "..") {
                out.pop_back();
            } else {
                out.emplace_back("..");
            }
        } else {
            out.emplace_back(seg);
        }
        if (pos == std::string_view::npos) break;
        path.remove_prefix(pos + 1);
    }
    return out;
}

inline std::string JoinSegments(const std::vector<std::string>& segs) {
    std::string out;
    for (const auto& s : segs) {
        if (!out.empty()) out.push_back('/');
        out += s;
    }
    return out;
}

// Lowercased extension of the last path component, including the dot.
// Leading dots of the component do not start an extension (".profile" -> "").
inline std::string LowerExtension(std::string_view path) {
    const auto slash = path.rfind('/');
    std::string_view base = slash == std::string_view::npos ? path : path.substr(slash + 1);

    size_t first = 0;
    while (first < base.size() && base[first] == '.') ++first;
    const auto dot = base.rfind('.');
    if (dot == std::string_view::npos || dot < first) return {};

    std::string ext(base.substr(dot));
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

} // namespace arcnav
