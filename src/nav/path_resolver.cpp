#include "nav/path_resolver.hpp"

#include "util/path_utils.hpp"

namespace arcnav {

Result PathResolver::Resolve(std::string_view current_base,
                             std::string_view input,
                             std::string& out) {
    const std::string in = NormalizeSeparators(input);
    const bool had_trailing = !in.empty() && in.back() == '/';

    std::string joined;
    if (in.empty()) {
        joined = NormalizeSeparators(current_base);
    } else if (in.front() == '/') {
        joined = in;
    } else {
        joined = NormalizeSeparators(current_base);
        joined.push_back('/');
        joined += in;
    }

    const auto segs = NormalizeSegments(joined);
    if (!segs.empty() && segs.front() == "..") {
        return Result::Fail(ErrorCode::ValidationError,
                            "Invalid path: '" + std::string(input) + "' escapes the archive root");
    }

    out = JoinSegments(segs);
    if (had_trailing && !out.empty()) out.push_back('/');
    return Result::Ok();
}

std::string PathResolver::Render(std::string_view canonical) {
    return "/" + std::string(canonical);
}

} // namespace arcnav
