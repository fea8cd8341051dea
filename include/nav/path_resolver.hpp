#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace arcnav {

// Resolves user-supplied paths against a current base directory inside the
// archive. Canonical paths are relative: "" is the logical root, segments are
// separated by '/', and a trailing '/' is kept when the caller wrote one.
class PathResolver {
  public:
    // Fails ValidationError when the result would climb above the root.
    static Result Resolve(std::string_view current_base, std::string_view input, std::string& out);

    // "" -> "/", "docs/" -> "/docs/".
    static std::string Render(std::string_view canonical);
};

} // namespace arcnav
