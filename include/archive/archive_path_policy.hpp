#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace arcnav {

// Decides whether an archive member name may be written below an extraction
// root. A name is unsafe when it is absolute, carries a drive prefix ("C:"),
// or normalizes to ".." or to something under "../".
class ArchivePathPolicy {
  public:
    static bool IsSafeMember(std::string_view name);

    // Joins a safe member name onto `root`; fails UnsafeMember otherwise.
    static Result TargetPath(const std::string& root, std::string_view member, std::string& out);
};

} // namespace arcnav
