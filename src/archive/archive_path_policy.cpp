#include "archive/archive_path_policy.hpp"

#include "util/path_utils.hpp"

#include <cctype>
#include <filesystem>

namespace arcnav {

bool ArchivePathPolicy::IsSafeMember(std::string_view name) {
    if (name.empty()) return false;
    if (name.front() == '/' || name.front() == '\\') return false;
    if (name.size() >= 2 && name[1] == ':' &&
        std::isalpha(static_cast<unsigned char>(name[0]))) {
        return false;
    }

    const auto segs = NormalizeSegments(NormalizeSeparators(name));
    if (segs.empty()) return false;
    return segs.front() != "..";
}

Result ArchivePathPolicy::TargetPath(const std::string& root,
                                     std::string_view member,
                                     std::string& out) {
    if (!IsSafeMember(member)) {
        return Result::Fail(ErrorCode::UnsafeMember,
                            "Unsafe archive member: " + std::string(member));
    }

    const auto rel = JoinSegments(NormalizeSegments(NormalizeSeparators(member)));
    out = (std::filesystem::path(root) / rel).string();
    return Result::Ok();
}

} // namespace arcnav
