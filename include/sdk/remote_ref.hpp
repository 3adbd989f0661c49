#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <variant>

namespace espkit {

struct Branch {
    std::string name;
};

struct Tag {
    std::string name;
};

struct Commit {
    std::string hash;
};

// Source-control pointer identifying one SDK revision.
using RemoteRef = std::variant<Branch, Tag, Commit>;

// The inner name, whichever alternative is held.
const std::string& RefName(const RemoteRef& ref);
const char* RefKind(const RemoteRef& ref);

// "branch:<b>", "tag:<t>" and "commit:<c>" select the kind explicitly.
// A bare version starting with a digit becomes Tag("v" + version); any
// other string is a branch name.
std::expected<RemoteRef, std::string> ParseRemoteRef(std::string_view version);

} // namespace espkit
