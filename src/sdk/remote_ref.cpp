#include "sdk/remote_ref.hpp"

#include <cctype>

namespace espkit {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

std::string_view Trim(std::string_view s) {
    constexpr std::string_view kWs = " \t\r\n";
    const auto b = s.find_first_not_of(kWs);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(kWs);
    return s.substr(b, e - b + 1);
}

} // namespace

const std::string& RefName(const RemoteRef& ref) {
    return std::visit(Overloaded{
                          [](const Branch& b) -> const std::string& { return b.name; },
                          [](const Tag& t) -> const std::string& { return t.name; },
                          [](const Commit& c) -> const std::string& { return c.hash; },
                      },
                      ref);
}

const char* RefKind(const RemoteRef& ref) {
    return std::visit(Overloaded{
                          [](const Branch&) { return "branch"; },
                          [](const Tag&) { return "tag"; },
                          [](const Commit&) { return "commit"; },
                      },
                      ref);
}

std::expected<RemoteRef, std::string> ParseRemoteRef(std::string_view version) {
    version = Trim(version);
    if (version.empty()) {
        return std::unexpected(std::string("Invalid SDK version: ''"));
    }

    auto strip = [&](std::string_view prefix, std::string_view& rest) {
        if (!version.starts_with(prefix)) return false;
        rest = version.substr(prefix.size());
        return true;
    };

    std::string_view rest;
    if (strip("branch:", rest) || strip("tag:", rest) || strip("commit:", rest)) {
        if (rest.empty()) {
            return std::unexpected("Invalid SDK version: '" + std::string(version) + "'");
        }
        if (version.starts_with("branch:")) return Branch{std::string(rest)};
        if (version.starts_with("tag:")) return Tag{std::string(rest)};
        return Commit{std::string(rest)};
    }

    if (std::isdigit(static_cast<unsigned char>(version.front()))) {
        return Tag{"v" + std::string(version)};
    }
    return Branch{std::string(version)};
}

} // namespace espkit
