#include "pkgstage/semver.hpp"

#include <algorithm>
#include <cctype>

namespace pkgstage {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

// Pad the numeric core to MAJOR.MINOR.PATCH, keeping any -pre/+build suffix
std::string pad_core(const std::string& s) {
    size_t suffix_pos = s.find_first_of("-+");
    std::string core = s.substr(0, suffix_pos);
    std::string suffix = suffix_pos == std::string::npos ? "" : s.substr(suffix_pos);

    auto dots = std::count(core.begin(), core.end(), '.');
    if (dots == 0) {
        core += ".0.0";
    } else if (dots == 1) {
        core += ".0";
    }
    return core + suffix;
}

} // namespace

std::optional<Version> parse_version(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(pad_core(s));
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

bool is_valid_min_version(const std::string& str) {
    return parse_version(str).has_value();
}

std::string stricter_min_version(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    auto va = parse_version(a);
    auto vb = parse_version(b);
    if (!va || !vb) return a;

    return (*vb > *va) ? b : a;
}

bool satisfies_min(const Version& version, const std::string& min_version) {
    if (trim(min_version).empty()) return true;

    auto min = parse_version(min_version);
    if (!min) return false;
    return version >= *min;
}

} // namespace pkgstage
