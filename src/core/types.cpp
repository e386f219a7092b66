#include "pkgstage/types.hpp"

#include <cctype>
#include <cstring>
#include <optional>
#include <utility>

namespace pkgstage {

namespace {

template <typename E>
using NameTable = std::pair<const char*, E>;

bool equals_ignore_case(const std::string& a, const char* b) {
    if (a.size() != std::strlen(b)) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != b[i]) return false;
    }
    return true;
}

template <typename E, size_t N>
std::optional<E> lookup(const std::string& text, const NameTable<E> (&table)[N]) {
    for (const auto& [name, value] : table) {
        if (equals_ignore_case(text, name)) return value;
    }
    return std::nullopt;
}

const NameTable<PreferredChannel> kPreferredChannels[] = {
    {"host", PreferredChannel::Host},
    {"index", PreferredChannel::Index},
    {"language-index", PreferredChannel::Index},
    {"bundled", PreferredChannel::Bundled},
};

const NameTable<PackageSource> kPackageSources[] = {
    {"host-repo", PackageSource::HostRepo},
    {"language-index", PackageSource::LanguageIndex},
    {"local-build", PackageSource::LocalBuild},
};

const NameTable<DepsMode> kDepsModes[] = {
    {"skip", DepsMode::Skip},
    {"full", DepsMode::Full},
};

const NameTable<Warning> kWarnings[] = {
    {"asset_substitution_miss", Warning::asset_substitution_miss},
    {"preferred_channel_overridden", Warning::preferred_channel_overridden},
    {"duplicate_dependency", Warning::duplicate_dependency},
    {"staging_root_not_empty", Warning::staging_root_not_empty},
    {"invalid_configuration", Warning::invalid_configuration},
};

const NameTable<WarningAction> kWarningActions[] = {
    {"warn", WarningAction::Warn},
    {"ignore", WarningAction::Ignore},
    {"error", WarningAction::Error},
};

} // namespace

std::optional<PreferredChannel> parse_preferred_channel(const std::string& s) {
    return lookup(s, kPreferredChannels);
}

std::optional<PackageSource> parse_package_source(const std::string& s) {
    return lookup(s, kPackageSources);
}

std::optional<DepsMode> parse_deps_mode(const std::string& s) {
    return lookup(s, kDepsModes);
}

std::optional<Warning> parse_warning_key(const std::string& key) {
    return lookup(key, kWarnings);
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    return lookup(s, kWarningActions);
}

// Runs of '-', '_' and '.' collapse to a single '-'; letters are lowercased
std::string normalize_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    bool in_separator = false;
    for (char c : name) {
        if (c == '-' || c == '_' || c == '.') {
            in_separator = true;
            continue;
        }
        if (in_separator && !out.empty()) out += '-';
        in_separator = false;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace pkgstage
