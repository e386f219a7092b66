#pragma once

#include "pkgstage/result.hpp"
#include "pkgstage/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace pkgstage {

using WarningFields = std::unordered_map<std::string, std::string>;

// ============================================================================
// Warning Collector
// ============================================================================

// Collects the non-fatal findings of one run. The recipe's `warnings` object
// maps a key to "warn" (default), "ignore" or "error". Every emitted warning
// is logged at once; the pipeline calls check_warning_policy() between
// stages so an upgraded warning stops the run.
class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy) {
        set_policy(policy);
    }

    // Keys are matched case-insensitively; unknown keys are dropped
    void set_policy(const std::unordered_map<std::string, WarningAction>& policy);

    void emit(Warning warning, WarningFields fields = {});

    WarningAction action_for(Warning warning) const;

    // Emitted warnings in order, minus the ignored ones
    std::vector<WarningObject> get_warnings() const;

    bool has_errors() const { return !first_error_key().empty(); }

    // Key of the first warning upgraded to error, empty if none
    std::string first_error_key() const;

private:
    struct Entry {
        Warning warning;
        WarningAction action;
        WarningFields fields;
    };

    std::map<Warning, WarningAction> policy_;
    std::vector<Entry> entries_;
};

Result<void> check_warning_policy(const WarningCollector& warnings, const std::string& stage);

// ============================================================================
// Field builders for specific warnings
// ============================================================================

namespace warnings {

inline WarningFields asset_substitution_miss(const std::string& asset_path,
                                             const std::string& expected_line) {
    return {{"asset", asset_path}, {"expected", expected_line}};
}

inline WarningFields preferred_channel_overridden(const std::string& dependency,
                                                  const std::string& preferred,
                                                  const std::string& assigned) {
    return {{"dependency", dependency}, {"preferred", preferred}, {"assigned", assigned}};
}

inline WarningFields duplicate_dependency(const std::string& dependency,
                                          const std::string& first_origin,
                                          const std::string& second_origin) {
    return {{"dependency", dependency},
            {"first_origin", first_origin},
            {"second_origin", second_origin}};
}

inline WarningFields staging_root_not_empty(const std::string& staging_root) {
    return {{"staging_root", staging_root}};
}

inline WarningFields invalid_configuration(const std::string& reason, const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

} // namespace warnings

} // namespace pkgstage
