#include "pkgstage/warnings.hpp"

#include <map>

#include <spdlog/spdlog.h>

namespace pkgstage {

namespace {

// "k=v k=v" with keys sorted, so log lines are stable across runs
std::string render_fields(const WarningFields& fields) {
    std::map<std::string, std::string> ordered(fields.begin(), fields.end());
    std::string line;
    for (const auto& [key, value] : ordered) {
        if (!line.empty()) line += ' ';
        line += key;
        line += '=';
        line += value;
    }
    return line;
}

} // namespace

void WarningCollector::set_policy(const std::unordered_map<std::string, WarningAction>& policy) {
    policy_.clear();
    for (const auto& [key, action] : policy) {
        if (auto warning = parse_warning_key(key)) {
            policy_[*warning] = action;
        }
    }
}

WarningAction WarningCollector::action_for(Warning warning) const {
    auto it = policy_.find(warning);
    return it == policy_.end() ? WarningAction::Warn : it->second;
}

void WarningCollector::emit(Warning warning, WarningFields fields) {
    WarningAction action = action_for(warning);
    const char* key = warning_to_string(warning);

    if (action == WarningAction::Error) {
        spdlog::error("{} (upgraded to error): {}", key, render_fields(fields));
    } else if (action == WarningAction::Warn) {
        spdlog::warn("{}: {}", key, render_fields(fields));
    } else {
        spdlog::debug("{} (ignored): {}", key, render_fields(fields));
    }

    entries_.push_back(Entry{warning, action, std::move(fields)});
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::vector<WarningObject> visible;
    for (const auto& entry : entries_) {
        if (entry.action == WarningAction::Ignore) continue;
        visible.push_back(WarningObject{warning_to_string(entry.warning),
                                        action_to_string(entry.action),
                                        entry.fields});
    }
    return visible;
}

std::string WarningCollector::first_error_key() const {
    for (const auto& entry : entries_) {
        if (entry.action == WarningAction::Error) return warning_to_string(entry.warning);
    }
    return {};
}

Result<void> check_warning_policy(const WarningCollector& warnings, const std::string& stage) {
    std::string key = warnings.first_error_key();
    if (key.empty()) {
        return Result<void>::ok();
    }
    return Result<void>::err(
        Error(ErrorCode::WARNING_AS_ERROR, "warning upgraded to error by policy")
            .withStage(stage).withSubject(key));
}

} // namespace pkgstage
