/// @file reaction_table.cpp
/// @brief ReactionTable registration, validation and lookup.

#include "lhe/health/reaction_table.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "lhe/foundation/game_logger.hpp"

namespace lhe::health {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

GameResult<void> configurationError(std::string message) {
    LHE_LOG_ERROR(LogCategory::Reaction, "rule rejected: " + message);
    return GameResult<void>::err(
        GameError(ErrorCode::ConfigurationError, std::move(message)));
}

GameResult<void> conflictError(std::string message, HealthClassification health,
                               DamageClassification damage) {
    LHE_LOG_ERROR(LogCategory::Reaction, "rule rejected: " + message);
    return GameResult<void>::err(GameError(ErrorCode::ConfigurationError,
                                           std::move(message),
                                           ReactionConflict{health, damage}));
}

std::string describe(HealthClassification health, DamageClassification damage) {
    return "(health " + std::to_string(health.value()) + ", damage "
        + std::to_string(damage.value()) + ")";
}

} // namespace

GameResult<void> ReactionTable::validate(const ReactionRule& rule) const {
    if (frozen_) {
        return configurationError("reaction table is frozen");
    }
    if (rule.healthClassifications.empty()) {
        return configurationError("rule declares no health classification");
    }
    if (rule.healthClassifications.size() > 1) {
        return configurationError("rule declares "
            + std::to_string(rule.healthClassifications.size())
            + " health classifications, expected exactly one");
    }
    if (rule.damageClassifications.empty()) {
        return configurationError("rule declares no damage classification");
    }
    if (!rule.transform) {
        return configurationError("rule has no transform");
    }

    auto health = rule.healthClassifications.front();
    if (!health.isValid()) {
        return configurationError("rule uses the invalid health classification");
    }

    const auto& damages = rule.damageClassifications;
    for (auto it = damages.begin(); it != damages.end(); ++it) {
        if (!it->isValid()) {
            return configurationError("rule uses the invalid damage classification");
        }
        if (std::find(damages.begin(), it, *it) != it) {
            return conflictError("rule repeats " + describe(health, *it), health, *it);
        }
        if (transforms_.count(Key{health, *it}) > 0) {
            return conflictError("duplicate reaction for " + describe(health, *it),
                                 health, *it);
        }
    }
    return GameResult<void>::ok();
}

GameResult<void> ReactionTable::Register(const ReactionRule& rule) {
    auto valid = validate(rule);
    if (!valid) {
        return valid;
    }

    auto health = rule.healthClassifications.front();
    for (auto damage : rule.damageClassifications) {
        transforms_.emplace(Key{health, damage}, rule.transform);
    }
    LHE_LOG_DEBUG(LogCategory::Reaction,
                  "registered " + std::to_string(rule.damageClassifications.size())
                      + " reaction(s) for health " + std::to_string(health.value()));
    return GameResult<void>::ok();
}

const ReactionTransform* ReactionTable::Lookup(HealthClassification health,
                                               DamageClassification damage) const {
    auto it = transforms_.find(Key{health, damage});
    return it == transforms_.end() ? nullptr : &it->second;
}

DamageInfo ReactionTable::Resolve(HealthClassification health,
                                  DamageClassification damage,
                                  float amount) const {
    const auto* transform = Lookup(health, damage);
    if (transform == nullptr) {
        return DamageInfo{amount, false};
    }

    auto info = (*transform)(amount);
    if (std::isnan(info.amount) || info.amount < 0.0f) {
        info.amount = 0.0f;
    }
    return info;
}

bool ReactionTable::Contains(HealthClassification health,
                             DamageClassification damage) const {
    return transforms_.count(Key{health, damage}) > 0;
}

void ReactionTable::Freeze() {
    if (frozen_) {
        return;
    }
    frozen_ = true;
    LHE_LOG_INFO(LogCategory::Core,
                 "reaction table frozen with " + std::to_string(transforms_.size())
                     + " reaction(s)");
}

void ReactionTable::Clear() {
    LHE_LOG_INFO(LogCategory::Core,
                 "reaction table cleared (" + std::to_string(transforms_.size())
                     + " reaction(s) dropped)");
    transforms_.clear();
    frozen_ = false;
}

ReactionTable& ReactionTable::Global() {
    static ReactionTable table;
    return table;
}

} // namespace lhe::health
