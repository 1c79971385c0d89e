/// @file reaction_rule_builder.cpp
/// @brief Stock transforms and ReactionRuleBuilder.

#include "lhe/health/reaction_rule_builder.hpp"

#include <algorithm>
#include <utility>

namespace lhe::health {

namespace reactions {

ReactionTransform Identity() {
    return [](float amount) { return DamageInfo{amount, false}; };
}

ReactionTransform Scaled(float factor, bool capped) {
    return [factor, capped](float amount) { return DamageInfo{amount * factor, capped}; };
}

ReactionTransform Flat(float reduction, bool capped) {
    return [reduction, capped](float amount) {
        return DamageInfo{std::max(amount - reduction, 0.0f), capped};
    };
}

ReactionTransform Capped() {
    return [](float amount) { return DamageInfo{amount, true}; };
}

ReactionTransform Immune() {
    return [](float) { return DamageInfo{0.0f, true}; };
}

} // namespace reactions

ReactionRuleBuilder& ReactionRuleBuilder::ForHealth(HealthClassification health) {
    rule_.healthClassifications.push_back(health);
    return *this;
}

ReactionRuleBuilder& ReactionRuleBuilder::ForDamage(DamageClassification damage) {
    rule_.damageClassifications.push_back(damage);
    return *this;
}

ReactionRuleBuilder& ReactionRuleBuilder::ForDamage(
    std::initializer_list<DamageClassification> damages) {
    rule_.damageClassifications.insert(rule_.damageClassifications.end(),
                                       damages.begin(), damages.end());
    return *this;
}

ReactionRuleBuilder& ReactionRuleBuilder::Transform(ReactionTransform fn) {
    rule_.transform = std::move(fn);
    return *this;
}

foundation::GameResult<void> ReactionRuleBuilder::RegisterIn(ReactionTable& table) const {
    return table.Register(rule_);
}

} // namespace lhe::health
