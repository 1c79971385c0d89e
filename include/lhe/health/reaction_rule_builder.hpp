#pragma once

/// @file reaction_rule_builder.hpp
/// @brief Fluent declaration of reaction rules and stock transforms.

#include <initializer_list>

#include "lhe/foundation/game_result.hpp"
#include "lhe/health/reaction_table.hpp"

namespace lhe::health {

/// Stock reaction transforms.
namespace reactions {

/// Full amount, bleeds through. Same as having no rule.
ReactionTransform Identity();

/// amount * @p factor.
ReactionTransform Scaled(float factor, bool capped = false);

/// amount - @p reduction, floored at 0.
ReactionTransform Flat(float reduction, bool capped = false);

/// Full amount, but the excess never leaves the segment.
ReactionTransform Capped();

/// Nothing gets through, and nothing bleeds past the segment.
ReactionTransform Immune();

} // namespace reactions

/// Builds a ReactionRule during startup.
///
/// Example:
/// @code
///   auto result = ReactionRuleBuilder()
///       .ForHealth(health_class::Armour)
///       .ForDamage({damage_class::Slash, damage_class::Pierce})
///       .Transform(reactions::Scaled(0.5f))
///       .RegisterIn(ReactionTable::Global());
/// @endcode
///
/// The builder does not validate; the table does, so a rule with two
/// ForHealth() calls is rejected at registration like any other malformed
/// rule.
class ReactionRuleBuilder {
public:
    ReactionRuleBuilder& ForHealth(HealthClassification health);
    ReactionRuleBuilder& ForDamage(DamageClassification damage);
    ReactionRuleBuilder& ForDamage(std::initializer_list<DamageClassification> damages);
    ReactionRuleBuilder& Transform(ReactionTransform fn);

    [[nodiscard]] const ReactionRule& Build() const noexcept { return rule_; }

    /// Register the built rule in @p table.
    foundation::GameResult<void> RegisterIn(ReactionTable& table) const;

private:
    ReactionRule rule_;
};

} // namespace lhe::health
