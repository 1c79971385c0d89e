#pragma once

/// @file reaction_table.hpp
/// @brief ReactionTable: (health, damage) -> damage transform registry.
///
/// Rules are registered once during startup, the table is frozen, and from
/// then on it is read by every Damageable that resolves damage against it.

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <vector>

#include "lhe/foundation/game_result.hpp"
#include "lhe/health/classification.hpp"
#include "lhe/health/damage_info.hpp"

namespace lhe::health {

/// Transforms an incoming damage amount for one segment.
using ReactionTransform = std::function<DamageInfo(float)>;

/// A declared reaction.
///
/// Valid only with exactly one health classification, at least one damage
/// classification (no repeats), and a callable transform. The lists exist so
/// that a malformed declaration is reported instead of being unrepresentable.
struct ReactionRule {
    std::vector<HealthClassification> healthClassifications;
    std::vector<DamageClassification> damageClassifications;
    ReactionTransform transform;
};

/// Context attached to a ConfigurationError for a pair-level failure.
struct ReactionConflict {
    HealthClassification health;
    DamageClassification damage;
};

/// Registry of reaction transforms keyed by (health, damage).
///
/// Registration is all-or-nothing per rule: a rule whose second pair
/// collides registers none of its pairs. Absence of a rule is never an
/// error at damage time; Resolve() falls back to the identity reaction
/// (full amount, not capped).
class ReactionTable {
public:
    ReactionTable() = default;

    ReactionTable(const ReactionTable&) = delete;
    ReactionTable& operator=(const ReactionTable&) = delete;
    ReactionTable(ReactionTable&&) noexcept = default;
    ReactionTable& operator=(ReactionTable&&) noexcept = default;

    /// Add @p rule.
    /// @return ConfigurationError for a malformed rule, a duplicate
    ///         (health, damage) pair, or a frozen table.
    foundation::GameResult<void> Register(const ReactionRule& rule);

    /// Transform registered for exactly (@p health, @p damage), or nullptr.
    [[nodiscard]] const ReactionTransform* Lookup(HealthClassification health,
                                                  DamageClassification damage) const;

    /// Apply the matching transform to @p amount, or the identity fallback.
    ///
    /// The returned amount is never negative: a transform producing a
    /// negative or NaN amount yields 0.
    [[nodiscard]] DamageInfo Resolve(HealthClassification health,
                                     DamageClassification damage,
                                     float amount) const;

    [[nodiscard]] bool Contains(HealthClassification health,
                                DamageClassification damage) const;

    /// Number of registered (health, damage) pairs.
    [[nodiscard]] std::size_t Size() const noexcept { return transforms_.size(); }

    /// End the registration phase; Register() fails afterwards.
    void Freeze();

    [[nodiscard]] bool IsFrozen() const noexcept { return frozen_; }

    /// Drop every rule and reopen registration.
    void Clear();

    /// Table used by Damageables constructed without an explicit one.
    static ReactionTable& Global();

private:
    struct Key {
        HealthClassification health;
        DamageClassification damage;

        bool operator==(const Key&) const = default;
    };

    struct KeyHash {
        std::size_t operator()(const Key& key) const noexcept {
            return std::hash<uint64_t>{}((uint64_t{key.health.value()} << 32)
                                         | uint64_t{key.damage.value()});
        }
    };

    foundation::GameResult<void> validate(const ReactionRule& rule) const;

    std::unordered_map<Key, ReactionTransform, KeyHash> transforms_;
    bool frozen_ = false;
};

} // namespace lhe::health
