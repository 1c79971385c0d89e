#pragma once

/// @file damageable.hpp
/// @brief Damageable: ordered health segments and damage resolution.
///
/// The host entity owns one Damageable. Callers feed it damage, healing and
/// scaling; it resolves reactions against a ReactionTable, walks its
/// segments front to back, and notifies observers when the entity dies.

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

#include "lhe/foundation/game_result.hpp"
#include "lhe/foundation/signal.hpp"
#include "lhe/foundation/types.hpp"
#include "lhe/health/classification.hpp"
#include "lhe/health/health_bar_segment.hpp"
#include "lhe/health/reaction_table.hpp"

namespace lhe::health {

/// Layered hitpoint pool of one entity.
///
/// Invariants:
///   - at least one segment at all times;
///   - CurrentHealth() / MaximumHealth() are the live sums over segments;
///   - Damage() and Heal() never push a segment below 0 or (Heal) above
///     its maximum.
///
/// Damage resolution, for each segment from the first non-depleted one:
///   1. info = table.Resolve(segment class, damage class, remaining)
///   2. the segment absorbs min(info.amount, current)
///   3. capped: stop, the excess is discarded
///   4. otherwise carry info.amount - absorbed to the next segment
/// Excess left after the last segment is discarded.
///
/// onDeath() fires once per transition of CurrentHealth() from > 0 to 0
/// caused by Damage(); healing above 0 re-arms it.
///
/// Damage() settles every segment and decides death before notifying, then
/// emits onDamaged, onSegmentDepleted and onDeath in that order. Slots may
/// call back into the Damageable (Heal(), RemoveLast(), ...) without
/// changing the notifications already decided. Only onDeath slots may
/// destroy it; Damage() touches nothing after emitting onDeath.
///
/// The referenced ReactionTable must outlive the Damageable. Not
/// thread-safe: one entity's update logic owns it.
class Damageable {
public:
    using const_iterator = std::vector<HealthBarSegment>::const_iterator;

    explicit Damageable(HealthBarSegment first,
                        const ReactionTable& table = ReactionTable::Global());

    /// Build from several segments, in depletion order.
    /// @return InvalidArgument when @p segments is empty.
    static foundation::GameResult<Damageable> Create(
        std::vector<HealthBarSegment> segments,
        const ReactionTable& table = ReactionTable::Global());

    Damageable(const Damageable&) = delete;
    Damageable& operator=(const Damageable&) = delete;
    Damageable(Damageable&&) noexcept = default;
    Damageable& operator=(Damageable&&) noexcept = default;

    // ── Queries ──────────────────────────────────────────────────────────

    [[nodiscard]] float CurrentHealth() const noexcept;
    [[nodiscard]] float MaximumHealth() const noexcept;
    [[nodiscard]] bool IsDead() const noexcept { return CurrentHealth() <= 0.0f; }

    [[nodiscard]] std::size_t SegmentCount() const noexcept { return segments_.size(); }

    /// Unchecked positional access.
    [[nodiscard]] const HealthBarSegment& operator[](std::size_t index) const {
        return segments_[index];
    }

    /// Checked positional access.
    /// @return OutOfRange for an index past the last segment.
    [[nodiscard]] foundation::GameResult<HealthBarSegment> SegmentAt(std::size_t index) const;

    [[nodiscard]] std::span<const HealthBarSegment> Segments() const noexcept {
        return segments_;
    }

    [[nodiscard]] const_iterator begin() const noexcept { return segments_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return segments_.end(); }

    // ── Combat ───────────────────────────────────────────────────────────

    /// Apply @p amount of @p damageClass damage. Negative and NaN amounts
    /// are treated as 0.
    void Damage(float amount, DamageClassification damageClass);

    /// Restore @p amount hitpoints front to back, each segment up to its
    /// own maximum. Negative and NaN amounts are ignored.
    void Heal(float amount);

    // ── Scaling ──────────────────────────────────────────────────────────

    void Scale(float multiplier) noexcept;
    void ScaleMaxHitpoints(float multiplier) noexcept;
    void ScaleCurrentHitpoints(float multiplier) noexcept;

    // ── Structure ────────────────────────────────────────────────────────

    /// Add @p segment behind the last one.
    /// @return InvalidArgument for a null segment; nothing is changed.
    foundation::GameResult<void> Append(std::unique_ptr<HealthBarSegment> segment);

    void Append(HealthBarSegment segment);

    /// Remove the last segment.
    /// @return OutOfRange when only one segment remains; nothing is changed.
    foundation::GameResult<void> RemoveLast();

    // ── Notifications ────────────────────────────────────────────────────

    /// Fired with no arguments when the entity dies.
    foundation::Signal<>& onDeath() noexcept { return onDeath_; }

    /// Fired after Damage() with the total removed and the damage class.
    foundation::Signal<float, DamageClassification>& onDamaged() noexcept {
        return onDamaged_;
    }

    /// Fired after Heal() with the total restored.
    foundation::Signal<float>& onHealed() noexcept { return onHealed_; }

    /// Fired with the index of each segment Damage() emptied.
    foundation::Signal<std::size_t>& onSegmentDepleted() noexcept {
        return onSegmentDepleted_;
    }

    /// Host entity id used in log context. Unset by default.
    void SetOwner(foundation::EntityId owner) noexcept { owner_ = owner; }
    [[nodiscard]] foundation::EntityId Owner() const noexcept { return owner_; }

private:
    Damageable(std::vector<HealthBarSegment> segments, const ReactionTable& table);

    std::vector<HealthBarSegment> segments_;
    const ReactionTable* table_;
    foundation::EntityId owner_;

    foundation::Signal<> onDeath_;
    foundation::Signal<float, DamageClassification> onDamaged_;
    foundation::Signal<float> onHealed_;
    foundation::Signal<std::size_t> onSegmentDepleted_;
};

} // namespace lhe::health
