#pragma once

/// @file health_bar_segment.hpp
/// @brief HealthBarSegment: one classified layer of an entity's hitpoints.

#include "lhe/health/classification.hpp"

namespace lhe::health {

class Damageable;

/// A single layer of a health bar.
///
/// Constructors clamp negative (and NaN) hitpoints to 0 and current to
/// maximum, so a freshly built segment satisfies 0 <= current <= max.
/// The raw scaling operations do not re-clamp: scaling only the maximum
/// below current leaves the segment over-full until the owning Damageable
/// next heals it.
///
/// Combat mutation (damage, heal) goes through Damageable only, which is
/// what lets damage bleed from one segment into the next.
class HealthBarSegment {
public:
    /// Full segment: current = max = @p hitpoints.
    HealthBarSegment(HealthClassification classification, float hitpoints);

    /// Segment at @p hitpoints out of @p maxHitpoints.
    HealthBarSegment(HealthClassification classification, float hitpoints,
                     float maxHitpoints);

    [[nodiscard]] float CurrentHitpoints() const noexcept { return current_; }
    [[nodiscard]] float MaximumHitpoints() const noexcept { return maximum_; }
    [[nodiscard]] HealthClassification Classification() const noexcept {
        return classification_;
    }

    [[nodiscard]] bool IsDepleted() const noexcept { return current_ <= 0.0f; }

    /// current / max, or 0 for a zero-capacity segment.
    [[nodiscard]] float Fraction() const noexcept;

    /// Multiply current and maximum by @p multiplier.
    void Scale(float multiplier) noexcept;

    /// Multiply maximum only. Current is left as is.
    void ScaleMax(float multiplier) noexcept;

    /// Multiply current only.
    void ScaleCurrent(float multiplier) noexcept;

    /// Copy all fields of @p other into this segment.
    void Set(const HealthBarSegment& other) noexcept;

    HealthBarSegment& operator*=(float multiplier) noexcept {
        Scale(multiplier);
        return *this;
    }

    bool operator==(const HealthBarSegment&) const = default;

private:
    friend class Damageable;

    /// Remove up to @p amount hitpoints. Returns what was removed.
    float Absorb(float amount) noexcept;

    /// Restore up to @p amount hitpoints, never past maximum.
    /// Returns what was restored.
    float Restore(float amount) noexcept;

    /// Pull current back to maximum after raw scaling.
    void ClampToMaximum() noexcept;

    float current_ = 0.0f;
    float maximum_ = 0.0f;
    HealthClassification classification_;
};

/// Scaled copy of @p segment.
inline HealthBarSegment operator*(HealthBarSegment segment, float multiplier) noexcept {
    segment.Scale(multiplier);
    return segment;
}

} // namespace lhe::health
