/// @file health_bar_segment.cpp
/// @brief HealthBarSegment construction and hitpoint arithmetic.

#include "lhe/health/health_bar_segment.hpp"

#include <algorithm>
#include <cmath>

namespace lhe::health {

namespace {

float nonNegative(float value) noexcept {
    return (std::isnan(value) || value < 0.0f) ? 0.0f : value;
}

} // namespace

HealthBarSegment::HealthBarSegment(HealthClassification classification, float hitpoints)
    : HealthBarSegment(classification, hitpoints, hitpoints) {}

HealthBarSegment::HealthBarSegment(HealthClassification classification, float hitpoints,
                                   float maxHitpoints)
    : maximum_(nonNegative(maxHitpoints)),
      classification_(classification) {
    current_ = std::min(nonNegative(hitpoints), maximum_);
}

float HealthBarSegment::Fraction() const noexcept {
    if (maximum_ <= 0.0f) {
        return 0.0f;
    }
    return current_ / maximum_;
}

void HealthBarSegment::Scale(float multiplier) noexcept {
    current_ *= multiplier;
    maximum_ *= multiplier;
}

void HealthBarSegment::ScaleMax(float multiplier) noexcept {
    maximum_ *= multiplier;
}

void HealthBarSegment::ScaleCurrent(float multiplier) noexcept {
    current_ *= multiplier;
}

void HealthBarSegment::Set(const HealthBarSegment& other) noexcept {
    current_ = other.current_;
    maximum_ = other.maximum_;
    classification_ = other.classification_;
}

float HealthBarSegment::Absorb(float amount) noexcept {
    if (current_ <= 0.0f) {
        return 0.0f;
    }
    float applied = std::min(nonNegative(amount), current_);
    current_ -= applied;
    if (current_ < 0.0f) {
        current_ = 0.0f;
    }
    return applied;
}

float HealthBarSegment::Restore(float amount) noexcept {
    float room = std::max(maximum_ - std::max(current_, 0.0f), 0.0f);
    float restored = std::min(nonNegative(amount), room);
    current_ = std::max(current_, 0.0f) + restored;
    return restored;
}

void HealthBarSegment::ClampToMaximum() noexcept {
    current_ = std::clamp(current_, 0.0f, std::max(maximum_, 0.0f));
}

} // namespace lhe::health
