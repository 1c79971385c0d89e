/// @file damageable.cpp
/// @brief Damageable implementation: damage resolution, healing, structure.

#include "lhe/health/damageable.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "lhe/foundation/game_logger.hpp"

namespace lhe::health {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameLogger;
using foundation::GameResult;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

float sanitize(float amount) noexcept {
    return (std::isnan(amount) || amount < 0.0f) ? 0.0f : amount;
}

void logCombat(LogLevel level, foundation::EntityId owner, const std::string& msg,
               LogContext ctx = {}) {
    auto& logger = GameLogger::instance();
    if (!logger.isEnabled(level, LogCategory::Combat)) {
        return;
    }
    if (owner.isValid()) {
        ctx.entityId = owner;
    }
    logger.logWithContext(level, LogCategory::Combat, msg, ctx);
}

} // namespace

Damageable::Damageable(HealthBarSegment first, const ReactionTable& table)
    : table_(&table) {
    segments_.push_back(std::move(first));
}

Damageable::Damageable(std::vector<HealthBarSegment> segments, const ReactionTable& table)
    : segments_(std::move(segments)), table_(&table) {}

GameResult<Damageable> Damageable::Create(std::vector<HealthBarSegment> segments,
                                          const ReactionTable& table) {
    if (segments.empty()) {
        return GameResult<Damageable>::err(
            GameError(ErrorCode::InvalidArgument, "a damageable needs at least one segment"));
    }
    return GameResult<Damageable>::ok(Damageable(std::move(segments), table));
}

float Damageable::CurrentHealth() const noexcept {
    float total = 0.0f;
    for (const auto& segment : segments_) {
        total += segment.CurrentHitpoints();
    }
    return total;
}

float Damageable::MaximumHealth() const noexcept {
    float total = 0.0f;
    for (const auto& segment : segments_) {
        total += segment.MaximumHitpoints();
    }
    return total;
}

GameResult<HealthBarSegment> Damageable::SegmentAt(std::size_t index) const {
    if (index >= segments_.size()) {
        return GameResult<HealthBarSegment>::err(
            GameError(ErrorCode::OutOfRange,
                      "segment index " + std::to_string(index) + " out of range (size "
                          + std::to_string(segments_.size()) + ")"));
    }
    return GameResult<HealthBarSegment>::ok(segments_[index]);
}

// ── Combat ──────────────────────────────────────────────────────────────

void Damageable::Damage(float amount, DamageClassification damageClass) {
    float remaining = sanitize(amount);
    if (remaining <= 0.0f) {
        return;
    }

    const bool wasAlive = CurrentHealth() > 0.0f;
    float totalApplied = 0.0f;
    std::vector<std::size_t> depleted;

    for (std::size_t i = 0; i < segments_.size() && remaining > 0.0f; ++i) {
        auto& segment = segments_[i];
        if (segment.IsDepleted()) {
            continue;
        }

        auto info = table_->Resolve(segment.Classification(), damageClass, remaining);
        float applied = segment.Absorb(info.amount);
        totalApplied += applied;
        if (applied > 0.0f && segment.IsDepleted()) {
            depleted.push_back(i);
        }

        if (info.capped) {
            break;
        }
        remaining = info.amount - applied;
    }

    const bool died = wasAlive && CurrentHealth() <= 0.0f;

    // Observers may mutate or destroy *this, so log first and then emit
    // from locals only, with onDeath last.
    if (totalApplied > 0.0f) {
        LogContext ctx;
        ctx.extra["damage_class"] = std::to_string(damageClass.value());
        ctx.extra["applied"] = std::to_string(totalApplied);
        logCombat(LogLevel::Debug, owner_, "damage applied", std::move(ctx));
    }
    if (died) {
        logCombat(LogLevel::Info, owner_, "damageable died");
    }

    if (totalApplied > 0.0f) {
        onDamaged_.emit(totalApplied, damageClass);
    }
    for (auto index : depleted) {
        onSegmentDepleted_.emit(index);
    }
    if (died) {
        onDeath_.emit();
    }
}

void Damageable::Heal(float amount) {
    for (auto& segment : segments_) {
        segment.ClampToMaximum();
    }

    float remaining = sanitize(amount);
    float totalRestored = 0.0f;
    for (auto& segment : segments_) {
        if (remaining <= 0.0f) {
            break;
        }
        float restored = segment.Restore(remaining);
        remaining -= restored;
        totalRestored += restored;
    }

    if (totalRestored > 0.0f) {
        logCombat(LogLevel::Debug, owner_, "healed " + std::to_string(totalRestored));
        onHealed_.emit(totalRestored);
    }
}

// ── Scaling ─────────────────────────────────────────────────────────────

void Damageable::Scale(float multiplier) noexcept {
    for (auto& segment : segments_) {
        segment.Scale(multiplier);
    }
}

void Damageable::ScaleMaxHitpoints(float multiplier) noexcept {
    for (auto& segment : segments_) {
        segment.ScaleMax(multiplier);
    }
}

void Damageable::ScaleCurrentHitpoints(float multiplier) noexcept {
    for (auto& segment : segments_) {
        segment.ScaleCurrent(multiplier);
    }
}

// ── Structure ───────────────────────────────────────────────────────────

GameResult<void> Damageable::Append(std::unique_ptr<HealthBarSegment> segment) {
    if (!segment) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "cannot append a null segment"));
    }
    segments_.push_back(std::move(*segment));
    return GameResult<void>::ok();
}

void Damageable::Append(HealthBarSegment segment) {
    segments_.push_back(std::move(segment));
}

GameResult<void> Damageable::RemoveLast() {
    if (segments_.size() <= 1) {
        return GameResult<void>::err(
            GameError(ErrorCode::OutOfRange, "cannot remove the only segment"));
    }
    segments_.pop_back();
    return GameResult<void>::ok();
}

} // namespace lhe::health
