#pragma once

/// @file damage_info.hpp
/// @brief DamageInfo: output of a reaction transform.

namespace lhe::health {

/// Transformed damage for one segment.
///
/// @c amount is what the segment should lose. When @c capped is set, any
/// part of @c amount the segment cannot absorb is discarded instead of
/// bleeding through to the next segment.
struct DamageInfo {
    float amount = 0.0f;
    bool capped = false;

    bool operator==(const DamageInfo&) const = default;
};

} // namespace lhe::health
