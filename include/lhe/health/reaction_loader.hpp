#pragma once

/// @file reaction_loader.hpp
/// @brief Declares classifications, reaction rules and segment presets from YAML.
///
/// Expected document layout:
/// @code
///   classifications:
///     health: [Chitin]
///     damage: [Acid]
///   reactions:
///     - health: Armour
///       damage: [Impact]
///       kind: capped           # identity | scaled | flat | capped | immune
///     - health: Armour
///       damage: [Slash, Pierce]
///       kind: scaled
///       factor: 0.5
///       capped: false
///   segments:
///     knight:
///       - { health: Armour, hitpoints: 50 }
///       - { health: Flesh, hitpoints: 100, max: 120 }
/// @endcode

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "lhe/foundation/config_manager.hpp"
#include "lhe/foundation/game_result.hpp"
#include "lhe/health/classification.hpp"
#include "lhe/health/health_bar_segment.hpp"
#include "lhe/health/reaction_table.hpp"

namespace lhe::health {

/// Reads a reaction configuration and applies it to a table.
///
/// Loading is fatal-on-first-error: LoadInto() stops at the first rule the
/// table rejects and returns that error. A table whose load failed must not
/// be frozen or used.
class ReactionLoader {
public:
    /// @return ConfigLoadFailed for a missing or malformed file.
    foundation::GameResult<void> LoadFile(const std::filesystem::path& path);

    foundation::GameResult<void> LoadString(std::string_view yaml);

    /// Intern declared classifications, then register every rule in order.
    /// @return ConfigurationError for a malformed rule, an unknown
    ///         classification name or a table conflict; ConfigTypeMismatch
    ///         for a field of the wrong type.
    foundation::GameResult<void> LoadInto(ReactionTable& table,
                                          HealthClassificationRegistry& healthNames,
                                          DamageClassificationRegistry& damageNames) const;

    /// Segments of the preset @p name, in depletion order.
    /// @return ConfigKeyNotFound for an unknown preset.
    [[nodiscard]] foundation::GameResult<std::vector<HealthBarSegment>> SegmentPreset(
        std::string_view name, const HealthClassificationRegistry& healthNames) const;

    [[nodiscard]] std::vector<std::string> PresetNames() const;

private:
    /// ConfigurationError when @p key is present with the wrong node kind:
    /// a mapping where a list is expected, or a scalar or list where a
    /// mapping is expected.
    foundation::GameResult<void> checkShape(std::string_view key, bool expectList) const;

    foundation::GameResult<ReactionRule> parseRule(
        const YAML::Node& node, std::size_t index,
        const HealthClassificationRegistry& healthNames,
        const DamageClassificationRegistry& damageNames) const;

    foundation::ConfigManager config_;
};

} // namespace lhe::health
