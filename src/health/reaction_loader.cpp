/// @file reaction_loader.cpp
/// @brief YAML reaction configuration -> ReactionTable / segment presets.

#include "lhe/health/reaction_loader.hpp"

#include <algorithm>
#include <iterator>
#include <string_view>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "lhe/foundation/game_logger.hpp"
#include "lhe/health/reaction_rule_builder.hpp"

namespace lhe::health {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr std::string_view kRuleFields[] = {
    "health", "damage", "kind", "factor", "reduction", "capped",
};

GameError configError(std::string message) {
    LHE_LOG_ERROR(LogCategory::Config, message);
    return GameError(ErrorCode::ConfigurationError, std::move(message));
}

/// A field that may be a single name or a list of names.
std::vector<std::string> nameList(const YAML::Node& node) {
    std::vector<std::string> names;
    if (!node.IsDefined() || node.IsNull()) {
        return names;
    }
    if (node.IsSequence()) {
        for (const auto& item : node) {
            names.push_back(item.as<std::string>());
        }
    } else {
        names.push_back(node.as<std::string>());
    }
    return names;
}

template <typename T>
T fieldOr(const YAML::Node& node, const char* key, T fallback) {
    auto field = node[key];
    return field.IsDefined() && !field.IsNull() ? field.as<T>() : fallback;
}

GameResult<ReactionTransform> makeTransform(const YAML::Node& node, const std::string& where) {
    auto kind = fieldOr<std::string>(node, "kind", "identity");
    if (kind == "identity") {
        return GameResult<ReactionTransform>::ok(reactions::Identity());
    }
    if (kind == "scaled") {
        return GameResult<ReactionTransform>::ok(reactions::Scaled(
            fieldOr<float>(node, "factor", 1.0f), fieldOr<bool>(node, "capped", false)));
    }
    if (kind == "flat") {
        return GameResult<ReactionTransform>::ok(reactions::Flat(
            fieldOr<float>(node, "reduction", 0.0f), fieldOr<bool>(node, "capped", false)));
    }
    if (kind == "capped") {
        return GameResult<ReactionTransform>::ok(reactions::Capped());
    }
    if (kind == "immune") {
        return GameResult<ReactionTransform>::ok(reactions::Immune());
    }
    return GameResult<ReactionTransform>::err(
        configError(where + ": unknown reaction kind '" + kind + "'"));
}

} // namespace

GameResult<void> ReactionLoader::LoadFile(const std::filesystem::path& path) {
    return config_.load(path);
}

GameResult<void> ReactionLoader::LoadString(std::string_view yaml) {
    return config_.loadString(yaml);
}

GameResult<void> ReactionLoader::checkShape(std::string_view key, bool expectList) const {
    // Mappings are flattened into dotted keys: a mapping shows up as children
    // of @p key, anything else as @p key itself.
    if (expectList) {
        if (!config_.hasKey(key) && !config_.childKeys(key).empty()) {
            return GameResult<void>::err(
                configError("'" + std::string(key) + "' must be a list, not a mapping"));
        }
        return GameResult<void>::ok();
    }
    auto leaf = config_.getOr<YAML::Node>(key, YAML::Node());
    if (leaf && !leaf.value().IsNull()) {
        return GameResult<void>::err(
            configError("'" + std::string(key) + "' must be a mapping"));
    }
    return GameResult<void>::ok();
}

GameResult<ReactionRule> ReactionLoader::parseRule(
    const YAML::Node& node, std::size_t index,
    const HealthClassificationRegistry& healthNames,
    const DamageClassificationRegistry& damageNames) const {
    auto where = "reactions[" + std::to_string(index) + "]";
    if (!node.IsMap()) {
        return GameResult<ReactionRule>::err(configError(where + " is not a mapping"));
    }

    try {
        for (const auto& field : node) {
            auto name = field.first.as<std::string>();
            if (std::find(std::begin(kRuleFields), std::end(kRuleFields), name)
                == std::end(kRuleFields)) {
                LHE_LOG_WARN(LogCategory::Config,
                             where + ": ignoring unknown field '" + name + "'");
            }
        }

        ReactionRule rule;
        for (const auto& name : nameList(node["health"])) {
            auto id = healthNames.Find(name);
            if (!id) {
                return GameResult<ReactionRule>::err(
                    configError(where + ": unknown health classification '" + name + "'"));
            }
            rule.healthClassifications.push_back(id.value());
        }
        for (const auto& name : nameList(node["damage"])) {
            auto id = damageNames.Find(name);
            if (!id) {
                return GameResult<ReactionRule>::err(
                    configError(where + ": unknown damage classification '" + name + "'"));
            }
            rule.damageClassifications.push_back(id.value());
        }

        auto transform = makeTransform(node, where);
        if (!transform) {
            return GameResult<ReactionRule>::err(transform.error());
        }
        rule.transform = std::move(transform).value();
        return GameResult<ReactionRule>::ok(std::move(rule));
    } catch (const YAML::Exception& e) {
        return GameResult<ReactionRule>::err(
            GameError(ErrorCode::ConfigTypeMismatch, where + ": " + e.what()));
    }
}

GameResult<void> ReactionLoader::LoadInto(ReactionTable& table,
                                          HealthClassificationRegistry& healthNames,
                                          DamageClassificationRegistry& damageNames) const {
    constexpr std::pair<std::string_view, bool> kShapes[] = {
        {"classifications", false},
        {"classifications.health", true},
        {"classifications.damage", true},
        {"reactions", true},
    };
    for (const auto& [key, expectList] : kShapes) {
        auto shape = checkShape(key, expectList);
        if (!shape) {
            return shape;
        }
    }

    auto declaredHealth = config_.getOr<std::vector<std::string>>(
        "classifications.health", {});
    auto declaredDamage = config_.getOr<std::vector<std::string>>(
        "classifications.damage", {});
    if (!declaredHealth) {
        return GameResult<void>::err(declaredHealth.error());
    }
    if (!declaredDamage) {
        return GameResult<void>::err(declaredDamage.error());
    }
    for (const auto& name : declaredHealth.value()) {
        auto id = healthNames.Intern(name);
        if (!id) {
            return GameResult<void>::err(id.error());
        }
    }
    for (const auto& name : declaredDamage.value()) {
        auto id = damageNames.Intern(name);
        if (!id) {
            return GameResult<void>::err(id.error());
        }
    }

    auto rules = config_.getOr<YAML::Node>("reactions", YAML::Node());
    if (!rules) {
        return GameResult<void>::err(rules.error());
    }
    const auto& list = rules.value();
    if (list.IsNull()) {
        return GameResult<void>::ok();
    }
    if (!list.IsSequence()) {
        return GameResult<void>::err(configError("'reactions' must be a list"));
    }

    std::size_t registered = 0;
    for (std::size_t i = 0; i < list.size(); ++i) {
        auto rule = parseRule(list[i], i, healthNames, damageNames);
        if (!rule) {
            return GameResult<void>::err(rule.error());
        }
        auto result = table.Register(rule.value());
        if (!result) {
            LHE_LOG_ERROR(LogCategory::Config,
                          "loading stopped at reactions[" + std::to_string(i) + "] after "
                              + std::to_string(registered) + " rule(s): "
                              + result.error().describe());
            return result;
        }
        ++registered;
    }

    LHE_LOG_INFO(LogCategory::Config,
                 "loaded " + std::to_string(registered) + " reaction rule(s)");
    return GameResult<void>::ok();
}

GameResult<std::vector<HealthBarSegment>> ReactionLoader::SegmentPreset(
    std::string_view name, const HealthClassificationRegistry& healthNames) const {
    using Segments = std::vector<HealthBarSegment>;

    auto key = "segments." + std::string(name);
    auto node = config_.get<YAML::Node>(key);
    if (!node) {
        return GameResult<Segments>::err(node.error());
    }
    const auto& list = node.value();
    if (!list.IsSequence() || list.size() == 0) {
        return GameResult<Segments>::err(
            configError(key + " must be a non-empty list of segments"));
    }

    Segments segments;
    try {
        for (std::size_t i = 0; i < list.size(); ++i) {
            auto where = key + "[" + std::to_string(i) + "]";
            const auto& entry = list[i];
            if (!entry.IsMap() || !entry["health"] || !entry["hitpoints"]) {
                return GameResult<Segments>::err(
                    configError(where + " needs 'health' and 'hitpoints'"));
            }
            auto healthName = entry["health"].as<std::string>();
            auto health = healthNames.Find(healthName);
            if (!health) {
                return GameResult<Segments>::err(configError(
                    where + ": unknown health classification '" + healthName + "'"));
            }
            auto hitpoints = entry["hitpoints"].as<float>();
            auto maximum = fieldOr<float>(entry, "max", hitpoints);
            segments.emplace_back(health.value(), hitpoints, maximum);
        }
    } catch (const YAML::Exception& e) {
        return GameResult<Segments>::err(
            GameError(ErrorCode::ConfigTypeMismatch, key + ": " + e.what()));
    }
    return GameResult<Segments>::ok(std::move(segments));
}

std::vector<std::string> ReactionLoader::PresetNames() const {
    return config_.childKeys("segments");
}

} // namespace lhe::health
