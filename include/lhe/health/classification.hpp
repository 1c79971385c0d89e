#pragma once

/// @file classification.hpp
/// @brief Health and damage classification ids and their name registries.
///
/// Classifications are interned symbols: a small integer id with a name
/// looked up through a ClassificationRegistry. The built-in sets below are
/// pre-seeded; configuration can intern more at startup without touching
/// the engine core.

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "lhe/foundation/game_result.hpp"
#include "lhe/foundation/types.hpp"

namespace lhe::health {

struct HealthClassificationTag {};
struct DamageClassificationTag {};

/// What a health segment is made of (Flesh, Armour, ...).
using HealthClassification = foundation::StrongId<HealthClassificationTag, uint32_t>;

/// What kind of damage is incoming (Slash, Fire, ...).
using DamageClassification = foundation::StrongId<DamageClassificationTag, uint32_t>;

/// Built-in health classifications. Ids match the seeding order of
/// HealthClassifications().
namespace health_class {
inline constexpr HealthClassification Flesh{1};
inline constexpr HealthClassification Armour{2};
inline constexpr HealthClassification Shield{3};
} // namespace health_class

/// Built-in damage classifications. Ids match the seeding order of
/// DamageClassifications().
namespace damage_class {
inline constexpr DamageClassification Slash{1};
inline constexpr DamageClassification Impact{2};
inline constexpr DamageClassification Fire{3};
inline constexpr DamageClassification Pierce{4};
} // namespace damage_class

/// Name <-> id interning table for one classification kind.
///
/// Ids are assigned densely from 1 in interning order; 0 stays invalid.
/// Registration happens during startup; afterwards the registry is only
/// read.
///
/// @tparam Id HealthClassification or DamageClassification.
template <typename Id>
class ClassificationRegistry {
public:
    ClassificationRegistry() = default;

    /// Seed with @p builtins, which receive ids 1..N in order.
    ClassificationRegistry(std::initializer_list<std::string_view> builtins) {
        for (auto name : builtins) {
            (void)Intern(name);
        }
    }

    /// Return the id for @p name, assigning a new one if it is unknown.
    /// @return InvalidArgument for an empty name.
    foundation::GameResult<Id> Intern(std::string_view name) {
        if (name.empty()) {
            return foundation::GameResult<Id>::err(foundation::GameError(
                foundation::ErrorCode::InvalidArgument, "classification name is empty"));
        }
        auto it = ids_.find(std::string(name));
        if (it != ids_.end()) {
            return foundation::GameResult<Id>::ok(it->second);
        }
        Id id(static_cast<typename Id::ValueType>(names_.size() + 1));
        names_.emplace_back(name);
        ids_.emplace(names_.back(), id);
        return foundation::GameResult<Id>::ok(id);
    }

    /// Look up an already interned name.
    /// @return ClassificationNotFound when @p name was never interned.
    [[nodiscard]] foundation::GameResult<Id> Find(std::string_view name) const {
        auto it = ids_.find(std::string(name));
        if (it == ids_.end()) {
            return foundation::GameResult<Id>::err(foundation::GameError(
                foundation::ErrorCode::ClassificationNotFound,
                "unknown classification: " + std::string(name)));
        }
        return foundation::GameResult<Id>::ok(it->second);
    }

    /// Name of @p id, or an empty view when it is not registered here.
    [[nodiscard]] std::string_view NameOf(Id id) const noexcept {
        if (!Contains(id)) {
            return {};
        }
        return names_[id.value() - 1];
    }

    [[nodiscard]] bool Contains(Id id) const noexcept {
        return id.isValid() && id.value() <= names_.size();
    }

    [[nodiscard]] std::size_t Size() const noexcept { return names_.size(); }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, Id> ids_;
};

using HealthClassificationRegistry = ClassificationRegistry<HealthClassification>;
using DamageClassificationRegistry = ClassificationRegistry<DamageClassification>;

/// Process-wide health registry seeded with Flesh, Armour, Shield.
HealthClassificationRegistry& HealthClassifications();

/// Process-wide damage registry seeded with Slash, Impact, Fire, Pierce.
DamageClassificationRegistry& DamageClassifications();

/// Fresh registries seeded with the built-ins, for loaders and tests that
/// must not touch the process-wide ones.
HealthClassificationRegistry MakeHealthClassificationRegistry();
DamageClassificationRegistry MakeDamageClassificationRegistry();

} // namespace lhe::health
