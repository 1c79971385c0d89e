#pragma once

/// @file types.hpp
/// @brief Strong id types shared across the engine.

#include <compare>
#include <cstdint>
#include <functional>

namespace lhe::foundation {

/// Tag-based strong typedef for integral ids.
///
/// Keeps health and damage classifications (and host entity ids) from being
/// mixed up at compile time while sharing one representation. The value 0
/// is the invalid sentinel.
///
/// @tparam Tag A unique tag type per id kind.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    using ValueType = T;

    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct EntityIdTag {};

/// Id of the host entity that owns a Damageable (used for log context).
using EntityId = StrongId<EntityIdTag>;

} // namespace lhe::foundation

template <typename Tag, typename T>
struct std::hash<lhe::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const lhe::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
