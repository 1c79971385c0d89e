#pragma once

/// @file signal.hpp
/// @brief Signal<Args...>: synchronous observer list for engine notifications.
///
/// Damageable exposes its death, damage and heal notifications through
/// Signal. Slots are invoked synchronously, in connection order, from the
/// thread that calls emit(). A Signal belongs to a single owner and is not
/// internally synchronized.

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace lhe::foundation {

/// Observer list dispatching to registered callbacks.
///
/// @tparam Args The argument types passed to each slot when the signal fires.
///
/// Example:
/// @code
///   Signal<> onDeath;
///   auto id = onDeath.connect([] { despawn(); });
///   onDeath.emit();
///   onDeath.disconnect(id);
/// @endcode
template <typename... Args>
class Signal {
public:
    using Slot = std::function<void(Args...)>;
    using SlotId = uint64_t;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    Signal(Signal&&) noexcept = default;
    Signal& operator=(Signal&&) noexcept = default;

    /// Register a callback. Returns an id for disconnect().
    /// Empty callbacks are ignored and yield id 0.
    SlotId connect(Slot slot) {
        if (!slot) {
            return 0;
        }
        auto id = nextId_++;
        slots_.emplace_back(id, std::move(slot));
        return id;
    }

    /// Remove a callback. Returns false if @p id was not connected.
    bool disconnect(SlotId id) {
        auto it = std::find_if(slots_.begin(), slots_.end(),
                               [id](const auto& entry) { return entry.first == id; });
        if (it == slots_.end()) {
            return false;
        }
        slots_.erase(it);
        return true;
    }

    void disconnectAll() { slots_.clear(); }

    /// Invoke every connected slot.
    ///
    /// Iterates over a snapshot, so a slot may connect or disconnect
    /// (including itself) without invalidating the dispatch in progress.
    void emit(Args... args) const {
        if (slots_.empty()) {
            return;
        }
        auto snapshot = slots_;
        for (const auto& [id, slot] : snapshot) {
            slot(args...);
        }
    }

    [[nodiscard]] std::size_t slotCount() const noexcept { return slots_.size(); }
    [[nodiscard]] bool empty() const noexcept { return slots_.empty(); }

private:
    std::vector<std::pair<SlotId, Slot>> slots_;
    SlotId nextId_ = 1;
};

} // namespace lhe::foundation
