#pragma once

#include <cstdint>
#include <limits>

namespace sprocket::controls {

enum class ButtonState : std::uint8_t {
    Up = 0,
    JustUp = 1,
    Down = 2,
    JustDown = 3
};

struct KeyState {
    bool down = false;
    // At least one transition since the last frame boundary.
    bool changed = false;
    // Frame boundaries crossed while continuously down.
    std::uint32_t heldFrames = 0;

    constexpr bool operator==(const KeyState&) const = default;
};

inline constexpr std::uint32_t kMaxHeldFrames = std::numeric_limits<std::uint32_t>::max();

inline constexpr ButtonState buttonStateOf(const KeyState& state) {
    if (state.down) {
        return state.changed ? ButtonState::JustDown : ButtonState::Down;
    }
    return state.changed ? ButtonState::JustUp : ButtonState::Up;
}

inline constexpr bool isDownState(ButtonState state) {
    return state == ButtonState::Down || state == ButtonState::JustDown;
}

inline constexpr bool isTransition(ButtonState state) {
    return state == ButtonState::JustDown || state == ButtonState::JustUp;
}

const char* buttonStateName(ButtonState state);

} // namespace sprocket::controls
