#include "controls/key_state.h"

namespace sprocket::controls {

const char* buttonStateName(ButtonState state) {
    switch (state) {
    case ButtonState::Up:
        return "Up";
    case ButtonState::JustUp:
        return "JustUp";
    case ButtonState::Down:
        return "Down";
    case ButtonState::JustDown:
        return "JustDown";
    }
    return "Up";
}

} // namespace sprocket::controls
