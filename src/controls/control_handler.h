#pragma once

#include <functional>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "controls/input_tracker.h"
#include "core/log.h"

// Controls ControlHandler subsystem
// Responsible for: translating backend inputs (key codes, button names) into game controls through a
// rebindable table, and feeding the result to an InputTracker keyed by control.
// Should NOT do: read devices, persist bindings, or resolve conflicts between controls.
namespace sprocket::controls {

template <typename Input,
          typename Control,
          typename InputHash = std::hash<Input>,
          typename ControlHash = std::hash<Control>>
class ControlHandler {
public:
    using Bindings = std::unordered_map<Input, Control, InputHash>;
    using InputSet = std::unordered_set<Input, InputHash>;
    using Tracker = InputTracker<Control, ControlHash>;

    ControlHandler() = default;
    explicit ControlHandler(Bindings bindings) : m_bindings(std::move(bindings)) {}

    // An input drives at most one control; binding it again moves it.
    void bind(const Input& input, const Control& control);
    bool unbind(const Input& input);
    std::optional<Control> controlFor(const Input& input) const;
    std::vector<Input> inputsFor(const Control& control) const;
    const Bindings& bindings() const { return m_bindings; }

    // The next input received replaces every binding of `control` and is consumed by the rebind.
    void listenForRebind(const Control& control);
    void cancelRebind();
    std::optional<Control> pendingRebind() const { return m_pendingRebind; }

    void syncPolled(const InputSet& inputsDown);
    void onInputDown(const Input& input);
    // Releases the control the input pressed, even if its binding changed while it was held.
    void onInputUp(const Input& input);
    void releaseAll();
    void endFrame();

    bool isDown(const Control& control) const { return m_tracker.isDown(control); }
    bool justPressed(const Control& control) const { return m_tracker.justPressed(control); }
    bool justReleased(const Control& control) const { return m_tracker.justReleased(control); }
    ButtonState state(const Control& control) const { return m_tracker.state(control); }
    std::uint32_t heldFrames(const Control& control) const { return m_tracker.heldFrames(control); }
    const Tracker& tracker() const { return m_tracker; }

private:
    void completeRebind(const Input& input);
    bool anyHeldInputDrives(const Control& control) const;

    Bindings m_bindings;
    std::optional<Control> m_pendingRebind;
    // Held input -> the control it pressed. Releases use this, not the current bindings.
    std::unordered_map<Input, Control, InputHash> m_heldInputs;
    Tracker m_tracker;
};

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline void ControlHandler<Input, Control, InputHash, ControlHash>::bind(const Input& input, const Control& control) {
    m_bindings.insert_or_assign(input, control);
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline bool ControlHandler<Input, Control, InputHash, ControlHash>::unbind(const Input& input) {
    return m_bindings.erase(input) > 0;
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline std::optional<Control> ControlHandler<Input, Control, InputHash, ControlHash>::controlFor(const Input& input) const {
    const auto it = m_bindings.find(input);
    if (it == m_bindings.end()) {
        return std::nullopt;
    }
    return it->second;
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline std::vector<Input> ControlHandler<Input, Control, InputHash, ControlHash>::inputsFor(const Control& control) const {
    std::vector<Input> inputs;
    for (const auto& [input, bound] : m_bindings) {
        if (bound == control) {
            inputs.push_back(input);
        }
    }
    return inputs;
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline void ControlHandler<Input, Control, InputHash, ControlHash>::listenForRebind(const Control& control) {
    m_pendingRebind = control;
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline void ControlHandler<Input, Control, InputHash, ControlHash>::cancelRebind() {
    m_pendingRebind.reset();
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline void ControlHandler<Input, Control, InputHash, ControlHash>::completeRebind(const Input& input) {
    const Control control = *m_pendingRebind;
    m_pendingRebind.reset();

    std::size_t replaced = 0;
    for (auto it = m_bindings.begin(); it != m_bindings.end();) {
        if (it->second == control) {
            it = m_bindings.erase(it);
            ++replaced;
        } else {
            ++it;
        }
    }
    m_bindings.insert_or_assign(input, control);
    SPROCKET_LOGI("controls") << "rebound control, replaced " << replaced << " previous binding(s)";
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline bool ControlHandler<Input, Control, InputHash, ControlHash>::anyHeldInputDrives(const Control& control) const {
    for (const auto& [held, driven] : m_heldInputs) {
        if (driven == control) {
            return true;
        }
    }
    return false;
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline void ControlHandler<Input, Control, InputHash, ControlHash>::syncPolled(const InputSet& inputsDown) {
    if (m_pendingRebind.has_value()) {
        // With several inputs down at once, which one wins is unspecified.
        if (!inputsDown.empty()) {
            completeRebind(*inputsDown.begin());
        }
        return;
    }

    typename Tracker::KeySet controlsDown;
    for (const Input& input : inputsDown) {
        const auto it = m_bindings.find(input);
        if (it != m_bindings.end()) {
            controlsDown.insert(it->second);
        }
    }
    m_tracker.syncPolled(controlsDown);
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline void ControlHandler<Input, Control, InputHash, ControlHash>::onInputDown(const Input& input) {
    if (m_pendingRebind.has_value()) {
        completeRebind(input);
        return;
    }

    if (m_heldInputs.find(input) != m_heldInputs.end()) {
        return;
    }
    const auto it = m_bindings.find(input);
    if (it == m_bindings.end()) {
        return;
    }
    m_heldInputs.emplace(input, it->second);
    m_tracker.onPress(it->second);
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline void ControlHandler<Input, Control, InputHash, ControlHash>::onInputUp(const Input& input) {
    const auto it = m_heldInputs.find(input);
    if (it == m_heldInputs.end()) {
        return;
    }
    const Control control = it->second;
    m_heldInputs.erase(it);
    if (!anyHeldInputDrives(control)) {
        m_tracker.onRelease(control);
    }
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline void ControlHandler<Input, Control, InputHash, ControlHash>::releaseAll() {
    m_heldInputs.clear();
    m_tracker.releaseAll();
}

template <typename Input, typename Control, typename InputHash, typename ControlHash>
inline void ControlHandler<Input, Control, InputHash, ControlHash>::endFrame() {
    m_tracker.endFrame();
}

} // namespace sprocket::controls
