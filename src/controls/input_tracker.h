#pragma once

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <unordered_set>

#include "controls/key_state.h"
#include "core/log.h"

// Controls InputTracker subsystem
// Responsible for: per-key down state and edge detection fed by polled snapshots or press/release events.
// Should NOT do: talk to devices, own the game loop, or synchronize across threads.
//
// Per tick: ingest (syncPolled and/or onPress/onRelease), query as often as needed, then endFrame().
// Skipping endFrame() lets transitions leak into the next tick as stale "just" edges.
//
// A press and a release delivered in the same tick collapse to the final state: the key reads as
// JustUp and the press is not reported, the same outcome polling gives since it only sees final states.
namespace sprocket::controls {

template <typename K, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
class InputTracker {
public:
    using KeySet = std::unordered_set<K, Hash, KeyEqual>;
    using StateMap = std::unordered_map<K, KeyState, Hash, KeyEqual>;

    // Full-state replace. Keys absent from downNow that were never tracked stay untracked.
    void syncPolled(const KeySet& downNow);

    void onPress(const K& key);
    void onRelease(const K& key);
    // Releases every held key, e.g. on focus loss when release events will never arrive.
    void releaseAll();

    void endFrame();

    bool isDown(const K& key) const;
    bool justPressed(const K& key) const;
    bool justReleased(const K& key) const;
    ButtonState state(const K& key) const;
    KeyState keyState(const K& key) const;
    std::uint32_t heldFrames(const K& key) const;

    bool isTracked(const K& key) const;
    std::size_t trackedKeyCount() const;
    const StateMap& states() const;

    // Writes a record verbatim. Only meant for restoring snapshots.
    void restoreKeyState(const K& key, const KeyState& state);

private:
    static void applyPolled(KeyState& state, bool newDown);

    StateMap m_states;
};

template <typename K, typename Hash, typename KeyEqual>
inline void InputTracker<K, Hash, KeyEqual>::applyPolled(KeyState& state, bool newDown) {
    const bool changed = newDown != state.down;
    if (changed) {
        state.heldFrames = 0;
    }
    state.down = newDown;
    state.changed = changed;
}

template <typename K, typename Hash, typename KeyEqual>
inline void InputTracker<K, Hash, KeyEqual>::syncPolled(const KeySet& downNow) {
    for (auto& [key, state] : m_states) {
        applyPolled(state, downNow.find(key) != downNow.end());
    }
    for (const K& key : downNow) {
        auto [it, inserted] = m_states.try_emplace(key);
        if (inserted) {
            applyPolled(it->second, true);
        }
    }
}

template <typename K, typename Hash, typename KeyEqual>
inline void InputTracker<K, Hash, KeyEqual>::onPress(const K& key) {
    KeyState& state = m_states[key];
    if (state.down) {
        return;
    }
    state.down = true;
    state.changed = true;
    state.heldFrames = 0;
}

template <typename K, typename Hash, typename KeyEqual>
inline void InputTracker<K, Hash, KeyEqual>::onRelease(const K& key) {
    KeyState& state = m_states[key];
    if (!state.down) {
        return;
    }
    state.down = false;
    state.changed = true;
    state.heldFrames = 0;
}

template <typename K, typename Hash, typename KeyEqual>
inline void InputTracker<K, Hash, KeyEqual>::releaseAll() {
    std::size_t releasedCount = 0;
    for (auto& [key, state] : m_states) {
        if (!state.down) {
            continue;
        }
        state.down = false;
        state.changed = true;
        state.heldFrames = 0;
        ++releasedCount;
    }
    SPROCKET_LOGT("controls") << "releaseAll released " << releasedCount << " of " << m_states.size() << " keys";
}

template <typename K, typename Hash, typename KeyEqual>
inline void InputTracker<K, Hash, KeyEqual>::endFrame() {
    for (auto& [key, state] : m_states) {
        state.changed = false;
        if (state.down && state.heldFrames < kMaxHeldFrames) {
            ++state.heldFrames;
        }
    }
}

template <typename K, typename Hash, typename KeyEqual>
inline bool InputTracker<K, Hash, KeyEqual>::isDown(const K& key) const {
    return keyState(key).down;
}

template <typename K, typename Hash, typename KeyEqual>
inline bool InputTracker<K, Hash, KeyEqual>::justPressed(const K& key) const {
    const KeyState state = keyState(key);
    return state.down && state.changed;
}

template <typename K, typename Hash, typename KeyEqual>
inline bool InputTracker<K, Hash, KeyEqual>::justReleased(const K& key) const {
    const KeyState state = keyState(key);
    return !state.down && state.changed;
}

template <typename K, typename Hash, typename KeyEqual>
inline ButtonState InputTracker<K, Hash, KeyEqual>::state(const K& key) const {
    return buttonStateOf(keyState(key));
}

template <typename K, typename Hash, typename KeyEqual>
inline KeyState InputTracker<K, Hash, KeyEqual>::keyState(const K& key) const {
    const auto it = m_states.find(key);
    if (it == m_states.end()) {
        return KeyState{};
    }
    return it->second;
}

template <typename K, typename Hash, typename KeyEqual>
inline std::uint32_t InputTracker<K, Hash, KeyEqual>::heldFrames(const K& key) const {
    return keyState(key).heldFrames;
}

template <typename K, typename Hash, typename KeyEqual>
inline bool InputTracker<K, Hash, KeyEqual>::isTracked(const K& key) const {
    return m_states.find(key) != m_states.end();
}

template <typename K, typename Hash, typename KeyEqual>
inline std::size_t InputTracker<K, Hash, KeyEqual>::trackedKeyCount() const {
    return m_states.size();
}

template <typename K, typename Hash, typename KeyEqual>
inline const typename InputTracker<K, Hash, KeyEqual>::StateMap& InputTracker<K, Hash, KeyEqual>::states() const {
    return m_states;
}

template <typename K, typename Hash, typename KeyEqual>
inline void InputTracker<K, Hash, KeyEqual>::restoreKeyState(const K& key, const KeyState& state) {
    m_states[key] = state;
}

} // namespace sprocket::controls
