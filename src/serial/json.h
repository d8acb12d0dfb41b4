#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

#include "controls/input_tracker.h"
#include "controls/key_state.h"
#include "core/log.h"
#include "grids/coord.h"
#include "grids/direction.h"
#include "grids/rect.h"

// Serial JSON subsystem
// Responsible for: structural JSON encoding of the value types and of tracker snapshots.
// Should NOT do: file I/O, schema migration, or versioning across releases.
//
// Objects keep field order (ordered_json), so decode followed by encode reproduces the document.
namespace sprocket::serial {

using Json = nlohmann::ordered_json;

} // namespace sprocket::serial

namespace sprocket::grids {

void to_json(serial::Json& json, const Coord& coord);
void from_json(const serial::Json& json, Coord& coord);
void to_json(serial::Json& json, const ICoord& coord);
void from_json(const serial::Json& json, ICoord& coord);
void to_json(serial::Json& json, const IRect& rect);
void from_json(const serial::Json& json, IRect& rect);

NLOHMANN_JSON_SERIALIZE_ENUM(Direction4, {
    {Direction4::North, "North"},
    {Direction4::East, "East"},
    {Direction4::South, "South"},
    {Direction4::West, "West"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Direction8, {
    {Direction8::North, "North"},
    {Direction8::NorthEast, "NorthEast"},
    {Direction8::East, "East"},
    {Direction8::SouthEast, "SouthEast"},
    {Direction8::South, "South"},
    {Direction8::SouthWest, "SouthWest"},
    {Direction8::West, "West"},
    {Direction8::NorthWest, "NorthWest"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Rotation, {
    {Rotation::Clockwise, "Clockwise"},
    {Rotation::CounterClockwise, "CounterClockwise"},
})

} // namespace sprocket::grids

namespace sprocket::controls {

void to_json(serial::Json& json, const KeyState& state);
void from_json(const serial::Json& json, KeyState& state);

NLOHMANN_JSON_SERIALIZE_ENUM(ButtonState, {
    {ButtonState::Up, "Up"},
    {ButtonState::JustUp, "JustUp"},
    {ButtonState::Down, "Down"},
    {ButtonState::JustDown, "JustDown"},
})

} // namespace sprocket::controls

namespace sprocket::serial {

// Returns false and logs instead of throwing; `out` is untouched on failure.
bool parseJson(std::string_view text, Json& out);
// indent < 0 gives the compact form. Invalid UTF-8 is replaced rather than thrown on.
std::string dumpJson(const Json& json, int indent = -1);

// Layout: {"keys": [{"key": <K>, "down": bool, "changed": bool, "heldFrames": uint}, ...]}.
// K needs its own to_json/from_json.
// trackerFromJson returns false and logs on a malformed document, leaving `out` untouched.
template <typename K, typename Hash, typename KeyEqual>
Json trackerToJson(const controls::InputTracker<K, Hash, KeyEqual>& tracker) {
    Json keys = Json::array();
    for (const auto& [key, state] : tracker.states()) {
        Json entry = Json::object();
        entry["key"] = key;
        entry["down"] = state.down;
        entry["changed"] = state.changed;
        entry["heldFrames"] = state.heldFrames;
        keys.push_back(std::move(entry));
    }
    Json json = Json::object();
    json["keys"] = std::move(keys);
    return json;
}

template <typename K, typename Hash, typename KeyEqual>
bool trackerFromJson(const Json& json, controls::InputTracker<K, Hash, KeyEqual>& out) {
    controls::InputTracker<K, Hash, KeyEqual> restored;
    try {
        for (const Json& entry : json.at("keys")) {
            const K key = entry.at("key").template get<K>();
            controls::KeyState state{};
            entry.get_to(state);
            restored.restoreKeyState(key, state);
        }
    } catch (const nlohmann::json::exception& e) {
        SPROCKET_LOGE("serial") << "tracker snapshot rejected: " << e.what();
        return false;
    }
    out = std::move(restored);
    return true;
}

} // namespace sprocket::serial
