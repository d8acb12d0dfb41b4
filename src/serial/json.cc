#include "serial/json.h"

#include <cstdint>
#include <limits>

namespace sprocket::grids {

void to_json(serial::Json& json, const Coord& coord) {
    json = serial::Json{{"x", coord.x}, {"y", coord.y}};
}

void from_json(const serial::Json& json, Coord& coord) {
    json.at("x").get_to(coord.x);
    json.at("y").get_to(coord.y);
}

void to_json(serial::Json& json, const ICoord& coord) {
    json = serial::Json{{"x", coord.x}, {"y", coord.y}};
}

void from_json(const serial::Json& json, ICoord& coord) {
    json.at("x").get_to(coord.x);
    json.at("y").get_to(coord.y);
}

void to_json(serial::Json& json, const IRect& rect) {
    json = serial::Json{
        {"left", rect.left},
        {"top", rect.top},
        {"width", rect.width},
        {"height", rect.height}
    };
}

void from_json(const serial::Json& json, IRect& rect) {
    json.at("left").get_to(rect.left);
    json.at("top").get_to(rect.top);
    json.at("width").get_to(rect.width);
    json.at("height").get_to(rect.height);
}

} // namespace sprocket::grids

namespace sprocket::controls {

void to_json(serial::Json& json, const KeyState& state) {
    json = serial::Json{
        {"down", state.down},
        {"changed", state.changed},
        {"heldFrames", state.heldFrames}
    };
}

// heldFrames may be omitted (reads as 0). A present value must be an unsigned 32-bit count, and only
// a held key may carry one.
void from_json(const serial::Json& json, KeyState& state) {
    KeyState decoded{};
    json.at("down").get_to(decoded.down);
    json.at("changed").get_to(decoded.changed);

    const auto heldFrames = json.find("heldFrames");
    if (heldFrames != json.end()) {
        if (!heldFrames->is_number_unsigned() ||
            heldFrames->get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
            throw serial::Json::out_of_range::create(406, "heldFrames is not an unsigned 32-bit count", &json);
        }
        decoded.heldFrames = heldFrames->get<std::uint32_t>();
    }
    if (!decoded.down && decoded.heldFrames > 0) {
        throw serial::Json::other_error::create(501, "heldFrames set on a key that is not down", &json);
    }
    state = decoded;
}

} // namespace sprocket::controls

namespace sprocket::serial {

bool parseJson(std::string_view text, Json& out) {
    Json parsed = Json::parse(text.begin(), text.end(), nullptr, false);
    if (parsed.is_discarded()) {
        SPROCKET_LOGE("serial") << "failed to parse JSON document (" << text.size() << " bytes)";
        return false;
    }
    out = std::move(parsed);
    return true;
}

std::string dumpJson(const Json& json, int indent) {
    return json.dump(indent, ' ', false, Json::error_handler_t::replace);
}

} // namespace sprocket::serial
