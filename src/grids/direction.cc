#include "grids/direction.h"

namespace sprocket::grids {
namespace {

constexpr float kTau = 6.28318530717958647692f;

} // namespace

float radians(Direction4 dir) {
    const std::size_t turnsFromEast = detail::wrapIndex(static_cast<int>(dir) - 1, 4);
    return static_cast<float>(turnsFromEast) * (kTau / 4.0f);
}

float radians(Direction8 dir) {
    const std::size_t turnsFromEast = detail::wrapIndex(static_cast<int>(dir) - 2, 8);
    return static_cast<float>(turnsFromEast) * (kTau / 8.0f);
}

const char* directionName(Direction4 dir) {
    switch (dir) {
    case Direction4::North:
        return "North";
    case Direction4::East:
        return "East";
    case Direction4::South:
        return "South";
    case Direction4::West:
        return "West";
    }
    return "North";
}

const char* directionName(Direction8 dir) {
    switch (dir) {
    case Direction8::North:
        return "North";
    case Direction8::NorthEast:
        return "NorthEast";
    case Direction8::East:
        return "East";
    case Direction8::SouthEast:
        return "SouthEast";
    case Direction8::South:
        return "South";
    case Direction8::SouthWest:
        return "SouthWest";
    case Direction8::West:
        return "West";
    case Direction8::NorthWest:
        return "NorthWest";
    }
    return "North";
}

const char* rotationName(Rotation rotation) {
    return rotation == Rotation::Clockwise ? "Clockwise" : "CounterClockwise";
}

} // namespace sprocket::grids
