#pragma once

#include <array>
#include <cstdint>

#include "grids/coord.h"

// Grids Direction subsystem
// Responsible for: 4-way and 8-way compass directions, rotation steps, and their grid deltas.
// Should NOT do: pathfinding, facing interpolation, or 3D axes.
//
// Screen convention: +x is right (East), +y is down (South). Enumerators are ordered clockwise
// starting at North, so the underlying value doubles as a rotation index.
namespace sprocket::grids {

enum class Rotation : std::uint8_t {
    Clockwise = 0,
    CounterClockwise = 1
};

inline constexpr int stepsClockwise(Rotation rotation) {
    return rotation == Rotation::Clockwise ? 1 : -1;
}

enum class Direction4 : std::uint8_t {
    North = 0,
    East = 1,
    South = 2,
    West = 3
};

enum class Direction8 : std::uint8_t {
    North = 0,
    NorthEast = 1,
    East = 2,
    SouthEast = 3,
    South = 4,
    SouthWest = 5,
    West = 6,
    NorthWest = 7
};

inline constexpr std::array<Direction4, 4> kAllDirection4 = {
    Direction4::North,
    Direction4::East,
    Direction4::South,
    Direction4::West
};

inline constexpr std::array<Direction8, 8> kAllDirection8 = {
    Direction8::North,
    Direction8::NorthEast,
    Direction8::East,
    Direction8::SouthEast,
    Direction8::South,
    Direction8::SouthWest,
    Direction8::West,
    Direction8::NorthWest
};

namespace detail {

inline constexpr std::size_t wrapIndex(int index, int count) {
    const int wrapped = index % count;
    return static_cast<std::size_t>(wrapped < 0 ? wrapped + count : wrapped);
}

} // namespace detail

// Negative steps turn counter-clockwise.
inline constexpr Direction4 rotateBy(Direction4 dir, int steps) {
    return kAllDirection4[detail::wrapIndex(static_cast<int>(dir) + steps, 4)];
}

inline constexpr Direction8 rotateBy(Direction8 dir, int steps) {
    return kAllDirection8[detail::wrapIndex(static_cast<int>(dir) + steps, 8)];
}

inline constexpr Direction4 rotate(Direction4 dir, Rotation rotation) {
    return rotateBy(dir, stepsClockwise(rotation));
}

inline constexpr Direction8 rotate(Direction8 dir, Rotation rotation) {
    return rotateBy(dir, stepsClockwise(rotation));
}

inline constexpr Direction4 flip(Direction4 dir) {
    return rotateBy(dir, 2);
}

inline constexpr Direction8 flip(Direction8 dir) {
    return rotateBy(dir, 4);
}

inline constexpr bool isHorizontal(Direction4 dir) {
    return dir == Direction4::East || dir == Direction4::West;
}

inline constexpr bool isVertical(Direction4 dir) {
    return dir == Direction4::North || dir == Direction4::South;
}

inline constexpr ICoord deltas(Direction4 dir) {
    switch (dir) {
    case Direction4::North: return ICoord{0, -1};
    case Direction4::East: return ICoord{1, 0};
    case Direction4::South: return ICoord{0, 1};
    case Direction4::West: return ICoord{-1, 0};
    }
    return ICoord{0, 0};
}

inline constexpr ICoord deltas(Direction8 dir) {
    switch (dir) {
    case Direction8::North: return ICoord{0, -1};
    case Direction8::NorthEast: return ICoord{1, -1};
    case Direction8::East: return ICoord{1, 0};
    case Direction8::SouthEast: return ICoord{1, 1};
    case Direction8::South: return ICoord{0, 1};
    case Direction8::SouthWest: return ICoord{-1, 1};
    case Direction8::West: return ICoord{-1, 0};
    case Direction8::NorthWest: return ICoord{-1, -1};
    }
    return ICoord{0, 0};
}

inline constexpr Direction8 toDirection8(Direction4 dir) {
    return kAllDirection8[static_cast<std::size_t>(dir) * 2u];
}

// 0 is East and angles grow clockwise (toward +y), so North is three quarters of a turn.
float radians(Direction4 dir);
float radians(Direction8 dir);

const char* directionName(Direction4 dir);
const char* directionName(Direction8 dir);
const char* rotationName(Rotation rotation);

inline constexpr ICoord operator+(const ICoord& coord, Direction4 dir) {
    return coord + deltas(dir);
}

inline constexpr ICoord operator+(const ICoord& coord, Direction8 dir) {
    return coord + deltas(dir);
}

inline constexpr ICoord& operator+=(ICoord& coord, Direction4 dir) {
    coord += deltas(dir);
    return coord;
}

inline constexpr ICoord& operator+=(ICoord& coord, Direction8 dir) {
    coord += deltas(dir);
    return coord;
}

} // namespace sprocket::grids
