#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

#include "core/hash.h"

// Grids Coord subsystem
// Responsible for: signed and unsigned 2D integer coordinates and their arithmetic.
// Should NOT do: know about tile contents, world units, or camera transforms.
namespace sprocket::grids {

struct ICoord;

// Unsigned coordinates, e.g. indices into a flattened 2D array.
struct Coord {
    std::uint32_t x = 0;
    std::uint32_t y = 0;

    constexpr Coord() = default;
    constexpr Coord(std::uint32_t xIn, std::uint32_t yIn) : x(xIn), y(yIn) {}

    constexpr bool operator==(const Coord&) const = default;

    constexpr Coord operator+(const Coord& rhs) const {
        return Coord{x + rhs.x, y + rhs.y};
    }

    constexpr Coord operator*(std::uint32_t scalar) const {
        return Coord{x * scalar, y * scalar};
    }

    constexpr Coord& operator+=(const Coord& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    constexpr Coord& operator*=(std::uint32_t scalar) {
        x *= scalar;
        y *= scalar;
        return *this;
    }

    // y * width + x
    constexpr std::size_t to2dIndex(std::size_t width) const {
        return static_cast<std::size_t>(y) * width + static_cast<std::size_t>(x);
    }

    constexpr ICoord toICoord() const;
};

struct ICoord {
    std::int32_t x = 0;
    std::int32_t y = 0;

    constexpr ICoord() = default;
    constexpr ICoord(std::int32_t xIn, std::int32_t yIn) : x(xIn), y(yIn) {}

    constexpr bool operator==(const ICoord&) const = default;

    constexpr ICoord operator+(const ICoord& rhs) const {
        return ICoord{x + rhs.x, y + rhs.y};
    }

    constexpr ICoord operator-(const ICoord& rhs) const {
        return ICoord{x - rhs.x, y - rhs.y};
    }

    constexpr ICoord operator*(std::int32_t scalar) const {
        return ICoord{x * scalar, y * scalar};
    }

    constexpr ICoord& operator+=(const ICoord& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    constexpr ICoord& operator-=(const ICoord& rhs) {
        x -= rhs.x;
        y -= rhs.y;
        return *this;
    }

    constexpr ICoord& operator*=(std::int32_t scalar) {
        x *= scalar;
        y *= scalar;
        return *this;
    }

    // 1: +x +y, 2: -x +y, 3: -x -y, 4: +x -y. Zero counts as positive.
    constexpr int quadrant() const {
        const bool posX = x >= 0;
        const bool posY = y >= 0;
        if (posX && posY) return 1;
        if (!posX && posY) return 2;
        if (!posX && !posY) return 3;
        return 4;
    }
};

inline constexpr ICoord Coord::toICoord() const {
    return ICoord{static_cast<std::int32_t>(x), static_cast<std::int32_t>(y)};
}

inline constexpr std::optional<Coord> toCoord(const ICoord& coord) {
    if (coord.x < 0 || coord.y < 0) {
        return std::nullopt;
    }
    return Coord{static_cast<std::uint32_t>(coord.x), static_cast<std::uint32_t>(coord.y)};
}

} // namespace sprocket::grids

namespace std {

template <>
struct hash<sprocket::grids::Coord> {
    size_t operator()(const sprocket::grids::Coord& coord) const noexcept {
        return sprocket::core::hashCombine(hash<uint32_t>{}(coord.x), coord.y);
    }
};

template <>
struct hash<sprocket::grids::ICoord> {
    size_t operator()(const sprocket::grids::ICoord& coord) const noexcept {
        return sprocket::core::hashCombine(hash<int32_t>{}(coord.x), coord.y);
    }
};

} // namespace std
