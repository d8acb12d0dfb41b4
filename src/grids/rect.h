#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "grids/coord.h"

// Grids Rect subsystem
// Responsible for: integer rectangles (rooms, selection boxes, camera bounds) and iterating their cells.
// Should NOT do: float geometry, clipping against other shapes, or spatial indexing.
namespace sprocket::grids {

struct IRect {
    std::int32_t left = 0;
    std::int32_t top = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;

    constexpr IRect() = default;
    constexpr IRect(std::int32_t leftIn, std::int32_t topIn, std::uint32_t widthIn, std::uint32_t heightIn)
        : left(leftIn), top(topIn), width(widthIn), height(heightIn) {}

    constexpr bool operator==(const IRect&) const = default;

    static IRect centered(const ICoord& center, std::uint32_t width, std::uint32_t height);

    // Last column/row inside the rect. Less than left/top when the rect is empty. 64-bit because a
    // rect may reach past the int32 coordinate range.
    constexpr std::int64_t right() const {
        return static_cast<std::int64_t>(left) + static_cast<std::int64_t>(width) - 1;
    }

    constexpr std::int64_t bottom() const {
        return static_cast<std::int64_t>(top) + static_cast<std::int64_t>(height) - 1;
    }

    constexpr std::uint64_t area() const {
        return static_cast<std::uint64_t>(width) * static_cast<std::uint64_t>(height);
    }

    constexpr bool empty() const {
        return width == 0 || height == 0;
    }

    // Boundary cells count as inside.
    constexpr bool contains(const ICoord& pos) const {
        return top <= pos.y && bottom() >= pos.y && left <= pos.x && right() >= pos.x;
    }

    constexpr IRect shifted(const ICoord& by) const {
        return IRect{left + by.x, top + by.y, width, height};
    }

    // Reading order: left to right, then top to bottom. Empty rects yield nothing, and cells past
    // INT32_MAX are left out since ICoord cannot hold them.
    std::vector<ICoord> containedCoords() const;
};

inline constexpr IRect operator+(const IRect& rect, const ICoord& by) {
    return rect.shifted(by);
}

} // namespace sprocket::grids

namespace std {

template <>
struct hash<sprocket::grids::IRect> {
    size_t operator()(const sprocket::grids::IRect& rect) const noexcept {
        size_t seed = hash<int32_t>{}(rect.left);
        seed = sprocket::core::hashCombine(seed, rect.top);
        seed = sprocket::core::hashCombine(seed, rect.width);
        return sprocket::core::hashCombine(seed, rect.height);
    }
};

} // namespace std
