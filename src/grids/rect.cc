#include "grids/rect.h"

#include <algorithm>
#include <limits>

namespace sprocket::grids {

IRect IRect::centered(const ICoord& center, std::uint32_t width, std::uint32_t height) {
    // Origins below INT32_MIN are clamped; the rect then reaches that far less to the left/top.
    constexpr std::int64_t kMinCoord = std::numeric_limits<std::int32_t>::min();
    const std::int64_t newLeft = std::max(static_cast<std::int64_t>(center.x) - width / 2u, kMinCoord);
    const std::int64_t newTop = std::max(static_cast<std::int64_t>(center.y) - height / 2u, kMinCoord);
    return IRect{static_cast<std::int32_t>(newLeft), static_cast<std::int32_t>(newTop), width, height};
}

std::vector<ICoord> IRect::containedCoords() const {
    std::vector<ICoord> coords;
    if (empty()) {
        return coords;
    }

    constexpr std::int64_t kMaxCoord = std::numeric_limits<std::int32_t>::max();
    const std::int64_t lastX = std::min(right(), kMaxCoord);
    const std::int64_t lastY = std::min(bottom(), kMaxCoord);
    const std::uint64_t columns = static_cast<std::uint64_t>(lastX - left + 1);
    const std::uint64_t rows = static_cast<std::uint64_t>(lastY - top + 1);

    coords.reserve(static_cast<std::size_t>(columns * rows));
    for (std::int64_t y = top; y <= lastY; ++y) {
        for (std::int64_t x = left; x <= lastX; ++x) {
            coords.emplace_back(static_cast<std::int32_t>(x), static_cast<std::int32_t>(y));
        }
    }
    return coords;
}

} // namespace sprocket::grids
