#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

// Ease subsystem
// Responsible for: linear interpolation and the classic easing curves (see easings.net).
// Should NOT do: own timelines, tween state, or clamp progress.
//
// Every curve maps progress t to an eased t and lerps with it. t outside [0, 1] is accepted and
// extrapolates.
namespace sprocket::ease {

template <typename F>
inline constexpr F kPi = static_cast<F>(3.14159265358979323846);

template <typename F, typename Value>
inline constexpr Value lerp(F t, const Value& start, const Value& end) {
    static_assert(std::is_floating_point_v<F>, "interpolation factor must be floating point");
    return start * (F(1) - t) + end * t;
}

template <typename F, std::size_t N>
inline constexpr std::array<F, N> lerp(F t, const std::array<F, N>& start, const std::array<F, N>& end) {
    std::array<F, N> out{};
    for (std::size_t i = 0; i < N; ++i) {
        out[i] = lerp(t, start[i], end[i]);
    }
    return out;
}

template <typename F>
inline F sineIn(F t) {
    return F(1) - std::cos((t * kPi<F>) / F(2));
}

template <typename F>
inline F sineOut(F t) {
    return std::sin((t * kPi<F>) / F(2));
}

template <typename F>
inline F sineInOut(F t) {
    return -(std::cos(t * kPi<F>) - F(1)) / F(2);
}

template <typename F>
inline constexpr F quadIn(F t) {
    return t * t;
}

template <typename F>
inline constexpr F quadOut(F t) {
    return F(1) - (F(1) - t) * (F(1) - t);
}

template <typename F>
inline constexpr F quadInOut(F t) {
    if (t < F(0.5)) {
        return F(2) * t * t;
    }
    const F u = F(-2) * t + F(2);
    return F(1) - (u * u) / F(2);
}

template <typename F>
inline constexpr F cubicIn(F t) {
    return t * t * t;
}

template <typename F>
inline constexpr F cubicOut(F t) {
    const F u = F(1) - t;
    return F(1) - u * u * u;
}

template <typename F>
inline constexpr F cubicInOut(F t) {
    if (t < F(0.5)) {
        return F(4) * t * t * t;
    }
    const F u = F(-2) * t + F(2);
    return F(1) - (u * u * u) / F(2);
}

template <typename F, typename Value>
inline Value sineIn(F t, const Value& start, const Value& end) { return lerp(sineIn(t), start, end); }
template <typename F, typename Value>
inline Value sineOut(F t, const Value& start, const Value& end) { return lerp(sineOut(t), start, end); }
template <typename F, typename Value>
inline Value sineInOut(F t, const Value& start, const Value& end) { return lerp(sineInOut(t), start, end); }
template <typename F, typename Value>
inline Value quadIn(F t, const Value& start, const Value& end) { return lerp(quadIn(t), start, end); }
template <typename F, typename Value>
inline Value quadOut(F t, const Value& start, const Value& end) { return lerp(quadOut(t), start, end); }
template <typename F, typename Value>
inline Value quadInOut(F t, const Value& start, const Value& end) { return lerp(quadInOut(t), start, end); }
template <typename F, typename Value>
inline Value cubicIn(F t, const Value& start, const Value& end) { return lerp(cubicIn(t), start, end); }
template <typename F, typename Value>
inline Value cubicOut(F t, const Value& start, const Value& end) { return lerp(cubicOut(t), start, end); }
template <typename F, typename Value>
inline Value cubicInOut(F t, const Value& start, const Value& end) { return lerp(cubicInOut(t), start, end); }

enum class EaseCurve : std::uint8_t {
    Linear = 0,
    SineIn,
    SineOut,
    SineInOut,
    QuadIn,
    QuadOut,
    QuadInOut,
    CubicIn,
    CubicOut,
    CubicInOut
};

inline constexpr std::array<EaseCurve, 10> kAllEaseCurves = {
    EaseCurve::Linear,
    EaseCurve::SineIn,
    EaseCurve::SineOut,
    EaseCurve::SineInOut,
    EaseCurve::QuadIn,
    EaseCurve::QuadOut,
    EaseCurve::QuadInOut,
    EaseCurve::CubicIn,
    EaseCurve::CubicOut,
    EaseCurve::CubicInOut
};

template <typename F>
inline F easeValue(EaseCurve curve, F t) {
    switch (curve) {
    case EaseCurve::Linear: return t;
    case EaseCurve::SineIn: return sineIn(t);
    case EaseCurve::SineOut: return sineOut(t);
    case EaseCurve::SineInOut: return sineInOut(t);
    case EaseCurve::QuadIn: return quadIn(t);
    case EaseCurve::QuadOut: return quadOut(t);
    case EaseCurve::QuadInOut: return quadInOut(t);
    case EaseCurve::CubicIn: return cubicIn(t);
    case EaseCurve::CubicOut: return cubicOut(t);
    case EaseCurve::CubicInOut: return cubicInOut(t);
    }
    return t;
}

template <typename F, typename Value>
inline Value interpolate(EaseCurve curve, F t, const Value& start, const Value& end) {
    return lerp(easeValue(curve, t), start, end);
}

const char* easeCurveName(EaseCurve curve);
// Case-sensitive match on the names easeCurveName produces, e.g. "QuadInOut".
std::optional<EaseCurve> parseEaseCurve(std::string_view name);

} // namespace sprocket::ease
