#include "ease/ease.h"

#include "core/log.h"

namespace sprocket::ease {

const char* easeCurveName(EaseCurve curve) {
    switch (curve) {
    case EaseCurve::Linear:
        return "Linear";
    case EaseCurve::SineIn:
        return "SineIn";
    case EaseCurve::SineOut:
        return "SineOut";
    case EaseCurve::SineInOut:
        return "SineInOut";
    case EaseCurve::QuadIn:
        return "QuadIn";
    case EaseCurve::QuadOut:
        return "QuadOut";
    case EaseCurve::QuadInOut:
        return "QuadInOut";
    case EaseCurve::CubicIn:
        return "CubicIn";
    case EaseCurve::CubicOut:
        return "CubicOut";
    case EaseCurve::CubicInOut:
        return "CubicInOut";
    }
    return "Linear";
}

std::optional<EaseCurve> parseEaseCurve(std::string_view name) {
    for (const EaseCurve curve : kAllEaseCurves) {
        if (name == easeCurveName(curve)) {
            return curve;
        }
    }
    SPROCKET_LOGW("ease") << "unknown ease curve '" << name << "'";
    return std::nullopt;
}

} // namespace sprocket::ease
