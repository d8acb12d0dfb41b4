#include <gtest/gtest.h>

#include <array>

#include "ease/ease.h"

namespace {

using sprocket::ease::EaseCurve;

TEST(Ease, LerpHitsEndpointsAndExtrapolates) {
    EXPECT_FLOAT_EQ(sprocket::ease::lerp(0.0f, 10.0f, 20.0f), 10.0f);
    EXPECT_FLOAT_EQ(sprocket::ease::lerp(1.0f, 10.0f, 20.0f), 20.0f);
    EXPECT_FLOAT_EQ(sprocket::ease::lerp(0.25f, 10.0f, 20.0f), 12.5f);
    EXPECT_FLOAT_EQ(sprocket::ease::lerp(1.5f, 10.0f, 20.0f), 25.0f);
    EXPECT_DOUBLE_EQ(sprocket::ease::lerp(-1.0, 0.0, 4.0), -4.0);
}

TEST(Ease, LerpArrayWorksPerComponent) {
    const std::array<float, 3> start{0.0f, 1.0f, -2.0f};
    const std::array<float, 3> end{10.0f, 1.0f, 2.0f};
    const std::array<float, 3> mid = sprocket::ease::lerp(0.5f, start, end);
    EXPECT_FLOAT_EQ(mid[0], 5.0f);
    EXPECT_FLOAT_EQ(mid[1], 1.0f);
    EXPECT_FLOAT_EQ(mid[2], 0.0f);
}

TEST(Ease, EveryCurveMapsEndpointsToEndpoints) {
    for (const EaseCurve curve : sprocket::ease::kAllEaseCurves) {
        EXPECT_NEAR(sprocket::ease::easeValue(curve, 0.0f), 0.0f, 1e-6f) << sprocket::ease::easeCurveName(curve);
        EXPECT_NEAR(sprocket::ease::easeValue(curve, 1.0f), 1.0f, 1e-6f) << sprocket::ease::easeCurveName(curve);
        EXPECT_NEAR(sprocket::ease::interpolate(curve, 1.0, -3.0, 7.0), 7.0, 1e-9) << sprocket::ease::easeCurveName(curve);
    }
}

TEST(Ease, InOutCurvesPassThroughMidpoint) {
    EXPECT_NEAR(sprocket::ease::sineInOut(0.5), 0.5, 1e-12);
    EXPECT_NEAR(sprocket::ease::quadInOut(0.5), 0.5, 1e-12);
    EXPECT_NEAR(sprocket::ease::cubicInOut(0.5), 0.5, 1e-12);
}

TEST(Ease, KnownSamples) {
    EXPECT_NEAR(sprocket::ease::sineIn(0.5), 1.0 - 0.70710678118654752, 1e-12);
    EXPECT_NEAR(sprocket::ease::sineOut(0.5), 0.70710678118654752, 1e-12);
    EXPECT_DOUBLE_EQ(sprocket::ease::quadIn(0.5), 0.25);
    EXPECT_DOUBLE_EQ(sprocket::ease::quadOut(0.5), 0.75);
    EXPECT_DOUBLE_EQ(sprocket::ease::quadInOut(0.25), 0.125);
    EXPECT_DOUBLE_EQ(sprocket::ease::quadInOut(0.75), 0.875);
    EXPECT_DOUBLE_EQ(sprocket::ease::cubicIn(0.5), 0.125);
    EXPECT_DOUBLE_EQ(sprocket::ease::cubicOut(0.5), 0.875);
}

TEST(Ease, InCurvesStartSlowOutCurvesStartFast) {
    for (double t = 0.05; t < 1.0; t += 0.1) {
        EXPECT_LT(sprocket::ease::sineIn(t), t);
        EXPECT_GT(sprocket::ease::sineOut(t), t);
        EXPECT_LT(sprocket::ease::quadIn(t), t);
        EXPECT_GT(sprocket::ease::quadOut(t), t);
    }
}

TEST(Ease, ThreeArgumentFormsLerpWithEasedProgress) {
    EXPECT_DOUBLE_EQ(sprocket::ease::quadIn(0.5, 100.0, 200.0), 125.0);
    EXPECT_DOUBLE_EQ(sprocket::ease::quadOut(0.5, 100.0, 200.0), 175.0);
    EXPECT_NEAR(sprocket::ease::sineInOut(0.5f, 0.0f, 8.0f), 4.0f, 1e-5f);
    EXPECT_DOUBLE_EQ(sprocket::ease::interpolate(EaseCurve::Linear, 0.3, 0.0, 10.0), 3.0);
}

TEST(Ease, CurveNamesRoundTrip) {
    for (const EaseCurve curve : sprocket::ease::kAllEaseCurves) {
        EXPECT_EQ(sprocket::ease::parseEaseCurve(sprocket::ease::easeCurveName(curve)), curve);
    }
    EXPECT_FALSE(sprocket::ease::parseEaseCurve("Bounce").has_value());
    EXPECT_FALSE(sprocket::ease::parseEaseCurve("quadin").has_value());
}

} // namespace
