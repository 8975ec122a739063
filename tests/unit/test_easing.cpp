#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <motionline/easing.hpp>

using namespace motionline;

namespace
{

constexpr Easing ALL_EASINGS[] = {
    Easing::Linear,
    Easing::EaseIn,
    Easing::EaseOut,
    Easing::EaseInOut,
    Easing::Bounce,
};

}   // anonymous namespace

// ─── Boundary properties ─────────────────────────────────────────────────────

TEST(EasingBoundary, EndpointsAreExact)
{
    for (Easing e : ALL_EASINGS)
    {
        SCOPED_TRACE(easing_name(e));
        EXPECT_EQ(apply_easing(e, 0.0), 0.0);
        EXPECT_EQ(apply_easing(e, 1.0), 1.0);
    }
}

TEST(EasingBoundary, InputsOutsideUnitAreClamped)
{
    for (Easing e : ALL_EASINGS)
    {
        SCOPED_TRACE(easing_name(e));
        EXPECT_EQ(apply_easing(e, -0.5), 0.0);
        EXPECT_EQ(apply_easing(e, 1.5), 1.0);
    }
}

TEST(EasingBoundary, NaNMapsToZero)
{
    double nan = std::numeric_limits<double>::quiet_NaN();
    for (Easing e : ALL_EASINGS)
    {
        EXPECT_EQ(apply_easing(e, nan), 0.0);
    }
}

TEST(EasingBoundary, OutputStaysInUnitRange)
{
    for (Easing e : ALL_EASINGS)
    {
        for (int i = 0; i <= 100; ++i)
        {
            double v = apply_easing(e, i / 100.0);
            EXPECT_GE(v, 0.0) << easing_name(e) << " at " << i;
            EXPECT_LE(v, 1.0) << easing_name(e) << " at " << i;
        }
    }
}

// ─── Curve values ────────────────────────────────────────────────────────────

TEST(EasingCurves, Linear)
{
    EXPECT_DOUBLE_EQ(ease::linear(0.25), 0.25);
    EXPECT_DOUBLE_EQ(ease::linear(0.5), 0.5);
}

TEST(EasingCurves, QuadraticInOut)
{
    EXPECT_DOUBLE_EQ(ease::ease_in(0.5), 0.25);
    EXPECT_DOUBLE_EQ(ease::ease_out(0.5), 0.75);
    EXPECT_DOUBLE_EQ(ease::ease_in_out(0.25), 0.125);
    EXPECT_DOUBLE_EQ(ease::ease_in_out(0.5), 0.5);
    EXPECT_DOUBLE_EQ(ease::ease_in_out(0.75), 0.875);
}

TEST(EasingCurves, EaseInOutIsSymmetric)
{
    for (int i = 0; i <= 20; ++i)
    {
        double t = i / 20.0;
        EXPECT_NEAR(ease::ease_in_out(t) + ease::ease_in_out(1.0 - t), 1.0, 1e-12);
    }
}

TEST(EasingCurves, BounceHalfway)
{
    EXPECT_NEAR(ease::bounce(0.5), 0.765625, 1e-9);
}

TEST(EasingCurves, BounceFirstBandBoundary)
{
    double b = 1.0 / 2.75;
    // First band reaches 1 at its boundary; the second band starts there too.
    EXPECT_NEAR(ease::bounce(b - 1e-9), 1.0, 1e-6);
    EXPECT_NEAR(ease::bounce(b), 1.0, 1e-6);
    EXPECT_LT(ease::bounce(b + 0.05), 1.0);
    EXPECT_NEAR(ease::bounce(0.2), 7.5625 * 0.04, 1e-12);
}

TEST(EasingCurves, BounceLaterBands)
{
    // Band minima sit at the documented offsets
    EXPECT_NEAR(ease::bounce(1.5 / 2.75), 0.75, 1e-12);
    EXPECT_NEAR(ease::bounce(2.25 / 2.75), 0.9375, 1e-12);
    EXPECT_NEAR(ease::bounce(2.625 / 2.75), 0.984375, 1e-12);
}

TEST(EasingCurves, MonotonicQuadratics)
{
    for (EasingFn fn : {ease::linear, ease::ease_in, ease::ease_out, ease::ease_in_out})
    {
        double prev = fn(0.0);
        for (int i = 1; i <= 50; ++i)
        {
            double v = fn(i / 50.0);
            EXPECT_GE(v, prev);
            prev = v;
        }
    }
}

// ─── Names ───────────────────────────────────────────────────────────────────

TEST(EasingNames, ParseCanonicalAndCamelCase)
{
    EXPECT_EQ(parse_easing("linear"), Easing::Linear);
    EXPECT_EQ(parse_easing("ease_in"), Easing::EaseIn);
    EXPECT_EQ(parse_easing("easeIn"), Easing::EaseIn);
    EXPECT_EQ(parse_easing("easeOut"), Easing::EaseOut);
    EXPECT_EQ(parse_easing("easeInOut"), Easing::EaseInOut);
    EXPECT_EQ(parse_easing("bounce"), Easing::Bounce);
    EXPECT_FALSE(parse_easing("elastic").has_value());
    EXPECT_FALSE(parse_easing("").has_value());
}

TEST(EasingNames, NameRoundTrip)
{
    for (Easing e : ALL_EASINGS)
    {
        EXPECT_EQ(parse_easing(easing_name(e)), e);
    }
}

TEST(EasingNames, UnknownNameFallsBackToLinear)
{
    EXPECT_DOUBLE_EQ(apply_easing("spring", 0.3), 0.3);
    EXPECT_DOUBLE_EQ(apply_easing("spring", 0.7), 0.7);
    EXPECT_DOUBLE_EQ(apply_easing("easeIn", 0.5), 0.25);
}
