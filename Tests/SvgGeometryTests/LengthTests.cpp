#include <gtest/gtest.h>

#include <cmath>

#include "SvgGeometry/Length.hpp"

namespace svggeo {
namespace {

NormalizeParams ParamsFor(double width, double height, double font_size = 12.0) {
    NormalizeParams params;
    params.dpi = Dpi{96.0, 96.0};
    params.vbox = Rect::FromSize(width, height);
    params.font_size = font_size;
    return params;
}

TEST(LengthTest, ParsesDefaultUnitAsPixels) {
    ValueError error;
    const auto length = Length<Horizontal>::Parse("42", error);
    ASSERT_TRUE(length.has_value());
    EXPECT_EQ(*length, Length<Horizontal>(42.0, LengthUnit::kPx));
}

TEST(LengthTest, ParsesUnits) {
    ValueError error;
    EXPECT_EQ(*Length<Horizontal>::Parse("-42px", error), Length<Horizontal>(-42.0, LengthUnit::kPx));
    EXPECT_EQ(*Length<Horizontal>::Parse("50.0%", error), Length<Horizontal>(0.5, LengthUnit::kPercent));
    EXPECT_EQ(*Length<Horizontal>::Parse("8em", error), Length<Horizontal>(8.0, LengthUnit::kEm));
    EXPECT_EQ(*Length<Horizontal>::Parse("8ex", error), Length<Horizontal>(8.0, LengthUnit::kEx));
    EXPECT_EQ(*Length<Horizontal>::Parse("2in", error), Length<Horizontal>(2.0, LengthUnit::kIn));
    EXPECT_EQ(*Length<Horizontal>::Parse("2cm", error), Length<Horizontal>(2.0, LengthUnit::kCm));
    EXPECT_EQ(*Length<Horizontal>::Parse("2mm", error), Length<Horizontal>(2.0, LengthUnit::kMm));
    EXPECT_EQ(*Length<Horizontal>::Parse("2pt", error), Length<Horizontal>(2.0, LengthUnit::kPt));
    EXPECT_EQ(*Length<Horizontal>::Parse("2pc", error), Length<Horizontal>(2.0, LengthUnit::kPc));
    EXPECT_EQ(*Length<Horizontal>::Parse("  1e1px  ", error), Length<Horizontal>(10.0, LengthUnit::kPx));
}

TEST(LengthTest, RejectsUnknownUnit) {
    ValueError error;
    EXPECT_FALSE(Length<Horizontal>::Parse("10furlong", error).has_value());
    EXPECT_EQ(error.kind, ValueErrorKind::kParse);
    EXPECT_EQ(error.message, "unknown length unit: furlong");
}

TEST(LengthTest, RejectsDetachedUnitAndGarbage) {
    ValueError error;
    EXPECT_FALSE(Length<Horizontal>::Parse("10 px", error).has_value());
    EXPECT_FALSE(Length<Horizontal>::Parse("", error).has_value());
    EXPECT_FALSE(Length<Horizontal>::Parse("px", error).has_value());
    EXPECT_FALSE(Length<Horizontal>::Parse("10px 20px", error).has_value());
}

TEST(LengthTest, UnsignedRejectsNegativeValues) {
    for (const char* text : {"-1", "-0.5px", "-50%", "-1e2em"}) {
        ValueError error;
        EXPECT_FALSE(ULength<Horizontal>::Parse(text, error).has_value()) << text;
        EXPECT_EQ(error.kind, ValueErrorKind::kValue) << text;
        EXPECT_EQ(error.message, "value must be non-negative") << text;

        EXPECT_TRUE(Length<Horizontal>::Parse(text, error).has_value()) << text;
    }
}

TEST(LengthTest, UnsignedAcceptsZero) {
    ValueError error;
    const auto length = ULength<Vertical>::Parse("0", error);
    ASSERT_TRUE(length.has_value());
    EXPECT_EQ(length->length(), 0.0);
}

TEST(LengthTest, NormalizesPercentAgainstViewport) {
    const auto params = ParamsFor(100.0, 100.0);
    ValueError error;
    EXPECT_DOUBLE_EQ(Length<Horizontal>::Parse("50%", error)->Normalize(params), 50.0);
    EXPECT_DOUBLE_EQ(Length<Vertical>::Parse("25%", error)->Normalize(params), 25.0);
    EXPECT_DOUBLE_EQ(Length<Both>::Parse("50%", error)->Normalize(params), 50.0);
}

TEST(LengthTest, BothOrientationUsesNormalizedDiagonal) {
    const auto params = ParamsFor(200.0, 100.0);
    ValueError error;
    const double expected = 0.5 * std::sqrt(200.0 * 200.0 + 100.0 * 100.0) / std::sqrt(2.0);
    EXPECT_DOUBLE_EQ(Length<Both>::Parse("50%", error)->Normalize(params), expected);
    EXPECT_DOUBLE_EQ(Length<Horizontal>::Parse("50%", error)->Normalize(params), 100.0);
    EXPECT_DOUBLE_EQ(Length<Vertical>::Parse("50%", error)->Normalize(params), 50.0);
}

TEST(LengthTest, NormalizesPhysicalUnitsWithDpi) {
    const auto params = ParamsFor(100.0, 100.0);
    EXPECT_DOUBLE_EQ(Length<Horizontal>(1.0, LengthUnit::kIn).Normalize(params), 96.0);
    EXPECT_DOUBLE_EQ(Length<Horizontal>(2.54, LengthUnit::kCm).Normalize(params), 96.0);
    EXPECT_DOUBLE_EQ(Length<Horizontal>(25.4, LengthUnit::kMm).Normalize(params), 96.0);
    EXPECT_DOUBLE_EQ(Length<Horizontal>(72.0, LengthUnit::kPt).Normalize(params), 96.0);
    EXPECT_DOUBLE_EQ(Length<Horizontal>(6.0, LengthUnit::kPc).Normalize(params), 96.0);
}

TEST(LengthTest, OrientationSelectsDpiAxis) {
    NormalizeParams params = ParamsFor(100.0, 100.0);
    params.dpi = Dpi{100.0, 200.0};
    EXPECT_DOUBLE_EQ(Length<Horizontal>(1.0, LengthUnit::kIn).Normalize(params), 100.0);
    EXPECT_DOUBLE_EQ(Length<Vertical>(1.0, LengthUnit::kIn).Normalize(params), 200.0);
}

TEST(LengthTest, NormalizesFontRelativeUnits) {
    const auto params = ParamsFor(100.0, 100.0, 16.0);
    EXPECT_DOUBLE_EQ(Length<Horizontal>(1.5, LengthUnit::kEm).Normalize(params), 24.0);
    EXPECT_DOUBLE_EQ(Length<Horizontal>(1.0, LengthUnit::kEx).Normalize(params), 8.0);
}

TEST(LengthTest, NormalizeIsDeterministic) {
    const auto params = ParamsFor(123.0, 45.0);
    ValueError error;
    const auto length = Length<Both>::Parse("33.3%", error);
    ASSERT_TRUE(length.has_value());
    EXPECT_EQ(length->Normalize(params), length->Normalize(params));
}

} // namespace
} // namespace svggeo
