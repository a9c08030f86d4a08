#include <gtest/gtest.h>

#include "SvgGeometry/AspectRatio.hpp"
#include "TestSupport.hpp"

namespace svggeo {
namespace {

using test::ExpectRectNear;
using test::ExpectTransformNear;

AspectRatio ParseAspectRatio(const std::string& text) {
    ValueError error;
    const auto parsed = AspectRatio::Parse(text, error);
    EXPECT_TRUE(parsed.has_value()) << text << ": " << error.ToString();
    return parsed.value_or(AspectRatio());
}

ViewBox ParseViewBox(const std::string& text) {
    ValueError error;
    const auto parsed = ViewBox::Parse(text, error);
    EXPECT_TRUE(parsed.has_value()) << text << ": " << error.ToString();
    return parsed.value_or(ViewBox());
}

TEST(AspectRatioTest, DefaultIsXMidYMidMeet) {
    const AspectRatio ratio;
    EXPECT_FALSE(ratio.defer());
    ASSERT_TRUE(ratio.align().has_value());
    EXPECT_EQ(*ratio.align(), (Align{Align1D::kMid, Align1D::kMid, FitMode::kMeet}));
}

TEST(AspectRatioTest, ParsesValidStrings) {
    EXPECT_EQ(ParseAspectRatio("none"), AspectRatio(false, std::nullopt));
    EXPECT_EQ(ParseAspectRatio("xMidYMid"), AspectRatio(false, Align{Align1D::kMid, Align1D::kMid, FitMode::kMeet}));
    EXPECT_EQ(ParseAspectRatio("defer none"), AspectRatio(true, std::nullopt));
    EXPECT_EQ(ParseAspectRatio("defer xMidYMax"), AspectRatio(true, Align{Align1D::kMid, Align1D::kMax, FitMode::kMeet}));
    EXPECT_EQ(ParseAspectRatio("defer xMinYMax slice"),
              AspectRatio(true, Align{Align1D::kMin, Align1D::kMax, FitMode::kSlice}));
    EXPECT_EQ(ParseAspectRatio("  xMaxYMin   meet "),
              AspectRatio(false, Align{Align1D::kMax, Align1D::kMin, FitMode::kMeet}));
}

TEST(AspectRatioTest, RejectsInvalidStrings) {
    for (const char* text : {"", "defer", "defer foo", "xMidYMid foo", "xMidYMid meet slice", "xmidymid", "xMidYMid,meet"}) {
        ValueError error;
        EXPECT_FALSE(AspectRatio::Parse(text, error).has_value()) << text;
    }
}

TEST(AspectRatioTest, ComputesAlignedRects) {
    const ViewBox vbox(Rect::FromSize(1.0, 10.0));
    const Rect viewport = Rect::FromSize(10.0, 1.0);

    struct Case {
        const char* text;
        Rect expected;
    };
    const Case cases[] = {
        {"xMinYMin meet", Rect::FromSize(0.1, 1.0)},
        {"xMinYMin slice", Rect::FromSize(10.0, 100.0)},
        {"xMinYMid meet", Rect::FromSize(0.1, 1.0)},
        {"xMinYMid slice", Rect(0.0, -49.5, 10.0, 100.0 - 49.5)},
        {"xMinYMax meet", Rect::FromSize(0.1, 1.0)},
        {"xMinYMax slice", Rect(0.0, -99.0, 10.0, 1.0)},
        {"xMidYMin meet", Rect(4.95, 0.0, 4.95 + 0.1, 1.0)},
        {"xMidYMin slice", Rect::FromSize(10.0, 100.0)},
        {"xMidYMid meet", Rect(4.95, 0.0, 4.95 + 0.1, 1.0)},
        {"xMidYMid slice", Rect(0.0, -49.5, 10.0, 100.0 - 49.5)},
        {"xMidYMax meet", Rect(4.95, 0.0, 4.95 + 0.1, 1.0)},
        {"xMidYMax slice", Rect(0.0, -99.0, 10.0, 1.0)},
        {"xMaxYMin meet", Rect(9.9, 0.0, 10.0, 1.0)},
        {"xMaxYMin slice", Rect::FromSize(10.0, 100.0)},
        {"xMaxYMid meet", Rect(9.9, 0.0, 10.0, 1.0)},
        {"xMaxYMid slice", Rect(0.0, -49.5, 10.0, 100.0 - 49.5)},
        {"xMaxYMax meet", Rect(9.9, 0.0, 10.0, 1.0)},
        {"xMaxYMax slice", Rect(0.0, -99.0, 10.0, 1.0)},
    };

    for (const auto& c : cases) {
        SCOPED_TRACE(c.text);
        ExpectRectNear(ParseAspectRatio(c.text).Compute(vbox, viewport), c.expected);
    }
}

TEST(AspectRatioTest, NoneStretchesToViewport) {
    const Rect viewport(5.0, 5.0, 15.0, 25.0);
    EXPECT_EQ(ParseAspectRatio("none").Compute(ViewBox(Rect::FromSize(1.0, 1.0)), viewport), viewport);
}

TEST(AspectRatioTest, EmptyViewportRendersNothing) {
    std::optional<Transform> transform = Transform::Identity();
    EXPECT_TRUE(AspectRatio().ViewportToViewboxTransform(ParseViewBox("10 10 40 40"), Rect::FromSize(0.0, 0.0), transform));
    EXPECT_FALSE(transform.has_value());

    transform = Transform::Identity();
    EXPECT_TRUE(AspectRatio().ViewportToViewboxTransform(std::nullopt, Rect::FromSize(10.0, 0.0), transform));
    EXPECT_FALSE(transform.has_value());
}

TEST(AspectRatioTest, EmptyViewBoxRendersNothing) {
    std::optional<Transform> transform = Transform::Identity();
    EXPECT_TRUE(AspectRatio().ViewportToViewboxTransform(ParseViewBox("10 10 0 0"), Rect::FromSize(10.0, 10.0), transform));
    EXPECT_FALSE(transform.has_value());

    transform = Transform::Identity();
    EXPECT_TRUE(AspectRatio().ViewportToViewboxTransform(ParseViewBox("0 0 10 0"), Rect::FromSize(10.0, 10.0), transform));
    EXPECT_FALSE(transform.has_value());
}

TEST(AspectRatioTest, MapsViewBoxOntoViewport) {
    std::optional<Transform> transform;
    EXPECT_TRUE(AspectRatio().ViewportToViewboxTransform(ParseViewBox("10 10 40 40"), Rect(1.0, 1.0, 2.0, 2.0), transform));
    ASSERT_TRUE(transform.has_value());
    ExpectTransformNear(*transform,
                        Transform::Identity().PreTranslate(1.0, 1.0).PreScale(0.025, 0.025).PreTranslate(-10.0, -10.0));
}

TEST(AspectRatioTest, WithoutViewBoxTranslatesToViewportOrigin) {
    std::optional<Transform> transform;
    EXPECT_TRUE(AspectRatio().ViewportToViewboxTransform(std::nullopt, Rect(3.0, 4.0, 13.0, 14.0), transform));
    ASSERT_TRUE(transform.has_value());
    EXPECT_EQ(*transform, Transform::NewTranslate(3.0, 4.0));
}

TEST(AspectRatioTest, HugeViewBoxIsNotInvertible) {
    std::optional<Transform> transform;
    EXPECT_FALSE(AspectRatio().ViewportToViewboxTransform(ParseViewBox("0 0 6E20 540"), Rect(1.0, 1.0, 2.0, 2.0), transform));
    EXPECT_FALSE(transform.has_value());
}

} // namespace
} // namespace svggeo
