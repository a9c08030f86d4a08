#include <gtest/gtest.h>

#include <cmath>

#include "SvgGeometry/Transform.hpp"
#include "TestSupport.hpp"

namespace svggeo {
namespace {

using test::ExpectTransformNear;

std::optional<Transform> ParseTransform(const std::string& text) {
    ValueError error;
    return Transform::Parse(text, error);
}

ValueError ParseTransformError(const std::string& text) {
    ValueError error;
    EXPECT_FALSE(Transform::Parse(text, error).has_value()) << text;
    return error;
}

TEST(TransformTest, EmptyListIsIdentity) {
    const auto t = ParseTransform("");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, Transform::Identity());
}

TEST(TransformTest, ParsesMatrix) {
    const auto t = ParseTransform("matrix(1 2 3 4 5 6)");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(*t, Transform(1.0, 2.0, 3.0, 4.0, 5.0, 6.0));

    const auto with_commas = ParseTransform("matrix (1,2,3,4,5,6)");
    ASSERT_TRUE(with_commas.has_value());
    EXPECT_EQ(*with_commas, Transform(1.0, 2.0, 3.0, 4.0, 5.0, 6.0));
}

TEST(TransformTest, ParsesTranslateAndScaleDefaults) {
    EXPECT_EQ(*ParseTransform("translate(10)"), Transform::NewTranslate(10.0, 0.0));
    EXPECT_EQ(*ParseTransform("translate(10, -20)"), Transform::NewTranslate(10.0, -20.0));
    EXPECT_EQ(*ParseTransform("scale(2)"), Transform::NewScale(2.0, 2.0));
    EXPECT_EQ(*ParseTransform("scale(2 3)"), Transform::NewScale(2.0, 3.0));
}

TEST(TransformTest, ParsesRotateAroundPoint) {
    ExpectTransformNear(*ParseTransform("rotate(90)"), Transform(0.0, 1.0, -1.0, 0.0, 0.0, 0.0));

    const auto t = ParseTransform("rotate(90 10 10)");
    ASSERT_TRUE(t.has_value());
    const Point p = t->TransformPoint(20.0, 10.0);
    EXPECT_NEAR(p.x, 10.0, 1e-9);
    EXPECT_NEAR(p.y, 20.0, 1e-9);
    const Point center = t->TransformPoint(10.0, 10.0);
    EXPECT_NEAR(center.x, 10.0, 1e-9);
    EXPECT_NEAR(center.y, 10.0, 1e-9);
}

TEST(TransformTest, ParsesSkew) {
    ExpectTransformNear(*ParseTransform("skewX(45)"), Transform(1.0, 0.0, 1.0, 1.0, 0.0, 0.0));
    ExpectTransformNear(*ParseTransform("skewY(45)"), Transform(1.0, 1.0, 0.0, 1.0, 0.0, 0.0));
}

TEST(TransformTest, ListAppliesRightmostFirst) {
    const auto t = ParseTransform("translate(10, 20) scale(2)");
    ASSERT_TRUE(t.has_value());
    const Point p = t->TransformPoint(1.0, 1.0);
    EXPECT_DOUBLE_EQ(p.x, 12.0);
    EXPECT_DOUBLE_EQ(p.y, 22.0);
    EXPECT_EQ(*t, Transform::NewScale(2.0, 2.0).PostTranslate(10.0, 20.0));
}

TEST(TransformTest, RejectsSyntaxErrors) {
    EXPECT_EQ(ParseTransformError("frobnicate(1)").kind, ValueErrorKind::kParse);
    EXPECT_EQ(ParseTransformError("matrix(1 2 3)").kind, ValueErrorKind::kParse);
    EXPECT_EQ(ParseTransformError("translate(1 2 3)").kind, ValueErrorKind::kParse);
    EXPECT_EQ(ParseTransformError("rotate(1 2)").kind, ValueErrorKind::kParse);
    EXPECT_EQ(ParseTransformError("scale(1").kind, ValueErrorKind::kParse);
    EXPECT_EQ(ParseTransformError("translate()").kind, ValueErrorKind::kParse);
}

TEST(TransformTest, NonInvertibleResultIsValueError) {
    const ValueError scale_zero = ParseTransformError("scale(0)");
    EXPECT_EQ(scale_zero.kind, ValueErrorKind::kValue);
    EXPECT_EQ(scale_zero.message, "invalid transformation matrix");

    EXPECT_EQ(ParseTransformError("scale(0), translate(10, 10)").kind, ValueErrorKind::kValue);
    EXPECT_EQ(ParseTransformError("matrix(1 2 2 4 0 0)").kind, ValueErrorKind::kValue);
}

TEST(TransformTest, CompositionIsAssociative) {
    const Transform a(1.0, 2.0, 3.0, 5.0, 7.0, -1.0);
    const Transform b = Transform::NewRotate(DegreesToRadians(30.0)).PostTranslate(3.0, 4.0);
    const Transform c = Transform::NewSkew(DegreesToRadians(10.0), 0.0).PostScale(2.0, 0.5);

    ExpectTransformNear(Transform::Multiply(Transform::Multiply(a, b), c),
                        Transform::Multiply(a, Transform::Multiply(b, c)));
}

TEST(TransformTest, InverseLaw) {
    const Transform transforms[] = {
        Transform(1.0, 2.0, 3.0, 5.0, 7.0, -1.0),
        Transform::NewRotate(DegreesToRadians(73.0)).PostTranslate(-12.0, 4.5),
        Transform::NewScale(0.25, 8.0),
    };

    for (const auto& t : transforms) {
        ASSERT_TRUE(t.IsInvertible());
        const auto inverse = t.Invert();
        ASSERT_TRUE(inverse.has_value());
        ExpectTransformNear(t.PreTransform(*inverse), Transform::Identity());
        ExpectTransformNear(t.PostTransform(*inverse), Transform::Identity());
    }
}

TEST(TransformTest, SingularMatrixHasNoInverse) {
    EXPECT_FALSE(Transform::NewScale(0.0, 1.0).Invert().has_value());
    EXPECT_FALSE(Transform(1.0, 2.0, 2.0, 4.0, 0.0, 0.0).IsInvertible());
}

TEST(TransformTest, PreAndPostOrder) {
    const Transform t = Transform::NewTranslate(10.0, 0.0);

    // Scale first, then translate.
    const Point pre = t.PreScale(2.0, 2.0).TransformPoint(1.0, 1.0);
    EXPECT_DOUBLE_EQ(pre.x, 12.0);
    EXPECT_DOUBLE_EQ(pre.y, 2.0);

    // Translate first, then scale.
    const Point post = t.PostScale(2.0, 2.0).TransformPoint(1.0, 1.0);
    EXPECT_DOUBLE_EQ(post.x, 22.0);
    EXPECT_DOUBLE_EQ(post.y, 2.0);
}

TEST(TransformTest, TransformsRectToBoundingBox) {
    const Transform t = Transform::NewRotate(DegreesToRadians(90.0));
    const Rect r = t.TransformRect(Rect(0.0, 0.0, 10.0, 20.0));
    EXPECT_NEAR(r.x0, -20.0, 1e-9);
    EXPECT_NEAR(r.y0, 0.0, 1e-9);
    EXPECT_NEAR(r.x1, 0.0, 1e-9);
    EXPECT_NEAR(r.y1, 10.0, 1e-9);
}

} // namespace
} // namespace svggeo
