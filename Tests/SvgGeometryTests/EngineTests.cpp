#include <gtest/gtest.h>

#include <string>

#include "SvgGeometry/Engine.hpp"
#include "TestSupport.hpp"

namespace svggeo {
namespace {

using test::ExpectTransformNear;

constexpr const char* kPatternFill = R"SVG(
<svg xmlns="http://www.w3.org/2000/svg" width="100" height="100">
  <defs>
    <pattern id="p" patternUnits="userSpaceOnUse" x="10" y="10" width="20" height="20">
      <rect width="10" height="10" fill="red"/>
    </pattern>
  </defs>
  <rect id="r" x="0" y="0" width="100" height="100" fill="url(#p)"/>
  <rect id="solid" width="10" height="10" fill="red" stroke="url(#missing) lime"/>
  <rect id="plain" width="10" height="10"/>
  <g fill="url(#p)" color="blue"><rect id="inherited" width="10" height="10" stroke="currentColor"/></g>
</svg>)SVG";

Color Rgb(float r, float g, float b) {
    return Color{true, false, r, g, b, 1.0f};
}

TEST(EngineTest, PatternFill) {
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;
    ASSERT_TRUE(engine.ResolveFill(kPatternFill, "r", RenderOptions(), paint, error)) << error.message;
    EXPECT_EQ(error.code, RenderErrorCode::kNone);
    EXPECT_EQ(paint.kind, PaintKind::kPattern);
    ASSERT_TRUE(paint.pattern.has_value());
    EXPECT_DOUBLE_EQ(paint.pattern->width, 20.0);
    EXPECT_DOUBLE_EQ(paint.pattern->height, 20.0);
    ExpectTransformNear(paint.pattern->coord_transform, Transform::NewTranslate(10, 10));

    const auto tile = PatternTile::Compute(*paint.pattern, Transform::Identity());
    ASSERT_TRUE(tile.has_value());
    EXPECT_EQ(tile->width, 20);
    EXPECT_EQ(tile->height, 20);
}

TEST(EngineTest, SolidAndDefaultPaints) {
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;

    ASSERT_TRUE(engine.ResolveFill(kPatternFill, "solid", RenderOptions(), paint, error));
    EXPECT_EQ(paint.kind, PaintKind::kSolidColor);
    EXPECT_EQ(paint.color, Rgb(1, 0, 0));

    ASSERT_TRUE(engine.ResolveStroke(kPatternFill, "solid", RenderOptions(), paint, error));
    EXPECT_EQ(paint.kind, PaintKind::kSolidColor);
    EXPECT_EQ(paint.color, Rgb(0, 1, 0));

    ASSERT_TRUE(engine.ResolveFill(kPatternFill, "plain", RenderOptions(), paint, error));
    EXPECT_EQ(paint.kind, PaintKind::kSolidColor);
    EXPECT_EQ(paint.color, Rgb(0, 0, 0));

    ASSERT_TRUE(engine.ResolveStroke(kPatternFill, "plain", RenderOptions(), paint, error));
    EXPECT_EQ(paint.kind, PaintKind::kNone);
}

TEST(EngineTest, InheritedPaint) {
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;

    ASSERT_TRUE(engine.ResolveFill(kPatternFill, "inherited", RenderOptions(), paint, error));
    EXPECT_EQ(paint.kind, PaintKind::kPattern);

    ASSERT_TRUE(engine.ResolveStroke(kPatternFill, "inherited", RenderOptions(), paint, error));
    EXPECT_EQ(paint.kind, PaintKind::kSolidColor);
    EXPECT_EQ(paint.color, Rgb(0, 0, 1));
}

TEST(EngineTest, InvalidPaintFallsBackToInitialValue) {
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;
    const std::string svg = R"SVG(<svg><rect id="r" width="1" height="1" fill="bogus" stroke="url(#"/></svg>)SVG";

    ASSERT_TRUE(engine.ResolveFill(svg, "r", RenderOptions(), paint, error));
    EXPECT_EQ(paint.kind, PaintKind::kSolidColor);
    EXPECT_EQ(paint.color, Rgb(0, 0, 0));

    ASSERT_TRUE(engine.ResolveStroke(svg, "r", RenderOptions(), paint, error));
    EXPECT_EQ(paint.kind, PaintKind::kNone);
}

TEST(EngineTest, ObjectBoundingBoxPattern) {
    const std::string svg = R"SVG(
<svg width="200" height="200">
  <pattern id="p" x="0.1" width="0.5" height="0.25"><rect width="1" height="1"/></pattern>
  <rect id="r" x="10" y="20" width="100" height="200" fill="url(#p)"/>
  <line id="l" x1="0" y1="5" x2="50" y2="5" stroke="url(#p) red"/>
</svg>)SVG";
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;

    ASSERT_TRUE(engine.ResolveFill(svg, "r", RenderOptions(), paint, error));
    ASSERT_EQ(paint.kind, PaintKind::kPattern);
    EXPECT_DOUBLE_EQ(paint.pattern->width, 50.0);
    EXPECT_DOUBLE_EQ(paint.pattern->height, 50.0);
    ExpectTransformNear(paint.pattern->coord_transform, Transform::NewTranslate(20, 20));

    // A horizontal line has an empty bounding box, so the alternate color wins.
    ASSERT_TRUE(engine.ResolveStroke(svg, "l", RenderOptions(), paint, error));
    EXPECT_EQ(paint.kind, PaintKind::kSolidColor);
    EXPECT_EQ(paint.color, Rgb(1, 0, 0));
}

TEST(EngineTest, PathUsesObjectBoundingBox) {
    const std::string svg = R"SVG(
<svg width="100" height="100">
  <pattern id="p" width="0.5" height="0.5"><rect width="1" height="1"/></pattern>
  <path id="a" d="M10 0 L60 0 L60 50 Z" fill="url(#p)"/>
</svg>)SVG";
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;
    ASSERT_TRUE(engine.ResolveFill(svg, "a", RenderOptions(), paint, error)) << error.message;
    ASSERT_EQ(paint.kind, PaintKind::kPattern);
    EXPECT_DOUBLE_EQ(paint.pattern->width, 25.0);
    EXPECT_DOUBLE_EQ(paint.pattern->height, 25.0);
    ExpectTransformNear(paint.pattern->coord_transform, Transform::NewTranslate(10, 0));
}

TEST(EngineTest, LongPathData) {
    std::string d = "M0 0";
    while (d.size() < 200000) {
        d += " L10 10";
    }
    d += " L100 50";
    const std::string svg = R"SVG(<svg><pattern id="p" width="0.5" height="0.5"><rect width="1" height="1"/></pattern>)SVG"
                            "<path id=\"a\" fill=\"url(#p)\" d=\"" + d + "\"/></svg>";

    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;
    ASSERT_TRUE(engine.ResolveFill(svg, "a", RenderOptions(), paint, error)) << error.message;
    ASSERT_EQ(paint.kind, PaintKind::kPattern);
    EXPECT_DOUBLE_EQ(paint.pattern->width, 50.0);
    EXPECT_DOUBLE_EQ(paint.pattern->height, 25.0);
}

TEST(EngineTest, DeeplyNestedDocumentExceedsLimit) {
    std::string svg = "<svg>";
    for (int i = 0; i < 50000; ++i) {
        svg += "<g>";
    }
    svg += "<rect id=\"r\"/>";
    for (int i = 0; i < 50000; ++i) {
        svg += "</g>";
    }
    svg += "</svg>";

    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;
    EXPECT_FALSE(engine.ResolveFill(svg, "r", RenderOptions(), paint, error));
    EXPECT_EQ(error.code, RenderErrorCode::kLimitExceeded);
    EXPECT_EQ(error.message, "cannot nest XML elements more than 1024 levels deep");
}

TEST(EngineTest, NestedSvgEstablishesViewport) {
    const std::string svg = R"SVG(
<svg width="100" height="100">
  <pattern id="p" patternUnits="userSpaceOnUse" width="50%" height="50%"><rect width="1" height="1"/></pattern>
  <svg x="10" y="10" width="50" height="50" viewBox="0 0 10 10">
    <rect id="r" width="10" height="10" fill="url(#p)"/>
  </svg>
  <svg width="0" height="50"><rect id="hidden" width="10" height="10" fill="red"/></svg>
</svg>)SVG";
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;

    ASSERT_TRUE(engine.ResolveFill(svg, "r", RenderOptions(), paint, error));
    ASSERT_EQ(paint.kind, PaintKind::kPattern);
    EXPECT_DOUBLE_EQ(paint.pattern->width, 5.0);
    EXPECT_DOUBLE_EQ(paint.pattern->height, 5.0);

    ASSERT_TRUE(engine.ResolveFill(svg, "hidden", RenderOptions(), paint, error));
    EXPECT_EQ(paint.kind, PaintKind::kNone);
}

TEST(EngineTest, CircularPatternUsesAlternateColor) {
    const std::string svg = R"SVG(
<svg>
  <pattern id="a" href="#b"/>
  <pattern id="b" href="#a"/>
  <rect id="r" width="10" height="10" fill="url(#a) lime"/>
</svg>)SVG";
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;
    ASSERT_TRUE(engine.ResolveFill(svg, "r", RenderOptions(), paint, error));
    EXPECT_EQ(paint.kind, PaintKind::kSolidColor);
    EXPECT_EQ(paint.color, Rgb(0, 1, 0));
}

TEST(EngineTest, ReferenceLimit) {
    RenderOptions options;
    options.max_referenced_elements = 0;
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;
    EXPECT_FALSE(engine.ResolveFill(kPatternFill, "r", options, paint, error));
    EXPECT_EQ(error.code, RenderErrorCode::kLimitExceeded);
    EXPECT_EQ(error.message, "exceeded more than 0 referenced elements");
    EXPECT_EQ(paint.kind, PaintKind::kNone);
}

TEST(EngineTest, LoadedElementLimit) {
    RenderOptions options;
    options.max_loaded_elements = 2;
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;
    EXPECT_FALSE(engine.ResolveFill(kPatternFill, "r", options, paint, error));
    EXPECT_EQ(error.code, RenderErrorCode::kLimitExceeded);
}

TEST(EngineTest, ReportsBadInput) {
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;

    EXPECT_FALSE(engine.ResolveFill(kPatternFill, "", RenderOptions(), paint, error));
    EXPECT_EQ(error.code, RenderErrorCode::kInvalidId);

    EXPECT_FALSE(engine.ResolveFill(kPatternFill, "nope", RenderOptions(), paint, error));
    EXPECT_EQ(error.code, RenderErrorCode::kIdNotFound);
    EXPECT_EQ(error.message, "Element not found: #nope");

    EXPECT_FALSE(engine.ResolveFill("<svg><rect id=\"r\"></svg>", "r", RenderOptions(), paint, error));
    EXPECT_EQ(error.code, RenderErrorCode::kInvalidDocument);

    EXPECT_FALSE(engine.ResolveFill("<html id=\"r\"/>", "r", RenderOptions(), paint, error));
    EXPECT_EQ(error.code, RenderErrorCode::kInvalidDocument);

    EXPECT_FALSE(engine.ResolveFill("<svg width=\"0\"><rect id=\"r\"/></svg>", "r", RenderOptions(), paint, error));
    EXPECT_EQ(error.code, RenderErrorCode::kInvalidDocument);
}

TEST(EngineTest, EmptyRootViewBoxPaintsNothing) {
    Engine engine;
    UserSpacePaintSource paint;
    RenderError error;
    ASSERT_TRUE(engine.ResolveFill(R"SVG(<svg width="10" height="10" viewBox="0 0 0 0"><rect id="r" fill="red"/></svg>)SVG",
                                   "r",
                                   RenderOptions(),
                                   paint,
                                   error));
    EXPECT_EQ(paint.kind, PaintKind::kNone);
}

TEST(EngineTest, ExternalPattern) {
    Engine engine;
    RenderError error;
    ASSERT_TRUE(engine.AddExternalDocument(
        "defs.svg",
        R"SVG(<svg><pattern id="ext" patternUnits="userSpaceOnUse" width="8" height="8"><rect/></pattern></svg>)SVG",
        RenderOptions(),
        error))
        << error.message;

    UserSpacePaintSource paint;
    ASSERT_TRUE(engine.ResolveFill(R"SVG(<svg><rect id="r" width="10" height="10" fill="url(defs.svg#ext) red"/></svg>)SVG",
                                   "r",
                                   RenderOptions(),
                                   paint,
                                   error));
    ASSERT_EQ(paint.kind, PaintKind::kPattern);
    EXPECT_DOUBLE_EQ(paint.pattern->width, 8.0);

    ASSERT_TRUE(engine.ResolveFill(R"SVG(<svg><rect id="r" width="10" height="10" fill="url(other.svg#ext) red"/></svg>)SVG",
                                   "r",
                                   RenderOptions(),
                                   paint,
                                   error));
    EXPECT_EQ(paint.kind, PaintKind::kSolidColor);
}

TEST(EngineTest, RemoteDocumentsAreBlocked) {
    Engine engine;
    RenderError error;
    EXPECT_FALSE(engine.AddExternalDocument("https://example.com/defs.svg", "<svg/>", RenderOptions(), error));
    EXPECT_EQ(error.code, RenderErrorCode::kExternalResourceBlocked);

    RenderOptions options;
    options.enable_external_resources = true;
    EXPECT_TRUE(engine.AddExternalDocument("https://example.com/defs.svg", "<svg/>", options, error));
}

TEST(EngineTest, StrictAttributes) {
    CompatFlags flags;
    flags.strict_attributes = true;
    Engine engine(flags);
    UserSpacePaintSource paint;
    RenderError error;
    EXPECT_FALSE(engine.ResolveFill(R"SVG(<svg><pattern id="p" patternUnits="bogus"/><rect id="r"/></svg>)SVG",
                                    "r",
                                    RenderOptions(),
                                    paint,
                                    error));
    EXPECT_EQ(error.code, RenderErrorCode::kInvalidDocument);
}

} // namespace
} // namespace svggeo
