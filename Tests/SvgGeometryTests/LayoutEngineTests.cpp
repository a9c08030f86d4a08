#include <gtest/gtest.h>

#include "SvgGeometry/LayoutEngine.hpp"
#include "TestSupport.hpp"

namespace svggeo {
namespace {

using test::ExpectTransformNear;
using test::LoadDocument;

std::optional<LayoutResult> Layout(const std::string& svg,
                                   const RenderOptions& options,
                                   RenderError& error) {
    const auto document = LoadDocument(svg, options);
    if (!document.has_value()) {
        return std::nullopt;
    }
    return LayoutEngine().Compute(*document, options, error);
}

TEST(LayoutEngineTest, ViewBoxScalesToViewport) {
    RenderError error;
    const auto layout = Layout(R"SVG(<svg width="200" height="100" viewBox="0 0 20 10"/>)SVG", RenderOptions(), error);
    ASSERT_TRUE(layout.has_value());
    EXPECT_DOUBLE_EQ(layout->width, 200.0);
    EXPECT_DOUBLE_EQ(layout->height, 100.0);
    ASSERT_TRUE(layout->viewport.has_value());
    ExpectTransformNear(layout->viewport->transform, Transform::NewScale(10, 10));
    EXPECT_EQ(layout->viewport->vbox, ViewBox(Rect(0, 0, 20, 10)));
}

TEST(LayoutEngineTest, DefaultSize) {
    RenderError error;
    const auto layout = Layout("<svg/>", RenderOptions(), error);
    ASSERT_TRUE(layout.has_value());
    EXPECT_DOUBLE_EQ(layout->width, 300.0);
    EXPECT_DOUBLE_EQ(layout->height, 150.0);
    EXPECT_EQ(layout->PixelWidth(), 300);
    EXPECT_EQ(layout->PixelHeight(), 150);
    ASSERT_TRUE(layout->viewport.has_value());
    ExpectTransformNear(layout->viewport->transform, Transform::Identity());
}

TEST(LayoutEngineTest, SizeFromViewBox) {
    RenderError error;
    const auto layout = Layout(R"SVG(<svg viewBox="0 0 40.5 20"/>)SVG", RenderOptions(), error);
    ASSERT_TRUE(layout.has_value());
    EXPECT_DOUBLE_EQ(layout->width, 40.5);
    EXPECT_DOUBLE_EQ(layout->height, 20.0);
    EXPECT_EQ(layout->PixelWidth(), 41);
}

TEST(LayoutEngineTest, PercentagesUseRequestedViewport) {
    RenderOptions options;
    options.viewport_width = 400;
    options.viewport_height = 300;
    RenderError error;
    const auto layout = Layout(R"SVG(<svg width="50%" height="1in"/>)SVG", options, error);
    ASSERT_TRUE(layout.has_value());
    EXPECT_DOUBLE_EQ(layout->width, 200.0);
    EXPECT_DOUBLE_EQ(layout->height, 96.0);
}

TEST(LayoutEngineTest, PhysicalUnitsUseDpi) {
    RenderOptions options;
    options.dpi_x = 72.0;
    options.dpi_y = 144.0;
    RenderError error;
    const auto layout = Layout(R"SVG(<svg width="1in" height="1in"/>)SVG", options, error);
    ASSERT_TRUE(layout.has_value());
    EXPECT_DOUBLE_EQ(layout->width, 72.0);
    EXPECT_DOUBLE_EQ(layout->height, 144.0);
    ASSERT_TRUE(layout->viewport.has_value());
    EXPECT_DOUBLE_EQ(layout->viewport->dpi.y, 144.0);
}

TEST(LayoutEngineTest, ZeroSizeIsInvalid) {
    RenderError error;
    EXPECT_FALSE(Layout(R"SVG(<svg width="0" height="100"/>)SVG", RenderOptions(), error).has_value());
    EXPECT_EQ(error.code, RenderErrorCode::kInvalidDocument);
    EXPECT_EQ(error.message, "Invalid SVG viewport dimensions");
}

TEST(LayoutEngineTest, EmptyViewBoxRendersNothing) {
    RenderError error;
    const auto layout = Layout(R"SVG(<svg width="100" height="100" viewBox="0 0 0 10"/>)SVG", RenderOptions(), error);
    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(error.code, RenderErrorCode::kNone);
    EXPECT_FALSE(layout->viewport.has_value());
}

TEST(LayoutEngineTest, PreserveAspectRatio) {
    RenderError error;
    const auto layout = Layout(R"SVG(<svg width="300" height="100" viewBox="0 0 10 10" preserveAspectRatio="xMinYMin meet"/>)SVG",
                               RenderOptions(),
                               error);
    ASSERT_TRUE(layout.has_value());
    ASSERT_TRUE(layout->viewport.has_value());
    ExpectTransformNear(layout->viewport->transform, Transform::NewScale(10, 10));
}

} // namespace
} // namespace svggeo
