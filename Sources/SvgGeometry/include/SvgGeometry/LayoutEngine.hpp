#ifndef SVG_GEOMETRY_LAYOUT_ENGINE_HPP
#define SVG_GEOMETRY_LAYOUT_ENGINE_HPP

#include <cstdint>
#include <optional>

#include "SvgGeometry/AspectRatio.hpp"
#include "SvgGeometry/SvgDom.hpp"
#include "SvgGeometry/Types.hpp"
#include "SvgGeometry/ViewBox.hpp"
#include "SvgGeometry/Viewport.hpp"

namespace svggeo {

struct LayoutResult {
    // Size of the outermost <svg> in pixels.
    double width = 300.0;
    double height = 150.0;
    std::optional<ViewBox> vbox;
    AspectRatio preserve_aspect_ratio;
    // Coordinate system of the root's content. Empty when the viewBox makes
    // the document render nothing.
    std::optional<Viewport> viewport;

    int32_t PixelWidth() const;
    int32_t PixelHeight() const;
};

class LayoutEngine {
public:
    std::optional<LayoutResult> Compute(const Document& document, const RenderOptions& options, RenderError& error) const;

    // Viewport the root <svg> is laid out in, before its own attributes.
    static Viewport InitialViewport(const Document& document, const RenderOptions& options);
};

} // namespace svggeo

#endif
