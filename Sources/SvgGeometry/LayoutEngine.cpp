#include "SvgGeometry/LayoutEngine.hpp"

#include <cmath>

#include "SvgGeometry/Attributes.hpp"
#include "SvgGeometry/Length.hpp"
#include "SvgGeometry/Log.hpp"

namespace svggeo {

int32_t LayoutResult::PixelWidth() const {
    return static_cast<int32_t>(std::ceil(width));
}

int32_t LayoutResult::PixelHeight() const {
    return static_cast<int32_t>(std::ceil(height));
}

Viewport LayoutEngine::InitialViewport(const Document& document, const RenderOptions& options) {
    const auto vbox = ParseAttribute<ViewBox>(document.root().attributes, "viewBox");
    const bool has_viewbox = vbox.has_value() && !vbox->IsEmpty();

    const double width = options.viewport_width > 0 ? static_cast<double>(options.viewport_width)
                                                    : (has_viewbox ? vbox->Width() : 300.0);
    const double height = options.viewport_height > 0 ? static_cast<double>(options.viewport_height)
                                                      : (has_viewbox ? vbox->Height() : 150.0);

    Viewport viewport;
    viewport.dpi = Dpi{options.dpi_x, options.dpi_y};
    viewport.vbox = ViewBox(Rect::FromSize(width, height));
    return viewport;
}

std::optional<LayoutResult> LayoutEngine::Compute(const Document& document, const RenderOptions& options, RenderError& error) const {
    error = {};

    const Node& root = document.root();
    const auto& attrs = root.attributes;

    LayoutResult layout;
    layout.vbox = ParseAttribute<ViewBox>(attrs, "viewBox");
    layout.preserve_aspect_ratio = ParseAttributeOr(attrs, "preserveAspectRatio", AspectRatio());

    const Viewport initial = InitialViewport(document, options);
    const NormalizeParams params = initial.Params(root.values);

    const auto width = ParseAttributeOr(attrs, "width", ULength<Horizontal>(1.0, LengthUnit::kPercent));
    const auto height = ParseAttributeOr(attrs, "height", ULength<Vertical>(1.0, LengthUnit::kPercent));
    layout.width = width.Normalize(params);
    layout.height = height.Normalize(params);

    if (!(layout.width > 0.0) || !(layout.height > 0.0) || !std::isfinite(layout.width) || !std::isfinite(layout.height)) {
        error.code = RenderErrorCode::kInvalidDocument;
        error.message = "Invalid SVG viewport dimensions";
        return std::nullopt;
    }

    ViewportStack stack(initial);
    auto root_params = stack.PushNewViewport(layout.vbox,
                                             Rect::FromSize(layout.width, layout.height),
                                             layout.preserve_aspect_ratio);
    if (root_params.has_value()) {
        layout.viewport = root_params->viewport();
    } else {
        Log()->debug("root viewport is empty, nothing will be rendered");
    }
    return layout;
}

} // namespace svggeo
