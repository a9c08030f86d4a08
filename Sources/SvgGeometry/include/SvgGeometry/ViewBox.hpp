#ifndef SVG_GEOMETRY_VIEW_BOX_HPP
#define SVG_GEOMETRY_VIEW_BOX_HPP

#include <optional>
#include <string>

#include "SvgGeometry/Error.hpp"
#include "SvgGeometry/Rect.hpp"

namespace svggeo {

// The viewBox attribute: "x y w h" with non-negative w and h. An empty
// viewBox is valid and disables rendering of its element.
struct ViewBox : Rect {
    ViewBox() = default;
    ViewBox(const Rect& rect) : Rect(rect) {}

    static std::optional<ViewBox> Parse(const std::string& text, ValueError& error);
};

} // namespace svggeo

#endif
