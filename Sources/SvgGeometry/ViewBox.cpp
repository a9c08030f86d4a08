#include "SvgGeometry/ViewBox.hpp"

#include "SvgGeometry/ValueParser.hpp"

namespace svggeo {

std::optional<ViewBox> ViewBox::Parse(const std::string& text, ValueError& error) {
    const auto numbers = NumberList::Parse(text, 4, 4, error);
    if (!numbers.has_value()) {
        return std::nullopt;
    }

    const double x = (*numbers)[0];
    const double y = (*numbers)[1];
    const double width = (*numbers)[2];
    const double height = (*numbers)[3];
    if (width < 0.0 || height < 0.0) {
        error = ValueError::Value("width and height must not be negative");
        return std::nullopt;
    }

    return ViewBox(Rect(x, y, x + width, y + height));
}

} // namespace svggeo
