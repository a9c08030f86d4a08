#ifndef SVG_GEOMETRY_STYLE_RESOLVER_HPP
#define SVG_GEOMETRY_STYLE_RESOLVER_HPP

#include <map>
#include <optional>
#include <string>

#include "SvgGeometry/Length.hpp"
#include "SvgGeometry/Types.hpp"

namespace svggeo {

// The cascaded values geometry resolution consumes. font_size is always
// absolute (never %, em or ex) once computed.
struct ComputedValues {
    Length<Both> font_size = Length<Both>(12.0, LengthUnit::kPx);
    double opacity = 1.0;
    Color color = Color{true, false, 0.0f, 0.0f, 0.0f, 1.0f};
    std::string fill_paint = "black";
    std::string stroke_paint = "none";

    double FontSizePx(const Dpi& dpi) const;
};

class StyleResolver {
public:
    // Computes the values of an element from its presentation attributes and
    // inline style, inheriting from |parent| (the root inherits from
    // |options|).
    ComputedValues Resolve(const std::map<std::string, std::string>& attributes,
                           const ComputedValues* parent,
                           const RenderOptions& options) const;

    static std::optional<Length<Both>> ComputeFontSize(const std::string& value, const Length<Both>& parent);
    static std::map<std::string, std::string> ParseInlineStyle(const std::string& style_text);

    // #rgb, #rgba, #rrggbb, #rrggbbaa, rgb()/rgba(), named colors,
    // transparent and currentColor.
    static std::optional<Color> ParseColor(const std::string& value);
};

} // namespace svggeo

#endif
