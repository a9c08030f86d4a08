#ifndef SVG_GEOMETRY_PAINT_SERVER_HPP
#define SVG_GEOMETRY_PAINT_SERVER_HPP

#include <optional>
#include <string>

#include "SvgGeometry/AcquiredNodes.hpp"
#include "SvgGeometry/Error.hpp"
#include "SvgGeometry/NodeId.hpp"
#include "SvgGeometry/Pattern.hpp"
#include "SvgGeometry/Rect.hpp"
#include "SvgGeometry/StyleResolver.hpp"
#include "SvgGeometry/Types.hpp"
#include "SvgGeometry/Viewport.hpp"

namespace svggeo {

enum class PaintKind {
    kNone,
    kPattern,
    kSolidColor,
};

// Paint normalized to the user space of the element being painted.
struct UserSpacePaintSource {
    PaintKind kind = PaintKind::kNone;
    std::optional<UserSpacePattern> pattern;
    Color color;
};

// Result of resolving a paint server reference.
struct PaintSource {
    PaintKind kind = PaintKind::kNone;
    std::optional<ResolvedPattern> pattern;
    // Used when the pattern turns out to paint nothing.
    std::optional<Color> alternate;
    Color color;

    UserSpacePaintSource ToUserSpace(const std::optional<Rect>& object_bbox,
                                     const Viewport& viewport,
                                     const ComputedValues& values) const;
};

// Value of the fill and stroke properties.
class PaintServer {
public:
    enum class Kind {
        kNone,
        kIri,
        kSolidColor,
    };

    static PaintServer None();
    static PaintServer Iri(const NodeId& iri, const std::optional<Color>& alternate);
    static PaintServer SolidColor(const Color& color);

    // none | url(<iri>) [none | <color>]? | <color>
    static std::optional<PaintServer> Parse(const std::string& text, ValueError& error);

    Kind kind() const { return kind_; }
    const NodeId& iri() const { return iri_; }
    const std::optional<Color>& alternate() const { return alternate_; }
    const Color& color() const { return color_; }

    // Unresolvable references fall back to the alternate color, or to no
    // paint at all. Only a fatal acquisition error returns std::nullopt.
    std::optional<PaintSource> Resolve(AcquiredNodes& acquired_nodes,
                                       const ComputedValues& values,
                                       AcquireError& error) const;

private:
    Kind kind_ = Kind::kNone;
    NodeId iri_;
    std::optional<Color> alternate_;
    Color color_;
};

} // namespace svggeo

#endif
