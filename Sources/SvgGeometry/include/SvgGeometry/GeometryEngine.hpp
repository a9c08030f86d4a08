#ifndef SVG_GEOMETRY_GEOMETRY_ENGINE_HPP
#define SVG_GEOMETRY_GEOMETRY_ENGINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "SvgGeometry/Length.hpp"
#include "SvgGeometry/Rect.hpp"
#include "SvgGeometry/SvgDom.hpp"
#include "SvgGeometry/Types.hpp"

namespace svggeo {

enum class PathCommandType {
    kMoveTo,
    kLineTo,
    kCurveTo,
    kClosePath,
};

// One absolute path segment. Quadratic curves and arcs are converted to
// cubics, so |control1| and |control2| are only set for kCurveTo.
struct PathCommand {
    PathCommandType type = PathCommandType::kMoveTo;
    Point point;
    Point control1;
    Point control2;
};

// Basic shape normalized to user space.
struct ShapeGeometry {
    ElementKind kind = ElementKind::kUnknown;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double rx = 0.0;
    double ry = 0.0;
    std::vector<Point> points;
    std::vector<PathCommand> path;

    // Object bounding box; empty for shapes that cover no area.
    std::optional<Rect> BoundingBox() const;
};

class GeometryEngine {
public:
    // Only rect, circle, ellipse, line, polygon, polyline and path have
    // geometry.
    std::optional<ShapeGeometry> Build(const Node& node, const NormalizeParams& params) const;

    // Coordinate pairs of a points attribute. Parsing stops at the first
    // error and an odd trailing coordinate is dropped.
    static std::vector<Point> ParsePointList(const std::string& value);

    // Segments of a path's d attribute, up to the first error.
    static std::vector<PathCommand> ParsePathData(const std::string& value);
};

} // namespace svggeo

#endif
