#ifndef SVG_GEOMETRY_TRANSFORM_HPP
#define SVG_GEOMETRY_TRANSFORM_HPP

#include <optional>
#include <string>

#include "SvgGeometry/Error.hpp"
#include "SvgGeometry/Rect.hpp"
#include "SvgGeometry/Types.hpp"

namespace svggeo {

double DegreesToRadians(double degrees);

// 2x3 affine matrix:
//   x' = xx * x + xy * y + x0
//   y' = yx * x + yy * y + y0
// The field order matches cairo_matrix_t and CGAffineTransform (a, b, c, d,
// tx, ty), so conversions copy the six numbers as they are.
struct Transform {
    double xx = 1.0;
    double yx = 0.0;
    double xy = 0.0;
    double yy = 1.0;
    double x0 = 0.0;
    double y0 = 0.0;

    Transform() = default;
    Transform(double xx, double yx, double xy, double yy, double x0, double y0);

    static Transform Identity();
    static Transform NewTranslate(double tx, double ty);
    static Transform NewScale(double sx, double sy);
    static Transform NewRotate(double radians);
    static Transform NewSkew(double ax_radians, double ay_radians);

    // Applies |t1| first, then |t2|.
    static Transform Multiply(const Transform& t1, const Transform& t2);

    // pre_* operations apply the argument before this transform, post_*
    // operations after it.
    Transform PreTransform(const Transform& t) const;
    Transform PostTransform(const Transform& t) const;
    Transform PreTranslate(double tx, double ty) const;
    Transform PreScale(double sx, double sy) const;
    Transform PreRotate(double radians) const;
    Transform PostTranslate(double tx, double ty) const;
    Transform PostScale(double sx, double sy) const;
    Transform PostRotate(double radians) const;

    double Determinant() const;
    bool IsInvertible() const;
    std::optional<Transform> Invert() const;

    Point TransformDistance(double dx, double dy) const;
    Point TransformPoint(double px, double py) const;
    // Bounding box of the four transformed corners.
    Rect TransformRect(const Rect& rect) const;

    // Parses a transform list such as "translate(10) rotate(45 5 5)". An
    // empty string is the identity. A list that does not produce an invertible
    // matrix is a value error.
    static std::optional<Transform> Parse(const std::string& text, ValueError& error);
};

bool operator==(const Transform& a, const Transform& b);
bool operator!=(const Transform& a, const Transform& b);

} // namespace svggeo

#endif
