#include "SvgGeometry/Transform.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>

#include "SvgGeometry/ValueParser.hpp"

namespace svggeo {
namespace {

constexpr double kPi = 3.14159265358979323846;

// Reads "(n1 [,] n2 ...)". |arities| lists the argument groups; the first is
// required and each later group is taken only when all of its numbers are
// present.
bool ParseArguments(ValueParser& parser,
                    std::initializer_list<size_t> arities,
                    double* out,
                    size_t& count,
                    ValueError& error) {
    if (!parser.ExpectChar('(', error)) {
        return false;
    }

    count = 0;
    bool first_group = true;
    for (size_t arity : arities) {
        const size_t group_start = parser.position();
        bool complete = true;
        for (size_t i = 0; i < arity; ++i) {
            if (count + i > 0) {
                parser.OptionalComma();
            }
            ValueError number_error;
            const auto value = parser.ParseNumber(number_error);
            if (!value.has_value()) {
                if (first_group || number_error.kind == ValueErrorKind::kValue) {
                    error = number_error;
                    return false;
                }
                complete = false;
                break;
            }
            out[count + i] = *value;
        }
        if (!complete) {
            parser.Reset(group_start);
            break;
        }
        count += arity;
        first_group = false;
    }

    return parser.ExpectChar(')', error);
}

std::optional<Transform> ParseCommand(ValueParser& parser, ValueError& error) {
    const auto name = parser.ParseIdent(error);
    if (!name.has_value()) {
        return std::nullopt;
    }

    double args[6] = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    size_t count = 0;

    if (*name == "matrix") {
        if (!ParseArguments(parser, {6}, args, count, error)) {
            return std::nullopt;
        }
        return Transform(args[0], args[1], args[2], args[3], args[4], args[5]);
    }
    if (*name == "translate") {
        if (!ParseArguments(parser, {1, 1}, args, count, error)) {
            return std::nullopt;
        }
        return Transform::NewTranslate(args[0], count > 1 ? args[1] : 0.0);
    }
    if (*name == "scale") {
        if (!ParseArguments(parser, {1, 1}, args, count, error)) {
            return std::nullopt;
        }
        return Transform::NewScale(args[0], count > 1 ? args[1] : args[0]);
    }
    if (*name == "rotate") {
        if (!ParseArguments(parser, {1, 2}, args, count, error)) {
            return std::nullopt;
        }
        const double angle = DegreesToRadians(args[0]);
        const double cx = count > 1 ? args[1] : 0.0;
        const double cy = count > 1 ? args[2] : 0.0;
        return Transform::NewTranslate(cx, cy).PreRotate(angle).PreTranslate(-cx, -cy);
    }
    if (*name == "skewX") {
        if (!ParseArguments(parser, {1}, args, count, error)) {
            return std::nullopt;
        }
        return Transform::NewSkew(DegreesToRadians(args[0]), 0.0);
    }
    if (*name == "skewY") {
        if (!ParseArguments(parser, {1}, args, count, error)) {
            return std::nullopt;
        }
        return Transform::NewSkew(0.0, DegreesToRadians(args[0]));
    }

    error = ValueError::Parse("expected matrix|translate|scale|rotate|skewX|skewY");
    return std::nullopt;
}

} // namespace

double DegreesToRadians(double degrees) {
    return degrees * kPi / 180.0;
}

Transform::Transform(double xx, double yx, double xy, double yy, double x0, double y0)
    : xx(xx), yx(yx), xy(xy), yy(yy), x0(x0), y0(y0) {}

Transform Transform::Identity() {
    return Transform();
}

Transform Transform::NewTranslate(double tx, double ty) {
    return Transform(1.0, 0.0, 0.0, 1.0, tx, ty);
}

Transform Transform::NewScale(double sx, double sy) {
    return Transform(sx, 0.0, 0.0, sy, 0.0, 0.0);
}

Transform Transform::NewRotate(double radians) {
    const double s = std::sin(radians);
    const double c = std::cos(radians);
    return Transform(c, s, -s, c, 0.0, 0.0);
}

Transform Transform::NewSkew(double ax_radians, double ay_radians) {
    return Transform(1.0, std::tan(ay_radians), std::tan(ax_radians), 1.0, 0.0, 0.0);
}

Transform Transform::Multiply(const Transform& t1, const Transform& t2) {
    return Transform(t1.xx * t2.xx + t1.yx * t2.xy,
                     t1.xx * t2.yx + t1.yx * t2.yy,
                     t1.xy * t2.xx + t1.yy * t2.xy,
                     t1.xy * t2.yx + t1.yy * t2.yy,
                     t1.x0 * t2.xx + t1.y0 * t2.xy + t2.x0,
                     t1.x0 * t2.yx + t1.y0 * t2.yy + t2.y0);
}

Transform Transform::PreTransform(const Transform& t) const {
    return Multiply(t, *this);
}

Transform Transform::PostTransform(const Transform& t) const {
    return Multiply(*this, t);
}

Transform Transform::PreTranslate(double tx, double ty) const {
    return PreTransform(NewTranslate(tx, ty));
}

Transform Transform::PreScale(double sx, double sy) const {
    return PreTransform(NewScale(sx, sy));
}

Transform Transform::PreRotate(double radians) const {
    return PreTransform(NewRotate(radians));
}

Transform Transform::PostTranslate(double tx, double ty) const {
    return PostTransform(NewTranslate(tx, ty));
}

Transform Transform::PostScale(double sx, double sy) const {
    return PostTransform(NewScale(sx, sy));
}

Transform Transform::PostRotate(double radians) const {
    return PostTransform(NewRotate(radians));
}

double Transform::Determinant() const {
    return xx * yy - xy * yx;
}

bool Transform::IsInvertible() const {
    const double det = Determinant();
    return det != 0.0 && std::isfinite(det);
}

std::optional<Transform> Transform::Invert() const {
    if (!IsInvertible()) {
        return std::nullopt;
    }

    const double inv_det = 1.0 / Determinant();
    return Transform(inv_det * yy,
                     inv_det * -yx,
                     inv_det * -xy,
                     inv_det * xx,
                     inv_det * (xy * y0 - yy * x0),
                     inv_det * (yx * x0 - xx * y0));
}

Point Transform::TransformDistance(double dx, double dy) const {
    return Point{dx * xx + dy * xy, dx * yx + dy * yy};
}

Point Transform::TransformPoint(double px, double py) const {
    const Point d = TransformDistance(px, py);
    return Point{d.x + x0, d.y + y0};
}

Rect Transform::TransformRect(const Rect& rect) const {
    const Point points[4] = {
        TransformPoint(rect.x0, rect.y0),
        TransformPoint(rect.x1, rect.y0),
        TransformPoint(rect.x0, rect.y1),
        TransformPoint(rect.x1, rect.y1),
    };

    Rect bounds(points[0].x, points[0].y, points[0].x, points[0].y);
    for (const auto& p : points) {
        bounds.x0 = std::min(bounds.x0, p.x);
        bounds.y0 = std::min(bounds.y0, p.y);
        bounds.x1 = std::max(bounds.x1, p.x);
        bounds.y1 = std::max(bounds.y1, p.y);
    }
    return bounds;
}

std::optional<Transform> Transform::Parse(const std::string& text, ValueError& error) {
    ValueParser parser(text);
    Transform transform;

    while (!parser.IsExhausted()) {
        const auto command = ParseCommand(parser, error);
        if (!command.has_value()) {
            return std::nullopt;
        }
        transform = command->PostTransform(transform);
        parser.OptionalComma();
    }

    if (!transform.IsInvertible()) {
        error = ValueError::Value("invalid transformation matrix");
        return std::nullopt;
    }
    return transform;
}

bool operator==(const Transform& a, const Transform& b) {
    return a.xx == b.xx && a.yx == b.yx && a.xy == b.xy && a.yy == b.yy && a.x0 == b.x0 && a.y0 == b.y0;
}

bool operator!=(const Transform& a, const Transform& b) {
    return !(a == b);
}

} // namespace svggeo
