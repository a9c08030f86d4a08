#include "SvgGeometry/GeometryEngine.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

#include "SvgGeometry/Attributes.hpp"
#include "SvgGeometry/Log.hpp"
#include "SvgGeometry/Transform.hpp"
#include "SvgGeometry/ValueParser.hpp"

namespace svggeo {
namespace {

template <typename L>
double NormalizeAttr(const AttributeMap& attributes, const std::string& key, const NormalizeParams& params) {
    return ParseAttributeOr(attributes, key, L()).Normalize(params);
}

constexpr double kPi = 3.14159265358979323846;
constexpr double kArcEpsilon = 1e-9;
constexpr char kPathCommands[] = "MmZzLlHhVvCcSsQqTtAa";
constexpr char kNumberStart[] = "+-.0123456789";

char PeekOneOf(const ValueParser& parser, const char* chars) {
    for (const char* c = chars; *c != '\0'; ++c) {
        if (parser.PeekChar(*c)) {
            return *c;
        }
    }
    return '\0';
}

char PeekPathCommand(const ValueParser& parser) {
    return PeekOneOf(parser, kPathCommands);
}

bool AtPathNumber(ValueParser& parser) {
    parser.SkipWhitespace();
    return PeekOneOf(parser, kNumberStart) != '\0';
}

bool ParseCoordinates(ValueParser& parser, double* out, size_t count, ValueError& error) {
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            parser.OptionalComma();
        }
        const auto number = parser.ParseNumber(error);
        if (!number.has_value()) {
            return false;
        }
        out[i] = *number;
    }
    return true;
}

// Arc flags are a single 0 or 1 and need no separator: "a5 5 0 1010 10".
bool ParseFlag(ValueParser& parser, bool& out, ValueError& error) {
    parser.OptionalComma();
    if (parser.ConsumeChar('0')) {
        out = false;
    } else if (parser.ConsumeChar('1')) {
        out = true;
    } else {
        error = ValueError::Parse("expected arc flag");
        return false;
    }
    return true;
}

Point MapUnitArcPoint(double ux, double uy, double cx, double cy, double rx, double ry, double cos_phi, double sin_phi) {
    return Point{cx + rx * ux * cos_phi - ry * uy * sin_phi, cy + rx * ux * sin_phi + ry * uy * cos_phi};
}

// Accumulates absolute commands while tracking the state relative and
// smooth segments depend on.
class PathBuilder {
public:
    void MoveTo(const Point& p) {
        Add(PathCommandType::kMoveTo, p);
        start_ = p;
        last_cubic_.reset();
        last_quad_.reset();
    }

    void LineTo(const Point& p) {
        Add(PathCommandType::kLineTo, p);
        last_cubic_.reset();
        last_quad_.reset();
    }

    void CurveTo(const Point& c1, const Point& c2, const Point& p) {
        PathCommand command;
        command.type = PathCommandType::kCurveTo;
        command.control1 = c1;
        command.control2 = c2;
        command.point = p;
        commands_.push_back(command);
        current_ = p;
        last_cubic_ = c2;
        last_quad_.reset();
    }

    void QuadTo(const Point& q, const Point& p) {
        const Point c1{current_.x + 2.0 / 3.0 * (q.x - current_.x), current_.y + 2.0 / 3.0 * (q.y - current_.y)};
        const Point c2{p.x + 2.0 / 3.0 * (q.x - p.x), p.y + 2.0 / 3.0 * (q.y - p.y)};
        CurveTo(c1, c2, p);
        last_cubic_.reset();
        last_quad_ = q;
    }

    // Endpoint parameterization to center parameterization, then one cubic
    // per quarter turn.
    void ArcTo(double rx, double ry, double x_axis_rotation, bool large_arc, bool sweep, const Point& p) {
        last_cubic_.reset();
        last_quad_.reset();

        const double x1 = current_.x;
        const double y1 = current_.y;
        if (std::fabs(x1 - p.x) <= kArcEpsilon && std::fabs(y1 - p.y) <= kArcEpsilon) {
            return;
        }

        rx = std::fabs(rx);
        ry = std::fabs(ry);
        if (rx < kArcEpsilon || ry < kArcEpsilon) {
            LineTo(p);
            return;
        }

        const double phi = DegreesToRadians(x_axis_rotation);
        const double cos_phi = std::cos(phi);
        const double sin_phi = std::sin(phi);

        const double dx2 = (x1 - p.x) / 2.0;
        const double dy2 = (y1 - p.y) / 2.0;
        const double x1p = cos_phi * dx2 + sin_phi * dy2;
        const double y1p = -sin_phi * dx2 + cos_phi * dy2;
        const double x1p2 = x1p * x1p;
        const double y1p2 = y1p * y1p;

        double rx2 = rx * rx;
        double ry2 = ry * ry;
        const double lambda = x1p2 / rx2 + y1p2 / ry2;
        if (lambda > 1.0) {
            const double scale = std::sqrt(lambda);
            rx *= scale;
            ry *= scale;
            rx2 = rx * rx;
            ry2 = ry * ry;
        }

        const double numerator = rx2 * ry2 - rx2 * y1p2 - ry2 * x1p2;
        const double denominator = rx2 * y1p2 + ry2 * x1p2;
        if (std::fabs(denominator) < kArcEpsilon) {
            LineTo(p);
            return;
        }

        double center_scale = std::sqrt(std::max(0.0, numerator / denominator));
        if (large_arc == sweep) {
            center_scale = -center_scale;
        }
        const double cxp = center_scale * (rx * y1p / ry);
        const double cyp = center_scale * (-(ry * x1p) / rx);
        const double cx = cos_phi * cxp - sin_phi * cyp + (x1 + p.x) / 2.0;
        const double cy = sin_phi * cxp + cos_phi * cyp + (y1 + p.y) / 2.0;

        const double ux = (x1p - cxp) / rx;
        const double uy = (y1p - cyp) / ry;
        const double vx = (-x1p - cxp) / rx;
        const double vy = (-y1p - cyp) / ry;

        const double start_angle = std::atan2(uy, ux);
        double delta_angle = std::atan2(ux * vy - uy * vx, ux * vx + uy * vy);
        if (!sweep && delta_angle > 0.0) {
            delta_angle -= 2.0 * kPi;
        } else if (sweep && delta_angle < 0.0) {
            delta_angle += 2.0 * kPi;
        }

        const int segments = std::max(1, static_cast<int>(std::ceil(std::fabs(delta_angle) / (kPi / 2.0))));
        const double segment_angle = delta_angle / segments;
        for (int i = 0; i < segments; ++i) {
            const double theta1 = start_angle + segment_angle * i;
            const double theta2 = theta1 + segment_angle;
            const double alpha = 4.0 / 3.0 * std::tan(segment_angle / 4.0);

            const double cos1 = std::cos(theta1);
            const double sin1 = std::sin(theta1);
            const double cos2 = std::cos(theta2);
            const double sin2 = std::sin(theta2);

            const Point c1 = MapUnitArcPoint(cos1 - alpha * sin1, sin1 + alpha * cos1, cx, cy, rx, ry, cos_phi, sin_phi);
            const Point c2 = MapUnitArcPoint(cos2 + alpha * sin2, sin2 - alpha * cos2, cx, cy, rx, ry, cos_phi, sin_phi);
            // The last segment ends exactly on the requested point.
            const Point end = i + 1 == segments ? p : MapUnitArcPoint(cos2, sin2, cx, cy, rx, ry, cos_phi, sin_phi);
            CurveTo(c1, c2, end);
        }
        last_cubic_.reset();
    }

    void ClosePath() {
        Add(PathCommandType::kClosePath, start_);
        last_cubic_.reset();
        last_quad_.reset();
    }

    const Point& current() const { return current_; }

    // Control point of a smooth segment: the reflection of the previous
    // segment's last control point, or the current point.
    Point Reflect(const std::optional<Point>& control) const {
        if (!control.has_value()) {
            return current_;
        }
        return Point{2.0 * current_.x - control->x, 2.0 * current_.y - control->y};
    }

    const std::optional<Point>& last_cubic() const { return last_cubic_; }
    const std::optional<Point>& last_quad() const { return last_quad_; }

    std::vector<PathCommand> Take() { return std::move(commands_); }

private:
    void Add(PathCommandType type, const Point& p) {
        PathCommand command;
        command.type = type;
        command.point = p;
        commands_.push_back(command);
        current_ = p;
    }

    std::vector<PathCommand> commands_;
    Point current_;
    Point start_;
    std::optional<Point> last_cubic_;
    std::optional<Point> last_quad_;
};

// Parses the arguments of one |command| segment and appends it.
bool ParsePathSegment(ValueParser& parser, char command, PathBuilder& builder, ValueError& error) {
    const bool relative = std::islower(static_cast<unsigned char>(command)) != 0;
    const Point origin = relative ? builder.current() : Point{};
    auto absolute = [&](double x, double y) { return Point{origin.x + x, origin.y + y}; };

    double args[6] = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    switch (std::toupper(static_cast<unsigned char>(command))) {
    case 'M':
        if (!ParseCoordinates(parser, args, 2, error)) {
            return false;
        }
        builder.MoveTo(absolute(args[0], args[1]));
        return true;
    case 'L':
        if (!ParseCoordinates(parser, args, 2, error)) {
            return false;
        }
        builder.LineTo(absolute(args[0], args[1]));
        return true;
    case 'H':
        if (!ParseCoordinates(parser, args, 1, error)) {
            return false;
        }
        builder.LineTo(Point{origin.x + args[0], builder.current().y});
        return true;
    case 'V':
        if (!ParseCoordinates(parser, args, 1, error)) {
            return false;
        }
        builder.LineTo(Point{builder.current().x, origin.y + args[0]});
        return true;
    case 'C':
        if (!ParseCoordinates(parser, args, 6, error)) {
            return false;
        }
        builder.CurveTo(absolute(args[0], args[1]), absolute(args[2], args[3]), absolute(args[4], args[5]));
        return true;
    case 'S':
        if (!ParseCoordinates(parser, args, 4, error)) {
            return false;
        }
        builder.CurveTo(builder.Reflect(builder.last_cubic()), absolute(args[0], args[1]), absolute(args[2], args[3]));
        return true;
    case 'Q':
        if (!ParseCoordinates(parser, args, 4, error)) {
            return false;
        }
        builder.QuadTo(absolute(args[0], args[1]), absolute(args[2], args[3]));
        return true;
    case 'T':
        if (!ParseCoordinates(parser, args, 2, error)) {
            return false;
        }
        builder.QuadTo(builder.Reflect(builder.last_quad()), absolute(args[0], args[1]));
        return true;
    case 'A': {
        bool large_arc = false;
        bool sweep = false;
        if (!ParseCoordinates(parser, args, 3, error) || !ParseFlag(parser, large_arc, error) ||
            !ParseFlag(parser, sweep, error)) {
            return false;
        }
        parser.OptionalComma();
        if (!ParseCoordinates(parser, args + 3, 2, error)) {
            return false;
        }
        builder.ArcTo(args[0], args[1], args[2], large_arc, sweep, absolute(args[3], args[4]));
        return true;
    }
    case 'Z':
        builder.ClosePath();
        return true;
    }
    return false;
}

// Parameters in (0, 1) where one coordinate of a cubic has an extremum.
std::vector<double> CubicExtrema(double p0, double p1, double p2, double p3) {
    const double a = -p0 + 3.0 * p1 - 3.0 * p2 + p3;
    const double b = 2.0 * (p0 - 2.0 * p1 + p2);
    const double c = p1 - p0;

    std::vector<double> roots;
    if (std::fabs(a) < 1e-12) {
        if (std::fabs(b) >= 1e-12) {
            roots.push_back(-c / b);
        }
    } else {
        const double discriminant = b * b - 4.0 * a * c;
        if (discriminant >= 0.0) {
            const double sqrt_d = std::sqrt(discriminant);
            roots.push_back((-b + sqrt_d) / (2.0 * a));
            roots.push_back((-b - sqrt_d) / (2.0 * a));
        }
    }

    roots.erase(std::remove_if(roots.begin(), roots.end(), [](double t) { return t <= 0.0 || t >= 1.0; }), roots.end());
    return roots;
}

Point CubicPoint(const Point& p0, const Point& p1, const Point& p2, const Point& p3, double t) {
    const double mt = 1.0 - t;
    const double w0 = mt * mt * mt;
    const double w1 = 3.0 * mt * mt * t;
    const double w2 = 3.0 * mt * t * t;
    const double w3 = t * t * t;
    return Point{w0 * p0.x + w1 * p1.x + w2 * p2.x + w3 * p3.x, w0 * p0.y + w1 * p1.y + w2 * p2.y + w3 * p3.y};
}

// Tight extents of the drawn segments. A lone moveto covers nothing.
std::optional<Rect> PathExtents(const std::vector<PathCommand>& path) {
    std::optional<Rect> box;
    auto include = [&](const Point& p) {
        const Rect r(p.x, p.y, p.x, p.y);
        box = box.has_value() ? box->Union(r) : r;
    };

    Point current;
    for (const auto& command : path) {
        switch (command.type) {
        case PathCommandType::kMoveTo:
            break;
        case PathCommandType::kLineTo:
        case PathCommandType::kClosePath:
            include(current);
            include(command.point);
            break;
        case PathCommandType::kCurveTo: {
            include(current);
            include(command.point);
            std::vector<double> ts = CubicExtrema(current.x, command.control1.x, command.control2.x, command.point.x);
            const auto ty = CubicExtrema(current.y, command.control1.y, command.control2.y, command.point.y);
            ts.insert(ts.end(), ty.begin(), ty.end());
            for (double t : ts) {
                include(CubicPoint(current, command.control1, command.control2, command.point, t));
            }
            break;
        }
        }
        current = command.point;
    }
    return box;
}

} // namespace

std::optional<Rect> ShapeGeometry::BoundingBox() const {
    Rect box;
    switch (kind) {
    case ElementKind::kRect:
        box = Rect(x, y, x + width, y + height);
        break;
    case ElementKind::kCircle:
    case ElementKind::kEllipse:
        box = Rect(x - rx, y - ry, x + rx, y + ry);
        break;
    case ElementKind::kLine:
    case ElementKind::kPolygon:
    case ElementKind::kPolyline: {
        if (points.empty()) {
            return std::nullopt;
        }
        box = Rect(points.front().x, points.front().y, points.front().x, points.front().y);
        for (const auto& point : points) {
            box = box.Union(Rect(point.x, point.y, point.x, point.y));
        }
        break;
    }
    case ElementKind::kPath: {
        const auto extents = PathExtents(path);
        if (!extents.has_value()) {
            return std::nullopt;
        }
        box = *extents;
        break;
    }
    default:
        return std::nullopt;
    }

    if (box.IsEmpty()) {
        return std::nullopt;
    }
    return box;
}

std::vector<Point> GeometryEngine::ParsePointList(const std::string& value) {
    std::vector<Point> points;
    ValueParser parser(value);

    while (!parser.IsExhausted()) {
        ValueError error;
        const auto x = parser.ParseNumber(error);
        std::optional<double> y;
        if (x.has_value()) {
            parser.OptionalComma();
            y = parser.ParseNumber(error);
        }
        if (!y.has_value()) {
            Log()->debug("ignoring points after error: {}", error.ToString());
            break;
        }
        points.push_back({*x, *y});
        parser.OptionalComma();
    }
    return points;
}

std::vector<PathCommand> GeometryEngine::ParsePathData(const std::string& value) {
    PathBuilder builder;
    ValueParser parser(value);
    char command = '\0';
    bool first = true;

    while (!parser.IsExhausted()) {
        const char next = PeekPathCommand(parser);
        if (next != '\0') {
            parser.ConsumeChar(next);
            command = next;
        } else if (command == '\0' || command == 'Z' || command == 'z' || !AtPathNumber(parser)) {
            Log()->debug("ignoring path data after error: unexpected data: {}", parser.Remaining());
            break;
        }

        // Path data has to start with a moveto.
        if (first && command != 'M' && command != 'm') {
            Log()->debug("ignoring path data that does not start with a moveto");
            break;
        }
        first = false;

        ValueError error;
        if (!ParsePathSegment(parser, command, builder, error)) {
            Log()->debug("ignoring path data after error: {}", error.ToString());
            break;
        }
        parser.OptionalComma();

        // Coordinates following a moveto are implicit linetos.
        if (command == 'M') {
            command = 'L';
        } else if (command == 'm') {
            command = 'l';
        }
    }
    return builder.Take();
}

std::optional<ShapeGeometry> GeometryEngine::Build(const Node& node, const NormalizeParams& params) const {
    const auto& attrs = node.attributes;
    ShapeGeometry geometry;
    geometry.kind = node.kind;

    switch (node.kind) {
    case ElementKind::kRect:
        geometry.x = NormalizeAttr<Length<Horizontal>>(attrs, "x", params);
        geometry.y = NormalizeAttr<Length<Vertical>>(attrs, "y", params);
        geometry.width = NormalizeAttr<ULength<Horizontal>>(attrs, "width", params);
        geometry.height = NormalizeAttr<ULength<Vertical>>(attrs, "height", params);
        geometry.rx = NormalizeAttr<ULength<Horizontal>>(attrs, "rx", params);
        geometry.ry = NormalizeAttr<ULength<Vertical>>(attrs, "ry", params);
        return geometry;

    case ElementKind::kCircle:
        geometry.x = NormalizeAttr<Length<Horizontal>>(attrs, "cx", params);
        geometry.y = NormalizeAttr<Length<Vertical>>(attrs, "cy", params);
        geometry.rx = NormalizeAttr<ULength<Both>>(attrs, "r", params);
        geometry.ry = geometry.rx;
        return geometry;

    case ElementKind::kEllipse:
        geometry.x = NormalizeAttr<Length<Horizontal>>(attrs, "cx", params);
        geometry.y = NormalizeAttr<Length<Vertical>>(attrs, "cy", params);
        geometry.rx = NormalizeAttr<ULength<Horizontal>>(attrs, "rx", params);
        geometry.ry = NormalizeAttr<ULength<Vertical>>(attrs, "ry", params);
        return geometry;

    case ElementKind::kLine:
        geometry.points.push_back({
            NormalizeAttr<Length<Horizontal>>(attrs, "x1", params),
            NormalizeAttr<Length<Vertical>>(attrs, "y1", params),
        });
        geometry.points.push_back({
            NormalizeAttr<Length<Horizontal>>(attrs, "x2", params),
            NormalizeAttr<Length<Vertical>>(attrs, "y2", params),
        });
        return geometry;

    case ElementKind::kPolygon:
    case ElementKind::kPolyline: {
        const auto it = attrs.find("points");
        if (it != attrs.end()) {
            geometry.points = ParsePointList(it->second);
        }
        return geometry;
    }

    case ElementKind::kPath: {
        const auto it = attrs.find("d");
        if (it != attrs.end()) {
            geometry.path = ParsePathData(it->second);
        }
        return geometry;
    }

    default:
        return std::nullopt;
    }
}

} // namespace svggeo
