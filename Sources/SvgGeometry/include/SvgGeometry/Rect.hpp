#ifndef SVG_GEOMETRY_RECT_HPP
#define SVG_GEOMETRY_RECT_HPP

namespace svggeo {

// Smallest fraction representable by cairo's 24.8 fixed point numbers. Values
// closer than this are indistinguishable once they reach the rasterizer.
constexpr double kFixedPointEpsilon = 1.0 / 256.0;

bool ApproxEqFixed(double a, double b);

// Axis aligned rectangle stored by its corners.
struct Rect {
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;

    Rect() = default;
    Rect(double x0, double y0, double x1, double y1);

    static Rect FromSize(double width, double height);

    double Width() const { return x1 - x0; }
    double Height() const { return y1 - y0; }

    bool IsEmpty() const;

    Rect Union(const Rect& other) const;
};

bool operator==(const Rect& a, const Rect& b);
bool operator!=(const Rect& a, const Rect& b);

} // namespace svggeo

#endif
