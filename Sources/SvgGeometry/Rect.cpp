#include "SvgGeometry/Rect.hpp"

#include <algorithm>
#include <cmath>

namespace svggeo {

bool ApproxEqFixed(double a, double b) {
    if (std::fabs(a - b) <= kFixedPointEpsilon) {
        return true;
    }
    // Huge values that are outside the fixed point range still compare equal
    // when they are one ulp apart.
    return std::nextafter(a, b) == b;
}

Rect::Rect(double x0, double y0, double x1, double y1) : x0(x0), y0(y0), x1(x1), y1(y1) {}

Rect Rect::FromSize(double width, double height) {
    return Rect(0.0, 0.0, width, height);
}

bool Rect::IsEmpty() const {
    return ApproxEqFixed(Width(), 0.0) || ApproxEqFixed(Height(), 0.0);
}

Rect Rect::Union(const Rect& other) const {
    return Rect(std::min(x0, other.x0), std::min(y0, other.y0), std::max(x1, other.x1), std::max(y1, other.y1));
}

bool operator==(const Rect& a, const Rect& b) {
    return a.x0 == b.x0 && a.y0 == b.y0 && a.x1 == b.x1 && a.y1 == b.y1;
}

bool operator!=(const Rect& a, const Rect& b) {
    return !(a == b);
}

} // namespace svggeo
