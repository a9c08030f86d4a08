#ifndef SVG_GEOMETRY_LENGTH_HPP
#define SVG_GEOMETRY_LENGTH_HPP

#include <cmath>
#include <optional>
#include <string>

#include "SvgGeometry/Error.hpp"
#include "SvgGeometry/Rect.hpp"
#include "SvgGeometry/Types.hpp"

namespace svggeo {

enum class LengthUnit {
    kPercent,
    kPx,
    kEm,
    kEx,
    kIn,
    kCm,
    kMm,
    kPt,
    kPc,
};

constexpr double kPointsPerInch = 72.0;
constexpr double kCmPerInch = 2.54;
constexpr double kMmPerInch = 25.4;
constexpr double kPicaPerInch = 6.0;

// Everything a length needs to become user space pixels.
struct NormalizeParams {
    Dpi dpi;
    Rect vbox;
    double font_size = 12.0;
};

// Orientation tags select which viewport dimension percentages and physical
// units are relative to.
struct Horizontal {
    static double Normalize(double x, double y) { return x; }
};

struct Vertical {
    static double Normalize(double x, double y) { return y; }
};

// "Other" lengths use the normalized diagonal, sqrt(w^2 + h^2) / sqrt(2).
struct Both {
    static double Normalize(double x, double y) { return std::sqrt(x * x + y * y) / std::sqrt(2.0); }
};

// Validation tags.
struct Signed {
    static bool Validate(double value, ValueError& error) { return true; }
};

struct Unsigned {
    static bool Validate(double value, ValueError& error);
};

struct RawLength {
    double length = 0.0;
    LengthUnit unit = LengthUnit::kPx;
};

// Number with an optional unit; "50%" is stored as 0.5 kPercent.
std::optional<RawLength> ParseRawLength(const std::string& text, ValueError& error);

// Converts |length| with the orientation already applied: |viewport_basis| is
// the normalized viewport size and |dpi_basis| the normalized resolution.
double NormalizeRawLength(const RawLength& length, double viewport_basis, double dpi_basis, double font_size);

template <typename N, typename V>
class CssLength {
public:
    CssLength() = default;
    CssLength(double length, LengthUnit unit) : length_(length), unit_(unit) {}

    static std::optional<CssLength> Parse(const std::string& text, ValueError& error) {
        const auto raw = ParseRawLength(text, error);
        if (!raw.has_value()) {
            return std::nullopt;
        }
        if (!V::Validate(raw->length, error)) {
            return std::nullopt;
        }
        return CssLength(raw->length, raw->unit);
    }

    double Normalize(const NormalizeParams& params) const {
        return NormalizeRawLength(RawLength{length_, unit_},
                                  N::Normalize(params.vbox.Width(), params.vbox.Height()),
                                  N::Normalize(params.dpi.x, params.dpi.y),
                                  params.font_size);
    }

    double length() const { return length_; }
    LengthUnit unit() const { return unit_; }

private:
    double length_ = 0.0;
    LengthUnit unit_ = LengthUnit::kPx;
};

template <typename N, typename V>
bool operator==(const CssLength<N, V>& a, const CssLength<N, V>& b) {
    return a.length() == b.length() && a.unit() == b.unit();
}

template <typename N, typename V>
bool operator!=(const CssLength<N, V>& a, const CssLength<N, V>& b) {
    return !(a == b);
}

template <typename N>
using Length = CssLength<N, Signed>;

template <typename N>
using ULength = CssLength<N, Unsigned>;

} // namespace svggeo

#endif
