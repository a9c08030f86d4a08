#ifndef SVG_GEOMETRY_ASPECT_RATIO_HPP
#define SVG_GEOMETRY_ASPECT_RATIO_HPP

#include <optional>
#include <string>

#include "SvgGeometry/Error.hpp"
#include "SvgGeometry/Rect.hpp"
#include "SvgGeometry/Transform.hpp"
#include "SvgGeometry/ViewBox.hpp"

namespace svggeo {

enum class FitMode {
    kMeet,
    kSlice,
};

enum class Align1D {
    kMin,
    kMid,
    kMax,
};

struct Align {
    Align1D x = Align1D::kMid;
    Align1D y = Align1D::kMid;
    FitMode fit = FitMode::kMeet;
};

bool operator==(const Align& a, const Align& b);

// preserveAspectRatio. A missing |align| is the "none" keyword.
class AspectRatio {
public:
    // xMidYMid meet
    AspectRatio();
    AspectRatio(bool defer, const std::optional<Align>& align);

    static std::optional<AspectRatio> Parse(const std::string& text, ValueError& error);

    bool defer() const { return defer_; }
    const std::optional<Align>& align() const { return align_; }

    // Rectangle inside |viewport| that |vbox| is mapped onto.
    Rect Compute(const ViewBox& vbox, const Rect& viewport) const;

    // Transform that establishes the viewBox coordinate system inside
    // |viewport|. |out| is left empty when the viewport or viewBox is empty,
    // which means "do not render". Returns false when the resulting matrix is
    // not invertible.
    bool ViewportToViewboxTransform(const std::optional<ViewBox>& vbox,
                                    const Rect& viewport,
                                    std::optional<Transform>& out) const;

private:
    bool defer_ = false;
    std::optional<Align> align_;
};

bool operator==(const AspectRatio& a, const AspectRatio& b);

} // namespace svggeo

#endif
