#ifndef SVG_GEOMETRY_VIEWPORT_HPP
#define SVG_GEOMETRY_VIEWPORT_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "SvgGeometry/AspectRatio.hpp"
#include "SvgGeometry/CoordUnits.hpp"
#include "SvgGeometry/Length.hpp"
#include "SvgGeometry/StyleResolver.hpp"
#include "SvgGeometry/Transform.hpp"
#include "SvgGeometry/Types.hpp"
#include "SvgGeometry/ViewBox.hpp"

namespace svggeo {

// A coordinate system: the transform from it to the device, and the box that
// percentages are resolved against.
struct Viewport {
    Dpi dpi;
    Transform transform;
    ViewBox vbox;

    // For objectBoundingBox units lengths are fractions of a 1x1 box.
    Viewport WithUnits(CoordUnits units) const;
    Viewport WithViewBox(double width, double height) const;

    NormalizeParams Params(const ComputedValues& values) const;
};

class ViewportStack;

// Keeps one entry of a ViewportStack alive; the entry is popped when the
// guard goes away.
class ViewParams {
public:
    ViewParams(ViewParams&& other);
    ViewParams& operator=(ViewParams&&) = delete;
    ViewParams(const ViewParams&) = delete;
    ViewParams& operator=(const ViewParams&) = delete;
    ~ViewParams();

    const Viewport& viewport() const { return viewport_; }
    NormalizeParams Params(const ComputedValues& values) const { return viewport_.Params(values); }

private:
    friend class ViewportStack;
    ViewParams(ViewportStack* stack, size_t depth, const Viewport& viewport);

    ViewportStack* stack_;
    size_t depth_;
    Viewport viewport_;
};

// The stack of nested coordinate systems of one drawing pass. It always holds
// at least the initial viewport.
class ViewportStack {
public:
    ViewportStack(const Viewport& initial);

    const Viewport& Top() const;
    size_t depth() const { return stack_.size(); }

    // New box for normalizing lengths, same transform.
    ViewParams PushViewBox(double width, double height);
    ViewParams PushCoordUnits(CoordUnits units);

    // Establishes the coordinate system of an <svg>, <symbol>, <marker> or
    // pattern content. Empty when the element must not be rendered.
    std::optional<ViewParams> PushNewViewport(const std::optional<ViewBox>& vbox,
                                              const Rect& viewport_rect,
                                              const AspectRatio& preserve_aspect_ratio);

private:
    friend class ViewParams;
    ViewParams Push(const Viewport& viewport);
    void Pop(size_t depth);

    std::vector<Viewport> stack_;
};

} // namespace svggeo

#endif
