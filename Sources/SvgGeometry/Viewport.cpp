#include "SvgGeometry/Viewport.hpp"

#include "SvgGeometry/Log.hpp"

namespace svggeo {

Viewport Viewport::WithUnits(CoordUnits units) const {
    if (units == CoordUnits::kObjectBoundingBox) {
        return WithViewBox(1.0, 1.0);
    }
    return *this;
}

Viewport Viewport::WithViewBox(double width, double height) const {
    Viewport viewport = *this;
    viewport.vbox = ViewBox(Rect::FromSize(width, height));
    return viewport;
}

NormalizeParams Viewport::Params(const ComputedValues& values) const {
    NormalizeParams params;
    params.dpi = dpi;
    params.vbox = vbox;
    params.font_size = values.FontSizePx(dpi);
    return params;
}

ViewParams::ViewParams(ViewportStack* stack, size_t depth, const Viewport& viewport)
    : stack_(stack), depth_(depth), viewport_(viewport) {}

ViewParams::ViewParams(ViewParams&& other) : stack_(other.stack_), depth_(other.depth_), viewport_(other.viewport_) {
    other.stack_ = nullptr;
}

ViewParams::~ViewParams() {
    if (stack_ != nullptr) {
        stack_->Pop(depth_);
    }
}

ViewportStack::ViewportStack(const Viewport& initial) {
    stack_.push_back(initial);
}

const Viewport& ViewportStack::Top() const {
    return stack_.back();
}

ViewParams ViewportStack::Push(const Viewport& viewport) {
    stack_.push_back(viewport);
    return ViewParams(this, stack_.size() - 1, viewport);
}

void ViewportStack::Pop(size_t depth) {
    // Entry 0 is the initial viewport and is never popped.
    if (depth > 0 && depth < stack_.size()) {
        stack_.resize(depth);
    }
}

ViewParams ViewportStack::PushViewBox(double width, double height) {
    return Push(Top().WithViewBox(width, height));
}

ViewParams ViewportStack::PushCoordUnits(CoordUnits units) {
    if (units == CoordUnits::kObjectBoundingBox) {
        return PushViewBox(1.0, 1.0);
    }
    return Push(Top());
}

std::optional<ViewParams> ViewportStack::PushNewViewport(const std::optional<ViewBox>& vbox,
                                                          const Rect& viewport_rect,
                                                          const AspectRatio& preserve_aspect_ratio) {
    std::optional<Transform> transform;
    if (!preserve_aspect_ratio.ViewportToViewboxTransform(vbox, viewport_rect, transform)) {
        if (vbox.has_value()) {
            Log()->debug("ignoring viewBox ({}, {}, {}, {}) since it is not usable",
                         vbox->x0, vbox->y0, vbox->Width(), vbox->Height());
        }
        return std::nullopt;
    }
    if (!transform.has_value()) {
        return std::nullopt;
    }

    const Viewport& current = Top();
    Viewport viewport;
    viewport.dpi = current.dpi;
    viewport.transform = current.transform.PreTransform(*transform);
    if (!viewport.transform.IsInvertible()) {
        return std::nullopt;
    }
    viewport.vbox = vbox.has_value() ? *vbox : current.vbox;
    return Push(viewport);
}

} // namespace svggeo
