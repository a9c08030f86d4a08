#include "SvgGeometry/AspectRatio.hpp"

#include <algorithm>

#include "SvgGeometry/ValueParser.hpp"

namespace svggeo {
namespace {

double ComputeAlign(Align1D align, double dest_pos, double dest_size, double obj_size) {
    switch (align) {
    case Align1D::kMin:
        return dest_pos;
    case Align1D::kMid:
        return dest_pos + (dest_size - obj_size) / 2.0;
    case Align1D::kMax:
        return dest_pos + dest_size - obj_size;
    }
    return dest_pos;
}

bool ParseAlign1D(const std::string& text, Align1D& out) {
    if (text == "Min") {
        out = Align1D::kMin;
    } else if (text == "Mid") {
        out = Align1D::kMid;
    } else if (text == "Max") {
        out = Align1D::kMax;
    } else {
        return false;
    }
    return true;
}

// "xMinYMid" and friends.
bool ParseAlignKeyword(const std::string& keyword, Align& out) {
    if (keyword.size() != 8 || keyword[0] != 'x' || keyword[4] != 'Y') {
        return false;
    }
    return ParseAlign1D(keyword.substr(1, 3), out.x) && ParseAlign1D(keyword.substr(5, 3), out.y);
}

} // namespace

bool operator==(const Align& a, const Align& b) {
    return a.x == b.x && a.y == b.y && a.fit == b.fit;
}

AspectRatio::AspectRatio() : defer_(false), align_(Align()) {}

AspectRatio::AspectRatio(bool defer, const std::optional<Align>& align) : defer_(defer), align_(align) {}

std::optional<AspectRatio> AspectRatio::Parse(const std::string& text, ValueError& error) {
    ValueParser parser(text);

    auto keyword = parser.ParseIdent(error);
    if (!keyword.has_value()) {
        return std::nullopt;
    }

    bool defer = false;
    if (*keyword == "defer") {
        defer = true;
        keyword = parser.ParseIdent(error);
        if (!keyword.has_value()) {
            return std::nullopt;
        }
    }

    std::optional<Align> align;
    if (*keyword != "none") {
        Align parsed;
        if (!ParseAlignKeyword(*keyword, parsed)) {
            error = ValueError::Parse("unexpected identifier: " + *keyword);
            return std::nullopt;
        }
        align = parsed;
    }

    if (!parser.IsExhausted()) {
        ValueError fit_error;
        const auto fit = parser.ParseIdent(fit_error);
        if (fit.has_value() && *fit == "meet") {
            if (align.has_value()) {
                align->fit = FitMode::kMeet;
            }
        } else if (fit.has_value() && *fit == "slice") {
            if (align.has_value()) {
                align->fit = FitMode::kSlice;
            }
        } else {
            error = ValueError::Parse("expected meet or slice");
            return std::nullopt;
        }
    }

    if (!parser.IsExhausted()) {
        error = ValueError::Parse("unexpected trailing data: " + parser.Remaining());
        return std::nullopt;
    }

    return AspectRatio(defer, align);
}

Rect AspectRatio::Compute(const ViewBox& vbox, const Rect& viewport) const {
    if (!align_.has_value()) {
        return viewport;
    }

    const double vb_width = vbox.Width();
    const double vb_height = vbox.Height();
    const double vp_width = viewport.Width();
    const double vp_height = viewport.Height();

    const double w_factor = vp_width / vb_width;
    const double h_factor = vp_height / vb_height;
    const double factor = align_->fit == FitMode::kMeet ? std::min(w_factor, h_factor) : std::max(w_factor, h_factor);

    const double w = vb_width * factor;
    const double h = vb_height * factor;

    const double xpos = ComputeAlign(align_->x, viewport.x0, vp_width, w);
    const double ypos = ComputeAlign(align_->y, viewport.y0, vp_height, h);

    return Rect(xpos, ypos, xpos + w, ypos + h);
}

bool AspectRatio::ViewportToViewboxTransform(const std::optional<ViewBox>& vbox,
                                             const Rect& viewport,
                                             std::optional<Transform>& out) const {
    out.reset();

    // A zero width or height on the viewport or the viewBox disables
    // rendering of the element; that is not an error.
    if (viewport.IsEmpty()) {
        return true;
    }

    Transform transform;
    if (vbox.has_value()) {
        if (vbox->IsEmpty()) {
            return true;
        }
        const Rect r = Compute(*vbox, viewport);
        transform = Transform::NewTranslate(r.x0, r.y0)
                        .PreScale(r.Width() / vbox->Width(), r.Height() / vbox->Height())
                        .PreTranslate(-vbox->x0, -vbox->y0);
    } else {
        transform = Transform::NewTranslate(viewport.x0, viewport.y0);
    }

    if (!transform.IsInvertible()) {
        return false;
    }
    out = transform;
    return true;
}

bool operator==(const AspectRatio& a, const AspectRatio& b) {
    return a.defer() == b.defer() && a.align() == b.align();
}

} // namespace svggeo
