#include "SvgGeometry/Pattern.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "SvgGeometry/Log.hpp"
#include "SvgGeometry/SvgDom.hpp"

namespace svggeo {
namespace {

template <typename T, typename ParseFn>
bool SetAttribute(std::optional<T>& field,
                  const std::string& name,
                  const std::string& value,
                  ParseFn parse,
                  bool strict,
                  AttributeError& error) {
    ValueError value_error;
    auto parsed = parse(value, value_error);
    if (parsed.has_value()) {
        field = std::move(*parsed);
        return true;
    }

    AttributeError attribute_error{name, value_error};
    if (strict) {
        error = attribute_error;
        return false;
    }
    Log()->debug("ignoring attribute with invalid value: {}", attribute_error.ToString());
    return true;
}

std::optional<std::optional<ViewBox>> ParsePatternViewBox(const std::string& value, ValueError& error) {
    const auto vbox = ViewBox::Parse(value, error);
    if (!vbox.has_value()) {
        return std::nullopt;
    }
    return std::optional<ViewBox>(*vbox);
}

std::optional<Rect> NonEmptyRect(const std::optional<Rect>& bbox) {
    if (!bbox.has_value() || bbox->IsEmpty()) {
        return std::nullopt;
    }
    return bbox;
}

AcquireError CircularReference(const NodeId& node_id) {
    AcquireError error;
    error.code = AcquireErrorCode::kCircularReference;
    error.node_id = node_id;
    return error;
}

} // namespace

bool PatternAttributes::IsResolved() const {
    return units.has_value() && content_units.has_value() && vbox.has_value() && preserve_aspect_ratio.has_value() &&
           transform.has_value() && x.has_value() && y.has_value() && width.has_value() && height.has_value();
}

void PatternAttributes::ResolveFromFallback(const PatternAttributes& fallback) {
    if (!units) {
        units = fallback.units;
    }
    if (!content_units) {
        content_units = fallback.content_units;
    }
    if (!vbox) {
        vbox = fallback.vbox;
    }
    if (!preserve_aspect_ratio) {
        preserve_aspect_ratio = fallback.preserve_aspect_ratio;
    }
    if (!transform) {
        transform = fallback.transform;
    }
    if (!x) {
        x = fallback.x;
    }
    if (!y) {
        y = fallback.y;
    }
    if (!width) {
        width = fallback.width;
    }
    if (!height) {
        height = fallback.height;
    }
}

void PatternAttributes::ResolveFromDefaults() {
    if (!units) {
        units = CoordUnits::kObjectBoundingBox;
    }
    if (!content_units) {
        content_units = CoordUnits::kUserSpaceOnUse;
    }
    if (!vbox) {
        vbox = std::optional<ViewBox>();
    }
    if (!preserve_aspect_ratio) {
        preserve_aspect_ratio = AspectRatio();
    }
    if (!transform) {
        transform = Transform::Identity();
    }
    if (!x) {
        x = Length<Horizontal>();
    }
    if (!y) {
        y = Length<Vertical>();
    }
    if (!width) {
        width = ULength<Horizontal>();
    }
    if (!height) {
        height = ULength<Vertical>();
    }
}

std::optional<AcquiredNode> UserSpacePattern::AcquirePatternNode(AcquiredNodes& acquired_nodes, AcquireError& error) const {
    const Node* node = acquired_nodes.document().Upgrade(node_with_children);
    if (node == nullptr) {
        error.code = AcquireErrorCode::kLinkNotFound;
        error.node_id = NodeId();
        error.message = "pattern content node is gone";
        return std::nullopt;
    }
    return acquired_nodes.AcquireRef(*node, error);
}

Rect ResolvedPattern::GetRect(const NormalizeParams& params) const {
    const double rx = x.Normalize(params);
    const double ry = y.Normalize(params);
    const double rw = width.Normalize(params);
    const double rh = height.Normalize(params);
    return Rect(rx, ry, rx + rw, ry + rh);
}

std::optional<UserSpacePattern> ResolvedPattern::ToUserSpace(const std::optional<Rect>& object_bbox,
                                                             const Viewport& viewport,
                                                             const ComputedValues& values) const {
    if (children.kind == PatternChildren::Kind::kEmpty) {
        return std::nullopt;
    }

    const Viewport units_viewport = viewport.WithUnits(units);
    const Rect rect = GetRect(units_viewport.Params(values));

    // Pattern tile coordinate system.
    double tile_width = 0.0;
    double tile_height = 0.0;
    Transform coord_transform;
    if (units == CoordUnits::kObjectBoundingBox) {
        const auto bbox = NonEmptyRect(object_bbox);
        if (!bbox.has_value()) {
            return std::nullopt;
        }
        tile_width = rect.Width() * bbox->Width();
        tile_height = rect.Height() * bbox->Height();
        coord_transform = Transform::NewTranslate(bbox->x0 + rect.x0 * bbox->Width(), bbox->y0 + rect.y0 * bbox->Height());
    } else {
        tile_width = rect.Width();
        tile_height = rect.Height();
        coord_transform = Transform::NewTranslate(rect.x0, rect.y0);
    }
    coord_transform = coord_transform.PostTransform(transform);

    // Pattern content coordinate system.
    Transform content_transform;
    if (vbox.has_value()) {
        const Rect r = preserve_aspect_ratio.Compute(*vbox, Rect::FromSize(tile_width, tile_height));
        const double sw = r.Width() / vbox->Width();
        const double sh = r.Height() / vbox->Height();
        content_transform = Transform::NewTranslate(r.x0 - vbox->x0 * sw, r.y0 - vbox->y0 * sh).PreScale(sw, sh);
    } else if (content_units == CoordUnits::kObjectBoundingBox) {
        const auto bbox = NonEmptyRect(object_bbox);
        if (!bbox.has_value()) {
            return std::nullopt;
        }
        content_transform = Transform::NewScale(bbox->Width(), bbox->Height());
    }

    UserSpacePattern pattern;
    pattern.width = tile_width;
    pattern.height = tile_height;
    pattern.transform = transform;
    pattern.coord_transform = coord_transform;
    pattern.content_transform = content_transform;
    pattern.opacity = opacity;
    pattern.node_with_children = children.node;
    return pattern;
}

std::optional<PatternTile> PatternTile::Compute(const UserSpacePattern& pattern, const Transform& current) {
    // A zero sized pattern paints nothing.
    if (ApproxEqFixed(pattern.width, 0.0) || ApproxEqFixed(pattern.height, 0.0)) {
        return std::nullopt;
    }

    const Transform taffine = current.PreTransform(pattern.transform);
    double scale_x = std::sqrt(taffine.xx * taffine.xx + taffine.xy * taffine.xy);
    double scale_y = std::sqrt(taffine.yx * taffine.yx + taffine.yy * taffine.yy);

    const double device_width = pattern.width * scale_x;
    const double device_height = pattern.height * scale_y;
    if (!(device_width >= 1.0) || !(device_height >= 1.0) || device_width > INT32_MAX || device_height > INT32_MAX) {
        return std::nullopt;
    }

    PatternTile tile;
    tile.width = static_cast<int32_t>(device_width);
    tile.height = static_cast<int32_t>(device_height);

    // Snap the scale so the tile is a whole number of pixels.
    scale_x = static_cast<double>(tile.width) / pattern.width;
    scale_y = static_cast<double>(tile.height) / pattern.height;

    if (ApproxEqFixed(scale_x, 1.0) && ApproxEqFixed(scale_y, 1.0)) {
        tile.coord_transform = pattern.coord_transform;
        tile.content_transform = pattern.content_transform;
    } else {
        tile.coord_transform = pattern.coord_transform.PreScale(1.0 / scale_x, 1.0 / scale_y);
        tile.content_transform = pattern.content_transform.PostScale(scale_x, scale_y);
    }

    if (!tile.content_transform.IsInvertible() || !tile.coord_transform.IsInvertible()) {
        return std::nullopt;
    }
    return tile;
}

Viewport PatternTile::ContentViewport(const Viewport& viewport, const UserSpacePattern& pattern) const {
    Viewport content = viewport.WithViewBox(pattern.width, pattern.height);
    content.transform = content_transform;
    return content;
}

bool Pattern::SetAttributes(const std::map<std::string, std::string>& attributes, bool strict, AttributeError& error) {
    for (const auto& [name, value] : attributes) {
        bool ok = true;
        if (name == "patternUnits") {
            ok = SetAttribute(common_.units, name, value, ParseCoordUnits, strict, error);
        } else if (name == "patternContentUnits") {
            ok = SetAttribute(common_.content_units, name, value, ParseCoordUnits, strict, error);
        } else if (name == "viewBox") {
            ok = SetAttribute(common_.vbox, name, value, ParsePatternViewBox, strict, error);
        } else if (name == "preserveAspectRatio") {
            ok = SetAttribute(common_.preserve_aspect_ratio, name, value, AspectRatio::Parse, strict, error);
        } else if (name == "patternTransform") {
            ok = SetAttribute(common_.transform, name, value, Transform::Parse, strict, error);
        } else if (name == "x") {
            ok = SetAttribute(common_.x, name, value, Length<Horizontal>::Parse, strict, error);
        } else if (name == "y") {
            ok = SetAttribute(common_.y, name, value, Length<Vertical>::Parse, strict, error);
        } else if (name == "width") {
            ok = SetAttribute(common_.width, name, value, ULength<Horizontal>::Parse, strict, error);
        } else if (name == "height") {
            ok = SetAttribute(common_.height, name, value, ULength<Vertical>::Parse, strict, error);
        }
        if (!ok) {
            return false;
        }
    }

    // href takes precedence over the deprecated xlink:href.
    auto href = attributes.find("href");
    if (href == attributes.end()) {
        href = attributes.find("xlink:href");
    }
    if (href != attributes.end()) {
        return SetAttribute(fallback_, href->first, href->second, NodeId::Parse, strict, error);
    }
    return true;
}

std::optional<ResolvedPattern> Pattern::Resolve(const Node& node, AcquiredNodes& acquired_nodes, AcquireError& error) const {
    const bool use_cache = acquired_nodes.document().flags().cache_resolved_patterns;
    const uint64_t pass = acquired_nodes.pass_serial();

    if (cache_pass_ == pass) {
        if (cache_state_ == PatternCacheState::kResolving) {
            error = CircularReference(NodeId::Internal(node.id));
            return std::nullopt;
        }
        if (use_cache && cache_state_ == PatternCacheState::kResolved && cached_.has_value()) {
            return cached_;
        }
    }

    cache_pass_ = pass;
    cache_state_ = PatternCacheState::kResolving;
    cached_.reset();

    auto resolved = ResolveChain(node, acquired_nodes, error);
    if (resolved.has_value() && use_cache) {
        cache_state_ = PatternCacheState::kResolved;
        cached_ = resolved;
    } else {
        cache_state_ = PatternCacheState::kUnresolved;
    }
    return resolved;
}

std::optional<ResolvedPattern> Pattern::ResolveChain(const Node& node, AcquiredNodes& acquired_nodes, AcquireError& error) const {
    PatternAttributes pattern = common_;
    std::optional<WeakNode> children;
    if (node.has_element_children) {
        children = node.Downgrade();
    }
    std::optional<NodeId> fallback = fallback_;

    // Guards for every pattern of the chain stay alive until the chain is
    // resolved, so a fallback pointing back into the chain is a cycle.
    std::vector<AcquiredNode> chain;
    std::vector<const Node*> visited = {&node};

    while (!pattern.IsResolved() || !children.has_value()) {
        if (!fallback.has_value()) {
            pattern.ResolveFromDefaults();
            break;
        }

        AcquireError acquire_error;
        auto acquired = acquired_nodes.Acquire(*fallback, acquire_error);
        if (!acquired.has_value()) {
            if (acquire_error.code == AcquireErrorCode::kMaxReferencesExceeded ||
                acquire_error.code == AcquireErrorCode::kCircularReference) {
                error = acquire_error;
                return std::nullopt;
            }
            Log()->debug("stopping pattern resolution: {}", acquire_error.ToString());
            pattern.ResolveFromDefaults();
            break;
        }

        const Node& fallback_node = acquired->get();
        if (std::find(visited.begin(), visited.end(), &fallback_node) != visited.end()) {
            error = CircularReference(*fallback);
            return std::nullopt;
        }

        const Pattern* fallback_pattern = fallback_node.pattern();
        if (fallback_pattern == nullptr) {
            Log()->debug("stopping pattern resolution: {} is not a pattern", fallback->ToString());
            pattern.ResolveFromDefaults();
            break;
        }

        pattern.ResolveFromFallback(fallback_pattern->common_);
        if (!children.has_value() && fallback_node.has_element_children) {
            children = fallback_node.Downgrade();
        }
        fallback = fallback_pattern->fallback_;

        visited.push_back(&fallback_node);
        chain.push_back(std::move(*acquired));
    }

    ResolvedPattern resolved;
    resolved.units = *pattern.units;
    resolved.content_units = *pattern.content_units;
    resolved.vbox = *pattern.vbox;
    resolved.preserve_aspect_ratio = *pattern.preserve_aspect_ratio;
    resolved.transform = *pattern.transform;
    resolved.x = *pattern.x;
    resolved.y = *pattern.y;
    resolved.width = *pattern.width;
    resolved.height = *pattern.height;
    resolved.opacity = node.values.opacity;
    if (children.has_value()) {
        resolved.children.kind = PatternChildren::Kind::kWithChildren;
        resolved.children.node = *children;
    }
    return resolved;
}

} // namespace svggeo
