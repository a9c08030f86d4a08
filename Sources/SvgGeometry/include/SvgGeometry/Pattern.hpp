#ifndef SVG_GEOMETRY_PATTERN_HPP
#define SVG_GEOMETRY_PATTERN_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "SvgGeometry/AcquiredNodes.hpp"
#include "SvgGeometry/AspectRatio.hpp"
#include "SvgGeometry/CoordUnits.hpp"
#include "SvgGeometry/Error.hpp"
#include "SvgGeometry/Length.hpp"
#include "SvgGeometry/NodeId.hpp"
#include "SvgGeometry/Rect.hpp"
#include "SvgGeometry/StyleResolver.hpp"
#include "SvgGeometry/Transform.hpp"
#include "SvgGeometry/ViewBox.hpp"
#include "SvgGeometry/Viewport.hpp"
#include "SvgGeometry/WeakNode.hpp"

namespace svggeo {

struct Node;

// Which node of a fallback chain supplies the pattern content.
struct PatternChildren {
    enum class Kind {
        kEmpty,
        kWithChildren,
    };

    Kind kind = Kind::kEmpty;
    WeakNode node;
};

// Attributes as written on one <pattern>; unset means "inherit from the
// fallback, or use the default". vbox is set to an empty inner optional once it
// is known that no viewBox was specified anywhere.
struct PatternAttributes {
    std::optional<CoordUnits> units;
    std::optional<CoordUnits> content_units;
    std::optional<std::optional<ViewBox>> vbox;
    std::optional<AspectRatio> preserve_aspect_ratio;
    std::optional<Transform> transform;
    std::optional<Length<Horizontal>> x;
    std::optional<Length<Vertical>> y;
    std::optional<ULength<Horizontal>> width;
    std::optional<ULength<Vertical>> height;

    bool IsResolved() const;
    // Fills every unset field from |fallback|.
    void ResolveFromFallback(const PatternAttributes& fallback);
    // Fills every unset field with its initial value.
    void ResolveFromDefaults();
};

// Pattern normalized to user space, ready to be turned into a tile.
struct UserSpacePattern {
    double width = 0.0;
    double height = 0.0;
    Transform transform;
    Transform coord_transform;
    Transform content_transform;
    double opacity = 1.0;
    WeakNode node_with_children;

    // The content node has to go through AcquiredNodes so that references
    // from the content back to the pattern are caught.
    std::optional<AcquiredNode> AcquirePatternNode(AcquiredNodes& acquired_nodes, AcquireError& error) const;
};

struct ResolvedPattern {
    CoordUnits units = CoordUnits::kObjectBoundingBox;
    CoordUnits content_units = CoordUnits::kUserSpaceOnUse;
    std::optional<ViewBox> vbox;
    AspectRatio preserve_aspect_ratio;
    Transform transform;
    Length<Horizontal> x;
    Length<Vertical> y;
    ULength<Horizontal> width;
    ULength<Vertical> height;
    double opacity = 1.0;
    PatternChildren children;

    Rect GetRect(const NormalizeParams& params) const;

    // Empty when no pattern in the chain has children, or when an
    // objectBoundingBox pattern is applied to an element without a usable
    // bounding box. Both mean "paint nothing".
    std::optional<UserSpacePattern> ToUserSpace(const std::optional<Rect>& object_bbox,
                                                const Viewport& viewport,
                                                const ComputedValues& values) const;
};

// Device space tile of a pattern.
struct PatternTile {
    int32_t width = 0;
    int32_t height = 0;
    // Maps tile pixels to user space.
    Transform coord_transform;
    // Maps pattern content to tile pixels.
    Transform content_transform;

    // |current| is the user space to device transform where the pattern is
    // used. Empty when the tile would be smaller than a pixel.
    static std::optional<PatternTile> Compute(const UserSpacePattern& pattern, const Transform& current);

    // Viewport the pattern content is drawn in.
    Viewport ContentViewport(const Viewport& viewport, const UserSpacePattern& pattern) const;
};

enum class PatternCacheState {
    kUnresolved,
    kResolving,
    kResolved,
};

class Pattern {
public:
    // Invalid values are logged and ignored. With |strict| the first invalid
    // value is reported through |error| and false is returned.
    bool SetAttributes(const std::map<std::string, std::string>& attributes, bool strict, AttributeError& error);

    const PatternAttributes& attributes() const { return common_; }
    const std::optional<NodeId>& fallback() const { return fallback_; }

    // Walks the fallback chain of |node| (which must hold this pattern).
    // kMaxReferencesExceeded and kCircularReference are returned through
    // |error|; broken links end the chain and the defaults are used.
    std::optional<ResolvedPattern> Resolve(const Node& node, AcquiredNodes& acquired_nodes, AcquireError& error) const;

    PatternCacheState cache_state() const { return cache_state_; }

private:
    std::optional<ResolvedPattern> ResolveChain(const Node& node, AcquiredNodes& acquired_nodes, AcquireError& error) const;

    PatternAttributes common_;
    std::optional<NodeId> fallback_;

    // Result of the last resolution, valid for the pass it was computed in.
    mutable PatternCacheState cache_state_ = PatternCacheState::kUnresolved;
    mutable uint64_t cache_pass_ = 0;
    mutable std::optional<ResolvedPattern> cached_;
};

} // namespace svggeo

#endif
