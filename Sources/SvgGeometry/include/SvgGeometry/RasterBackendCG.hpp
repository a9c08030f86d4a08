#ifndef SVG_GEOMETRY_RASTER_BACKEND_CG_HPP
#define SVG_GEOMETRY_RASTER_BACKEND_CG_HPP

#include <CoreGraphics/CoreGraphics.h>

#include <cstdint>
#include <vector>

#include "SvgGeometry/Pattern.hpp"
#include "SvgGeometry/Transform.hpp"
#include "SvgGeometry/Types.hpp"

namespace svggeo {

// CGAffineTransform is {a, b, c, d, tx, ty} == {xx, yx, xy, yy, x0, y0}.
CGAffineTransform ToCGAffineTransform(const Transform& transform);
Transform FromCGAffineTransform(const CGAffineTransform& transform);

// Bitmap a pattern tile is drawn into. The context's CTM is the tile's
// content transform, so pattern content can be drawn in its own units.
class PatternSurface {
public:
    PatternSurface(const PatternTile& tile);
    ~PatternSurface();

    PatternSurface(const PatternSurface&) = delete;
    PatternSurface& operator=(const PatternSurface&) = delete;

    CGContextRef context() const;
    int32_t width() const { return width_; }
    int32_t height() const { return height_; }

    // Snapshot of the tile; the caller releases it.
    CGImageRef CreateImage(RenderError& error) const;

private:
    int32_t width_;
    int32_t height_;
    std::vector<uint8_t> bytes_;
    CGContextRef context_;
};

} // namespace svggeo

#endif
