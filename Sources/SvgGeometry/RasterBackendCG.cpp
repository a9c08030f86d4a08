#include "SvgGeometry/RasterBackendCG.hpp"

namespace svggeo {

CGAffineTransform ToCGAffineTransform(const Transform& transform) {
    return CGAffineTransformMake(static_cast<CGFloat>(transform.xx),
                                 static_cast<CGFloat>(transform.yx),
                                 static_cast<CGFloat>(transform.xy),
                                 static_cast<CGFloat>(transform.yy),
                                 static_cast<CGFloat>(transform.x0),
                                 static_cast<CGFloat>(transform.y0));
}

Transform FromCGAffineTransform(const CGAffineTransform& transform) {
    Transform out;
    out.xx = transform.a;
    out.yx = transform.b;
    out.xy = transform.c;
    out.yy = transform.d;
    out.x0 = transform.tx;
    out.y0 = transform.ty;
    return out;
}

PatternSurface::PatternSurface(const PatternTile& tile)
    : width_(tile.width),
      height_(tile.height),
      bytes_(static_cast<size_t>(tile.width) * static_cast<size_t>(tile.height) * 4u, 0),
      context_(nullptr) {
    CGColorSpaceRef color_space = CGColorSpaceCreateDeviceRGB();
    context_ = CGBitmapContextCreate(bytes_.data(),
                                     static_cast<size_t>(width_),
                                     static_cast<size_t>(height_),
                                     8,
                                     static_cast<size_t>(width_) * 4,
                                     color_space,
                                     kCGImageAlphaPremultipliedLast | kCGBitmapByteOrderDefault);
    CGColorSpaceRelease(color_space);

    if (context_ != nullptr) {
        CGContextConcatCTM(context_, ToCGAffineTransform(tile.content_transform));
    }
}

PatternSurface::~PatternSurface() {
    if (context_ != nullptr) {
        CGContextRelease(context_);
    }
}

CGContextRef PatternSurface::context() const {
    return context_;
}

CGImageRef PatternSurface::CreateImage(RenderError& error) const {
    if (context_ == nullptr) {
        error.code = RenderErrorCode::kRenderFailed;
        error.message = "Failed to create bitmap context";
        return nullptr;
    }

    CGImageRef image = CGBitmapContextCreateImage(context_);
    if (image == nullptr) {
        error.code = RenderErrorCode::kRenderFailed;
        error.message = "Failed to snapshot pattern tile";
    }
    return image;
}

} // namespace svggeo
