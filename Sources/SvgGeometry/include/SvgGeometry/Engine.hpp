#ifndef SVG_GEOMETRY_ENGINE_HPP
#define SVG_GEOMETRY_ENGINE_HPP

#include <memory>
#include <string>

#include "SvgGeometry/CompatFlags.hpp"
#include "SvgGeometry/PaintServer.hpp"
#include "SvgGeometry/ResourceResolver.hpp"
#include "SvgGeometry/Types.hpp"

namespace svggeo {

// Entry point: resolves the paint of one element of an SVG document in user
// space. Every call is a separate pass with its own reference budget.
class Engine {
public:
    Engine();
    Engine(const CompatFlags& flags);

    // Makes |svg_text| available to "url#id" references as |url|.
    bool AddExternalDocument(const std::string& url,
                             const std::string& svg_text,
                             const RenderOptions& options,
                             RenderError& out_error);

    bool ResolveFill(const std::string& svg_text,
                     const std::string& element_id,
                     const RenderOptions& options,
                     UserSpacePaintSource& out_paint,
                     RenderError& out_error) const;

    bool ResolveStroke(const std::string& svg_text,
                       const std::string& element_id,
                       const RenderOptions& options,
                       UserSpacePaintSource& out_paint,
                       RenderError& out_error) const;

private:
    enum class PaintTarget {
        kFill,
        kStroke,
    };

    bool ResolvePaint(const std::string& svg_text,
                      const std::string& element_id,
                      const RenderOptions& options,
                      PaintTarget target,
                      UserSpacePaintSource& out_paint,
                      RenderError& out_error) const;

    CompatFlags flags_;
    std::shared_ptr<ResourceResolver> resources_;
};

} // namespace svggeo

#endif
