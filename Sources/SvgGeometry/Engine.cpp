#include "SvgGeometry/Engine.hpp"

#include <vector>

#include "SvgGeometry/AcquiredNodes.hpp"
#include "SvgGeometry/Attributes.hpp"
#include "SvgGeometry/GeometryEngine.hpp"
#include "SvgGeometry/LayoutEngine.hpp"
#include "SvgGeometry/Log.hpp"
#include "SvgGeometry/SvgDom.hpp"
#include "SvgGeometry/Viewport.hpp"
#include "SvgGeometry/XmlParser.hpp"

namespace svggeo {
namespace {

std::vector<const Node*> AncestorsOf(const Document& document, const Node& node) {
    std::vector<const Node*> chain;
    for (const Node* current = &node; current->parent.has_value(); ) {
        current = &document.node(*current->parent);
        chain.insert(chain.begin(), current);
    }
    return chain;
}

// Nested <svg> elements establish new viewports.
std::optional<ViewParams> PushNestedSvg(ViewportStack& stack, const Node& svg) {
    const auto& attrs = svg.attributes;
    const NormalizeParams params = stack.Top().Params(svg.values);

    const double x = ParseAttributeOr(attrs, "x", Length<Horizontal>()).Normalize(params);
    const double y = ParseAttributeOr(attrs, "y", Length<Vertical>()).Normalize(params);
    const double w = ParseAttributeOr(attrs, "width", ULength<Horizontal>(1.0, LengthUnit::kPercent)).Normalize(params);
    const double h = ParseAttributeOr(attrs, "height", ULength<Vertical>(1.0, LengthUnit::kPercent)).Normalize(params);

    return stack.PushNewViewport(ParseAttribute<ViewBox>(attrs, "viewBox"),
                                 Rect(x, y, x + w, y + h),
                                 ParseAttributeOr(attrs, "preserveAspectRatio", AspectRatio()));
}

} // namespace

Engine::Engine() : resources_(std::make_shared<ResourceResolver>()) {}

Engine::Engine(const CompatFlags& flags) : flags_(flags), resources_(std::make_shared<ResourceResolver>()) {}

bool Engine::AddExternalDocument(const std::string& url,
                                 const std::string& svg_text,
                                 const RenderOptions& options,
                                 RenderError& out_error) {
    out_error = {};
    ScopedDebugLogging logging(options.enable_logging);

    if (!ResourceResolver::ValidatePolicy(url, options, out_error)) {
        return false;
    }

    XmlParser xml_parser(options.max_loaded_elements);
    auto xml_root = xml_parser.Parse(svg_text, out_error);
    if (!xml_root.has_value()) {
        return false;
    }

    // External documents do not resolve references into further documents.
    SvgDom dom_builder(options, flags_, nullptr);
    auto document = dom_builder.Build(*xml_root, out_error);
    if (!document.has_value()) {
        return false;
    }

    resources_->AddDocument(url, std::make_shared<const Document>(std::move(*document)));
    return true;
}

bool Engine::ResolveFill(const std::string& svg_text,
                         const std::string& element_id,
                         const RenderOptions& options,
                         UserSpacePaintSource& out_paint,
                         RenderError& out_error) const {
    return ResolvePaint(svg_text, element_id, options, PaintTarget::kFill, out_paint, out_error);
}

bool Engine::ResolveStroke(const std::string& svg_text,
                           const std::string& element_id,
                           const RenderOptions& options,
                           UserSpacePaintSource& out_paint,
                           RenderError& out_error) const {
    return ResolvePaint(svg_text, element_id, options, PaintTarget::kStroke, out_paint, out_error);
}

bool Engine::ResolvePaint(const std::string& svg_text,
                          const std::string& element_id,
                          const RenderOptions& options,
                          PaintTarget target,
                          UserSpacePaintSource& out_paint,
                          RenderError& out_error) const {
    out_error = {};
    out_paint = {};
    ScopedDebugLogging logging(options.enable_logging);

    if (element_id.empty()) {
        out_error.code = RenderErrorCode::kInvalidId;
        out_error.message = "Element id must not be empty";
        return false;
    }

    XmlParser xml_parser(options.max_loaded_elements);
    SvgDom dom_builder(options, flags_, resources_);
    LayoutEngine layout_engine;
    GeometryEngine geometry_engine;

    auto xml_root = xml_parser.Parse(svg_text, out_error);
    if (!xml_root.has_value()) {
        return false;
    }

    auto document = dom_builder.Build(*xml_root, out_error);
    if (!document.has_value()) {
        return false;
    }

    auto layout = layout_engine.Compute(*document, options, out_error);
    if (!layout.has_value()) {
        return false;
    }

    const Node* element = document->LookupId(element_id);
    if (element == nullptr) {
        out_error.code = RenderErrorCode::kIdNotFound;
        out_error.message = "Element not found: #" + element_id;
        return false;
    }

    if (!layout->viewport.has_value()) {
        return true;
    }

    ViewportStack stack(*layout->viewport);
    std::vector<ViewParams> nested;
    for (const Node* ancestor : AncestorsOf(*document, *element)) {
        if (ancestor->parent.has_value() && ancestor->kind == ElementKind::kSvg) {
            auto params = PushNestedSvg(stack, *ancestor);
            if (!params.has_value()) {
                // An empty nested viewport hides its whole subtree.
                return true;
            }
            nested.push_back(std::move(*params));
        }
    }

    const ComputedValues& values = element->values;
    std::optional<Rect> bbox;
    if (const auto geometry = geometry_engine.Build(*element, stack.Top().Params(values)); geometry.has_value()) {
        bbox = geometry->BoundingBox();
    }

    const bool is_fill = target == PaintTarget::kFill;
    const std::string& paint_text = is_fill ? values.fill_paint : values.stroke_paint;
    ValueError paint_error;
    auto server = PaintServer::Parse(paint_text, paint_error);
    if (!server.has_value()) {
        Log()->debug("ignoring attribute with invalid value: {}",
                     AttributeError{is_fill ? "fill" : "stroke", paint_error}.ToString());
        server = is_fill ? PaintServer::SolidColor(ComputedValues().color) : PaintServer::None();
    }

    AcquiredNodes acquired_nodes(*document, options.max_referenced_elements);
    AcquireError acquire_error;
    const auto source = server->Resolve(acquired_nodes, values, acquire_error);
    if (!source.has_value()) {
        out_error.code = RenderErrorCode::kLimitExceeded;
        out_error.message = acquire_error.ToString();
        return false;
    }

    out_paint = source->ToUserSpace(bbox, stack.Top(), values);
    return true;
}

} // namespace svggeo
