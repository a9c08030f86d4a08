#ifndef SVG_GEOMETRY_SVG_DOM_HPP
#define SVG_GEOMETRY_SVG_DOM_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "SvgGeometry/CompatFlags.hpp"
#include "SvgGeometry/NodeId.hpp"
#include "SvgGeometry/Pattern.hpp"
#include "SvgGeometry/StyleResolver.hpp"
#include "SvgGeometry/Types.hpp"
#include "SvgGeometry/WeakNode.hpp"

namespace svggeo {

class ResourceResolver;

enum class ElementKind {
    kSvg,
    kG,
    kDefs,
    kUse,
    kRect,
    kCircle,
    kEllipse,
    kLine,
    kPath,
    kPolygon,
    kPolyline,
    kText,
    kImage,
    kPattern,
    kLinearGradient,
    kRadialGradient,
    kMarker,
    kClipPath,
    kMask,
    kFilter,
    kSymbol,
    kUnknown,
};

ElementKind ElementKindFromName(const std::string& name);
const char* ElementKindName(ElementKind kind);

// Elements that are only ever rendered through a reference from another
// element. They go on the acquisition stack so that cycles are detected.
bool IsAccessedByReference(ElementKind kind);

enum class NodeType {
    kElement,
    kChars,
};

struct Node {
    size_t index = 0;
    NodeType type = NodeType::kElement;
    ElementKind kind = ElementKind::kUnknown;
    std::string name;
    std::string id;
    std::map<std::string, std::string> attributes;
    // Character data of kChars nodes.
    std::string text;

    std::optional<size_t> parent;
    std::vector<size_t> children;
    bool has_element_children = false;

    ComputedValues values;
    uint64_t document_serial = 0;
    std::variant<std::monostate, Pattern> data;

    bool IsElement() const { return type == NodeType::kElement; }
    const Pattern* pattern() const { return std::get_if<Pattern>(&data); }
    WeakNode Downgrade() const { return WeakNode{document_serial, index}; }
};

// A loaded SVG document. Nodes live in an arena in document order; the root
// <svg> element is node 0.
class Document {
public:
    const Node& root() const { return nodes_.front(); }
    const Node& node(size_t index) const { return nodes_[index]; }
    size_t size() const { return nodes_.size(); }

    // First element in document order with |id|, or nullptr.
    const Node* LookupId(const std::string& id) const;

    // Resolves internal references through the id map and external ones
    // through the resource resolver. nullptr when the node cannot be found
    // or the external document may not be used.
    const Node* LookupNode(const NodeId& node_id) const;

    // nullptr when |weak| belongs to a document this one does not know.
    const Node* Upgrade(const WeakNode& weak) const;

    uint64_t serial() const { return serial_; }
    const CompatFlags& flags() const { return flags_; }
    const RenderOptions& options() const { return options_; }

private:
    friend class SvgDom;
    Document() = default;

    uint64_t serial_ = 0;
    std::vector<Node> nodes_;
    std::map<std::string, size_t> ids_;
    RenderOptions options_;
    CompatFlags flags_;
    std::shared_ptr<const ResourceResolver> resources_;
};

class SvgDom {
public:
    SvgDom(const RenderOptions& options, const CompatFlags& flags, std::shared_ptr<const ResourceResolver> resources);

    std::optional<Document> Build(const XmlNode& root, RenderError& error) const;

private:
    // Appends |xml| (and its character data) to the arena without descending
    // into its children. Returns the index of the new element.
    std::optional<size_t> AddNode(const XmlNode& xml,
                                  std::optional<size_t> parent,
                                  Document& document,
                                  RenderError& error) const;
    bool SetElementData(Node& node, RenderError& error) const;

    RenderOptions options_;
    CompatFlags flags_;
    std::shared_ptr<const ResourceResolver> resources_;
    StyleResolver style_resolver_;
};

} // namespace svggeo

#endif
