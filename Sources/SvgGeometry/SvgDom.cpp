#include "SvgGeometry/SvgDom.hpp"

#include <atomic>
#include <utility>

#include "SvgGeometry/Log.hpp"
#include "SvgGeometry/ResourceResolver.hpp"

namespace svggeo {
namespace {

struct ElementName {
    const char* name;
    ElementKind kind;
};

constexpr ElementName kElementNames[] = {
    {"svg", ElementKind::kSvg},
    {"g", ElementKind::kG},
    {"defs", ElementKind::kDefs},
    {"use", ElementKind::kUse},
    {"rect", ElementKind::kRect},
    {"circle", ElementKind::kCircle},
    {"ellipse", ElementKind::kEllipse},
    {"line", ElementKind::kLine},
    {"path", ElementKind::kPath},
    {"polygon", ElementKind::kPolygon},
    {"polyline", ElementKind::kPolyline},
    {"text", ElementKind::kText},
    {"image", ElementKind::kImage},
    {"pattern", ElementKind::kPattern},
    {"linearGradient", ElementKind::kLinearGradient},
    {"radialGradient", ElementKind::kRadialGradient},
    {"marker", ElementKind::kMarker},
    {"clipPath", ElementKind::kClipPath},
    {"mask", ElementKind::kMask},
    {"filter", ElementKind::kFilter},
    {"symbol", ElementKind::kSymbol},
};

uint64_t NextDocumentSerial() {
    static std::atomic<uint64_t> next_serial{1};
    return next_serial++;
}

std::string LocalName(const std::string& name) {
    if (name.rfind("svg:", 0) == 0) {
        return name.substr(4);
    }
    return name;
}

bool IsBlank(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

ElementKind ElementKindFromName(const std::string& name) {
    const std::string local = LocalName(name);
    for (const auto& entry : kElementNames) {
        if (local == entry.name) {
            return entry.kind;
        }
    }
    return ElementKind::kUnknown;
}

const char* ElementKindName(ElementKind kind) {
    for (const auto& entry : kElementNames) {
        if (entry.kind == kind) {
            return entry.name;
        }
    }
    return "unknown";
}

bool IsAccessedByReference(ElementKind kind) {
    switch (kind) {
    case ElementKind::kPattern:
    case ElementKind::kLinearGradient:
    case ElementKind::kRadialGradient:
    case ElementKind::kMarker:
    case ElementKind::kClipPath:
    case ElementKind::kMask:
    case ElementKind::kFilter:
        return true;
    default:
        return false;
    }
}

const Node* Document::LookupId(const std::string& id) const {
    const auto it = ids_.find(id);
    if (it == ids_.end()) {
        return nullptr;
    }
    return &nodes_[it->second];
}

const Node* Document::LookupNode(const NodeId& node_id) const {
    if (!node_id.is_external()) {
        return LookupId(node_id.fragment());
    }

    RenderError policy_error;
    if (!ResourceResolver::ValidatePolicy(node_id.url(), options_, policy_error)) {
        Log()->debug("{}", policy_error.message);
        return nullptr;
    }
    if (!resources_) {
        Log()->debug("no external documents available for {}", node_id.ToString());
        return nullptr;
    }

    const auto external = resources_->Lookup(node_id.url());
    if (!external) {
        Log()->debug("external document not loaded: {}", node_id.url());
        return nullptr;
    }
    return external->LookupId(node_id.fragment());
}

const Node* Document::Upgrade(const WeakNode& weak) const {
    if (weak.document_serial == serial_) {
        return weak.index < nodes_.size() ? &nodes_[weak.index] : nullptr;
    }
    if (!resources_) {
        return nullptr;
    }
    const Document* other = resources_->LookupBySerial(weak.document_serial);
    if (other == nullptr || other == this) {
        return nullptr;
    }
    return other->Upgrade(weak);
}

SvgDom::SvgDom(const RenderOptions& options, const CompatFlags& flags, std::shared_ptr<const ResourceResolver> resources)
    : options_(options), flags_(flags), resources_(std::move(resources)) {}

std::optional<Document> SvgDom::Build(const XmlNode& root, RenderError& error) const {
    error = {};

    if (LocalName(root.name) != "svg") {
        error.code = RenderErrorCode::kInvalidDocument;
        error.message = "Root element must be <svg>";
        return std::nullopt;
    }

    Document document;
    document.serial_ = NextDocumentSerial();
    document.options_ = options_;
    document.flags_ = flags_;
    document.resources_ = resources_;

    // Walked with an explicit stack so that deep documents cannot exhaust
    // the call stack. Children are pushed in reverse to keep document order.
    std::vector<std::pair<const XmlNode*, std::optional<size_t>>> pending;
    pending.emplace_back(&root, std::nullopt);
    while (!pending.empty()) {
        const auto [xml, parent] = pending.back();
        pending.pop_back();

        const auto index = AddNode(*xml, parent, document, error);
        if (!index.has_value()) {
            return std::nullopt;
        }
        for (auto it = xml->children.rbegin(); it != xml->children.rend(); ++it) {
            pending.emplace_back(&*it, *index);
        }
    }
    return document;
}

std::optional<size_t> SvgDom::AddNode(const XmlNode& xml,
                                      std::optional<size_t> parent,
                                      Document& document,
                                      RenderError& error) const {
    if (document.nodes_.size() >= options_.max_loaded_elements) {
        error.code = RenderErrorCode::kLimitExceeded;
        error.message = "cannot load more than " + std::to_string(options_.max_loaded_elements) + " XML elements";
        Log()->warn("{}", error.message);
        return std::nullopt;
    }

    // Copy the parent's values; the arena may reallocate below.
    std::optional<ComputedValues> parent_values;
    if (parent.has_value()) {
        parent_values = document.nodes_[*parent].values;
    }

    Node node;
    node.index = document.nodes_.size();
    node.kind = ElementKindFromName(xml.name);
    node.name = LocalName(xml.name);
    node.attributes = xml.attributes;
    node.parent = parent;
    node.document_serial = document.serial_;
    node.values = style_resolver_.Resolve(xml.attributes, parent_values ? &*parent_values : nullptr, options_);

    const auto id_it = xml.attributes.find("id");
    if (id_it != xml.attributes.end()) {
        node.id = id_it->second;
    }
    if (!SetElementData(node, error)) {
        return std::nullopt;
    }

    const size_t index = node.index;
    if (!node.id.empty()) {
        document.ids_.emplace(node.id, index);
    }
    document.nodes_.push_back(std::move(node));
    if (parent.has_value()) {
        document.nodes_[*parent].children.push_back(index);
        document.nodes_[*parent].has_element_children = true;
    }

    if (!IsBlank(xml.text)) {
        Node chars;
        chars.index = document.nodes_.size();
        chars.type = NodeType::kChars;
        chars.text = xml.text;
        chars.parent = index;
        chars.document_serial = document.serial_;
        chars.values = document.nodes_[index].values;
        document.nodes_[index].children.push_back(chars.index);
        document.nodes_.push_back(std::move(chars));
    }
    return index;
}

bool SvgDom::SetElementData(Node& node, RenderError& error) const {
    if (node.kind != ElementKind::kPattern) {
        return true;
    }

    Pattern pattern;
    AttributeError attribute_error;
    if (!pattern.SetAttributes(node.attributes, flags_.strict_attributes, attribute_error)) {
        error.code = RenderErrorCode::kInvalidDocument;
        error.message = "<" + node.name + "> " + attribute_error.ToString();
        return false;
    }
    node.data = std::move(pattern);
    return true;
}

} // namespace svggeo
