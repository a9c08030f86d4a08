#include "SvgGeometry/NodeId.hpp"

namespace svggeo {

NodeId NodeId::Internal(const std::string& fragment) {
    NodeId id;
    id.fragment_ = fragment;
    return id;
}

NodeId NodeId::External(const std::string& url, const std::string& fragment) {
    NodeId id;
    id.external_ = true;
    id.url_ = url;
    id.fragment_ = fragment;
    return id;
}

std::optional<NodeId> NodeId::Parse(const std::string& href, ValueError& error) {
    const auto hash = href.rfind('#');
    if (hash == std::string::npos || hash + 1 == href.size()) {
        error = ValueError::Value("fragment identifier required");
        return std::nullopt;
    }

    const std::string fragment = href.substr(hash + 1);
    if (hash == 0) {
        return Internal(fragment);
    }
    return External(href.substr(0, hash), fragment);
}

std::string NodeId::ToString() const {
    if (external_) {
        return url_ + "#" + fragment_;
    }
    return "#" + fragment_;
}

bool operator==(const NodeId& a, const NodeId& b) {
    return a.is_external() == b.is_external() && a.url() == b.url() && a.fragment() == b.fragment();
}

bool operator!=(const NodeId& a, const NodeId& b) {
    return !(a == b);
}

} // namespace svggeo
