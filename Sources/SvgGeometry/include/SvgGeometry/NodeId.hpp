#ifndef SVG_GEOMETRY_NODE_ID_HPP
#define SVG_GEOMETRY_NODE_ID_HPP

#include <optional>
#include <string>

#include "SvgGeometry/Error.hpp"

namespace svggeo {

// Reference to an element, either "#id" in the same document or "url#id" in
// an external one.
class NodeId {
public:
    NodeId() = default;

    static NodeId Internal(const std::string& fragment);
    static NodeId External(const std::string& url, const std::string& fragment);

    // Fails with "fragment identifier required" when there is no "#id" part.
    static std::optional<NodeId> Parse(const std::string& href, ValueError& error);

    bool is_external() const { return external_; }
    const std::string& url() const { return url_; }
    const std::string& fragment() const { return fragment_; }

    std::string ToString() const;

private:
    bool external_ = false;
    std::string url_;
    std::string fragment_;
};

bool operator==(const NodeId& a, const NodeId& b);
bool operator!=(const NodeId& a, const NodeId& b);

} // namespace svggeo

#endif
