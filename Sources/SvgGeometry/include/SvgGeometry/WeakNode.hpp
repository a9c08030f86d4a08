#ifndef SVG_GEOMETRY_WEAK_NODE_HPP
#define SVG_GEOMETRY_WEAK_NODE_HPP

#include <cstddef>
#include <cstdint>

namespace svggeo {

// Non-owning reference to a node: the serial of the document that owns it and
// the node's index in that document. Resolve it with Document::Upgrade(),
// which fails for references into another document instance.
struct WeakNode {
    uint64_t document_serial = 0;
    size_t index = 0;
};

inline bool operator==(const WeakNode& a, const WeakNode& b) {
    return a.document_serial == b.document_serial && a.index == b.index;
}

inline bool operator!=(const WeakNode& a, const WeakNode& b) {
    return !(a == b);
}

} // namespace svggeo

#endif
