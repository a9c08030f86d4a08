#ifndef SVG_GEOMETRY_ACQUIRED_NODES_HPP
#define SVG_GEOMETRY_ACQUIRED_NODES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "SvgGeometry/Limits.hpp"
#include "SvgGeometry/NodeId.hpp"

namespace svggeo {

class Document;
struct Node;
class AcquiredNodes;

enum class AcquireErrorCode {
    kNone,
    kLinkNotFound,
    kInvalidLinkType,
    kCircularReference,
    kMaxReferencesExceeded,
};

struct AcquireError {
    AcquireErrorCode code = AcquireErrorCode::kNone;
    NodeId node_id;
    std::string message;

    // Only running into the reference limit aborts a whole pass; everything
    // else makes the referencing element render without the feature.
    bool IsFatal() const { return code == AcquireErrorCode::kMaxReferencesExceeded; }
    std::string ToString() const;
};

// Guard for a node acquired through AcquiredNodes. Nodes that are accessed by
// reference stay on the acquisition stack until the guard is destroyed.
class AcquiredNode {
public:
    AcquiredNode(AcquiredNode&& other);
    AcquiredNode& operator=(AcquiredNode&& other);
    AcquiredNode(const AcquiredNode&) = delete;
    AcquiredNode& operator=(const AcquiredNode&) = delete;
    ~AcquiredNode();

    const Node& get() const { return *node_; }

private:
    friend class AcquiredNodes;
    AcquiredNode(AcquiredNodes* owner, const Node* node);
    void Release();

    AcquiredNodes* owner_;
    const Node* node_;
};

// Resolves references for one render or measurement pass, detecting reference
// cycles and limiting the total number of references followed. Construct a new
// instance for every pass; it is not meant to be shared between threads.
class AcquiredNodes {
public:
    AcquiredNodes(const Document& document, size_t max_referenced_elements = kMaxReferencedElements);
    AcquiredNodes(const AcquiredNodes&) = delete;
    AcquiredNodes& operator=(const AcquiredNodes&) = delete;

    // Looks |node_id| up. Counts against the reference limit whether or not
    // it succeeds.
    std::optional<AcquiredNode> Acquire(const NodeId& node_id, AcquireError& error);

    // Puts an already known node on the acquisition stack. Fails with
    // kCircularReference if it is already there.
    std::optional<AcquiredNode> AcquireRef(const Node& node, AcquireError& error);

    bool IsAcquired(const Node& node) const;

    const Document& document() const { return document_; }
    uint64_t pass_serial() const { return pass_serial_; }
    size_t num_elements_acquired() const { return num_elements_acquired_; }
    size_t max_referenced_elements() const { return max_referenced_elements_; }
    size_t stack_depth() const { return stack_.size(); }

private:
    friend class AcquiredNode;
    void Pop(const Node* node);

    const Document& document_;
    size_t max_referenced_elements_;
    size_t num_elements_acquired_ = 0;
    uint64_t pass_serial_;
    std::vector<const Node*> stack_;
};

} // namespace svggeo

#endif
