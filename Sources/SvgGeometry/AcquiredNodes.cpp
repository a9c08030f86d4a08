#include "SvgGeometry/AcquiredNodes.hpp"

#include <algorithm>
#include <atomic>
#include <iterator>

#include "SvgGeometry/Log.hpp"
#include "SvgGeometry/SvgDom.hpp"

namespace svggeo {
namespace {

uint64_t NextPassSerial() {
    static std::atomic<uint64_t> next_serial{1};
    return next_serial++;
}

AcquireError MakeError(AcquireErrorCode code, const NodeId& node_id, const std::string& message) {
    AcquireError error;
    error.code = code;
    error.node_id = node_id;
    error.message = message;
    return error;
}

NodeId IdOf(const Node& node) {
    return NodeId::Internal(node.id);
}

} // namespace

std::string AcquireError::ToString() const {
    switch (code) {
    case AcquireErrorCode::kNone:
        return "no error";
    case AcquireErrorCode::kLinkNotFound:
        return "link not found: " + node_id.ToString();
    case AcquireErrorCode::kInvalidLinkType:
        return "invalid link type: " + node_id.ToString();
    case AcquireErrorCode::kCircularReference:
        return "circular reference: " + node_id.ToString();
    case AcquireErrorCode::kMaxReferencesExceeded:
        return message.empty() ? "maximum number of references exceeded" : message;
    }
    return message;
}

AcquiredNode::AcquiredNode(AcquiredNodes* owner, const Node* node) : owner_(owner), node_(node) {}

AcquiredNode::AcquiredNode(AcquiredNode&& other) : owner_(other.owner_), node_(other.node_) {
    other.owner_ = nullptr;
}

AcquiredNode& AcquiredNode::operator=(AcquiredNode&& other) {
    if (this != &other) {
        Release();
        owner_ = other.owner_;
        node_ = other.node_;
        other.owner_ = nullptr;
    }
    return *this;
}

AcquiredNode::~AcquiredNode() {
    Release();
}

void AcquiredNode::Release() {
    if (owner_ != nullptr) {
        owner_->Pop(node_);
        owner_ = nullptr;
    }
}

AcquiredNodes::AcquiredNodes(const Document& document, size_t max_referenced_elements)
    : document_(document), max_referenced_elements_(max_referenced_elements), pass_serial_(NextPassSerial()) {}

std::optional<AcquiredNode> AcquiredNodes::Acquire(const NodeId& node_id, AcquireError& error) {
    ++num_elements_acquired_;

    // Mitigation for documents that instance a huge number of elements
    // through <use>, recursive patterns and the like.
    if (num_elements_acquired_ > max_referenced_elements_) {
        if (num_elements_acquired_ == max_referenced_elements_ + 1) {
            Log()->warn("exceeded more than {} referenced elements", max_referenced_elements_);
        }
        error = MakeError(AcquireErrorCode::kMaxReferencesExceeded,
                          node_id,
                          "exceeded more than " + std::to_string(max_referenced_elements_) + " referenced elements");
        return std::nullopt;
    }

    const Node* node = document_.LookupNode(node_id);
    if (node == nullptr) {
        error = MakeError(AcquireErrorCode::kLinkNotFound, node_id, "");
        return std::nullopt;
    }

    if (!node->IsElement()) {
        error = MakeError(AcquireErrorCode::kInvalidLinkType, node_id, "");
        return std::nullopt;
    }

    if (IsAccessedByReference(node->kind)) {
        auto acquired = AcquireRef(*node, error);
        if (!acquired.has_value()) {
            error.node_id = node_id;
        }
        return acquired;
    }
    return AcquiredNode(nullptr, node);
}

std::optional<AcquiredNode> AcquiredNodes::AcquireRef(const Node& node, AcquireError& error) {
    if (IsAcquired(node)) {
        error = MakeError(AcquireErrorCode::kCircularReference, IdOf(node), "");
        return std::nullopt;
    }

    stack_.push_back(&node);
    return AcquiredNode(this, &node);
}

bool AcquiredNodes::IsAcquired(const Node& node) const {
    return std::find(stack_.begin(), stack_.end(), &node) != stack_.end();
}

void AcquiredNodes::Pop(const Node* node) {
    const auto it = std::find(stack_.rbegin(), stack_.rend(), node);
    if (it != stack_.rend()) {
        stack_.erase(std::next(it).base());
    }
}

} // namespace svggeo
