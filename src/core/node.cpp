/**
 * SPNLearn Node Implementation
 */

#include "spnlearn/node.hpp"
#include <algorithm>
#include <queue>
#include <stdexcept>
#include <utility>

namespace spnlearn {

// ============================================================================
// Internal Node
// ============================================================================

size_t InternalNode::add_placeholder() {
    children_.emplace_back(nullptr);
    return children_.size() - 1;
}

size_t InternalNode::add_child(std::unique_ptr<Node> child) {
    if (!child) {
        throw std::logic_error("cannot add a null child to " + name());
    }
    children_.push_back(std::move(child));
    return children_.size() - 1;
}

void InternalNode::set_child(size_t slot, std::unique_ptr<Node> child) {
    if (slot >= children_.size()) {
        throw std::logic_error("slot " + std::to_string(slot) + " does not exist in " + name());
    }
    if (children_[slot]) {
        throw std::logic_error("slot " + std::to_string(slot) + " of " + name() + " is already filled");
    }
    if (!child) {
        throw std::logic_error("cannot fill slot " + std::to_string(slot) + " of " + name() + " with null");
    }
    children_[slot] = std::move(child);
}

std::unique_ptr<Node> InternalNode::release_child(size_t slot) {
    if (slot >= children_.size()) {
        throw std::logic_error("slot " + std::to_string(slot) + " does not exist in " + name());
    }
    return std::move(children_[slot]);
}

bool InternalNode::has_placeholders() const {
    return std::any_of(children_.begin(), children_.end(),
                       [](const std::unique_ptr<Node>& c) { return !c; });
}

// ============================================================================
// Traversal
// ============================================================================

std::vector<const Node*> collect_nodes(const Node& root) {
    std::vector<const Node*> result;
    std::queue<const Node*> bfs;
    bfs.push(&root);

    while (!bfs.empty()) {
        const Node* node = bfs.front();
        bfs.pop();
        result.push_back(node);

        if (!node->is_leaf()) {
            for (const auto& child : static_cast<const InternalNode*>(node)->children()) {
                if (child) bfs.push(child.get());
            }
        }
    }
    return result;
}

std::vector<Node*> collect_nodes(Node& root) {
    std::vector<Node*> result;
    std::queue<Node*> bfs;
    bfs.push(&root);

    while (!bfs.empty()) {
        Node* node = bfs.front();
        bfs.pop();
        result.push_back(node);

        if (!node->is_leaf()) {
            for (auto& child : static_cast<InternalNode*>(node)->children()) {
                if (child) bfs.push(child.get());
            }
        }
    }
    return result;
}

NodeCounts count_nodes(const Node& root) {
    NodeCounts counts;
    for (const Node* node : collect_nodes(root)) {
        switch (node->type()) {
            case NodeType::Sum: counts.sum++; break;
            case NodeType::Product: counts.product++; break;
            case NodeType::Leaf: counts.leaf++; break;
        }
    }
    return counts;
}

uint32_t depth(const Node& root) {
    uint32_t max_depth = 0;
    std::queue<std::pair<const Node*, uint32_t>> bfs;
    bfs.push({&root, 0});

    while (!bfs.empty()) {
        auto [node, d] = bfs.front();
        bfs.pop();
        max_depth = std::max(max_depth, d);

        if (!node->is_leaf()) {
            for (const auto& child : static_cast<const InternalNode*>(node)->children()) {
                if (child) bfs.push({child.get(), d + 1});
            }
        }
    }
    return max_depth;
}

// ============================================================================
// Printing
// ============================================================================

namespace {

void print_scope(const Scope& scope, std::ostream& out) {
    out << "[";
    for (size_t i = 0; i < scope.size(); ++i) {
        if (i > 0) out << ", ";
        out << scope[i];
    }
    out << "]";
}

void print_node(const Node& node, std::ostream& out, size_t indent, const Double* weight) {
    out << std::string(indent * 2, ' ');
    if (weight) {
        out << *weight << " * ";
    }
    out << node.name() << " scope=";
    print_scope(node.scope(), out);

    if (node.is_leaf()) {
        out << " ";
        static_cast<const LeafNode&>(node).describe(out);
        out << "\n";
        return;
    }
    out << "\n";

    const auto& internal = static_cast<const InternalNode&>(node);
    const SumNode* sum = node.type() == NodeType::Sum ? static_cast<const SumNode*>(&node) : nullptr;

    for (size_t i = 0; i < internal.n_children(); ++i) {
        const Double* w = (sum && i < sum->weights().size()) ? &sum->weights()[i] : nullptr;
        const Node* child = internal.child(i);
        if (child) {
            print_node(*child, out, indent + 1, w);
        } else {
            out << std::string((indent + 1) * 2, ' ') << "<placeholder>\n";
        }
    }
}

} // namespace

void print(const Node& root, std::ostream& out) {
    print_node(root, out, 0, nullptr);
}

} // namespace spnlearn
