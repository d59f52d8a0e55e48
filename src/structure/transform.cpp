/**
 * SPNLearn Structure Transforms Implementation
 */

#include "spnlearn/transform.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

namespace spnlearn {

// ============================================================================
// Id Assignment
// ============================================================================

void assign_ids(Node& root) {
    NodeId next_id = 0;
    for (Node* node : collect_nodes(root)) {
        node->set_id(next_id++);
    }
}

// ============================================================================
// Pruning
// ============================================================================

namespace {

void prune_children(InternalNode& node) {
    auto& children = node.children();

    for (auto& child : children) {
        if (child && !child->is_leaf()) {
            prune_children(static_cast<InternalNode&>(*child));
        }
    }

    SumNode* sum = node.type() == NodeType::Sum ? static_cast<SumNode*>(&node) : nullptr;
    if (sum && sum->weights().size() != children.size()) {
        throw std::logic_error(node.name() + " weights are not aligned with its children");
    }

    size_t i = 0;
    while (i < children.size()) {
        Node* child = children[i].get();
        if (child == nullptr || child->is_leaf()) {
            ++i;
            continue;
        }

        auto& inner = static_cast<InternalNode&>(*child);

        // Single-child wrapper: link the grandchild directly
        if (inner.n_children() == 1 && inner.child(0) != nullptr) {
            std::unique_ptr<Node> grandchild = inner.release_child(0);
            children[i] = std::move(grandchild);
            continue;
        }

        // Nested node of the same type: splice its children in place
        if (inner.type() == node.type()) {
            std::vector<std::unique_ptr<Node>> grandchildren = std::move(inner.children());

            if (sum) {
                auto& weights = sum->weights();
                const Double w = weights[i];
                std::vector<Double> scaled = static_cast<SumNode&>(inner).weights();
                for (Double& cw : scaled) {
                    cw *= w;
                }
                weights.erase(weights.begin() + i);
                weights.insert(weights.begin() + i, scaled.begin(), scaled.end());
            }

            children.erase(children.begin() + i);
            children.insert(children.begin() + i,
                            std::make_move_iterator(grandchildren.begin()),
                            std::make_move_iterator(grandchildren.end()));
            continue;
        }

        ++i;
    }
}

} // namespace

std::unique_ptr<Node> prune(std::unique_ptr<Node> root) {
    if (!root) {
        throw std::invalid_argument("cannot prune an empty network");
    }

    if (!root->is_leaf()) {
        prune_children(static_cast<InternalNode&>(*root));

        while (!root->is_leaf()) {
            auto& internal = static_cast<InternalNode&>(*root);
            if (internal.n_children() != 1 || internal.child(0) == nullptr) {
                break;
            }
            std::unique_ptr<Node> only_child = internal.release_child(0);
            root = std::move(only_child);
        }
    }

    assign_ids(*root);
    return root;
}

// ============================================================================
// Validity
// ============================================================================

namespace {

ValidityResult invalid(std::string message) {
    ValidityResult result;
    result.valid = false;
    result.message = std::move(message);
    return result;
}

Scope sorted_scope(const Scope& scope) {
    Scope sorted = scope;
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

ValidityResult check_ids(const std::vector<const Node*>& nodes) {
    std::unordered_set<NodeId> ids;
    NodeId max_id = 0;
    for (const Node* node : nodes) {
        ids.insert(node->id());
        max_id = std::max(max_id, node->id());
    }

    if (ids.size() != nodes.size()) {
        return invalid("nodes are missing ids or there are repeated ids");
    }
    if (ids.count(0) == 0) {
        return invalid("node ids not starting at 0");
    }
    if (max_id != ids.size() - 1) {
        return invalid("node ids not consecutive");
    }
    return {};
}

ValidityResult check_sum(const SumNode& node) {
    const auto& weights = node.weights();
    if (weights.size() != node.n_children()) {
        return invalid(node.name() + " has " + std::to_string(weights.size()) +
                       " weights for " + std::to_string(node.n_children()) + " children");
    }

    Double total = 0;
    for (Double w : weights) {
        if (!(w >= 0)) {
            return invalid(node.name() + " has a negative or NaN weight");
        }
        total += w;
    }
    if (std::abs(total - 1.0) > 1e-4) {
        return invalid(node.name() + " weights sum to " + std::to_string(total) + ", not 1");
    }

    const Scope scope = sorted_scope(node.scope());
    for (const auto& child : node.children()) {
        if (sorted_scope(child->scope()) != scope) {
            return invalid(node.name() + " is not complete: " + child->name() +
                           " has a different scope");
        }
    }
    return {};
}

ValidityResult check_product(const ProductNode& node) {
    Scope joined;
    for (const auto& child : node.children()) {
        joined.insert(joined.end(), child->scope().begin(), child->scope().end());
    }
    std::sort(joined.begin(), joined.end());

    if (std::adjacent_find(joined.begin(), joined.end()) != joined.end()) {
        return invalid(node.name() + " is not decomposable: children scopes overlap");
    }
    if (joined != sorted_scope(node.scope())) {
        return invalid(node.name() + " children scopes do not cover its scope");
    }
    return {};
}

} // namespace

ValidityResult is_valid(const Node& root) {
    std::vector<const Node*> nodes = collect_nodes(root);

    for (const Node* node : nodes) {
        if (node->scope().empty()) {
            return invalid(node->name() + " has an empty scope");
        }
        if (node->is_leaf()) {
            continue;
        }

        const auto& internal = static_cast<const InternalNode&>(*node);
        if (internal.n_children() == 0) {
            return invalid(node->name() + " has no children");
        }
        if (internal.has_placeholders()) {
            return invalid(node->name() + " has unfilled placeholder slots");
        }

        ValidityResult result = node->type() == NodeType::Sum
            ? check_sum(static_cast<const SumNode&>(*node))
            : check_product(static_cast<const ProductNode&>(*node));
        if (!result.valid) {
            return result;
        }
    }

    return check_ids(nodes);
}

} // namespace spnlearn
