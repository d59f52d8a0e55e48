#pragma once

/**
 * SPNLearn Node Structures
 *
 * A learned network is a tree of Sum and Product nodes with leaf
 * distributions at the fringe. Parents own their children through
 * unique_ptr. Internal nodes are built with pre-allocated placeholder
 * slots (null children) that the structure learner fills one at a time.
 */

#include "types.hpp"
#include <memory>
#include <string>
#include <vector>
#include <ostream>

namespace spnlearn {

// ============================================================================
// Node Base
// ============================================================================

class Node {
public:
    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    virtual NodeType type() const = 0;

    // Type label used in names and printouts ("SumNode", "Gaussian", ...)
    virtual std::string kind() const = 0;

    std::string name() const { return kind() + "_" + std::to_string(id_); }

    NodeId id() const { return id_; }
    void set_id(NodeId id) { id_ = id; }

    const Scope& scope() const { return scope_; }
    Scope& scope() { return scope_; }

    bool is_leaf() const { return type() == NodeType::Leaf; }

protected:
    Node() = default;
    explicit Node(Scope scope) : scope_(std::move(scope)) {}

private:
    NodeId id_ = 0;
    Scope scope_;
};

// ============================================================================
// Internal Node (children with placeholder slots)
// ============================================================================

class InternalNode : public Node {
public:
    // Append an empty slot, returns its index
    size_t add_placeholder();

    // Append a filled slot, returns its index
    size_t add_child(std::unique_ptr<Node> child);

    /**
     * Fill a placeholder slot. Throws std::logic_error when the slot does not
     * exist, is already filled, or child is null.
     */
    void set_child(size_t slot, std::unique_ptr<Node> child);

    // Take ownership of a child, leaving a placeholder behind
    std::unique_ptr<Node> release_child(size_t slot);

    Node* child(size_t i) const { return children_.at(i).get(); }
    size_t n_children() const { return children_.size(); }
    bool has_placeholders() const;

    const std::vector<std::unique_ptr<Node>>& children() const { return children_; }
    std::vector<std::unique_ptr<Node>>& children() { return children_; }

protected:
    InternalNode() = default;
    explicit InternalNode(Scope scope) : Node(std::move(scope)) {}

private:
    std::vector<std::unique_ptr<Node>> children_;
};

// ============================================================================
// Sum Node
// ============================================================================

class SumNode : public InternalNode {
public:
    SumNode() = default;
    explicit SumNode(Scope scope) : InternalNode(std::move(scope)) {}

    NodeType type() const override { return NodeType::Sum; }
    std::string kind() const override { return "SumNode"; }

    // weights()[i] belongs to child(i)
    const std::vector<Double>& weights() const { return weights_; }
    std::vector<Double>& weights() { return weights_; }
    void add_weight(Double weight) { weights_.push_back(weight); }

private:
    std::vector<Double> weights_;
};

// ============================================================================
// Product Node
// ============================================================================

class ProductNode : public InternalNode {
public:
    ProductNode() = default;
    explicit ProductNode(Scope scope) : InternalNode(std::move(scope)) {}

    NodeType type() const override { return NodeType::Product; }
    std::string kind() const override { return "ProductNode"; }
};

// ============================================================================
// Leaf Node
// ============================================================================

/**
 * Univariate distribution over scope()[0]. Concrete families live in
 * leaves.hpp; the learner only places leaves into slots.
 */
class LeafNode : public Node {
public:
    NodeType type() const override { return NodeType::Leaf; }

    Index variable() const { return scope().front(); }

    virtual Double log_density(Float value) const = 0;

    // One-line parameter summary for print()
    virtual void describe(std::ostream& out) const = 0;

protected:
    explicit LeafNode(Index variable) : Node(Scope{variable}) {}
};

// ============================================================================
// Traversal Helpers
// ============================================================================

struct NodeCounts {
    size_t sum = 0;
    size_t product = 0;
    size_t leaf = 0;

    size_t total() const { return sum + product + leaf; }
};

// Breadth-first order starting at root; placeholders are skipped
std::vector<const Node*> collect_nodes(const Node& root);
std::vector<Node*> collect_nodes(Node& root);

NodeCounts count_nodes(const Node& root);

// Number of edges on the longest root-to-leaf path
uint32_t depth(const Node& root);

// Indented dump, one node per line
void print(const Node& root, std::ostream& out);

} // namespace spnlearn
