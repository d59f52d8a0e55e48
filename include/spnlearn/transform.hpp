#pragma once

/**
 * SPNLearn Structure Transforms
 *
 * Post-learning passes over a finished network: id assignment, pruning
 * of redundant internal nodes and the structural validity check.
 */

#include "node.hpp"
#include <memory>
#include <string>

namespace spnlearn {

/**
 * Number nodes 0..N-1 in breadth-first order (root is 0).
 */
void assign_ids(Node& root);

/**
 * Compact a network bottom-up:
 * - an internal child with exactly one child is replaced by that grandchild
 *   (a Sum parent keeps the slot's weight)
 * - a child of the same type as its parent is spliced into the parent in
 *   place; for Sum nodes the spliced weights are scaled by the child's weight
 * - a root with a single child is replaced by that child
 * Ids are reassigned afterwards. Returns the (possibly different) root.
 */
std::unique_ptr<Node> prune(std::unique_ptr<Node> root);

struct ValidityResult {
    bool valid = true;
    std::string message;

    explicit operator bool() const { return valid; }
};

/**
 * Structural validity:
 * - no placeholders and no childless internal nodes
 * - Sum: one non-negative weight per child, weights sum to 1,
 *   every child has the Sum's scope
 * - Product: children have pairwise disjoint scopes covering the Product's scope
 * - leaves have a non-empty scope
 * - ids are unique and consecutive from 0
 */
ValidityResult is_valid(const Node& root);

} // namespace spnlearn
