#pragma once

/**
 * SPNLearn: Sum-Product Network Structure Learning
 *
 * Core type definitions shared by the dataset, node and learner layers.
 */

#include <cstdint>
#include <cstddef>
#include <vector>
#include <Eigen/Dense>

namespace spnlearn {

// ============================================================================
// Basic Types
// ============================================================================

using Float = float;                    // Stored data values
using Double = double;                  // Parameters, weights, log-likelihoods
using Index = uint32_t;                 // Row/column indices and variable ids
using NodeId = uint32_t;                // Node identifier assigned after learning

// Ordered list of variable identifiers a node or slice is responsible for.
// Entries are stable ids (by default original column indices), not positions.
using Scope = std::vector<Index>;

using Matrix = Eigen::Matrix<Float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// ============================================================================
// Node Type
// ============================================================================

enum class NodeType : uint8_t {
    Sum = 0,        // Weighted mixture over children sharing one scope
    Product = 1,    // Factorization over children with disjoint scopes
    Leaf = 2        // Univariate distribution
};

// ============================================================================
// Variable Meta Type
// ============================================================================

enum class MetaType : uint8_t {
    Real = 0,
    Discrete = 1
};

} // namespace spnlearn
