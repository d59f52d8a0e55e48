#pragma once

/**
 * SPNLearn Structure Learning
 *
 * learn_structure drives a breadth-first worklist of pending (slice, scope)
 * tasks. For every task the operation policy picks one of five operations;
 * the builder either creates a Sum/Product node with one placeholder slot per
 * follow-up task, or places a leaf and ends the branch. A split that comes
 * back with a single part re-enqueues the same task with its failure flag
 * set, so every lineage reaches naive factorization or a leaf.
 *
 * Usage:
 * ```cpp
 * spnlearn::Dataset data(matrix);
 * spnlearn::Config config;
 * auto spn = spnlearn::learn_parametric(data, config);
 * ```
 */

#include "types.hpp"
#include "config.hpp"
#include "dataset.hpp"
#include "node.hpp"
#include "policy.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace spnlearn {

// ============================================================================
// Collaborator Contracts
// ============================================================================

/**
 * One part of a row or column split.
 * Row splits: row subset, unchanged scope, mixture proportion.
 * Column splits: column subset, the matching subset of the scope; proportion
 * is ignored.
 */
struct SliceSplit {
    DataSlice slice;
    Scope scope;
    Double proportion = 0.0;
};

using SplitRowsFn = std::function<std::vector<SliceSplit>(const DataSlice&, const Context&, const Scope&)>;
using SplitColumnsFn = std::function<std::vector<SliceSplit>(const DataSlice&, const Context&, const Scope&)>;
using CreateLeafFn = std::function<std::unique_ptr<LeafNode>(const DataSlice&, const Context&, const Scope&)>;

// (slice, scope, no_clusters, no_independencies, is_first)
using NextOperationFn = std::function<OperationChoice(const DataSlice&, const Scope&, bool, bool, bool)>;

// (slice, scope-relative column positions) -> column subset
using DataSlicerFn = std::function<DataSlice(const DataSlice&, const std::vector<Index>&)>;

// ============================================================================
// Structure Builder
// ============================================================================

/**
 * Learn a network over dataset.
 *
 * @param initial_scope Variable id per dataset column; empty means 0..n_cols-1
 * @param data_slicer   Column carve-out; empty means DataSlice::select_columns
 * @param verbosity     0 silent, 1 summary line, 2 every operation
 * @return Pruned, id-assigned, validated root
 *
 * Throws std::invalid_argument on bad inputs, std::logic_error when a
 * collaborator breaks its contract, std::runtime_error if the finished
 * network fails validation.
 */
std::unique_ptr<Node> learn_structure(
    const Dataset& dataset,
    const Context& context,
    const SplitRowsFn& split_rows,
    const SplitColumnsFn& split_columns,
    const CreateLeafFn& create_leaf,
    const NextOperationFn& next_operation,
    const Scope& initial_scope = {},
    const DataSlicerFn& data_slicer = {},
    int32_t verbosity = 0
);

/**
 * learn_structure with the default collaborators: k-means row splits,
 * correlation column splits, parametric leaves and the configured policy.
 */
std::unique_ptr<Node> learn_parametric(
    const Dataset& dataset,
    const Context& context,
    const Config& config
);

// Context detected from the data (see Context::from_dataset)
std::unique_ptr<Node> learn_parametric(const Dataset& dataset, const Config& config);

} // namespace spnlearn
