/**
 * SPNLearn Structure Learning Implementation
 */

#include "spnlearn/structure.hpp"
#include "spnlearn/clustering.hpp"
#include "spnlearn/independence.hpp"
#include "spnlearn/leaves.hpp"
#include "spnlearn/transform.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <deque>
#include <numeric>
#include <stdexcept>
#include <string>

namespace spnlearn {

namespace {

// ============================================================================
// Task
// ============================================================================

// Pending work: fill parent's slot with a model of slice over scope
struct Task {
    DataSlice slice;
    InternalNode* parent;
    size_t slot;
    Scope scope;
    bool no_clusters;
    bool no_independencies;
};

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

// Place node into the task's slot, returns the non-owning handle
template <typename NodeT>
NodeT* splice(const Task& task, std::unique_ptr<NodeT> node) {
    NodeT* raw = node.get();
    task.parent->set_child(task.slot, std::move(node));
    return raw;
}

bool is_subset(const Scope& sub, const Scope& scope) {
    for (Index v : sub) {
        if (std::find(scope.begin(), scope.end(), v) == scope.end()) {
            return false;
        }
    }
    return true;
}

void check_row_splits(const std::vector<SliceSplit>& splits, const Task& task) {
    if (splits.empty()) {
        throw std::logic_error("split_rows returned no row subsets");
    }
    for (const auto& part : splits) {
        if (part.slice.n_cols() != task.slice.n_cols()) {
            throw std::logic_error("split_rows changed the slice width from " +
                                   std::to_string(task.slice.n_cols()) + " to " +
                                   std::to_string(part.slice.n_cols()));
        }
        if (part.slice.n_rows() == 0) {
            throw std::logic_error("split_rows returned an empty row subset");
        }
    }
}

void check_column_splits(const std::vector<SliceSplit>& splits, const Task& task) {
    if (splits.empty()) {
        throw std::logic_error("split_columns returned no column subsets");
    }
    for (const auto& part : splits) {
        if (part.scope.empty() || !is_subset(part.scope, task.scope)) {
            throw std::logic_error("split_columns returned a scope that is not a subset of the task scope");
        }
        if (part.slice.n_cols() != part.scope.size()) {
            throw std::logic_error("split_columns returned a slice with " +
                                   std::to_string(part.slice.n_cols()) + " columns for a scope of " +
                                   std::to_string(part.scope.size()));
        }
    }
}

// One single-column task per position, both flags set
template <typename NodeT>
void enqueue_single_columns(std::deque<Task>& tasks, NodeT* node, const Task& task,
                            const std::vector<Index>& positions, const DataSlicerFn& slicer) {
    for (Index col : positions) {
        size_t slot = node->add_placeholder();
        tasks.push_back(Task{slicer(task.slice, {col}), node, slot, Scope{task.scope[col]}, true, true});
    }
}

} // namespace

// ============================================================================
// Structure Builder
// ============================================================================

std::unique_ptr<Node> learn_structure(
    const Dataset& dataset,
    const Context& context,
    const SplitRowsFn& split_rows,
    const SplitColumnsFn& split_columns,
    const CreateLeafFn& create_leaf,
    const NextOperationFn& next_operation,
    const Scope& initial_scope,
    const DataSlicerFn& data_slicer,
    int32_t verbosity
) {
    if (dataset.empty()) {
        throw std::invalid_argument("dataset must not be empty");
    }
    if (context.empty()) {
        throw std::invalid_argument("context must describe the dataset variables");
    }
    if (!split_rows || !split_columns || !create_leaf || !next_operation) {
        throw std::invalid_argument("split_rows, split_columns, create_leaf and next_operation are required");
    }

    Scope scope = initial_scope;
    if (scope.empty()) {
        scope.resize(dataset.n_cols());
        std::iota(scope.begin(), scope.end(), static_cast<Index>(0));
    } else {
        if (scope.size() != dataset.n_cols()) {
            throw std::invalid_argument("initial scope has " + std::to_string(scope.size()) +
                                        " variables for " + std::to_string(dataset.n_cols()) + " columns");
        }
        Scope sorted = scope;
        std::sort(sorted.begin(), sorted.end());
        if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
            throw std::invalid_argument("initial scope contains repeated variables");
        }
    }

    const DataSlicerFn slicer = data_slicer ? data_slicer
        : [](const DataSlice& slice, const std::vector<Index>& positions) {
              return slice.select_columns(positions);
          };

    const auto start = Clock::now();

    // Synthetic wrapper whose single slot receives the real root
    auto root = std::make_unique<ProductNode>();
    root->add_placeholder();

    std::deque<Task> tasks;
    tasks.push_back(Task{DataSlice(dataset), root.get(), 0, scope, false, false});

    while (!tasks.empty()) {
        Task task = std::move(tasks.front());
        tasks.pop_front();

        if (task.slice.n_cols() != task.scope.size()) {
            throw std::logic_error("slice has " + std::to_string(task.slice.n_cols()) +
                                   " columns for a scope of " + std::to_string(task.scope.size()));
        }

        const OperationChoice choice = next_operation(task.slice, task.scope, task.no_clusters,
                                                      task.no_independencies, task.parent == root.get());

        if (verbosity > 1) {
            std::printf("[DEBUG] OP: %s on slice %ux%u (remaining tasks %zu)\n",
                        to_string(choice.operation), task.slice.n_rows(), task.slice.n_cols(), tasks.size());
        }

        switch (choice.operation) {
            case Operation::RemoveUninformativeFeatures: {
                ProductNode* node = splice(task, std::make_unique<ProductNode>(task.scope));

                std::vector<bool> uninformative(task.scope.size(), false);
                for (Index col : choice.uninformative) {
                    if (col >= task.scope.size() || uninformative[col]) {
                        throw std::logic_error("invalid uninformative column position " + std::to_string(col));
                    }
                    uninformative[col] = true;
                }
                enqueue_single_columns(tasks, node, task, choice.uninformative, slicer);

                std::vector<Index> rest;
                Scope rest_scope;
                for (Index col = 0; col < task.scope.size(); ++col) {
                    if (!uninformative[col]) {
                        rest.push_back(col);
                        rest_scope.push_back(task.scope[col]);
                    }
                }
                if (rest.empty()) {
                    throw std::logic_error("REMOVE_UNINFORMATIVE_FEATURES left no informative columns");
                }

                // A single remaining column heads straight for a leaf
                const bool next_final = rest.size() == 1;
                size_t slot = node->add_placeholder();
                tasks.push_back(Task{slicer(task.slice, rest), node, slot, std::move(rest_scope),
                                     next_final, next_final});
                break;
            }

            case Operation::SplitRows: {
                const auto split_start = Clock::now();
                std::vector<SliceSplit> parts = split_rows(task.slice, context, task.scope);
                if (verbosity > 1) {
                    std::printf("[DEBUG]     found %zu row clusters (in %.5f secs)\n",
                                parts.size(), seconds_since(split_start));
                }
                check_row_splits(parts, task);

                if (parts.size() == 1) {
                    task.no_clusters = true;
                    tasks.push_back(std::move(task));
                    break;
                }

                SumNode* node = splice(task, std::make_unique<SumNode>(task.scope));
                for (auto& part : parts) {
                    size_t slot = node->add_placeholder();
                    node->add_weight(part.proportion);
                    tasks.push_back(Task{std::move(part.slice), node, slot, task.scope, false, false});
                }
                break;
            }

            case Operation::SplitColumns: {
                const auto split_start = Clock::now();
                std::vector<SliceSplit> parts = split_columns(task.slice, context, task.scope);
                if (verbosity > 1) {
                    std::printf("[DEBUG]     found %zu col clusters (in %.5f secs)\n",
                                parts.size(), seconds_since(split_start));
                }
                check_column_splits(parts, task);

                if (parts.size() == 1) {
                    task.no_independencies = true;
                    tasks.push_back(std::move(task));
                    break;
                }

                ProductNode* node = splice(task, std::make_unique<ProductNode>(task.scope));
                for (auto& part : parts) {
                    size_t slot = node->add_placeholder();
                    tasks.push_back(Task{std::move(part.slice), node, slot, std::move(part.scope), false, false});
                }
                break;
            }

            case Operation::NaiveFactorization: {
                const auto split_start = Clock::now();
                ProductNode* node = splice(task, std::make_unique<ProductNode>(task.scope));

                std::vector<Index> positions(task.scope.size());
                std::iota(positions.begin(), positions.end(), static_cast<Index>(0));
                enqueue_single_columns(tasks, node, task, positions, slicer);

                if (verbosity > 1) {
                    std::printf("[DEBUG]     split %zu columns (in %.5f secs)\n",
                                task.scope.size(), seconds_since(split_start));
                }
                break;
            }

            case Operation::CreateLeaf: {
                const auto leaf_start = Clock::now();
                std::unique_ptr<LeafNode> leaf = create_leaf(task.slice, context, task.scope);
                if (!leaf) {
                    throw std::logic_error("create_leaf returned no leaf");
                }
                LeafNode* placed = splice(task, std::move(leaf));
                if (verbosity > 1) {
                    std::printf("[DEBUG]     created leaf %s for %zu variables (in %.5f secs)\n",
                                placed->kind().c_str(), task.scope.size(), seconds_since(leaf_start));
                }
                break;
            }

            default:
                throw std::logic_error("invalid operation: " +
                                       std::to_string(static_cast<int>(choice.operation)));
        }
    }

    std::unique_ptr<Node> spn = root->release_child(0);
    if (!spn) {
        throw std::logic_error("root slot left unfilled");
    }

    assign_ids(*spn);
    spn = prune(std::move(spn));

    ValidityResult validity = is_valid(*spn);
    if (!validity.valid) {
        throw std::runtime_error("invalid spn: " + validity.message);
    }

    if (verbosity > 0) {
        NodeCounts counts = count_nodes(*spn);
        std::printf("Structure learned in %.2fs with %zu nodes (%zu sum, %zu product, %zu leaves)\n",
                    seconds_since(start), counts.total(), counts.sum, counts.product, counts.leaf);
    }

    return spn;
}

// ============================================================================
// Default Wiring
// ============================================================================

std::unique_ptr<Node> learn_parametric(
    const Dataset& dataset,
    const Context& context,
    const Config& config
) {
    config.validate();

    return learn_structure(
        dataset,
        context,
        KMeansRowSplitter(config.clustering, config.seed),
        CorrelationColumnSplitter(config.independence),
        ParametricLeafFactory(config.leaf),
        OperationPolicy(config.structure),
        {},
        {},
        config.verbosity
    );
}

std::unique_ptr<Node> learn_parametric(const Dataset& dataset, const Config& config) {
    if (dataset.empty()) {
        throw std::invalid_argument("dataset must not be empty");
    }
    Context context = Context::from_dataset(dataset, config.context.max_discrete_values);
    return learn_parametric(dataset, context, config);
}

} // namespace spnlearn
