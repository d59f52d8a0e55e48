#pragma once

/**
 * SPNLearn Operation Policy
 *
 * Chooses the next structural operation for a pending data slice from its
 * shape, its scope and the record of earlier failed attempts on it.
 */

#include "types.hpp"
#include "config.hpp"
#include "dataset.hpp"
#include <vector>

namespace spnlearn {

// ============================================================================
// Operation
// ============================================================================

enum class Operation : uint8_t {
    CreateLeaf = 1,
    SplitColumns = 2,
    SplitRows = 3,
    NaiveFactorization = 4,
    RemoveUninformativeFeatures = 5
};

// Upper-case name used in logs ("SPLIT_ROWS", ...)
const char* to_string(Operation op);

struct OperationChoice {
    Operation operation = Operation::CreateLeaf;

    // Scope-relative positions of zero-variance columns, ascending.
    // Empty unless operation == RemoveUninformativeFeatures.
    std::vector<Index> uninformative;
};

// ============================================================================
// Decision Function
// ============================================================================

/**
 * Pure decision over (slice, scope, attempt flags). First matching rule wins:
 *  1. single-variable scope: leaf, unless rows remain above the floor,
 *     clustering has not failed and cluster_univariate is set (split rows)
 *  2. zero-variance columns: all -> naive factorization,
 *     some -> remove uninformative features
 *  3. row floor reached or both splits failed -> naive factorization
 *  4. independence splitting failed -> split rows
 *  5. clustering failed -> split columns
 *  6. first task -> split rows if cluster_first, else split columns
 *  7. split columns
 */
OperationChoice select_operation(
    const DataSlice& slice,
    const Scope& scope,
    bool no_clusters,
    bool no_independencies,
    bool is_first,
    bool cluster_first,
    bool cluster_univariate,
    uint32_t min_instances_slice
);

// ============================================================================
// Configured Policy
// ============================================================================

class OperationPolicy {
public:
    OperationPolicy() = default;
    explicit OperationPolicy(const StructureConfig& config) : config_(config) {}

    OperationChoice operator()(
        const DataSlice& slice,
        const Scope& scope,
        bool no_clusters,
        bool no_independencies,
        bool is_first
    ) const;

    const StructureConfig& config() const { return config_; }

private:
    StructureConfig config_;
};

} // namespace spnlearn
