/**
 * SPNLearn Operation Policy Implementation
 */

#include "spnlearn/policy.hpp"

namespace spnlearn {

const char* to_string(Operation op) {
    switch (op) {
        case Operation::CreateLeaf: return "CREATE_LEAF";
        case Operation::SplitColumns: return "SPLIT_COLUMNS";
        case Operation::SplitRows: return "SPLIT_ROWS";
        case Operation::NaiveFactorization: return "NAIVE_FACTORIZATION";
        case Operation::RemoveUninformativeFeatures: return "REMOVE_UNINFORMATIVE_FEATURES";
    }
    return "UNKNOWN";
}

OperationChoice select_operation(
    const DataSlice& slice,
    const Scope& scope,
    bool no_clusters,
    bool no_independencies,
    bool is_first,
    bool cluster_first,
    bool cluster_univariate,
    uint32_t min_instances_slice
) {
    const bool minimal_features = scope.size() == 1;
    const bool minimal_instances = slice.n_rows() <= min_instances_slice;

    if (minimal_features) {
        if (minimal_instances || no_clusters) {
            return {Operation::CreateLeaf, {}};
        }
        if (cluster_univariate) {
            return {Operation::SplitRows, {}};
        }
        return {Operation::CreateLeaf, {}};
    }

    std::vector<Index> uninformative = slice.zero_variance_columns(static_cast<Index>(scope.size()));
    if (!uninformative.empty()) {
        if (uninformative.size() == slice.n_cols()) {
            return {Operation::NaiveFactorization, {}};
        }
        return {Operation::RemoveUninformativeFeatures, std::move(uninformative)};
    }

    if (minimal_instances || (no_clusters && no_independencies)) {
        return {Operation::NaiveFactorization, {}};
    }

    if (no_independencies) {
        return {Operation::SplitRows, {}};
    }

    if (no_clusters) {
        return {Operation::SplitColumns, {}};
    }

    if (is_first) {
        return {cluster_first ? Operation::SplitRows : Operation::SplitColumns, {}};
    }

    return {Operation::SplitColumns, {}};
}

OperationChoice OperationPolicy::operator()(
    const DataSlice& slice,
    const Scope& scope,
    bool no_clusters,
    bool no_independencies,
    bool is_first
) const {
    return select_operation(slice, scope, no_clusters, no_independencies, is_first,
                            config_.cluster_first, config_.cluster_univariate,
                            config_.min_instances_slice);
}

} // namespace spnlearn
