#pragma once

/**
 * SPNLearn Column Independence Splitting
 *
 * Default column-split collaborator. Columns are vertices of a graph with an
 * edge wherever the absolute Pearson correlation reaches the threshold; each
 * connected component becomes one column subset.
 */

#include "types.hpp"
#include "config.hpp"
#include "dataset.hpp"
#include "structure.hpp"
#include <vector>

namespace spnlearn {

/**
 * Absolute pairwise Pearson correlation [n_cols x n_cols]. Pairs involving a
 * constant column are 0; the diagonal is 1.
 */
Eigen::MatrixXd absolute_correlation(const Matrix& data);

/**
 * Connected components of the thresholded correlation graph, each a sorted
 * list of column positions, ordered by their smallest position.
 */
std::vector<std::vector<Index>> dependent_components(const Matrix& data, Float threshold);

class CorrelationColumnSplitter {
public:
    CorrelationColumnSplitter() = default;
    explicit CorrelationColumnSplitter(const IndependenceConfig& config) : config_(config) {}

    std::vector<SliceSplit> operator()(
        const DataSlice& slice,
        const Context& context,
        const Scope& scope
    ) const;

private:
    IndependenceConfig config_;
};

} // namespace spnlearn
