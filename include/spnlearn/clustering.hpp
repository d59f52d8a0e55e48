#pragma once

/**
 * SPNLearn Row Clustering
 *
 * Default row-split collaborator: k-means over min-max normalized slice
 * columns. Each non-empty cluster becomes one row subset whose proportion is
 * its share of the slice's rows.
 */

#include "types.hpp"
#include "config.hpp"
#include "dataset.hpp"
#include "structure.hpp"
#include <vector>

namespace spnlearn {

/**
 * Scale every column to [0, 1]; constant columns map to 0 and NaN to 0.
 */
Matrix normalize_minmax(const Matrix& data);

/**
 * Lloyd's algorithm with seeded initialization on distinct rows.
 * Returns a cluster label in [0, k) per row. Fewer distinct rows than k
 * shrinks k accordingly.
 */
std::vector<Index> kmeans(
    const Matrix& data,
    uint32_t k,
    uint32_t max_iterations,
    Float tolerance,
    uint64_t seed
);

class KMeansRowSplitter {
public:
    KMeansRowSplitter() = default;
    KMeansRowSplitter(const ClusteringConfig& config, uint64_t seed)
        : config_(config), seed_(seed) {}

    std::vector<SliceSplit> operator()(
        const DataSlice& slice,
        const Context& context,
        const Scope& scope
    ) const;

private:
    ClusteringConfig config_;
    uint64_t seed_ = 42;
};

} // namespace spnlearn
