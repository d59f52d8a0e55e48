/**
 * SPNLearn Row Clustering Implementation
 */

#include "spnlearn/clustering.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace spnlearn {

Matrix normalize_minmax(const Matrix& data) {
    Matrix normalized(data.rows(), data.cols());

    for (Eigen::Index j = 0; j < data.cols(); ++j) {
        Float min_val = std::numeric_limits<Float>::max();
        Float max_val = std::numeric_limits<Float>::lowest();
        for (Eigen::Index i = 0; i < data.rows(); ++i) {
            Float v = data(i, j);
            if (std::isnan(v)) continue;
            min_val = std::min(min_val, v);
            max_val = std::max(max_val, v);
        }

        const Float range = max_val - min_val;
        for (Eigen::Index i = 0; i < data.rows(); ++i) {
            Float v = data(i, j);
            normalized(i, j) = (std::isnan(v) || !(range > 0)) ? 0.0f : (v - min_val) / range;
        }
    }
    return normalized;
}

std::vector<Index> kmeans(
    const Matrix& data,
    uint32_t k,
    uint32_t max_iterations,
    Float tolerance,
    uint64_t seed
) {
    const Index n_rows = static_cast<Index>(data.rows());
    std::vector<Index> labels(n_rows, 0);
    if (n_rows == 0 || k < 2) {
        return labels;
    }

    // Seeded initialization: first k distinct rows of a shuffled order
    std::vector<Index> order(n_rows);
    std::iota(order.begin(), order.end(), static_cast<Index>(0));
    std::mt19937_64 rng(seed);
    std::shuffle(order.begin(), order.end(), rng);

    std::vector<Index> seeds;
    for (Index idx : order) {
        bool duplicate = false;
        for (Index s : seeds) {
            if (data.row(idx) == data.row(s)) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            seeds.push_back(idx);
            if (seeds.size() == k) break;
        }
    }

    if (seeds.size() < 2) {
        return labels;
    }
    k = static_cast<uint32_t>(seeds.size());

    Matrix centroids(k, data.cols());
    for (uint32_t c = 0; c < k; ++c) {
        centroids.row(c) = data.row(seeds[c]);
    }

    const int64_t n = static_cast<int64_t>(n_rows);
    for (uint32_t iter = 0; iter < max_iterations; ++iter) {
        // Assignment step
        #pragma omp parallel for schedule(static) if(n > 10000)
        for (int64_t i = 0; i < n; ++i) {
            Index best = 0;
            Float best_dist = std::numeric_limits<Float>::max();
            for (uint32_t c = 0; c < k; ++c) {
                Float dist = (data.row(i) - centroids.row(c)).squaredNorm();
                if (dist < best_dist) {
                    best_dist = dist;
                    best = c;
                }
            }
            labels[i] = best;
        }

        // Update step; empty clusters keep their centroid
        Matrix sums = Matrix::Zero(k, data.cols());
        std::vector<Index> counts(k, 0);
        for (Index i = 0; i < n_rows; ++i) {
            sums.row(labels[i]) += data.row(i);
            counts[labels[i]]++;
        }

        Float max_shift = 0;
        for (uint32_t c = 0; c < k; ++c) {
            if (counts[c] == 0) continue;
            Eigen::Matrix<Float, 1, Eigen::Dynamic> updated = sums.row(c) / static_cast<Float>(counts[c]);
            max_shift = std::max(max_shift, (updated - centroids.row(c)).norm());
            centroids.row(c) = updated;
        }

        if (max_shift <= tolerance) {
            break;
        }
    }

    return labels;
}

std::vector<SliceSplit> KMeansRowSplitter::operator()(
    const DataSlice& slice,
    const Context& /*context*/,
    const Scope& scope
) const {
    if (slice.n_rows() < config_.n_clusters) {
        return {SliceSplit{slice, scope, 1.0}};
    }

    Matrix normalized = normalize_minmax(slice.to_matrix());
    std::vector<Index> labels = kmeans(normalized, config_.n_clusters,
                                       config_.max_iterations, config_.tolerance, seed_);

    std::vector<std::vector<Index>> clusters(config_.n_clusters);
    for (Index r = 0; r < slice.n_rows(); ++r) {
        clusters[labels[r]].push_back(r);
    }

    std::vector<SliceSplit> result;
    for (const auto& rows : clusters) {
        if (rows.empty()) continue;
        const Double proportion = static_cast<Double>(rows.size()) / slice.n_rows();
        result.push_back(SliceSplit{slice.select_rows(rows), scope, proportion});
    }
    return result;
}

} // namespace spnlearn
