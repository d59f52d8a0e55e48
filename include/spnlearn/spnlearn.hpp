#pragma once

/**
 * SPNLearn: Sum-Product Network Structure Learning
 *
 * Learns a tree of Sum (mixture) and Product (factorization) nodes with
 * univariate leaves from tabular data, choosing at every row/column subset
 * between clustering rows, splitting independent columns, factorizing
 * naively or fitting a leaf.
 *
 * Usage:
 * ```cpp
 * #include <spnlearn/spnlearn.hpp>
 *
 * spnlearn::Dataset data;
 * data.from_dense(X, n_rows, n_cols);
 *
 * spnlearn::Config config;
 * config.structure.min_instances_slice = 100;
 *
 * auto spn = spnlearn::learn_parametric(data, config);
 * auto ll = spnlearn::log_likelihood(*spn, data);
 * ```
 *
 * Custom collaborators:
 * ```cpp
 * auto spn = spnlearn::learn_structure(
 *     data, context, my_row_split, my_col_split, my_leaf,
 *     spnlearn::OperationPolicy(config.structure));
 * ```
 *
 * @version 0.1.0
 */

#define SPNLEARN_VERSION_MAJOR 0
#define SPNLEARN_VERSION_MINOR 1
#define SPNLEARN_VERSION_PATCH 0
#define SPNLEARN_VERSION_STRING "0.1.0"

#include "spnlearn/types.hpp"
#include "spnlearn/config.hpp"
#include "spnlearn/dataset.hpp"
#include "spnlearn/node.hpp"
#include "spnlearn/policy.hpp"
#include "spnlearn/structure.hpp"
#include "spnlearn/transform.hpp"
#include "spnlearn/clustering.hpp"
#include "spnlearn/independence.hpp"
#include "spnlearn/leaves.hpp"
#include "spnlearn/inference.hpp"
#include <cstdio>

namespace spnlearn {

/**
 * Library version information
 */
struct Version {
    static constexpr int major = SPNLEARN_VERSION_MAJOR;
    static constexpr int minor = SPNLEARN_VERSION_MINOR;
    static constexpr int patch = SPNLEARN_VERSION_PATCH;
    static constexpr const char* string = SPNLEARN_VERSION_STRING;
};

/**
 * Get compile-time feature flags
 */
struct CompileFeatures {
    static constexpr bool has_openmp =
        #ifdef _OPENMP
            true;
        #else
            false;
        #endif
};

/**
 * Print library info
 */
inline void print_info() {
    std::printf("SPNLearn v%s\n", Version::string);
    std::printf("  Eigen: %d.%d.%d\n", EIGEN_WORLD_VERSION, EIGEN_MAJOR_VERSION, EIGEN_MINOR_VERSION);
    std::printf("  OpenMP: %s\n", CompileFeatures::has_openmp ? "Yes" : "No");
}

} // namespace spnlearn
