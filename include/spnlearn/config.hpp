#pragma once

/**
 * SPNLearn Configuration
 *
 * Hyperparameters for structure learning and for the default collaborators
 * (k-means row splitting, correlation column splitting, parametric leaves).
 */

#include "types.hpp"
#include <stdexcept>

namespace spnlearn {

// ============================================================================
// Structure Configuration (operation policy)
// ============================================================================

struct StructureConfig {
    uint32_t min_instances_slice = 200;        // Row-count floor for further splitting
    bool cluster_first = true;                 // Opening move: split rows before columns
    bool cluster_univariate = false;           // Keep clustering single-variable slices
};

// ============================================================================
// Row Clustering Configuration
// ============================================================================

struct ClusteringConfig {
    uint32_t n_clusters = 2;                   // k for k-means
    uint32_t max_iterations = 100;             // Lloyd iterations
    Float tolerance = 1e-4f;                   // Stop when no centroid moves further
};

// ============================================================================
// Column Independence Configuration
// ============================================================================

struct IndependenceConfig {
    Float threshold = 0.3f;                    // |correlation| >= threshold => dependent
};

// ============================================================================
// Leaf Configuration
// ============================================================================

struct LeafConfig {
    Double min_stdev = 1e-8;                   // Floor for Gaussian standard deviation
    Double alpha = 1.0;                        // Laplace smoothing for categorical leaves
};

// ============================================================================
// Context Detection Configuration
// ============================================================================

struct ContextConfig {
    uint32_t max_discrete_values = 20;         // Integral columns up to this cardinality are Discrete
};

// ============================================================================
// Main Configuration
// ============================================================================

struct Config {
    StructureConfig structure;
    ClusteringConfig clustering;
    IndependenceConfig independence;
    LeafConfig leaf;
    ContextConfig context;

    // Verbosity and logging
    int32_t verbosity = 1;                     // 0=silent, 1=summary, 2=debug (every operation)

    // Random state
    uint64_t seed = 42;

    // ========================================================================
    // Factory Methods for Common Setups
    // ========================================================================

    static Config mixture_first() {
        Config cfg;
        cfg.structure.cluster_first = true;
        return cfg;
    }

    static Config independence_first() {
        Config cfg;
        cfg.structure.cluster_first = false;
        return cfg;
    }

    // Smaller slices and more clusters: deeper networks, slower learning
    static Config fine_grained() {
        Config cfg;
        cfg.structure.min_instances_slice = 50;
        cfg.clustering.n_clusters = 4;
        cfg.independence.threshold = 0.2f;
        return cfg;
    }

    static Config coarse() {
        Config cfg;
        cfg.structure.min_instances_slice = 1000;
        cfg.independence.threshold = 0.5f;
        return cfg;
    }

    // ========================================================================
    // Validation
    // ========================================================================

    void validate() const {
        if (clustering.n_clusters < 2) {
            throw std::invalid_argument("n_clusters must be at least 2");
        }
        if (clustering.max_iterations == 0) {
            throw std::invalid_argument("max_iterations must be positive");
        }
        if (clustering.tolerance < 0) {
            throw std::invalid_argument("tolerance cannot be negative");
        }
        if (independence.threshold < 0 || independence.threshold > 1) {
            throw std::invalid_argument("independence threshold must be in [0, 1]");
        }
        if (leaf.min_stdev <= 0) {
            throw std::invalid_argument("min_stdev must be positive");
        }
        if (leaf.alpha < 0) {
            throw std::invalid_argument("alpha cannot be negative");
        }
        if (context.max_discrete_values == 0) {
            throw std::invalid_argument("max_discrete_values must be positive");
        }
    }
};

} // namespace spnlearn
