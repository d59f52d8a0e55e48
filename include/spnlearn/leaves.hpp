#pragma once

/**
 * SPNLearn Leaf Distributions
 *
 * Parametric univariate leaves and the default leaf-creation collaborator.
 */

#include "types.hpp"
#include "config.hpp"
#include "dataset.hpp"
#include "node.hpp"
#include <memory>
#include <vector>

namespace spnlearn {

// ============================================================================
// Gaussian Leaf (Real variables)
// ============================================================================

class GaussianLeaf : public LeafNode {
public:
    GaussianLeaf(Index variable, Double mean, Double stdev);

    std::string kind() const override { return "Gaussian"; }
    Double log_density(Float value) const override;
    void describe(std::ostream& out) const override;

    Double mean() const { return mean_; }
    Double stdev() const { return stdev_; }

private:
    Double mean_;
    Double stdev_;
};

// ============================================================================
// Categorical Leaf (Discrete variables)
// ============================================================================

class CategoricalLeaf : public LeafNode {
public:
    /**
     * @param values Sorted distinct support values
     * @param probabilities One probability per support value
     */
    CategoricalLeaf(Index variable, std::vector<Float> values, std::vector<Double> probabilities);

    std::string kind() const override { return "Categorical"; }

    // -inf for values outside the support
    Double log_density(Float value) const override;
    void describe(std::ostream& out) const override;

    const std::vector<Float>& values() const { return values_; }
    const std::vector<Double>& probabilities() const { return probabilities_; }

private:
    std::vector<Float> values_;
    std::vector<Double> probabilities_;
};

// ============================================================================
// Maximum-Likelihood Fitting (NaN values are ignored)
// ============================================================================

std::unique_ptr<GaussianLeaf> fit_gaussian(
    const std::vector<Float>& values,
    Index variable,
    Double min_stdev
);

/**
 * Laplace-smoothed frequencies over domain. An empty domain means
 * "the distinct observed values". Values outside a non-empty domain throw
 * std::invalid_argument.
 */
std::unique_ptr<CategoricalLeaf> fit_categorical(
    const std::vector<Float>& values,
    Index variable,
    const std::vector<Float>& domain,
    Double alpha
);

// ============================================================================
// Default Leaf Factory
// ============================================================================

/**
 * Creates a Gaussian leaf for Real variables and a Categorical leaf over the
 * context domain for Discrete variables. Only single-variable slices are
 * accepted.
 */
class ParametricLeafFactory {
public:
    ParametricLeafFactory() = default;
    explicit ParametricLeafFactory(const LeafConfig& config) : config_(config) {}

    std::unique_ptr<LeafNode> operator()(
        const DataSlice& slice,
        const Context& context,
        const Scope& scope
    ) const;

private:
    LeafConfig config_;
};

} // namespace spnlearn
