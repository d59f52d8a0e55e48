/**
 * SPNLearn Leaf Distributions Implementation
 */

#include "spnlearn/leaves.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace spnlearn {

namespace {
constexpr Double LOG_SQRT_2PI = 0.91893853320467274178;
}

// ============================================================================
// Gaussian Leaf
// ============================================================================

GaussianLeaf::GaussianLeaf(Index variable, Double mean, Double stdev)
    : LeafNode(variable), mean_(mean), stdev_(stdev) {
    if (!(stdev > 0)) {
        throw std::invalid_argument("Gaussian stdev must be positive");
    }
}

Double GaussianLeaf::log_density(Float value) const {
    const Double z = (static_cast<Double>(value) - mean_) / stdev_;
    return -LOG_SQRT_2PI - std::log(stdev_) - 0.5 * z * z;
}

void GaussianLeaf::describe(std::ostream& out) const {
    out << "mean=" << mean_ << " stdev=" << stdev_;
}

std::unique_ptr<GaussianLeaf> fit_gaussian(
    const std::vector<Float>& values,
    Index variable,
    Double min_stdev
) {
    Double sum = 0;
    size_t n = 0;
    for (Float v : values) {
        if (std::isnan(v)) continue;
        sum += v;
        n++;
    }

    // No observations: standard normal
    if (n == 0) {
        return std::make_unique<GaussianLeaf>(variable, 0.0, 1.0);
    }

    const Double mean = sum / n;
    Double sq = 0;
    for (Float v : values) {
        if (std::isnan(v)) continue;
        const Double d = v - mean;
        sq += d * d;
    }

    const Double stdev = std::max(std::sqrt(sq / n), min_stdev);
    return std::make_unique<GaussianLeaf>(variable, mean, stdev);
}

// ============================================================================
// Categorical Leaf
// ============================================================================

CategoricalLeaf::CategoricalLeaf(Index variable, std::vector<Float> values, std::vector<Double> probabilities)
    : LeafNode(variable), values_(std::move(values)), probabilities_(std::move(probabilities)) {
    if (values_.empty()) {
        throw std::invalid_argument("Categorical leaf needs a non-empty support");
    }
    if (values_.size() != probabilities_.size()) {
        throw std::invalid_argument("Categorical leaf needs one probability per support value");
    }
    if (!std::is_sorted(values_.begin(), values_.end())) {
        throw std::invalid_argument("Categorical support must be sorted");
    }
}

Double CategoricalLeaf::log_density(Float value) const {
    auto it = std::lower_bound(values_.begin(), values_.end(), value);
    if (it == values_.end() || *it != value) {
        return -std::numeric_limits<Double>::infinity();
    }
    return std::log(probabilities_[it - values_.begin()]);
}

void CategoricalLeaf::describe(std::ostream& out) const {
    out << "p={";
    for (size_t i = 0; i < values_.size(); ++i) {
        if (i > 0) out << ", ";
        out << values_[i] << ": " << probabilities_[i];
    }
    out << "}";
}

std::unique_ptr<CategoricalLeaf> fit_categorical(
    const std::vector<Float>& values,
    Index variable,
    const std::vector<Float>& domain,
    Double alpha
) {
    std::vector<Float> support = domain;
    if (support.empty()) {
        for (Float v : values) {
            if (!std::isnan(v)) support.push_back(v);
        }
        std::sort(support.begin(), support.end());
        support.erase(std::unique(support.begin(), support.end()), support.end());
    }
    if (support.empty()) {
        throw std::invalid_argument("cannot fit a categorical leaf for variable " +
                                    std::to_string(variable) + " without any values");
    }

    std::vector<Double> counts(support.size(), 0.0);
    size_t n = 0;
    for (Float v : values) {
        if (std::isnan(v)) continue;
        auto it = std::lower_bound(support.begin(), support.end(), v);
        if (it == support.end() || *it != v) {
            throw std::invalid_argument("value " + std::to_string(v) + " outside the domain of variable " +
                                        std::to_string(variable));
        }
        counts[it - support.begin()] += 1.0;
        n++;
    }

    const Double denom = static_cast<Double>(n) + alpha * support.size();
    std::vector<Double> probabilities(support.size());
    for (size_t i = 0; i < support.size(); ++i) {
        probabilities[i] = denom > 0 ? (counts[i] + alpha) / denom : 1.0 / support.size();
    }

    return std::make_unique<CategoricalLeaf>(variable, std::move(support), std::move(probabilities));
}

// ============================================================================
// Leaf Factory
// ============================================================================

std::unique_ptr<LeafNode> ParametricLeafFactory::operator()(
    const DataSlice& slice,
    const Context& context,
    const Scope& scope
) const {
    if (scope.size() != 1 || slice.n_cols() != 1) {
        throw std::invalid_argument("parametric leaves are univariate, got scope of size " +
                                    std::to_string(scope.size()) + " over " +
                                    std::to_string(slice.n_cols()) + " columns");
    }

    const Index variable = scope[0];
    std::vector<Float> values = slice.column(0);

    switch (context.meta_type(variable)) {
        case MetaType::Real:
            return fit_gaussian(values, variable, config_.min_stdev);
        case MetaType::Discrete: {
            static const std::vector<Float> observed;
            const std::vector<Float>& domain = context.has_domain(variable) ? context.domain(variable) : observed;
            return fit_categorical(values, variable, domain, config_.alpha);
        }
    }
    throw std::logic_error("unknown meta type for variable " + std::to_string(variable));
}

} // namespace spnlearn
