/**
 * SPNLearn Inference Implementation
 */

#include "spnlearn/inference.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace spnlearn {

Double log_likelihood(const Node& root, const Float* row) {
    switch (root.type()) {
        case NodeType::Leaf: {
            const auto& leaf = static_cast<const LeafNode&>(root);
            const Float value = row[leaf.variable()];
            if (std::isnan(value)) {
                return 0.0;
            }
            return leaf.log_density(value);
        }

        case NodeType::Product: {
            Double total = 0;
            for (const auto& child : static_cast<const InternalNode&>(root).children()) {
                total += log_likelihood(*child, row);
            }
            return total;
        }

        case NodeType::Sum: {
            const auto& sum = static_cast<const SumNode&>(root);
            std::vector<Double> terms;
            terms.reserve(sum.n_children());
            for (size_t i = 0; i < sum.n_children(); ++i) {
                terms.push_back(std::log(sum.weights()[i]) + log_likelihood(*sum.child(i), row));
            }

            // log-sum-exp
            const Double max_term = *std::max_element(terms.begin(), terms.end());
            if (std::isinf(max_term)) {
                return max_term;
            }
            Double acc = 0;
            for (Double t : terms) {
                acc += std::exp(t - max_term);
            }
            return max_term + std::log(acc);
        }
    }
    throw std::logic_error("unknown node type in " + root.name());
}

std::vector<Double> log_likelihood(const Node& root, const Dataset& data) {
    const Scope& scope = root.scope();
    if (!scope.empty() && *std::max_element(scope.begin(), scope.end()) >= data.n_cols()) {
        throw std::invalid_argument("network scope exceeds the " + std::to_string(data.n_cols()) +
                                    " dataset columns");
    }

    std::vector<Double> result(data.n_rows());
    const int64_t n = static_cast<int64_t>(data.n_rows());

    #pragma omp parallel for schedule(static) if(n > 1000)
    for (int64_t i = 0; i < n; ++i) {
        result[i] = log_likelihood(root, data.row(static_cast<Index>(i)));
    }
    return result;
}

} // namespace spnlearn
