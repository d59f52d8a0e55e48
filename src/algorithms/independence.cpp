/**
 * SPNLearn Column Independence Splitting Implementation
 */

#include "spnlearn/independence.hpp"
#include <algorithm>
#include <cmath>
#include <queue>
#include <stdexcept>

namespace spnlearn {

Eigen::MatrixXd absolute_correlation(const Matrix& data) {
    const Eigen::Index n_cols = data.cols();
    Eigen::MatrixXd x = data.cast<Double>();

    // NaN entries are replaced by their column mean so they do not contribute
    for (Eigen::Index j = 0; j < n_cols; ++j) {
        Double sum = 0;
        Eigen::Index n = 0;
        for (Eigen::Index i = 0; i < x.rows(); ++i) {
            if (!std::isnan(x(i, j))) {
                sum += x(i, j);
                n++;
            }
        }
        const Double mean = n > 0 ? sum / n : 0.0;
        for (Eigen::Index i = 0; i < x.rows(); ++i) {
            x(i, j) = std::isnan(x(i, j)) ? 0.0 : x(i, j) - mean;
        }
    }

    Eigen::MatrixXd cov = x.transpose() * x;
    Eigen::VectorXd norms = cov.diagonal().cwiseSqrt();

    Eigen::MatrixXd corr = Eigen::MatrixXd::Identity(n_cols, n_cols);
    for (Eigen::Index i = 0; i < n_cols; ++i) {
        for (Eigen::Index j = i + 1; j < n_cols; ++j) {
            Double value = 0;
            if (norms(i) > 0 && norms(j) > 0) {
                value = std::abs(cov(i, j) / (norms(i) * norms(j)));
            }
            corr(i, j) = value;
            corr(j, i) = value;
        }
    }
    return corr;
}

std::vector<std::vector<Index>> dependent_components(const Matrix& data, Float threshold) {
    const Index n_cols = static_cast<Index>(data.cols());
    Eigen::MatrixXd corr = absolute_correlation(data);

    std::vector<bool> visited(n_cols, false);
    std::vector<std::vector<Index>> components;

    for (Index start = 0; start < n_cols; ++start) {
        if (visited[start]) continue;

        std::vector<Index> component;
        std::queue<Index> bfs;
        bfs.push(start);
        visited[start] = true;

        while (!bfs.empty()) {
            Index col = bfs.front();
            bfs.pop();
            component.push_back(col);

            for (Index other = 0; other < n_cols; ++other) {
                if (!visited[other] && other != col && corr(col, other) >= threshold) {
                    visited[other] = true;
                    bfs.push(other);
                }
            }
        }

        std::sort(component.begin(), component.end());
        components.push_back(std::move(component));
    }
    return components;
}

std::vector<SliceSplit> CorrelationColumnSplitter::operator()(
    const DataSlice& slice,
    const Context& /*context*/,
    const Scope& scope
) const {
    if (scope.size() != slice.n_cols()) {
        throw std::invalid_argument("scope size does not match slice width");
    }

    std::vector<std::vector<Index>> components = dependent_components(slice.to_matrix(), config_.threshold);

    std::vector<SliceSplit> result;
    result.reserve(components.size());
    for (const auto& positions : components) {
        Scope sub_scope;
        sub_scope.reserve(positions.size());
        for (Index p : positions) {
            sub_scope.push_back(scope[p]);
        }
        result.push_back(SliceSplit{slice.select_columns(positions), std::move(sub_scope), 0.0});
    }
    return result;
}

} // namespace spnlearn
