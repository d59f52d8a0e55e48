/**
 * SPNLearn Dataset Implementation
 */

#include "spnlearn/dataset.hpp"
#include <algorithm>
#include <numeric>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace spnlearn {

// ============================================================================
// Dataset Construction
// ============================================================================

Dataset::Dataset(Matrix data) {
    from_matrix(std::move(data));
}

void Dataset::from_dense(const Float* data, Index n_rows, Index n_cols) {
    if (data == nullptr || n_rows == 0 || n_cols == 0) {
        throw std::invalid_argument("dataset must be a non-empty 2D array");
    }

    data_.resize(n_rows, n_cols);
    std::memcpy(data_.data(), data, static_cast<size_t>(n_rows) * n_cols * sizeof(Float));
}

void Dataset::from_matrix(Matrix data) {
    if (data.rows() == 0 || data.cols() == 0) {
        throw std::invalid_argument("dataset must be a non-empty 2D array");
    }
    data_ = std::move(data);
}

// ============================================================================
// Data Slice
// ============================================================================

DataSlice::DataSlice(const Dataset& dataset)
    : dataset_(&dataset), rows_(dataset.n_rows()), cols_(dataset.n_cols()) {
    std::iota(rows_.begin(), rows_.end(), static_cast<Index>(0));
    std::iota(cols_.begin(), cols_.end(), static_cast<Index>(0));
}

DataSlice::DataSlice(const Dataset& dataset, std::vector<Index> rows, std::vector<Index> cols)
    : dataset_(&dataset), rows_(std::move(rows)), cols_(std::move(cols)) {
    for (Index r : rows_) {
        if (r >= dataset.n_rows()) {
            throw std::out_of_range("row index " + std::to_string(r) + " outside dataset");
        }
    }
    for (Index c : cols_) {
        if (c >= dataset.n_cols()) {
            throw std::out_of_range("column index " + std::to_string(c) + " outside dataset");
        }
    }
}

DataSlice DataSlice::select_rows(const std::vector<Index>& positions) const {
    DataSlice result;
    result.dataset_ = dataset_;
    result.cols_ = cols_;
    result.rows_.reserve(positions.size());

    for (Index p : positions) {
        if (p >= rows_.size()) {
            throw std::out_of_range("row position " + std::to_string(p) + " outside slice");
        }
        result.rows_.push_back(rows_[p]);
    }
    return result;
}

DataSlice DataSlice::select_columns(const std::vector<Index>& positions) const {
    DataSlice result;
    result.dataset_ = dataset_;
    result.rows_ = rows_;
    result.cols_.reserve(positions.size());

    for (Index p : positions) {
        if (p >= cols_.size()) {
            throw std::out_of_range("column position " + std::to_string(p) + " outside slice");
        }
        result.cols_.push_back(cols_[p]);
    }
    return result;
}

std::vector<Float> DataSlice::column(Index col) const {
    if (col >= cols_.size()) {
        throw std::out_of_range("column position " + std::to_string(col) + " outside slice");
    }

    std::vector<Float> values;
    values.reserve(rows_.size());
    const Index source_col = cols_[col];
    for (Index r : rows_) {
        values.push_back(dataset_->value(r, source_col));
    }
    return values;
}

Matrix DataSlice::to_matrix() const {
    Matrix result(rows_.size(), cols_.size());
    const int64_t n = static_cast<int64_t>(rows_.size());

    #pragma omp parallel for schedule(static) if(n > 10000)
    for (int64_t i = 0; i < n; ++i) {
        const Float* src = dataset_->row(rows_[i]);
        for (size_t j = 0; j < cols_.size(); ++j) {
            result(i, j) = src[cols_[j]];
        }
    }
    return result;
}

std::vector<Index> DataSlice::zero_variance_columns(Index n_leading) const {
    std::vector<Index> result;
    const Index n = std::min(n_leading, n_cols());

    for (Index c = 0; c < n; ++c) {
        bool constant = true;
        if (!rows_.empty()) {
            const Float first = value(0, c);
            for (Index r = 0; r < n_rows(); ++r) {
                if (!(value(r, c) == first)) {
                    constant = false;
                    break;
                }
            }
        }
        if (constant) {
            result.push_back(c);
        }
    }
    return result;
}

bool operator==(const DataSlice& a, const DataSlice& b) {
    return &a.dataset() == &b.dataset() &&
           a.row_indices() == b.row_indices() &&
           a.col_indices() == b.col_indices();
}

bool operator!=(const DataSlice& a, const DataSlice& b) {
    return !(a == b);
}

// ============================================================================
// Context
// ============================================================================

Context::Context(std::vector<MetaType> meta_types)
    : meta_types_(std::move(meta_types)) {}

Context Context::from_dataset(const Dataset& dataset, uint32_t max_discrete_values) {
    std::vector<MetaType> types(dataset.n_cols(), MetaType::Real);

    for (Index f = 0; f < dataset.n_cols(); ++f) {
        std::vector<Float> values;
        values.reserve(dataset.n_rows());
        bool integral = true;

        for (Index i = 0; i < dataset.n_rows(); ++i) {
            Float val = dataset.value(i, f);
            if (std::isnan(val)) {
                continue;
            }
            if (std::floor(val) != val) {
                integral = false;
                break;
            }
            values.push_back(val);
        }

        if (!integral || values.empty()) {
            continue;
        }

        std::sort(values.begin(), values.end());
        size_t n_distinct = std::unique(values.begin(), values.end()) - values.begin();
        if (n_distinct <= max_discrete_values) {
            types[f] = MetaType::Discrete;
        }
    }

    Context context(std::move(types));
    context.compute_domains(dataset);
    return context;
}

void Context::compute_domains(const Dataset& dataset) {
    if (dataset.n_cols() != meta_types_.size()) {
        throw std::invalid_argument("context has " + std::to_string(meta_types_.size()) +
                                    " variables but dataset has " +
                                    std::to_string(dataset.n_cols()) + " columns");
    }

    domains_.assign(meta_types_.size(), {});
    for (Index f = 0; f < dataset.n_cols(); ++f) {
        std::vector<Float>& domain = domains_[f];
        domain.reserve(dataset.n_rows());
        for (Index i = 0; i < dataset.n_rows(); ++i) {
            Float val = dataset.value(i, f);
            if (!std::isnan(val)) {
                domain.push_back(val);
            }
        }
        std::sort(domain.begin(), domain.end());
        domain.erase(std::unique(domain.begin(), domain.end()), domain.end());
    }
}

} // namespace spnlearn
