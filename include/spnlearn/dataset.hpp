#pragma once

/**
 * SPNLearn Dataset
 *
 * - Dataset: owned row-major value matrix
 * - DataSlice: read-only view on a row/column subset of a Dataset
 * - Context: per-variable meta types and domains, passed through to
 *   the split and leaf collaborators
 */

#include "types.hpp"
#include <vector>

namespace spnlearn {

// ============================================================================
// Dataset
// ============================================================================

class Dataset {
public:
    Dataset() = default;
    explicit Dataset(Matrix data);

    /**
     * Copy a dense row-major buffer [n_rows x n_cols]
     */
    void from_dense(const Float* data, Index n_rows, Index n_cols);

    void from_matrix(Matrix data);

    Index n_rows() const { return static_cast<Index>(data_.rows()); }
    Index n_cols() const { return static_cast<Index>(data_.cols()); }
    bool empty() const { return data_.size() == 0; }

    Float value(Index row, Index col) const { return data_(row, col); }

    // Pointer to a full row (row-major, n_cols values)
    const Float* row(Index row_idx) const {
        return data_.data() + static_cast<size_t>(row_idx) * data_.cols();
    }

    const Matrix& matrix() const { return data_; }

private:
    Matrix data_;
};

// ============================================================================
// Data Slice
// ============================================================================

/**
 * View on a Dataset restricted to selected rows and columns.
 *
 * Only index lists are stored; values are always read from the dataset,
 * which must outlive every slice taken from it. Positions passed to
 * select_rows/select_columns are relative to this slice. Selecting a
 * single column still yields a two-dimensional slice.
 */
class DataSlice {
public:
    DataSlice() = default;
    explicit DataSlice(const Dataset& dataset);
    DataSlice(const Dataset& dataset, std::vector<Index> rows, std::vector<Index> cols);

    Index n_rows() const { return static_cast<Index>(rows_.size()); }
    Index n_cols() const { return static_cast<Index>(cols_.size()); }

    Float value(Index row, Index col) const {
        return dataset_->value(rows_[row], cols_[col]);
    }

    const Dataset& dataset() const { return *dataset_; }
    const std::vector<Index>& row_indices() const { return rows_; }
    const std::vector<Index>& col_indices() const { return cols_; }

    DataSlice select_rows(const std::vector<Index>& positions) const;
    DataSlice select_columns(const std::vector<Index>& positions) const;

    // Values of one slice column
    std::vector<Float> column(Index col) const;

    // Dense copy of the viewed values [n_rows x n_cols]
    Matrix to_matrix() const;

    /**
     * Positions (ascending) among the first n_leading columns whose values
     * are all identical. NaN never compares equal, so a column holding NaN
     * is never reported.
     */
    std::vector<Index> zero_variance_columns(Index n_leading) const;

private:
    const Dataset* dataset_ = nullptr;
    std::vector<Index> rows_;
    std::vector<Index> cols_;
};

// Same dataset, same rows and columns in the same order
bool operator==(const DataSlice& a, const DataSlice& b);
bool operator!=(const DataSlice& a, const DataSlice& b);

// ============================================================================
// Context
// ============================================================================

class Context {
public:
    Context() = default;
    explicit Context(std::vector<MetaType> meta_types);

    /**
     * Detect meta types from the data: a column whose non-NaN values are all
     * integral with at most max_discrete_values distinct values is Discrete,
     * anything else is Real. Domains are computed as well.
     */
    static Context from_dataset(const Dataset& dataset, uint32_t max_discrete_values = 20);

    // Domain of every variable: sorted distinct non-NaN column values
    void compute_domains(const Dataset& dataset);

    Index n_variables() const { return static_cast<Index>(meta_types_.size()); }
    bool empty() const { return meta_types_.empty(); }

    MetaType meta_type(Index variable) const { return meta_types_.at(variable); }

    bool has_domain(Index variable) const {
        return variable < domains_.size() && !domains_[variable].empty();
    }
    const std::vector<Float>& domain(Index variable) const { return domains_.at(variable); }

private:
    std::vector<MetaType> meta_types_;
    std::vector<std::vector<Float>> domains_;
};

} // namespace spnlearn
