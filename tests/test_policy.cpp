/**
 * SPNLearn Operation Policy Tests
 */

#include <gtest/gtest.h>
#include "spnlearn/policy.hpp"
#include <limits>

using namespace spnlearn;

namespace {

// Varying columns; column j of row i holds (i * (j + 2)) % 7
Dataset varying_dataset(Index rows, Index cols) {
    Matrix m(rows, cols);
    for (Index i = 0; i < rows; ++i) {
        for (Index j = 0; j < cols; ++j) {
            m(i, j) = static_cast<Float>((i * (j + 2)) % 7);
        }
    }
    return Dataset(m);
}

Scope full_scope(Index cols) {
    Scope scope(cols);
    for (Index j = 0; j < cols; ++j) scope[j] = j;
    return scope;
}

Operation decide(const DataSlice& slice, const Scope& scope,
                 bool no_clusters, bool no_independencies, bool is_first,
                 bool cluster_first = true, bool cluster_univariate = false,
                 uint32_t floor = 100) {
    return select_operation(slice, scope, no_clusters, no_independencies, is_first,
                            cluster_first, cluster_univariate, floor).operation;
}

} // namespace

// ============================================================================
// Single Variable
// ============================================================================

TEST(PolicyTest, SingleColumnFewRowsIsLeaf) {
    Dataset data = varying_dataset(50, 1);
    DataSlice slice(data);

    for (bool nc : {false, true}) {
        for (bool ni : {false, true}) {
            for (bool first : {false, true}) {
                for (bool univariate : {false, true}) {
                    EXPECT_EQ(decide(slice, {0}, nc, ni, first, true, univariate), Operation::CreateLeaf);
                }
            }
        }
    }
}

TEST(PolicyTest, SingleColumnManyRows) {
    Dataset data = varying_dataset(500, 1);
    DataSlice slice(data);

    EXPECT_EQ(decide(slice, {0}, false, false, true, true, false), Operation::CreateLeaf);
    EXPECT_EQ(decide(slice, {0}, false, false, true, true, true), Operation::SplitRows);

    // Clustering already failed on this slice
    EXPECT_EQ(decide(slice, {0}, true, false, true, true, true), Operation::CreateLeaf);
}

TEST(PolicyTest, ConstantSingleColumnIsLeaf) {
    Matrix m = Matrix::Constant(500, 1, 3.0f);
    Dataset data(m);

    EXPECT_EQ(decide(DataSlice(data), {0}, false, false, true, true, false), Operation::CreateLeaf);
}

// ============================================================================
// Zero-Variance Columns
// ============================================================================

TEST(PolicyTest, AllConstantColumnsFactorize) {
    Matrix m = Matrix::Zero(500, 3);
    Dataset data(m);

    EXPECT_EQ(decide(DataSlice(data), full_scope(3), false, false, true), Operation::NaiveFactorization);
}

TEST(PolicyTest, SomeConstantColumnsAreRemoved) {
    Matrix m(500, 3);
    for (Index i = 0; i < 500; ++i) {
        m(i, 0) = 1.0f;
        m(i, 1) = static_cast<Float>(i % 3);
        m(i, 2) = -2.0f;
    }
    Dataset data(m);

    OperationChoice choice = select_operation(DataSlice(data), {4, 5, 6}, false, false, true, true, false, 100);

    EXPECT_EQ(choice.operation, Operation::RemoveUninformativeFeatures);
    EXPECT_EQ(choice.uninformative, (std::vector<Index>{0, 2}));
}

TEST(PolicyTest, ConstantColumnsCheckedBeforeRowFloor) {
    Matrix m(10, 2);
    for (Index i = 0; i < 10; ++i) {
        m(i, 0) = static_cast<Float>(i);
        m(i, 1) = 5.0f;
    }
    Dataset data(m);

    EXPECT_EQ(decide(DataSlice(data), {0, 1}, true, true, false), Operation::RemoveUninformativeFeatures);
}

TEST(PolicyTest, NaNColumnIsNotUninformative) {
    const Float nan = std::numeric_limits<Float>::quiet_NaN();
    Matrix m(300, 2);
    for (Index i = 0; i < 300; ++i) {
        m(i, 0) = nan;
        m(i, 1) = static_cast<Float>(i % 4);
    }
    Dataset data(m);

    EXPECT_EQ(decide(DataSlice(data), {0, 1}, false, false, false), Operation::SplitColumns);
}

// ============================================================================
// Multivariate Rules
// ============================================================================

TEST(PolicyTest, FewRowsFactorize) {
    Dataset data = varying_dataset(100, 3);

    // Row count equal to the floor counts as minimal
    EXPECT_EQ(decide(DataSlice(data), full_scope(3), false, false, true), Operation::NaiveFactorization);
}

TEST(PolicyTest, BothFlagsFactorize) {
    Dataset data = varying_dataset(500, 3);

    EXPECT_EQ(decide(DataSlice(data), full_scope(3), true, true, false), Operation::NaiveFactorization);
    EXPECT_EQ(decide(DataSlice(data), full_scope(3), true, true, true), Operation::NaiveFactorization);
}

TEST(PolicyTest, SingleFlagSelectsTheOtherSplit) {
    Dataset data = varying_dataset(500, 3);
    DataSlice slice(data);

    EXPECT_EQ(decide(slice, full_scope(3), false, true, false), Operation::SplitRows);
    EXPECT_EQ(decide(slice, full_scope(3), true, false, false), Operation::SplitColumns);

    // Flags take precedence over the first-slice preference
    EXPECT_EQ(decide(slice, full_scope(3), false, true, true, false), Operation::SplitRows);
    EXPECT_EQ(decide(slice, full_scope(3), true, false, true, true), Operation::SplitColumns);
}

TEST(PolicyTest, FirstSliceFollowsClusterFirst) {
    Dataset data = varying_dataset(500, 3);
    DataSlice slice(data);

    EXPECT_EQ(decide(slice, full_scope(3), false, false, true, true), Operation::SplitRows);
    EXPECT_EQ(decide(slice, full_scope(3), false, false, true, false), Operation::SplitColumns);
}

TEST(PolicyTest, DefaultIsSplitColumns) {
    Dataset data = varying_dataset(500, 3);

    EXPECT_EQ(decide(DataSlice(data), full_scope(3), false, false, false, true), Operation::SplitColumns);
    EXPECT_EQ(decide(DataSlice(data), full_scope(3), false, false, false, false), Operation::SplitColumns);
}

TEST(PolicyTest, Deterministic) {
    Dataset data = varying_dataset(500, 4);
    DataSlice slice = DataSlice(data).select_rows({1, 2, 3, 5, 8, 13});

    for (bool nc : {false, true}) {
        for (bool ni : {false, true}) {
            OperationChoice a = select_operation(slice, full_scope(4), nc, ni, false, true, false, 2);
            OperationChoice b = select_operation(slice, full_scope(4), nc, ni, false, true, false, 2);
            EXPECT_EQ(a.operation, b.operation);
            EXPECT_EQ(a.uninformative, b.uninformative);
        }
    }
}

// ============================================================================
// Configured Policy
// ============================================================================

TEST(OperationPolicyTest, UsesConfig) {
    Dataset data = varying_dataset(150, 2);
    DataSlice slice(data);

    StructureConfig config;
    config.min_instances_slice = 100;
    config.cluster_first = false;
    OperationPolicy policy(config);

    EXPECT_EQ(policy(slice, {0, 1}, false, false, true).operation, Operation::SplitColumns);

    config.min_instances_slice = 200;
    EXPECT_EQ(OperationPolicy(config)(slice, {0, 1}, false, false, true).operation,
              Operation::NaiveFactorization);
    EXPECT_EQ(policy.config().min_instances_slice, 100u);
}

TEST(OperationPolicyTest, Names) {
    EXPECT_STREQ(to_string(Operation::CreateLeaf), "CREATE_LEAF");
    EXPECT_STREQ(to_string(Operation::SplitColumns), "SPLIT_COLUMNS");
    EXPECT_STREQ(to_string(Operation::SplitRows), "SPLIT_ROWS");
    EXPECT_STREQ(to_string(Operation::NaiveFactorization), "NAIVE_FACTORIZATION");
    EXPECT_STREQ(to_string(Operation::RemoveUninformativeFeatures), "REMOVE_UNINFORMATIVE_FEATURES");
}
