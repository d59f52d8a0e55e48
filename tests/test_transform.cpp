/**
 * SPNLearn Transform Tests
 */

#include <gtest/gtest.h>
#include "spnlearn/transform.hpp"
#include "spnlearn/leaves.hpp"
#include <sstream>

using namespace spnlearn;

namespace {

std::unique_ptr<Node> gaussian(Index variable, Double mean = 0.0) {
    return std::make_unique<GaussianLeaf>(variable, mean, 1.0);
}

std::unique_ptr<ProductNode> product_of(Scope scope) {
    auto node = std::make_unique<ProductNode>(scope);
    for (Index v : scope) {
        node->add_child(gaussian(v));
    }
    return node;
}

} // namespace

// ============================================================================
// Node Tests
// ============================================================================

TEST(NodeTest, PlaceholderSlots) {
    ProductNode node(Scope{0, 1});
    size_t a = node.add_placeholder();
    size_t b = node.add_placeholder();

    EXPECT_EQ(a, 0u);
    EXPECT_EQ(b, 1u);
    EXPECT_TRUE(node.has_placeholders());

    node.set_child(1, gaussian(1));
    node.set_child(0, gaussian(0));
    EXPECT_FALSE(node.has_placeholders());
    EXPECT_EQ(node.child(0)->scope(), Scope{0});

    EXPECT_THROW(node.set_child(0, gaussian(0)), std::logic_error);
    EXPECT_THROW(node.set_child(5, gaussian(0)), std::logic_error);
    EXPECT_THROW(node.add_child(nullptr), std::logic_error);

    std::unique_ptr<Node> released = node.release_child(1);
    ASSERT_NE(released, nullptr);
    EXPECT_TRUE(node.has_placeholders());
}

TEST(NodeTest, NamesAndCounts) {
    auto sum = std::make_unique<SumNode>(Scope{0, 1});
    sum->add_child(product_of({0, 1}));
    sum->add_weight(0.5);
    sum->add_child(product_of({0, 1}));
    sum->add_weight(0.5);
    assign_ids(*sum);

    EXPECT_EQ(sum->name(), "SumNode_0");
    EXPECT_EQ(sum->child(1)->name(), "ProductNode_2");

    NodeCounts counts = count_nodes(*sum);
    EXPECT_EQ(counts.sum, 1u);
    EXPECT_EQ(counts.product, 2u);
    EXPECT_EQ(counts.leaf, 4u);
    EXPECT_EQ(depth(*sum), 2u);

    std::ostringstream out;
    print(*sum, out);
    EXPECT_NE(out.str().find("SumNode_0"), std::string::npos);
    EXPECT_NE(out.str().find("Gaussian_3"), std::string::npos);
}

// ============================================================================
// Id Assignment
// ============================================================================

TEST(AssignIdsTest, BreadthFirstOrder) {
    auto root = std::make_unique<ProductNode>(Scope{0, 1, 2});
    auto inner = std::make_unique<ProductNode>(Scope{0, 1});
    inner->add_child(gaussian(0));
    inner->add_child(gaussian(1));
    Node* inner_raw = inner.get();
    root->add_child(std::move(inner));
    root->add_child(gaussian(2));

    assign_ids(*root);

    EXPECT_EQ(root->id(), 0u);
    EXPECT_EQ(inner_raw->id(), 1u);
    EXPECT_EQ(root->child(1)->id(), 2u);
    EXPECT_EQ(static_cast<ProductNode*>(inner_raw)->child(0)->id(), 3u);
    EXPECT_EQ(static_cast<ProductNode*>(inner_raw)->child(1)->id(), 4u);
}

// ============================================================================
// Pruning
// ============================================================================

TEST(PruneTest, SingleChildChainIsShortened) {
    auto root = std::make_unique<ProductNode>(Scope{0, 1, 2});
    auto wrapper = std::make_unique<SumNode>(Scope{0, 1});
    wrapper->add_child(product_of({0, 1}));
    wrapper->add_weight(1.0);
    root->add_child(std::move(wrapper));
    root->add_child(gaussian(2));

    std::unique_ptr<Node> pruned = prune(std::move(root));

    // Sum wrapper removed, then the nested product is merged
    ASSERT_EQ(pruned->type(), NodeType::Product);
    const auto& product = static_cast<const ProductNode&>(*pruned);
    ASSERT_EQ(product.n_children(), 3u);
    EXPECT_EQ(product.child(0)->scope(), Scope{0});
    EXPECT_EQ(product.child(1)->scope(), Scope{1});
    EXPECT_EQ(product.child(2)->scope(), Scope{2});
    EXPECT_TRUE(is_valid(*pruned).valid);
}

TEST(PruneTest, NestedSumsAreMerged) {
    auto inner = std::make_unique<SumNode>(Scope{0});
    inner->add_child(gaussian(0, -1.0));
    inner->add_weight(0.5);
    inner->add_child(gaussian(0, 1.0));
    inner->add_weight(0.5);

    auto root = std::make_unique<SumNode>(Scope{0});
    root->add_child(std::move(inner));
    root->add_weight(0.4);
    root->add_child(gaussian(0, 5.0));
    root->add_weight(0.6);

    std::unique_ptr<Node> pruned = prune(std::move(root));

    ASSERT_EQ(pruned->type(), NodeType::Sum);
    const auto& sum = static_cast<const SumNode&>(*pruned);
    ASSERT_EQ(sum.n_children(), 3u);
    ASSERT_EQ(sum.weights().size(), 3u);
    EXPECT_DOUBLE_EQ(sum.weights()[0], 0.2);
    EXPECT_DOUBLE_EQ(sum.weights()[1], 0.2);
    EXPECT_DOUBLE_EQ(sum.weights()[2], 0.6);
    EXPECT_DOUBLE_EQ(static_cast<const GaussianLeaf&>(*sum.child(0)).mean(), -1.0);
    EXPECT_DOUBLE_EQ(static_cast<const GaussianLeaf&>(*sum.child(2)).mean(), 5.0);
    EXPECT_TRUE(is_valid(*pruned).valid);
}

TEST(PruneTest, SingleChildRootCollapses) {
    auto root = std::make_unique<SumNode>(Scope{0, 1});
    root->add_child(product_of({0, 1}));
    root->add_weight(1.0);

    std::unique_ptr<Node> pruned = prune(std::move(root));

    EXPECT_EQ(pruned->type(), NodeType::Product);
    EXPECT_EQ(pruned->id(), 0u);
    EXPECT_TRUE(is_valid(*pruned).valid);
}

TEST(PruneTest, LeafRootIsKept) {
    std::unique_ptr<Node> pruned = prune(gaussian(3));

    EXPECT_TRUE(pruned->is_leaf());
    EXPECT_EQ(pruned->scope(), Scope{3});
}

TEST(PruneTest, RenumbersIds) {
    auto root = std::make_unique<ProductNode>(Scope{0, 1, 2});
    root->add_child(product_of({0, 1}));
    root->add_child(gaussian(2));
    assign_ids(*root);

    std::unique_ptr<Node> pruned = prune(std::move(root));

    NodeId expected = 0;
    for (const Node* node : collect_nodes(*pruned)) {
        EXPECT_EQ(node->id(), expected++);
    }
    EXPECT_EQ(expected, 4u);
}

TEST(PruneTest, NullThrows) {
    EXPECT_THROW(prune(nullptr), std::invalid_argument);
}

// ============================================================================
// Validity
// ============================================================================

TEST(ValidityTest, AcceptsWellFormedNetwork) {
    auto root = std::make_unique<SumNode>(Scope{0, 1});
    root->add_child(product_of({0, 1}));
    root->add_weight(0.25);
    root->add_child(product_of({1, 0}));
    root->add_weight(0.75);
    assign_ids(*root);

    ValidityResult result = is_valid(*root);
    EXPECT_TRUE(result.valid) << result.message;
    EXPECT_TRUE(static_cast<bool>(result));
}

TEST(ValidityTest, RejectsPlaceholder) {
    auto root = std::make_unique<ProductNode>(Scope{0, 1});
    root->add_child(gaussian(0));
    root->add_placeholder();
    assign_ids(*root);

    EXPECT_FALSE(is_valid(*root).valid);
}

TEST(ValidityTest, RejectsMisalignedWeights) {
    auto root = std::make_unique<SumNode>(Scope{0});
    root->add_child(gaussian(0));
    root->add_child(gaussian(0));
    root->add_weight(1.0);
    assign_ids(*root);

    EXPECT_FALSE(is_valid(*root).valid);
}

TEST(ValidityTest, RejectsUnnormalizedWeights) {
    auto root = std::make_unique<SumNode>(Scope{0});
    root->add_child(gaussian(0));
    root->add_weight(0.5);
    root->add_child(gaussian(0));
    root->add_weight(0.2);
    assign_ids(*root);

    ValidityResult result = is_valid(*root);
    EXPECT_FALSE(result.valid);
    EXPECT_FALSE(result.message.empty());
}

TEST(ValidityTest, RejectsIncompleteSum) {
    auto root = std::make_unique<SumNode>(Scope{0, 1});
    root->add_child(product_of({0, 1}));
    root->add_weight(0.5);
    root->add_child(gaussian(0));
    root->add_weight(0.5);
    assign_ids(*root);

    EXPECT_FALSE(is_valid(*root).valid);
}

TEST(ValidityTest, RejectsOverlappingProduct) {
    auto root = std::make_unique<ProductNode>(Scope{0, 1});
    root->add_child(gaussian(0));
    root->add_child(gaussian(0));
    assign_ids(*root);

    EXPECT_FALSE(is_valid(*root).valid);
}

TEST(ValidityTest, RejectsUncoveredProductScope) {
    auto root = std::make_unique<ProductNode>(Scope{0, 1, 2});
    root->add_child(gaussian(0));
    root->add_child(gaussian(1));
    assign_ids(*root);

    EXPECT_FALSE(is_valid(*root).valid);
}

TEST(ValidityTest, RejectsRepeatedIds) {
    auto root = product_of({0, 1});
    assign_ids(*root);
    root->child(1)->set_id(1);

    EXPECT_FALSE(is_valid(*root).valid);
}

TEST(ValidityTest, RejectsGapInIds) {
    auto root = product_of({0, 1});
    assign_ids(*root);
    root->child(1)->set_id(7);

    EXPECT_FALSE(is_valid(*root).valid);
}
