#include "crypto/commitment_tree.hpp"
#include "crypto/error.hpp"
#include "tree_test_utils.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace Ballot::Crypto::CommitmentTree {

class CommitmentTreeTest : public ::testing::Test {
protected:
    std::vector<Leaf> leaves;

    void SetUp() override
    {
        leaves = make_leaves(5);
    }

    static Tree build(std::initializer_list<Leaf> values)
    {
        Tree tree;
        for (const auto& v : values) {
            tree.insert(v);
        }
        return tree;
    }
};

// 测试 1: 空树
TEST_F(CommitmentTreeTest, EmptyTree)
{
    Tree tree;

    EXPECT_TRUE(tree.empty());
    EXPECT_EQ(tree.leaf_count(), 0U);
    EXPECT_FALSE(tree.root().has_value());
    EXPECT_TRUE(tree.levels().empty());

    auto proof = tree.prove("anything");
    ASSERT_FALSE(proof.has_value());
    EXPECT_EQ(proof.error(), Error::EmptyTree);
}

// 测试 2: 单叶子树，根就是叶子本身
TEST_F(CommitmentTreeTest, SingleLeaf)
{
    Tree tree;
    auto res = tree.insert(leaves[0]);

    EXPECT_TRUE(res.changed);
    EXPECT_EQ(res.leaf_count, 1U);
    ASSERT_TRUE(res.root.has_value());
    EXPECT_EQ(*res.root, leaves[0]);

    auto proof = tree.prove(leaves[0]);
    ASSERT_TRUE(proof.has_value());
    EXPECT_TRUE(proof->path.empty());
    EXPECT_EQ(proof->root, leaves[0]);
    EXPECT_TRUE(verify(*proof));
}

// 测试 3: 三个叶子，奇数层末尾节点与自身配对
TEST_F(CommitmentTreeTest, ThreeLeavesLiteralRoot)
{
    Tree tree = build({ "h1", "h2", "h3" });

    const HexDigest p1 = "dac079ce8e97c5434424c28112b96e601aa4ff36ba0377619b9e38f473310cf3";
    const HexDigest p2 = "f858727943465ed9759534a90713a9da630425509eaf13633d9c3229434490ff";
    const HexDigest root = "4279484b826df5de36382d7cf13be9a59ea62f7bc986d257c038d0bd9df207e2";

    ASSERT_EQ(tree.levels().size(), 3U);
    const auto& level1 = tree.levels()[1];
    ASSERT_EQ(level1.size(), 2U);
    EXPECT_EQ(level1[0].hash, p1);
    EXPECT_EQ(level1[0].pairing, Pairing::Pair);
    EXPECT_EQ(level1[1].hash, p2);
    EXPECT_EQ(level1[1].pairing, Pairing::PairedWithSelf);

    ASSERT_TRUE(tree.root().has_value());
    EXPECT_EQ(*tree.root(), root);
    EXPECT_EQ(*tree.root(), Commitment::parent_hash(p1, p2));

    auto proof = tree.prove("h3");
    ASSERT_TRUE(proof.has_value());
    const std::vector<PathStep> expected_path = {
        { .hash = "h3", .position = Side::Right },
        { .hash = p1, .position = Side::Left },
    };
    EXPECT_EQ(proof->leaf, "h3");
    EXPECT_EQ(proof->path, expected_path);
    EXPECT_EQ(proof->root, root);
    EXPECT_TRUE(verify(*proof));
}

// 测试 4: 所有叶子的证明都能通过验证，覆盖 1..17 个叶子
TEST_F(CommitmentTreeTest, EveryLeafVerifies)
{
    auto many = make_leaves(17);
    for (size_t n = 1; n <= many.size(); ++n) {
        Tree tree = Tree::from_leaves(std::span(many).first(n));
        ASSERT_EQ(tree.leaf_count(), n);

        for (size_t i = 0; i < n; ++i) {
            auto proof = tree.prove(many[i]);
            ASSERT_TRUE(proof.has_value());
            EXPECT_EQ(proof->root, *tree.root());
            EXPECT_EQ(proof->path.size(), tree.levels().size() - 1);
            EXPECT_TRUE(verify(*proof)) << "Verification failed for leaf " << i << " of " << n;
        }
    }
}

// 测试 5: 同一序列构建的树完全一致
TEST_F(CommitmentTreeTest, DeterministicFromSequence)
{
    Tree a = Tree::from_leaves(leaves);
    Tree b;
    for (const auto& leaf : leaves) {
        b.insert(leaf);
    }

    EXPECT_EQ(a.root(), b.root());
    EXPECT_EQ(a.leaves(), b.leaves());
    EXPECT_EQ(*a.prove(leaves[3]), *b.prove(leaves[3]));

    // 顺序不同则根不同
    std::vector<Leaf> reversed(leaves.rbegin(), leaves.rend());
    EXPECT_NE(Tree::from_leaves(reversed).root(), a.root());
}

// 测试 6: 重复插入是 no-op
TEST_F(CommitmentTreeTest, DuplicateInsertIsNoOp)
{
    Tree tree;
    auto first = tree.insert(leaves[0]);
    auto second = tree.insert(leaves[0]);

    EXPECT_TRUE(first.changed);
    EXPECT_FALSE(second.changed);
    EXPECT_EQ(first.root, second.root);
    EXPECT_EQ(second.leaf_count, 1U);
    EXPECT_EQ(tree.leaves(), std::vector<Leaf> { leaves[0] });
}

TEST_F(CommitmentTreeTest, SeedingKeepsFirstOccurrence)
{
    std::vector<Leaf> history = { leaves[0], leaves[1], leaves[0], leaves[2], leaves[1] };
    Tree tree = Tree::from_leaves(history);

    std::vector<Leaf> expected = { leaves[0], leaves[1], leaves[2] };
    EXPECT_EQ(tree.leaves(), expected);
    EXPECT_EQ(tree.root(), Tree::from_leaves(expected).root());
}

TEST_F(CommitmentTreeTest, EmptyLeafIsNeverStored)
{
    Tree tree;
    auto res = tree.insert("");
    EXPECT_FALSE(res.changed);
    EXPECT_FALSE(res.root.has_value());
    EXPECT_TRUE(tree.empty());

    tree.insert("a");
    EXPECT_EQ(tree.leaf_count(), 1U);
    EXPECT_FALSE(tree.contains(""));

    auto proof = tree.prove("a");
    ASSERT_TRUE(proof.has_value());
    EXPECT_NO_THROW(EXPECT_TRUE(verify(*proof)));
}

TEST_F(CommitmentTreeTest, SeedingSkipsEmptyLeaves)
{
    std::vector<Leaf> history = { "", leaves[0], "", leaves[1], leaves[2] };
    Tree tree = Tree::from_leaves(history);

    std::vector<Leaf> expected = { leaves[0], leaves[1], leaves[2] };
    EXPECT_EQ(tree.leaves(), expected);
    for (const auto& leaf : expected) {
        auto proof = tree.prove(leaf);
        ASSERT_TRUE(proof.has_value());
        EXPECT_NO_THROW(EXPECT_TRUE(verify(*proof)));
    }
}

// 测试 7: 删除后幸存叶子保持原有顺序
TEST_F(CommitmentTreeTest, RemovePreservesOrder)
{
    Tree tree;
    tree.insert(leaves[0]);
    tree.insert(leaves[1]);
    auto res = tree.remove(leaves[0]);

    Tree only_b;
    only_b.insert(leaves[1]);

    EXPECT_TRUE(res.changed);
    EXPECT_EQ(res.leaf_count, 1U);
    EXPECT_EQ(tree.leaves(), only_b.leaves());
    EXPECT_EQ(tree.root(), only_b.root());

    Tree five = Tree::from_leaves(leaves);
    five.remove(leaves[2]);
    std::vector<Leaf> expected = { leaves[0], leaves[1], leaves[3], leaves[4] };
    EXPECT_EQ(five.leaves(), expected);
    EXPECT_EQ(five.root(), Tree::from_leaves(expected).root());
}

TEST_F(CommitmentTreeTest, RemoveUnknownIsNoOp)
{
    Tree tree = Tree::from_leaves(leaves);
    auto before = tree.root();

    auto res = tree.remove("not-a-leaf");
    EXPECT_FALSE(res.changed);
    EXPECT_EQ(res.root, before);
    EXPECT_EQ(res.leaf_count, leaves.size());
}

// 测试 8: 插入再删除回到空树
TEST_F(CommitmentTreeTest, InsertThenRemoveReturnsToEmpty)
{
    Tree tree;
    tree.insert("c1");
    auto res = tree.remove("c1");

    Tree fresh;
    EXPECT_TRUE(res.changed);
    EXPECT_FALSE(res.root.has_value());
    EXPECT_EQ(res.leaf_count, 0U);
    EXPECT_EQ(tree.root(), fresh.root());
    EXPECT_EQ(tree.leaves(), fresh.leaves());
    EXPECT_TRUE(tree.levels().empty());
    EXPECT_EQ(tree.prove("c1").error(), Error::EmptyTree);
}

// 测试 9: 替换同一位置的叶子会改变根 (投票更新)
TEST_F(CommitmentTreeTest, UpdateChangesRoot)
{
    Tree tree = Tree::from_leaves(std::span(leaves).first(3));
    auto before = *tree.root();
    auto old_proof = *tree.prove(leaves[1]);

    tree.remove(leaves[1]);
    tree.insert(leaves[4]);

    EXPECT_NE(*tree.root(), before);
    EXPECT_EQ(tree.prove(leaves[1]).error(), Error::LeafNotFound);

    // 旧证明本身依然自洽，但不再对应当前根
    EXPECT_TRUE(verify(old_proof));
    EXPECT_NE(old_proof.root, *tree.root());

    for (const auto& leaf : tree.leaves()) {
        EXPECT_TRUE(verify(*tree.prove(leaf)));
    }
}

TEST_F(CommitmentTreeTest, ProveUnknownLeaf)
{
    Tree tree = Tree::from_leaves(leaves);
    auto proof = tree.prove("missing");
    ASSERT_FALSE(proof.has_value());
    EXPECT_EQ(proof.error(), Error::LeafNotFound);
}

// 测试 10: 证明路径中任何一个哈希被篡改都会导致验证失败
TEST_F(CommitmentTreeTest, DetectsHashTampering)
{
    Tree tree = Tree::from_leaves(leaves);

    for (const auto& leaf : leaves) {
        const auto proof = *tree.prove(leaf);
        for (size_t i = 0; i < proof.path.size(); ++i) {
            for (size_t pos : { size_t { 0 }, proof.path[i].hash.size() - 1 }) {
                auto tampered = proof;
                flip_hex(tampered.path[i].hash, pos);
                EXPECT_FALSE(verify(tampered)) << "step " << i << " pos " << pos;
            }
        }
    }
}

// 测试 11: 交换方向也会导致验证失败；自配对步骤两侧相同，交换无效果
TEST_F(CommitmentTreeTest, DetectsPositionSwap)
{
    Tree tree = Tree::from_leaves(leaves);

    for (const auto& leaf : leaves) {
        const auto proof = *tree.prove(leaf);
        for (size_t i = 0; i < proof.path.size(); ++i) {
            auto tampered = proof;
            auto& step = tampered.path[i];
            step.position = (step.position == Side::Left) ? Side::Right : Side::Left;

            if (step.hash == fold_prefix(proof, i)) {
                EXPECT_TRUE(verify(tampered));
            } else {
                EXPECT_FALSE(verify(tampered)) << "step " << i;
            }
        }
    }
}

TEST_F(CommitmentTreeTest, DetectsWrongLeafOrRoot)
{
    Tree tree = Tree::from_leaves(leaves);
    auto proof = *tree.prove(leaves[1]);

    auto wrong_leaf = proof;
    wrong_leaf.leaf = leaves[2];
    EXPECT_FALSE(verify(wrong_leaf));

    auto wrong_root = proof;
    flip_hex(wrong_root.root, 0);
    EXPECT_FALSE(verify(wrong_root));

    auto truncated = proof;
    truncated.path.pop_back();
    EXPECT_FALSE(verify(truncated));
}

// 测试 12: 结构错误的证明应抛异常而不是返回 false
TEST_F(CommitmentTreeTest, MalformedProofThrows)
{
    Tree tree = Tree::from_leaves(leaves);
    const auto proof = *tree.prove(leaves[0]);

    auto no_leaf = proof;
    no_leaf.leaf.clear();
    EXPECT_THROW((void)verify(no_leaf), std::invalid_argument);

    auto no_root = proof;
    no_root.root.clear();
    EXPECT_THROW((void)verify(no_root), std::invalid_argument);

    auto empty_step = proof;
    empty_step.path[1].hash.clear();
    EXPECT_THROW((void)verify(empty_step), std::invalid_argument);

    auto bad_position = proof;
    bad_position.path[0].position = static_cast<Side>(7);
    EXPECT_THROW((void)verify(bad_position), std::invalid_argument);
}

TEST_F(CommitmentTreeTest, LeavesIsACopy)
{
    Tree tree = Tree::from_leaves(leaves);
    auto view = tree.leaves();
    view.clear();
    view.push_back("injected");

    EXPECT_EQ(tree.leaf_count(), leaves.size());
    EXPECT_FALSE(tree.contains("injected"));
    EXPECT_EQ(tree.index_of(leaves[3]), 3U);
}

// 测试 13: 大量数据
TEST_F(CommitmentTreeTest, LargeTree)
{
    auto many = make_leaves(100, "bulk");
    Tree tree = Tree::from_leaves(many);
    ASSERT_EQ(tree.levels().size(), 8U); // ceil(log2(100)) + 1

    for (size_t idx : { 0, 1, 33, 50, 98, 99 }) {
        auto proof = tree.prove(many[idx]);
        ASSERT_TRUE(proof.has_value());
        EXPECT_TRUE(verify(*proof));
    }
}

} // namespace Ballot::Crypto::CommitmentTree
