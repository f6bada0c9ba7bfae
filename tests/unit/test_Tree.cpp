#include <gtest/gtest.h>
#include "node/Tree.hpp"
#include "error/Errors.hpp"

using namespace canopy::node;
using namespace canopy::node::model;
using namespace canopy::error;
using canopy::rbac::PermissionLevel;
using canopy::rbac::model::Grant;

namespace {

Node makeNode(const uint64_t id, const NodeType type, const std::optional<uint64_t> parent, const uint64_t owner = 1) {
    Node n;
    n.id = id;
    n.type = type;
    n.name = "n" + std::to_string(id);
    n.parent_id = parent;
    n.owner_id = owner;
    n.created_at = n.updated_at = 1700000000;
    return n;
}

}

class TreeTest : public ::testing::Test {
protected:
    // 10 (ws) -> 20 (cat) -> 30 (cat) -> 40 (doc)
    //         -> 21 (res)
    Tree tree;

    void SetUp() override {
        tree = Tree::build({
            makeNode(10, NodeType::Workspace, std::nullopt),
            makeNode(20, NodeType::Category, 10),
            makeNode(21, NodeType::Resource, 10),
            makeNode(30, NodeType::Category, 20),
            makeNode(40, NodeType::Document, 30),
        }, {Grant(20, 7, PermissionLevel::Read)});
    }
};

TEST_F(TreeTest, AncestorsRunParentFirstToRoot) {
    const auto chain = tree.ancestors(40);
    ASSERT_EQ(chain.size(), 3u);
    EXPECT_EQ(chain[0]->id, 30u);
    EXPECT_EQ(chain[1]->id, 20u);
    EXPECT_EQ(chain[2]->id, 10u);
    EXPECT_TRUE(tree.ancestors(10).empty());
}

TEST_F(TreeTest, DescendantCheckFollowsParentChain) {
    EXPECT_TRUE(tree.isDescendant(40, 10));
    EXPECT_TRUE(tree.isDescendant(40, 20));
    EXPECT_FALSE(tree.isDescendant(20, 40));
    EXPECT_FALSE(tree.isDescendant(21, 20));
}

TEST_F(TreeTest, ChildrenAreOrderedById) {
    EXPECT_EQ(tree.children(10), (std::vector<uint64_t>{20, 21}));
    EXPECT_EQ(tree.nextChild(10, std::nullopt), 20u);
    EXPECT_EQ(tree.nextChild(10, 20), 21u);
    EXPECT_FALSE(tree.nextChild(10, 21).has_value());
    EXPECT_FALSE(tree.nextChild(40, std::nullopt).has_value());
}

TEST_F(TreeTest, CreateValidation) {
    EXPECT_NO_THROW(tree.validateCreate(NodeType::Workspace, std::nullopt));
    EXPECT_THROW(tree.validateCreate(NodeType::Workspace, 10), InvalidParentError);
    EXPECT_THROW(tree.validateCreate(NodeType::Document, std::nullopt), InvalidParentError);
    EXPECT_THROW(tree.validateCreate(NodeType::Document, 999), ParentNotFoundError);
    EXPECT_THROW(tree.validateCreate(NodeType::Document, 21), InvalidParentError);
    EXPECT_NO_THROW(tree.validateCreate(NodeType::Document, 40));
}

TEST_F(TreeTest, CreateUnderTrashedParentIsRejected) {
    tree.markDeleted(20, 1700000100);
    EXPECT_TRUE(tree.isTrashed(40));
    EXPECT_THROW(tree.validateCreate(NodeType::Document, 30), InvalidParentError);
}

TEST_F(TreeTest, MoveOntoSelfOrDescendantIsACycle) {
    EXPECT_THROW(tree.validateMove(20, 20), CycleError);
    EXPECT_THROW(tree.validateMove(20, 30), CycleError);
    EXPECT_THROW(tree.validateMove(20, 40), CycleError);
    EXPECT_NO_THROW(tree.validateMove(30, 10));
}

TEST_F(TreeTest, MoveToMissingParentIsNotFound) {
    EXPECT_THROW(tree.validateMove(30, 999), NotFoundError);
    EXPECT_THROW(tree.validateMove(999, 10), NotFoundError);
}

TEST_F(TreeTest, InvertingAMoveFailsWithCycle) {
    tree.validateMove(40, 20);
    tree.reparent(40, 20, 1700000200);
    // 20 -> 40 now; putting 20 under 40 would loop
    EXPECT_THROW(tree.validateMove(20, 40), CycleError);
}

TEST_F(TreeTest, ReparentUpdatesChildIndex) {
    tree.reparent(30, 10, 1700000200);
    EXPECT_EQ(tree.children(10), (std::vector<uint64_t>{20, 21, 30}));
    EXPECT_TRUE(tree.children(20).empty());
    EXPECT_EQ(tree.get(30).parent_id, 10u);
    EXPECT_EQ(tree.get(30).updated_at, 1700000200);
}

TEST_F(TreeTest, RestoreNeedsDeletedNodeAndLiveParent) {
    EXPECT_THROW(tree.validateRestore(30), InvalidOperationError);
    tree.markDeleted(20, 1700000100);
    tree.markDeleted(30, 1700000100);
    EXPECT_THROW(tree.validateRestore(30), InvalidParentError);
    EXPECT_NO_THROW(tree.validateRestore(20));
}

TEST_F(TreeTest, GrantsAreKeptPerNodeAndSubject) {
    EXPECT_EQ(tree.grantFor(20, 7), PermissionLevel::Read);
    EXPECT_FALSE(tree.grantFor(30, 7).has_value());
    tree.putGrant(Grant(20, 7, PermissionLevel::Edit));
    EXPECT_EQ(tree.grantFor(20, 7), PermissionLevel::Edit);
    EXPECT_TRUE(tree.eraseGrant(20, 7));
    EXPECT_FALSE(tree.eraseGrant(20, 7));
    EXPECT_EQ(tree.grantsOn(20), nullptr);
}

TEST(TreeBuildTest, RejectsDanglingParent) {
    EXPECT_THROW((void)Tree::build({makeNode(2, NodeType::Category, 1)}, {}), ParentNotFoundError);
}

TEST(TreeBuildTest, RejectsWorkspaceWithParent) {
    EXPECT_THROW((void)Tree::build({makeNode(1, NodeType::Workspace, std::nullopt),
                                    makeNode(2, NodeType::Workspace, 1)}, {}), InvalidParentError);
}

TEST(TreeBuildTest, RejectsCycleDetachedFromAnyRoot) {
    EXPECT_THROW((void)Tree::build({makeNode(1, NodeType::Workspace, std::nullopt),
                                    makeNode(2, NodeType::Category, 3),
                                    makeNode(3, NodeType::Category, 2)}, {}), CycleError);
}

TEST(TreeBuildTest, RejectsGrantOnMissingNode) {
    EXPECT_THROW((void)Tree::build({makeNode(1, NodeType::Workspace, std::nullopt)},
                                   {Grant(5, 7, PermissionLevel::Read)}), NotFoundError);
}
