//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <random>
#include <vector>

#include <Tinsel/Testing/GTest.h>

#include <Tinsel/Scene/Sprite.h>
#include <Tinsel/Scene/SpriteTraversal.h>
#include <Tinsel/Scene/Test/Mocks/FakeTexture.h>

using tinsel::scene::CountSprites;
using tinsel::scene::GenerateNodeId;
using tinsel::scene::NodeId;
using tinsel::scene::Sprite;
using tinsel::scene::testing::MakeTexture;

namespace {

class SpriteChildrenTest : public testing::Test {
protected:
  void SetUp() override { texture_ = MakeTexture(16, 16); }

  [[nodiscard]] auto MakeSprite() const -> Sprite { return Sprite(texture_); }

  // Helper: ids of the direct children, in order
  static auto ChildIds(const Sprite& sprite) -> std::vector<NodeId>
  {
    std::vector<NodeId> ids;
    for (const auto& child : sprite.GetChildren()) {
      ids.push_back(child.GetId());
    }
    return ids;
  }

  // Helper: every child must be found through the index, at its position
  static void ExpectIndexConsistent(const Sprite& sprite)
  {
    for (const auto& child : sprite.GetChildren()) {
      const auto found = sprite.FindChild(child.GetId());
      ASSERT_TRUE(found.has_value());
      EXPECT_EQ(&found->get(), &child);
    }
  }

  Sprite::TexturePtr texture_;
};

//=== AddChild ===------------------------------------------------------------//

NOLINT_TEST_F(SpriteChildrenTest, AddChild_ReturnsIdAndAppends)
{
  // Arrange
  auto root = MakeSprite();
  auto first = MakeSprite();
  auto second = MakeSprite();
  const auto first_id = first.GetId();
  const auto second_id = second.GetId();

  // Act
  const auto added_first = root.AddChild(std::move(first));
  const auto added_second = root.AddChild(std::move(second));

  // Assert
  EXPECT_EQ(added_first, first_id);
  EXPECT_EQ(added_second, second_id);
  EXPECT_THAT(ChildIds(root), testing::ElementsAre(first_id, second_id));
  GCHECK_F(ExpectIndexConsistent(root));
}

//=== FindChild ===-----------------------------------------------------------//

NOLINT_TEST_F(SpriteChildrenTest, FindChild_FindsDirectChildAndGrandchild)
{
  // Arrange
  auto root = MakeSprite();
  auto child = MakeSprite();
  const auto grandchild_id = child.AddChild(MakeSprite());
  const auto child_id = root.AddChild(std::move(child));

  // Act
  const auto found_child = root.FindChild(child_id);
  const auto found_grandchild = root.FindChild(grandchild_id);

  // Assert
  ASSERT_TRUE(found_child.has_value());
  EXPECT_EQ(found_child->get().GetId(), child_id);
  ASSERT_TRUE(found_grandchild.has_value());
  EXPECT_EQ(found_grandchild->get().GetId(), grandchild_id);
}

NOLINT_TEST_F(SpriteChildrenTest, FindChild_MutableReferenceModifiesTree)
{
  // Arrange
  auto root = MakeSprite();
  auto child = MakeSprite();
  const auto grandchild_id = child.AddChild(MakeSprite());
  root.AddChild(std::move(child));

  // Act
  auto found = root.FindChild(grandchild_id);
  ASSERT_TRUE(found.has_value());
  found->get().SetPosition({ 7.0, 8.0 });

  // Assert
  const auto& const_root = root;
  const auto again = const_root.FindChild(grandchild_id);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->get().GetPosition(), glm::dvec2(7.0, 8.0));
}

NOLINT_TEST_F(SpriteChildrenTest, FindChild_UnknownIdOrSelfIsNotFound)
{
  // Arrange
  auto root = MakeSprite();
  root.AddChild(MakeSprite());

  // Act & Assert
  EXPECT_FALSE(root.FindChild(GenerateNodeId()).has_value());
  EXPECT_FALSE(root.FindChild(root.GetId()).has_value());
}

//=== RemoveChild ===---------------------------------------------------------//

NOLINT_TEST_F(SpriteChildrenTest, RemoveChild_ReindexesLaterSiblings)
{
  // Arrange
  auto root = MakeSprite();
  const auto a = root.AddChild(MakeSprite());
  const auto b = root.AddChild(MakeSprite());
  const auto c = root.AddChild(MakeSprite());
  const auto d = root.AddChild(MakeSprite());

  // Act
  const auto removed = root.RemoveChild(b);

  // Assert
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(removed->GetId(), b);
  EXPECT_THAT(ChildIds(root), testing::ElementsAre(a, c, d));
  GCHECK_F(ExpectIndexConsistent(root));

  // Removing the (reindexed) last child must hit the right element
  const auto removed_last = root.RemoveChild(d);
  ASSERT_TRUE(removed_last.has_value());
  EXPECT_EQ(removed_last->GetId(), d);
  EXPECT_THAT(ChildIds(root), testing::ElementsAre(a, c));
}

NOLINT_TEST_F(SpriteChildrenTest, RemoveChild_GrandchildLeavesRestUntouched)
{
  // Arrange
  auto root = MakeSprite();
  auto left = MakeSprite();
  auto right = MakeSprite();
  const auto left_a = left.AddChild(MakeSprite());
  const auto left_b = left.AddChild(MakeSprite());
  const auto left_c = left.AddChild(MakeSprite());
  const auto right_a = right.AddChild(MakeSprite());
  const auto left_id = root.AddChild(std::move(left));
  const auto right_id = root.AddChild(std::move(right));

  // Act
  const auto removed = root.RemoveChild(left_b);

  // Assert
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(removed->GetId(), left_b);
  EXPECT_THAT(ChildIds(root), testing::ElementsAre(left_id, right_id));
  const auto& children = root.GetChildren();
  EXPECT_THAT(ChildIds(children[0]), testing::ElementsAre(left_a, left_c));
  EXPECT_THAT(ChildIds(children[1]), testing::ElementsAre(right_a));
  GCHECK_F(ExpectIndexConsistent(children[0]));
  EXPECT_EQ(CountSprites(root), 5U);
}

NOLINT_TEST_F(SpriteChildrenTest, RemoveChild_TakesSubtreeAlong)
{
  // Arrange
  auto root = MakeSprite();
  auto child = MakeSprite();
  const auto grandchild_id = child.AddChild(MakeSprite());
  const auto child_id = root.AddChild(std::move(child));

  // Act
  auto removed = root.RemoveChild(child_id);

  // Assert
  ASSERT_TRUE(removed.has_value());
  EXPECT_FALSE(root.HasChildren());
  EXPECT_FALSE(root.FindChild(grandchild_id).has_value());
  EXPECT_TRUE(removed->FindChild(grandchild_id).has_value());
}

NOLINT_TEST_F(SpriteChildrenTest, RemoveChild_UnknownIdReturnsEmpty)
{
  // Arrange
  auto root = MakeSprite();
  const auto child_id = root.AddChild(MakeSprite());

  // Act
  const auto removed = root.RemoveChild(GenerateNodeId());
  const auto self = root.RemoveChild(root.GetId());

  // Assert
  EXPECT_FALSE(removed.has_value());
  EXPECT_FALSE(self.has_value());
  EXPECT_THAT(ChildIds(root), testing::ElementsAre(child_id));
}

NOLINT_TEST_F(SpriteChildrenTest, RemoveChild_TwiceFailsTheSecondTime)
{
  // Arrange
  auto root = MakeSprite();
  const auto id = root.AddChild(MakeSprite());

  // Act
  const auto first = root.RemoveChild(id);
  const auto second = root.RemoveChild(id);

  // Assert
  EXPECT_TRUE(first.has_value());
  EXPECT_FALSE(second.has_value());
}

NOLINT_TEST_F(SpriteChildrenTest, RemovedChild_CanBeReattachedElsewhere)
{
  // Arrange
  auto root = MakeSprite();
  const auto a = root.AddChild(MakeSprite());
  const auto b = root.AddChild(MakeSprite());
  auto moved = root.RemoveChild(a);
  ASSERT_TRUE(moved.has_value());

  // Act
  auto target = root.FindChild(b);
  ASSERT_TRUE(target.has_value());
  const auto reattached = target->get().AddChild(std::move(*moved));

  // Assert
  EXPECT_EQ(reattached, a);
  EXPECT_THAT(ChildIds(root), testing::ElementsAre(b));
  EXPECT_TRUE(root.FindChild(a).has_value());
}

//! Random sequences of insertions and removals keep the index in sync with
//! the children order.
NOLINT_TEST_F(SpriteChildrenTest, RandomMutations_KeepIndexInvariant)
{
  // Arrange
  auto root = MakeSprite();
  std::vector<NodeId> expected;
  std::mt19937 rng(42); // NOLINT(*-magic-numbers)

  // Act & Assert
  for (int step = 0; step < 200; ++step) {
    const bool add = expected.empty() || (rng() % 3 != 0);
    if (add) {
      expected.push_back(root.AddChild(MakeSprite()));
    } else {
      const auto position = rng() % expected.size();
      const auto id = expected[position];
      expected.erase(expected.begin() + static_cast<std::ptrdiff_t>(position));
      const auto removed = root.RemoveChild(id);
      ASSERT_TRUE(removed.has_value());
      EXPECT_EQ(removed->GetId(), id);
    }
    ASSERT_EQ(ChildIds(root), expected) << "at step " << step;
    TRACE_GCHECK_F(ExpectIndexConsistent(root), "index consistency");
  }
}

} // namespace
