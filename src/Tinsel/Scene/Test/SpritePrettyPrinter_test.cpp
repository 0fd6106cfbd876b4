//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <string>
#include <utility>

#include <Tinsel/Testing/GTest.h>
#include <Tinsel/Testing/LogCapture.h>

#include <Tinsel/Scene/SpritePrettyPrinter.h>
#include <Tinsel/Scene/Test/Mocks/FakeTexture.h>

using tinsel::scene::CharacterSet;
using tinsel::scene::FormatSpriteTree;
using tinsel::scene::LogSpriteTree;
using tinsel::scene::NodeId;
using tinsel::scene::PrintOptions;
using tinsel::scene::Rect;
using tinsel::scene::Sprite;
using tinsel::scene::VerbosityLevel;
using tinsel::scene::testing::MakeTexture;
using tinsel::testing::LogCapture;

namespace {

class SpritePrettyPrinterTest : public testing::Test {
protected:
  SpritePrettyPrinterTest()
    : root_(MakeTexture(16, 8))
  {
  }

  //! root -> { a -> { a1 }, b }
  void SetUp() override
  {
    const auto texture = root_.GetTexture();
    Sprite a(texture);
    a1_ = a.AddChild(Sprite(texture));
    a_ = root_.AddChild(std::move(a));
    b_ = root_.AddChild(Sprite(texture));
  }

  [[nodiscard]] static auto Label(
    const NodeId& id, const std::size_t length = 8) -> std::string
  {
    return to_string(id).substr(0, length);
  }

  [[nodiscard]] auto Find(const NodeId& id) -> Sprite&
  {
    auto sprite = root_.FindChild(id);
    EXPECT_TRUE(sprite.has_value());
    return sprite->get();
  }

  Sprite root_;
  NodeId a_;
  NodeId a1_;
  NodeId b_;
};

NOLINT_TEST_F(SpritePrettyPrinterTest, Format_AsciiTreeStructure)
{
  // Act
  const auto lines = FormatSpriteTree(root_);

  // Assert
  EXPECT_THAT(lines,
    testing::ElementsAre(Label(root_.GetId()), "|-- " + Label(a_),
      "|   `-- " + Label(a1_), "`-- " + Label(b_)));
}

NOLINT_TEST_F(SpritePrettyPrinterTest, Format_UnicodeTreeStructure)
{
  // Arrange
  const PrintOptions options { .charset = CharacterSet::kUnicode };

  // Act
  const auto lines = FormatSpriteTree(root_, options);

  // Assert
  EXPECT_THAT(lines,
    testing::ElementsAre(Label(root_.GetId()), "├── " + Label(a_),
      "│   └── " + Label(a1_), "└── " + Label(b_)));
}

NOLINT_TEST_F(SpritePrettyPrinterTest, Format_MaxDepthLimitsLevels)
{
  // Arrange
  const PrintOptions options { .max_depth = 1 };

  // Act
  const auto lines = FormatSpriteTree(root_, options);
  const auto root_only
    = FormatSpriteTree(root_, PrintOptions { .max_depth = 0 });

  // Assert
  EXPECT_THAT(lines,
    testing::ElementsAre(
      Label(root_.GetId()), "|-- " + Label(a_), "`-- " + Label(b_)));
  EXPECT_THAT(root_only, testing::ElementsAre(Label(root_.GetId())));
}

NOLINT_TEST_F(SpritePrettyPrinterTest, Format_FullIdLength)
{
  // Arrange
  const PrintOptions options { .id_length = 36 };

  // Act
  const auto lines = FormatSpriteTree(root_, options);

  // Assert
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(lines[0], to_string(root_.GetId()));
}

NOLINT_TEST_F(SpritePrettyPrinterTest, Format_CompactShowsStateFlags)
{
  // Arrange
  auto& a = Find(a_);
  a.SetVisible(false);
  a.SetFlipX(true);
  auto& b = Find(b_);
  ASSERT_TRUE(b.AddFrameSet("walk", true, 0.1,
    { Rect { .width = 2.0, .height = 2.0 },
      Rect { .x = 2.0, .width = 2.0, .height = 2.0 } }));
  ASSERT_TRUE(b.AddFrameSet("idle", true, 0.1,
    { Rect { .width = 2.0, .height = 2.0 } }));
  ASSERT_TRUE(b.Play("walk", "idle"));
  b.Update(0.1);

  // Act
  const auto lines = FormatSpriteTree(root_);

  // Assert
  EXPECT_THAT(lines,
    testing::ElementsAre(Label(root_.GetId()),
      "|-- " + Label(a_) + " [hidden, flip-x]", "|   `-- " + Label(a1_),
      "`-- " + Label(b_) + " [clip=walk#1, then=idle]"));
}

NOLINT_TEST_F(SpritePrettyPrinterTest, Format_NoneVerbosityHidesState)
{
  // Arrange
  Find(a_).SetFlipY(true);
  const PrintOptions options { .verbosity = VerbosityLevel::kNone };

  // Act
  const auto lines = FormatSpriteTree(root_, options);

  // Assert
  ASSERT_EQ(lines.size(), 4U);
  EXPECT_EQ(lines[1], "|-- " + Label(a_));
}

NOLINT_TEST_F(SpritePrettyPrinterTest, Format_DetailedShowsTransformAndTint)
{
  // Arrange
  Sprite sprite(MakeTexture(16, 8));
  sprite.SetPosition({ 1.5, -2.0 });
  sprite.SetRotation(45.0);
  sprite.SetScale({ 2.0, 2.0 });
  sprite.SetOpacity(0.5F);
  const PrintOptions options { .verbosity = VerbosityLevel::kDetailed };

  // Act
  const auto lines = FormatSpriteTree(sprite, options);

  // Assert
  ASSERT_EQ(lines.size(), 1U);
  EXPECT_EQ(lines[0],
    Label(sprite.GetId())
      + " [pos=(1.5, -2), rot=45, scale=(2, 2), anchor=(0.5, 0.5),"
        " tint=(1, 1, 1, 0.5), src=[0, 0, 16 x 8]]");
}

NOLINT_TEST_F(SpritePrettyPrinterTest, Log_WritesHeaderAndEveryLine)
{
  // Arrange
  LogCapture capture { loguru::Verbosity_INFO };

  // Act
  LogSpriteTree(root_);

  // Assert
  EXPECT_TRUE(capture.Contains("Sprite tree (4 sprites)"));
  EXPECT_TRUE(capture.Contains(Label(a1_)));
  EXPECT_EQ(capture.Count(Label(b_)), 1);
}

//! The scope header is formatted before it reaches loguru, whose scopes only
//! understand printf style names.
NOLINT_TEST_F(SpritePrettyPrinterTest, Log_HeaderHasNoPlaceholder)
{
  // Arrange
  const Sprite lone(MakeTexture(4, 4));
  LogCapture capture { loguru::Verbosity_INFO };

  // Act
  LogSpriteTree(lone);

  // Assert
  EXPECT_TRUE(capture.Contains("Sprite tree (1 sprites)"));
  EXPECT_FALSE(capture.Contains("{}"));
  EXPECT_EQ(capture.Count(Label(lone.GetId())), 1);
}

} // namespace
