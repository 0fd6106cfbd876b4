//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Tinsel/Base/Logging.h>
#include <Tinsel/Scene/SpriteTraversal.h>

auto tinsel::scene::to_string(const VisitResult value) -> const char*
{
  switch (value) {
  case VisitResult::kContinue:
    return "Continue";
  case VisitResult::kSkipSubtree:
    return "Skip Subtree";
  case VisitResult::kStop:
    return "Stop";
  }
  return "__NotSupported__";
}

auto tinsel::scene::AdvanceAnimations(Sprite& root, const double dt) -> void
{
  // Update() never changes the tree structure, so a mutable traversal is safe.
  [[maybe_unused]] const auto completed
    = Traverse(root, [dt](Sprite& sprite, std::size_t /*depth*/) {
        sprite.Update(dt);
        return VisitResult::kContinue;
      });
  DCHECK_F(completed);
}

auto tinsel::scene::CountSprites(const Sprite& root) -> std::size_t
{
  std::size_t count = 0;
  [[maybe_unused]] const auto completed = Traverse(
    root, [&count](const Sprite& /*sprite*/, std::size_t /*depth*/) {
      ++count;
      return VisitResult::kContinue;
    });
  DCHECK_F(completed);
  return count;
}
