//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include <Tinsel/Scene/Sprite.h>
#include <Tinsel/Scene/api_export.h>

namespace tinsel::scene {

//! Visitor result controlling traversal continuation
enum class VisitResult : uint8_t {
  kContinue, //!< Continue traversal as normal
  kSkipSubtree, //!< Do not traverse this sprite's children
  kStop //!< Stop traversal entirely
};
TNSL_SCN_API auto to_string(VisitResult value) -> const char*;

//! A callable visiting sprites of a tree, with their depth below the root.
template <typename V, typename SpriteT>
concept SpriteVisitor
  = requires(V& visitor, SpriteT& sprite, std::size_t depth) {
      { visitor(sprite, depth) } -> std::same_as<VisitResult>;
    };

namespace detail {

  template <typename SpriteT, typename Visitor>
  auto TraverseImpl(SpriteT& sprite, Visitor& visitor, const std::size_t depth)
    -> bool
  {
    const auto result = visitor(sprite, depth);
    if (result == VisitResult::kStop) {
      return false;
    }
    if (result == VisitResult::kSkipSubtree) {
      return true;
    }

    if constexpr (std::is_const_v<SpriteT>) {
      for (const auto& child : sprite.GetChildren()) {
        if (!TraverseImpl(child, visitor, depth + 1)) {
          return false;
        }
      }
    } else {
      for (auto& child : SpriteChildrenAccess::Children(sprite)) {
        if (!TraverseImpl(child, visitor, depth + 1)) {
          return false;
        }
      }
    }
    return true;
  }

} // namespace detail

//! Visits `root` and its descendants, depth-first, parents before children.
/*!
 The root has depth 0. Visibility is not considered: invisible sprites and
 their subtrees are visited like any other.

 The visitor may modify the sprites it is given, but must not add or remove
 children of any sprite still to be visited.

 @return `false` if the visitor stopped the traversal, `true` otherwise.
*/
template <SpriteVisitor<Sprite> Visitor>
[[nodiscard]] auto Traverse(Sprite& root, Visitor&& visitor) -> bool
{
  return detail::TraverseImpl(root, visitor, 0);
}

template <SpriteVisitor<const Sprite> Visitor>
[[nodiscard]] auto Traverse(const Sprite& root, Visitor&& visitor) -> bool
{
  return detail::TraverseImpl(root, visitor, 0);
}

//! Calls Sprite::Update(dt) on `root` and on every sprite below it.
TNSL_SCN_API auto AdvanceAnimations(Sprite& root, double dt) -> void;

//! Number of sprites in the tree rooted at `root`, `root` included.
TNSL_SCN_NDAPI auto CountSprites(const Sprite& root) -> std::size_t;

} // namespace tinsel::scene
