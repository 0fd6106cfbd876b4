//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <glm/vec4.hpp>

#include <Tinsel/Scene/Sprite.h>

using tinsel::graphics::QuadRenderer;
using tinsel::scene::Mat3;
using tinsel::scene::Rect;
using tinsel::scene::Sprite;

auto Sprite::Draw(const Mat3& parent_transform, QuadRenderer& renderer) const
  -> void
{
  DrawImpl(parent_transform, renderer, std::nullopt);
}

/*!
 Same as Draw(), but every quad of the subtree is tinted with `color` instead
 of its sprite's own color. Opacity still comes from each sprite.
*/
auto Sprite::DrawTinted(const Mat3& parent_transform, QuadRenderer& renderer,
  const glm::vec3& color) const -> void
{
  DrawImpl(parent_transform, renderer, color);
}

auto Sprite::GetSubmittedSourceRect() const -> std::optional<Rect>
{
  if (active_) {
    return active_->frame_set.frames[frame_index_];
  }
  return source_rect_;
}

/*!
 __Transforms__

 - The accumulated transform `T = parent * T(position) * R(rotation) *
   S(scale)` is what children receive.
 - The quad uses `M`, which is `T` followed by the flips. Flipping mirrors
   around the anchor: the quad is first shifted by `size - 2 * anchor` along
   the flipped axis, then mirrored.

 The quad covers `(-anchor, size)` in the space of `M`, where `size` is the
 active source rectangle's size and `anchor` the normalized anchor scaled to
 that size.

 An invisible sprite returns before submitting anything, so its whole subtree
 is skipped.
*/
auto Sprite::DrawImpl(const Mat3& parent_transform, QuadRenderer& renderer,
  const std::optional<glm::vec3>& tint_override) const -> void
{
  if (!visible_) {
    return;
  }

  const auto source = GetActiveSourceRect();
  const Vec2 anchor { anchor_.x * source.width, anchor_.y * source.height };

  const auto transformed
    = ComposeLocal(parent_transform, position_, rotation_, scale_);

  auto model = transformed;
  if (flip_x_) {
    model = FlipHorizontal(
      Translate(model, Vec2 { source.width - 2.0 * anchor.x, 0.0 }));
  }
  if (flip_y_) {
    model = FlipVertical(
      Translate(model, Vec2 { 0.0, source.height - 2.0 * anchor.y }));
  }

  const auto& color = tint_override ? *tint_override : color_;
  renderer.DrawQuad(*texture_,
    Rect {
      .x = -anchor.x,
      .y = -anchor.y,
      .width = source.width,
      .height = source.height,
    },
    GetSubmittedSourceRect(), glm::vec4 { color, opacity_ }, model);

  for (const auto& child : children_) {
    child.DrawImpl(transformed, renderer, tint_override);
  }
}
