//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <stdexcept>
#include <utility>

#include <Tinsel/Base/Logging.h>
#include <Tinsel/Scene/Sprite.h>

using tinsel::scene::Rect;
using tinsel::scene::Sprite;

namespace {

auto CheckTexture(Sprite::TexturePtr texture) -> Sprite::TexturePtr
{
  if (!texture) {
    throw std::invalid_argument("a sprite requires a non-null texture");
  }
  return texture;
}

} // namespace

Sprite::Sprite(TexturePtr texture, const SpriteConfig& config)
  : id_(GenerateNodeId())
  , visible_(config.visible)
  , anchor_(config.anchor)
  , color_(config.color)
  , opacity_(config.opacity)
  , texture_(CheckTexture(std::move(texture)))
{
  DLOG_F(2, "sprite {} created (full texture {})", to_string(id_),
    graphics::to_string(texture_->GetFullRect()));
}

Sprite::Sprite(
  TexturePtr texture, const Rect& source_rect, const SpriteConfig& config)
  : Sprite(std::move(texture), config)
{
  source_rect_ = source_rect;
  DLOG_F(2, "sprite {} source rect: {}", to_string(id_),
    graphics::to_string(source_rect));
}

auto Sprite::SetTexture(TexturePtr texture) -> void
{
  texture_ = CheckTexture(std::move(texture));
}

/*!
 The active source rectangle is, in order of precedence:
 - the current frame of the playing clip,
 - the explicit source rectangle,
 - the whole texture.

 Its size drives the quad size, the anchor offset and the flip pivot.
*/
auto Sprite::GetActiveSourceRect() const -> Rect
{
  if (active_) {
    DCHECK_F(frame_index_ < active_->frame_set.GetFrameCount());
    return active_->frame_set.frames[frame_index_];
  }
  return source_rect_.value_or(texture_->GetFullRect());
}

/*!
 The box is expressed in the coordinate space the sprite's position lives in,
 i.e. its parent's local space. Its size is the active source rectangle scaled
 by the sprite's scale, and it is offset so that the anchor lands on the
 position.

 @note Rotation is not taken into account. The box is only meaningful for
 picking or culling sprites that are not rotated.
*/
auto Sprite::GetBoundingBox() const -> Rect
{
  const auto source = GetActiveSourceRect();
  const auto width = source.width * scale_.x;
  const auto height = source.height * scale_.y;

  return Rect {
    .x = position_.x - anchor_.x * width,
    .y = position_.y - anchor_.y * height,
    .width = width,
    .height = height,
  };
}
