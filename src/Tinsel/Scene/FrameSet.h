//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <Tinsel/Graphics/Types/Rect.h>
#include <Tinsel/Scene/api_export.h>

namespace tinsel::scene {

using graphics::Rect;

//! An animation clip: source rectangles shown one after the other, each for
//! `frame_time` seconds.
/*!
 A FrameSet is a value. Sprites keep their own registry of named frame sets
 and copy the active one when it starts playing, so editing a registry entry
 never affects a clip in flight. A valid FrameSet has at least one frame;
 Sprite::AddFrameSet() rejects empty ones.
*/
struct FrameSet {
  //! Loop back to the first frame after the last one, instead of freezing or
  //! chaining to a followup clip.
  bool repeat { false };

  //! How long each frame is displayed, in seconds.
  double frame_time { 0.0 };

  //! Source rectangles, in texture pixel space, one per frame.
  std::vector<Rect> frames;

  [[nodiscard]] auto GetFrameCount() const noexcept -> std::size_t
  {
    return frames.size();
  }

  [[nodiscard]] auto IsLastFrame(const std::size_t index) const noexcept
    -> bool
  {
    return index + 1 >= frames.size();
  }
};

//! Builds `count` frames by tiling `base` rightward by its own width.
/*!
 Frame `i` is `base` moved by `i * base.width` along x; y, width and height
 are shared by every frame. This is the common layout of a sprite sheet row.

 @return The frames, empty when `count` is zero.
*/
TNSL_SCN_NDAPI auto MakeHorizontalFrames(const Rect& base, std::uint32_t count)
  -> std::vector<Rect>;

} // namespace tinsel::scene
