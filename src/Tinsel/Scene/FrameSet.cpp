//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <Tinsel/Scene/FrameSet.h>

auto tinsel::scene::MakeHorizontalFrames(
  const Rect& base, const std::uint32_t count) -> std::vector<Rect>
{
  std::vector<Rect> frames;
  frames.reserve(count);
  for (std::uint32_t i = 0; i < count; ++i) {
    frames.push_back(Rect {
      .x = base.x + static_cast<double>(i) * base.width,
      .y = base.y,
      .width = base.width,
      .height = base.height,
    });
  }
  return frames;
}
