//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

namespace tinsel {

//! Initial state of newly constructed sprites.
struct SpriteConfig {
  // Normalized pivot of the sprite quad. The default pivots around the
  // center of the source rectangle.
  glm::dvec2 anchor { 0.5, 0.5 };

  // Tint color, multiplied with the texture color.
  glm::vec3 color { 1.0F, 1.0F, 1.0F };

  // Alpha of the tint. Independent from `color`.
  float opacity { 1.0F };

  // Whether the sprite and its subtree are drawn.
  bool visible { true };
};

} // namespace tinsel
