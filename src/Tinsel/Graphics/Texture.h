//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <glm/vec2.hpp>

#include <Tinsel/Base/Macros.h>
#include <Tinsel/Graphics/Types/Rect.h>

namespace tinsel::graphics {

//! A texture resource, as seen by the scene graph.
/*!
 The scene graph never samples, uploads or mutates textures. It only needs
 their size in pixels, to resolve the full-texture source rectangle. Backends
 derive from this class and hand out `std::shared_ptr<const Texture>`, which
 sprites share.
*/
class Texture {
public:
  Texture() = default;
  virtual ~Texture() = default;

  TINSEL_MAKE_NON_COPYABLE(Texture)
  TINSEL_DEFAULT_MOVABLE(Texture)

  //! Size of the texture in pixels, (width, height).
  [[nodiscard]] virtual auto GetSize() const -> glm::uvec2 = 0;

  //! The rectangle covering the whole texture, in pixel space.
  [[nodiscard]] auto GetFullRect() const -> Rect
  {
    const auto size = GetSize();
    return Rect {
      .x = 0.0,
      .y = 0.0,
      .width = static_cast<double>(size.x),
      .height = static_cast<double>(size.y),
    };
  }
};

} // namespace tinsel::graphics
