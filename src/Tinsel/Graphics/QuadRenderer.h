//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>

#include <glm/mat3x3.hpp>
#include <glm/vec4.hpp>

#include <Tinsel/Base/Macros.h>
#include <Tinsel/Graphics/Texture.h>
#include <Tinsel/Graphics/Types/Rect.h>

namespace tinsel::graphics {

//! Rendering backend capability used by sprite traversal.
/*!
 Rasterizes one textured, tinted quad. Implementations own every GPU concern
 (batching, state, shaders); the scene graph only submits quads in traversal
 order, which is also the paint order.

 @param texture The texture to sample.
 @param destination Quad in the local space of `transform`.
 @param source Region of the texture to map onto the quad, in pixels. Empty
 when the whole texture is used.
 @param tint Color multiplier (r, g, b, a), alpha being the opacity.
 @param transform 2D affine transform (homogeneous 3x3, column major) from the
 quad's local space to the target's space.
*/
class QuadRenderer {
public:
  QuadRenderer() = default;
  virtual ~QuadRenderer() = default;

  TINSEL_MAKE_NON_COPYABLE(QuadRenderer)
  TINSEL_DEFAULT_MOVABLE(QuadRenderer)

  virtual auto DrawQuad(const Texture& texture, const Rect& destination,
    const std::optional<Rect>& source, const glm::vec4& tint,
    const glm::dmat3& transform) -> void
    = 0;
};

} // namespace tinsel::graphics
