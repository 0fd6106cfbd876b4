//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

#include <Tinsel/Graphics/api_export.h>

namespace tinsel::graphics {

//! Axis aligned rectangle, origin at its top-left corner.
/*!
 Used both for regions of a texture in pixel space (source rectangles,
 animation frames) and for quads in local sprite space (destination
 rectangles, bounding boxes). Zero or negative extents are valid values.
*/
struct Rect {
  double x { 0.0 };
  double y { 0.0 };
  double width { 0.0 };
  double height { 0.0 };

  auto operator==(const Rect&) const -> bool = default;
};

//! String representation of a Rect, `[x, y, w x h]`.
TNSL_GFX_NDAPI auto to_string(const Rect& rect) -> std::string;

} // namespace tinsel::graphics
