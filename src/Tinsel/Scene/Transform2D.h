//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <glm/mat3x3.hpp>
#include <glm/vec2.hpp>

#include <Tinsel/Scene/api_export.h>

//! 2D affine transform helpers used by sprite traversal.
/*!
 Transforms are homogeneous 3x3 double precision matrices. Every helper
 post-multiplies its argument, so a chain of calls reads left to right in the
 order the operations apply to the local space of a quad:

 ```cpp
 auto t = Scale(RotateDegrees(Translate(parent, position), rotation), scale);
 ```
*/
namespace tinsel::scene {

using Mat3 = glm::dmat3;
using Vec2 = glm::dvec2;

TNSL_SCN_NDAPI auto Translate(const Mat3& m, const Vec2& offset) -> Mat3;

//! Rotates by `degrees`, counter-clockwise in a y-up space (clockwise on a
//! y-down screen).
TNSL_SCN_NDAPI auto RotateDegrees(const Mat3& m, double degrees) -> Mat3;

TNSL_SCN_NDAPI auto Scale(const Mat3& m, const Vec2& factors) -> Mat3;

//! Mirrors the x axis (x -> -x).
TNSL_SCN_NDAPI auto FlipHorizontal(const Mat3& m) -> Mat3;

//! Mirrors the y axis (y -> -y).
TNSL_SCN_NDAPI auto FlipVertical(const Mat3& m) -> Mat3;

//! Applies the transform to a point (implicit w = 1).
TNSL_SCN_NDAPI auto TransformPoint(const Mat3& m, const Vec2& point) -> Vec2;

//! Composes `parent * T(position) * R(rotation) * S(scale)`.
TNSL_SCN_NDAPI auto ComposeLocal(const Mat3& parent, const Vec2& position,
  double rotation_degrees, const Vec2& scale) -> Mat3;

} // namespace tinsel::scene
