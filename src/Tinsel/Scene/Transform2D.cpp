//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <glm/glm.hpp>
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/gtx/matrix_transform_2d.hpp>

#include <Tinsel/Scene/Transform2D.h>

namespace tinsel::scene {

auto Translate(const Mat3& m, const Vec2& offset) -> Mat3
{
  return glm::translate(m, offset);
}

auto RotateDegrees(const Mat3& m, const double degrees) -> Mat3
{
  return glm::rotate(m, glm::radians(degrees));
}

auto Scale(const Mat3& m, const Vec2& factors) -> Mat3
{
  return glm::scale(m, factors);
}

auto FlipHorizontal(const Mat3& m) -> Mat3
{
  return glm::scale(m, Vec2 { -1.0, 1.0 });
}

auto FlipVertical(const Mat3& m) -> Mat3
{
  return glm::scale(m, Vec2 { 1.0, -1.0 });
}

auto TransformPoint(const Mat3& m, const Vec2& point) -> Vec2
{
  const auto p = m * glm::dvec3 { point, 1.0 };
  return Vec2 { p.x, p.y };
}

auto ComposeLocal(const Mat3& parent, const Vec2& position,
  const double rotation_degrees, const Vec2& scale) -> Mat3
{
  return Scale(
    RotateDegrees(Translate(parent, position), rotation_degrees), scale);
}

} // namespace tinsel::scene
