//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <fmt/format.h>

#include <Tinsel/Graphics/Types/Rect.h>

auto tinsel::graphics::to_string(const Rect& rect) -> std::string
{
  return fmt::format(
    "[{}, {}, {} x {}]", rect.x, rect.y, rect.width, rect.height);
}
