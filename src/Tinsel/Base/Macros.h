//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

// use this inside a class declaration to make it non-copyable
#define TINSEL_MAKE_NON_COPYABLE(Type)                                         \
  Type(const Type&) = delete;                                                  \
  auto operator=(const Type&)->Type& = delete;

// use this inside a class declaration to declare default move constructor and
// move assignment operator
// NOLINTBEGIN
#define TINSEL_DEFAULT_MOVABLE(Type)                                           \
  Type(Type&&) noexcept = default;                                             \
  auto operator=(Type&&) noexcept->Type& = default;
// NOLINTEND
