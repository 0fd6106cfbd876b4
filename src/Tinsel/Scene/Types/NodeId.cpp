//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <array>
#include <functional>
#include <random>

#include <Tinsel/Scene/Types/NodeId.h>

namespace {

//! Random generator shared by all sprites of the process.
/*!
 Seeding a full mt19937 state from std::random_device is expensive, so it is
 done once. Sprites are created from a single thread.
*/
auto GetGenerator() -> uuids::uuid_random_generator&
{
  static std::mt19937 engine = [] {
    std::random_device rd;
    auto seed_data = std::array<int, std::mt19937::state_size> {};
    std::generate(std::begin(seed_data), std::end(seed_data), std::ref(rd));
    std::seed_seq seq(std::begin(seed_data), std::end(seed_data));
    return std::mt19937(seq);
  }();
  static uuids::uuid_random_generator generator { engine };
  return generator;
}

} // namespace

auto tinsel::scene::GenerateNodeId() -> NodeId { return GetGenerator()(); }

auto tinsel::scene::to_string(const NodeId& id) -> std::string
{
  return uuids::to_string(id);
}
