//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

#include <uuid.h> // stduuid: https://github.com/mariusbancila/stduuid

#include <Tinsel/Scene/api_export.h>

namespace tinsel::scene {

//! Identity of a sprite, unique for the lifetime of the process and beyond.
/*!
 A random (version 4) UUID. It is totally ordered and hashable (stduuid
 provides `std::hash<uuids::uuid>`), so it can key both ordered and unordered
 associative containers.
*/
using NodeId = uuids::uuid;

//! Generates a new random NodeId.
TNSL_SCN_NDAPI auto GenerateNodeId() -> NodeId;

//! Canonical 8-4-4-4-12 lowercase hex representation of a NodeId.
TNSL_SCN_NDAPI auto to_string(const NodeId& id) -> std::string;

} // namespace tinsel::scene
