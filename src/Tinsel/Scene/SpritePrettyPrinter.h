//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <Tinsel/Base/Logging.h>
#include <Tinsel/Scene/Sprite.h>
#include <Tinsel/Scene/api_export.h>

namespace tinsel::scene {

//! Character sets for cross-platform tree visualization
enum class CharacterSet : uint8_t {
  kAscii, //!< Basic ASCII characters: |, -, `
  kUnicode //!< Unicode box drawing: ├, └, │, ─
};

//! Verbosity levels for sprite information display
enum class VerbosityLevel : uint8_t {
  kNone, //!< Structure only (sprite ids)
  kCompact, //!< Visibility, flips and animation state
  kDetailed //!< Compact, plus transform, anchor and tint
};

//! Configuration options for sprite tree printing
struct PrintOptions {
  CharacterSet charset = CharacterSet::kAscii;
  VerbosityLevel verbosity = VerbosityLevel::kCompact;
  //! Length of the id prefix printed for each sprite, 36 for the full id.
  std::size_t id_length = 8;
  //! Deepest level printed, the root being level 0. -1 is unlimited.
  std::ptrdiff_t max_depth = -1;
};

//! Formats the tree rooted at `root`, one line per sprite, parents before
//! children.
TNSL_SCN_NDAPI auto FormatSpriteTree(
  const Sprite& root, const PrintOptions& options = {})
  -> std::vector<std::string>;

//! Logs the tree rooted at `root` in a loguru scope, one message per sprite.
TNSL_SCN_API auto LogSpriteTree(const Sprite& root,
  loguru::Verbosity verbosity = loguru::Verbosity_INFO,
  const PrintOptions& options = {}) -> void;

} // namespace tinsel::scene
