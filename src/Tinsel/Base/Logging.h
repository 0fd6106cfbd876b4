//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

// All Tinsel code logs through loguru with fmt-style format strings. The build
// defines LOGURU_USE_FMTLIB=1 for every target linking loguru; keep the guard
// here so a stray translation unit cannot silently fall back to printf style.
#if !defined(LOGURU_USE_FMTLIB)
#  define LOGURU_USE_FMTLIB 1
#endif

#include <loguru.hpp>
