//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef TNSL_GFX_STATIC
#    define TNSL_GFX_API
#  else
#    ifdef TNSL_GFX_EXPORTS
#      define TNSL_GFX_API __declspec(dllexport)
#    else
#      define TNSL_GFX_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef TNSL_GFX_EXPORTS
#    define TNSL_GFX_API __attribute__((visibility("default")))
#  else
#    define TNSL_GFX_API
#  endif
#else
#  define TNSL_GFX_API
#endif

#define TNSL_GFX_NDAPI [[nodiscard]] TNSL_GFX_API
