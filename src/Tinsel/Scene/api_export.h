//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef TNSL_SCN_STATIC
#    define TNSL_SCN_API
#  else
#    ifdef TNSL_SCN_EXPORTS
#      define TNSL_SCN_API __declspec(dllexport)
#    else
#      define TNSL_SCN_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef TNSL_SCN_EXPORTS
#    define TNSL_SCN_API __attribute__((visibility("default")))
#  else
#    define TNSL_SCN_API
#  endif
#else
#  define TNSL_SCN_API
#endif

#define TNSL_SCN_NDAPI [[nodiscard]] TNSL_SCN_API
