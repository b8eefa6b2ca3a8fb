//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef VLLM_PATH_STATIC
#    define VLLM_PATH_API
#  else
#    ifdef VLLM_PATH_EXPORTS
#      define VLLM_PATH_API __declspec(dllexport)
#    else
#      define VLLM_PATH_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef VLLM_PATH_EXPORTS
#    define VLLM_PATH_API __attribute__((visibility("default")))
#  else
#    define VLLM_PATH_API
#  endif
#else
#  define VLLM_PATH_API
#endif

#define VLLM_PATH_NDAPI [[nodiscard]] VLLM_PATH_API
