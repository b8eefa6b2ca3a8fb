//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#if defined(_WIN32) || defined(_WIN64)
#  ifdef VLLM_PUBL_STATIC
#    define VLLM_PUBL_API
#  else
#    ifdef VLLM_PUBL_EXPORTS
#      define VLLM_PUBL_API __declspec(dllexport)
#    else
#      define VLLM_PUBL_API __declspec(dllimport)
#    endif
#  endif
#elif defined(__APPLE__) || defined(__linux__)
#  ifdef VLLM_PUBL_EXPORTS
#    define VLLM_PUBL_API __attribute__((visibility("default")))
#  else
#    define VLLM_PUBL_API
#  endif
#else
#  define VLLM_PUBL_API
#endif

#define VLLM_PUBL_NDAPI [[nodiscard]] VLLM_PUBL_API
