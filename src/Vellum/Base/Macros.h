//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

// Declare inside a class to delete copy construction and copy assignment.
#define VELLUM_MAKE_NON_COPYABLE(Type)                                         \
  Type(const Type&) = delete;                                                  \
  auto operator=(const Type&)->Type& = delete;

// Declare inside a class to delete move construction and move assignment.
// NOLINTBEGIN
#define VELLUM_MAKE_NON_MOVABLE(Type)                                          \
  Type(Type&&) = delete;                                                       \
  auto operator=(Type&&)->Type& = delete;
// NOLINTEND

// Declare inside a class to default move construction and move assignment.
// NOLINTBEGIN
#define VELLUM_DEFAULT_MOVABLE(Type)                                           \
  Type(Type&&) = default;                                                      \
  auto operator=(Type&&)->Type& = default;
// NOLINTEND
