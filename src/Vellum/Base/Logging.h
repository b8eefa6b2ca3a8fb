//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

//! Logging entry point for all Vellum libraries.
/*!
 @file Logging.h

 Vellum logs through Loguru built with fmt support, so every `LOG_F`,
 `DLOG_F`, `CHECK_F` message uses `{}` placeholders:

 ```cpp
 LOG_F(INFO, "publish '{}' committed {} file(s)", identity_str, count);
 ```

 Paths must be passed as strings (`path.string()`); no fmt formatter is
 registered for `std::filesystem::path`.
*/

#ifndef LOGURU_USE_FMTLIB
#  define LOGURU_USE_FMTLIB 1
#endif

#include <loguru.hpp>
