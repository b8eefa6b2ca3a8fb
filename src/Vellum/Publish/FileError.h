//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! Outcome of one operation on the publish area.
/*!
 The write side of a publish (directory creation, copy, rename, removal)
 reports failures as values, so that the committer can collect every failure
 of a batch and roll back. POSIX and Windows error values are folded into
 these codes.
*/
enum class FileError : uint32_t {
  kOk = 0,

  // Missing or misplaced entries.
  kNotFound,
  kAlreadyExists, //!< Publishes never overwrite.
  kIsDirectory,
  kNotDirectory,

  // Refused by the system.
  kAccessDenied,
  kReadOnly,
  kTooManyOpenFiles,
  kNoSpace, //!< Device full or quota exceeded.

  // Bad names.
  kInvalidPath,
  kPathTooLong,

  // Interrupted or broken transfers.
  kIOError,
  kTimedOut, //!< The commit deadline passed before the copy finished.
  kCancelled,

  kUnknown,
};

VLLM_PUBL_NDAPI auto to_string(FileError value) -> const char*;

//! A failed (or successful) file operation with its context.
/*!
 ```cpp
 if (const auto error = fs.Rename(temp, destination); error.IsError()) {
   LOG_F(ERROR, "{}", error.ToString());
 }
 ```
*/
struct FileErrorInfo {
  FileError code = FileError::kUnknown;

  //! Entry the operation was working on.
  std::filesystem::path path {};

  //! OS error behind the failure, if any.
  std::error_code system_error {};

  std::string message {};

  //! `Code: 'path' - message (system: ...)`, omitting empty parts.
  VLLM_PUBL_NDAPI auto ToString() const -> std::string;

  [[nodiscard]] auto IsError() const -> bool { return code != FileError::kOk; }
};

[[nodiscard]] inline auto FileOk() -> FileErrorInfo
{
  return FileErrorInfo { .code = FileError::kOk };
}

//! Classify an OS error. Unmapped values give `kUnknown`.
VLLM_PUBL_NDAPI auto MapSystemError(std::error_code ec) -> FileError;

VLLM_PUBL_NDAPI auto MakeFileError(
  const std::filesystem::path& path, std::error_code ec) -> FileErrorInfo;

VLLM_PUBL_NDAPI auto MakeFileError(const std::filesystem::path& path,
  FileError code, std::string message) -> FileErrorInfo;

} // namespace vellum::publish
