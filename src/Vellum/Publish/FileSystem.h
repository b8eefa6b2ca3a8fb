//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <vector>

#include <Vellum/Publish/FileError.h>
#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! Point in time after which a file operation gives up.
using Deadline = std::chrono::steady_clock::time_point;

//! File operations used to commit a publish.
/*!
 The interface covers the write side of a publish: creating destination
 directories, copying to a temporary name, renaming into place and removing
 what a failed operation left behind.

 ### Error Handling
 All operations return `FileErrorInfo`. No exceptions are thrown.

 ### Thread Safety
 Implementations must support concurrent operations on different files.
*/
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  [[nodiscard]] virtual auto Exists(const std::filesystem::path& path) const
    -> bool
    = 0;

  //! Create `directory` and its missing parents.
  /*!
   Each directory actually created is appended to `created`, outermost
   first, so the caller can remove exactly those on rollback.
  */
  [[nodiscard]] virtual auto CreateDirectories(
    const std::filesystem::path& directory,
    std::vector<std::filesystem::path>& created) -> FileErrorInfo
    = 0;

  //! Copy `source` to the new file `destination`.
  /*!
   ### Errors
   - `kAlreadyExists` if the destination exists; it is never overwritten.
   - `kNotFound` if the source does not exist.
   - `kTimedOut` if the copy did not finish before `deadline`. A partially
     written destination is removed.
   - `kIOError` for other read or write failures.
  */
  [[nodiscard]] virtual auto CopyFile(const std::filesystem::path& source,
    const std::filesystem::path& destination, Deadline deadline)
    -> FileErrorInfo
    = 0;

  //! Rename `from` to `to`. Fails with `kAlreadyExists` if `to` exists.
  [[nodiscard]] virtual auto Rename(
    const std::filesystem::path& from, const std::filesystem::path& to)
    -> FileErrorInfo
    = 0;

  [[nodiscard]] virtual auto RemoveFile(const std::filesystem::path& path)
    -> FileErrorInfo
    = 0;

  //! Remove a directory, only if it is empty.
  [[nodiscard]] virtual auto RemoveEmptyDirectory(
    const std::filesystem::path& directory) -> FileErrorInfo
    = 0;
};

//! `IFileSystem` backed by the local file system.
/*!
 Files are copied in chunks of `chunk_size` bytes; the deadline is checked
 between chunks.
*/
class LocalFileSystem final : public IFileSystem {
public:
  static constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

  explicit LocalFileSystem(const std::size_t chunk_size = kDefaultChunkSize)
    : chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size)
  {
  }

  VLLM_PUBL_NDAPI auto Exists(const std::filesystem::path& path) const
    -> bool override;

  VLLM_PUBL_NDAPI auto CreateDirectories(const std::filesystem::path& directory,
    std::vector<std::filesystem::path>& created) -> FileErrorInfo override;

  VLLM_PUBL_NDAPI auto CopyFile(const std::filesystem::path& source,
    const std::filesystem::path& destination, Deadline deadline)
    -> FileErrorInfo override;

  VLLM_PUBL_NDAPI auto Rename(const std::filesystem::path& from,
    const std::filesystem::path& to) -> FileErrorInfo override;

  VLLM_PUBL_NDAPI auto RemoveFile(const std::filesystem::path& path)
    -> FileErrorInfo override;

  VLLM_PUBL_NDAPI auto RemoveEmptyDirectory(
    const std::filesystem::path& directory) -> FileErrorInfo override;

private:
  std::size_t chunk_size_;
};

} // namespace vellum::publish
