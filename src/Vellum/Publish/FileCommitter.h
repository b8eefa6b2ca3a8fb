//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <vector>

#include <Vellum/Publish/FileSystem.h>
#include <Vellum/Publish/PublishIdentity.h>
#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! One file to publish.
struct CopyItem {
  std::filesystem::path source;
  std::filesystem::path destination;
};

//! Copies the members of one artifact into the publish area, all or nothing.
/*!
 Each file is copied to a hidden temporary name next to its destination,
 then renamed into place, so a destination never appears partially written.
 Copies run in parallel on up to `workers` threads.

 If any copy fails, times out, or the operation is cancelled, the workers
 finish their in-flight copy and stop, then everything the operation created
 is removed: renamed destinations, temporary files, and the directories it
 created. Source files are never modified.

 Destinations that already exist are never overwritten; they fail the
 operation before anything is written.
*/
class FileCommitter {
public:
  struct Options {
    std::size_t workers = 4;

    //! Bound on the whole commit. Copies still running past it fail.
    std::chrono::milliseconds timeout { std::chrono::minutes(5) };
  };

  VLLM_PUBL_API FileCommitter(
    std::shared_ptr<IFileSystem> file_system, Options options);

  //! Commit every item.
  /*!
   @return The committed destination paths, in item order.

   @throw PublishIOError if any file operation failed. The error lists every
     failure, the destinations removed by the rollback, and any rollback
     failure.
   @throw PublishCancelledError if `stop` was requested during the commit. Its
     rollback failures are reported the same way as for `PublishIOError`.
  */
  VLLM_PUBL_API auto Commit(const std::vector<CopyItem>& items,
    std::stop_token stop = {},
    const std::optional<PublishIdentity>& identity = std::nullopt) const
    -> std::vector<std::filesystem::path>;

  //! Hidden temporary name used while copying to `destination`.
  VLLM_PUBL_NDAPI static auto TempPathFor(
    const std::filesystem::path& destination) -> std::filesystem::path;

private:
  std::shared_ptr<IFileSystem> file_system_;
  Options options_;
};

} // namespace vellum::publish
