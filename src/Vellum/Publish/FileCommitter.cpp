//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>

#include <Vellum/Base/Logging.h>
#include <Vellum/Publish/FileCommitter.h>
#include <Vellum/Publish/PublishErrors.h>

namespace fs = std::filesystem;

using vellum::publish::CopyItem;
using vellum::publish::Deadline;
using vellum::publish::FileCommitter;
using vellum::publish::FileError;
using vellum::publish::FileErrorInfo;
using vellum::publish::FileOk;
using vellum::publish::IFileSystem;

namespace {

auto DiscardTemp(IFileSystem& file_system, const fs::path& temp) -> void
{
  if (!file_system.Exists(temp)) {
    return;
  }
  if (const auto error = file_system.RemoveFile(temp); error.IsError()) {
    LOG_F(WARNING, "could not remove temporary file: {}", error.ToString());
  }
}

auto CommitOne(IFileSystem& file_system, const CopyItem& item,
  const Deadline deadline) -> FileErrorInfo
{
  const auto temp = FileCommitter::TempPathFor(item.destination);
  if (file_system.Exists(temp)) {
    LOG_F(WARNING, "removing stale temporary file '{}'", temp.string());
    if (auto error = file_system.RemoveFile(temp); error.IsError()) {
      return error;
    }
  }

  if (auto error = file_system.CopyFile(item.source, temp, deadline);
    error.IsError()) {
    DiscardTemp(file_system, temp);
    return error;
  }
  if (auto error = file_system.Rename(temp, item.destination);
    error.IsError()) {
    DiscardTemp(file_system, temp);
    return error;
  }
  DLOG_F(1, "copied '{}' -> '{}'", item.source.string(),
    item.destination.string());
  return FileOk();
}

} // namespace

namespace vellum::publish {

FileCommitter::FileCommitter(
  std::shared_ptr<IFileSystem> file_system, const Options options)
  : file_system_(std::move(file_system))
  , options_(options)
{
  CHECK_NOTNULL_F(file_system_.get());
}

auto FileCommitter::TempPathFor(const fs::path& destination) -> fs::path
{
  return destination.parent_path()
    / fmt::format(".{}.vellum-tmp", destination.filename().string());
}

auto FileCommitter::Commit(const std::vector<CopyItem>& items,
  const std::stop_token stop,
  const std::optional<PublishIdentity>& identity) const -> std::vector<fs::path>
{
  if (items.empty()) {
    return {};
  }
  const auto deadline = std::chrono::steady_clock::now() + options_.timeout;

  std::vector<FileErrorInfo> failures;
  std::set<fs::path> seen;
  for (const auto& item : items) {
    if (!seen.insert(item.destination).second) {
      failures.push_back(MakeFileError(item.destination,
        FileError::kAlreadyExists, "destination staged more than once"));
    } else if (file_system_->Exists(item.destination)) {
      failures.push_back(MakeFileError(item.destination,
        FileError::kAlreadyExists, "destination already exists"));
    }
  }
  if (!failures.empty()) {
    for (const auto& failure : failures) {
      LOG_F(ERROR, "commit refused: {}", failure.ToString());
    }
    throw PublishIOError(std::move(failures), {}, {}, identity);
  }
  if (stop.stop_requested()) {
    throw PublishCancelledError(identity);
  }

  std::vector<fs::path> created_directories;
  std::set<fs::path> parents;
  for (const auto& item : items) {
    parents.insert(item.destination.parent_path());
  }
  for (const auto& parent : parents) {
    if (auto error
      = file_system_->CreateDirectories(parent, created_directories);
      error.IsError()) {
      failures.push_back(std::move(error));
      break;
    }
  }

  // One flag per item; each is written by the single worker that took it.
  std::vector<char> committed(items.size(), 0);
  if (failures.empty()) {
    std::atomic<std::size_t> next { 0 };
    std::atomic<bool> abort { false };
    std::mutex failures_mutex;

    const auto worker = [&]() {
      while (!abort.load() && !stop.stop_requested()) {
        const auto index = next.fetch_add(1);
        if (index >= items.size()) {
          return;
        }
        auto error = CommitOne(*file_system_, items[index], deadline);
        if (error.IsError()) {
          abort.store(true);
          std::scoped_lock lock(failures_mutex);
          failures.push_back(std::move(error));
        } else {
          committed[index] = 1;
        }
      }
    };

    const auto count = std::clamp<std::size_t>(
      options_.workers, std::size_t { 1 }, items.size());
    std::vector<std::jthread> workers;
    workers.reserve(count);
    try {
      for (std::size_t i = 0; i < count; ++i) {
        workers.emplace_back(worker);
      }
    } catch (const std::system_error& ex) {
      // Workers already running stop after their in-flight copy.
      abort.store(true);
      std::scoped_lock lock(failures_mutex);
      failures.push_back(MakeFileError({}, FileError::kUnknown,
        fmt::format("could not start copy worker: {}", ex.what())));
    }
  }

  const bool cancelled = stop.stop_requested();
  if (failures.empty() && !cancelled) {
    std::vector<fs::path> destinations;
    destinations.reserve(items.size());
    for (const auto& item : items) {
      destinations.push_back(item.destination);
    }
    LOG_F(INFO, "committed {} file(s){}", destinations.size(),
      identity ? fmt::format(" for {}", to_string(*identity)) : "");
    return destinations;
  }

  std::vector<fs::path> rolled_back;
  std::vector<FileErrorInfo> rollback_failures;
  for (std::size_t i = 0; i < items.size(); ++i) {
    const auto& destination = items[i].destination;
    if (committed[i] != 0) {
      if (auto error = file_system_->RemoveFile(destination);
        error.IsError()) {
        rollback_failures.push_back(std::move(error));
      } else {
        rolled_back.push_back(destination);
      }
      continue;
    }
    const auto temp = TempPathFor(destination);
    if (file_system_->Exists(temp)) {
      if (auto error = file_system_->RemoveFile(temp); error.IsError()) {
        rollback_failures.push_back(std::move(error));
      }
    }
  }
  for (auto it = created_directories.rbegin(); it != created_directories.rend();
    ++it) {
    if (auto error = file_system_->RemoveEmptyDirectory(*it); error.IsError()) {
      rollback_failures.push_back(std::move(error));
    }
  }
  for (const auto& failure : rollback_failures) {
    LOG_F(ERROR, "rollback incomplete: {}", failure.ToString());
  }

  if (failures.empty()) {
    LOG_F(WARNING, "commit cancelled, {} file(s) rolled back",
      rolled_back.size());
    throw PublishCancelledError(
      identity, std::move(rolled_back), std::move(rollback_failures));
  }
  for (const auto& failure : failures) {
    LOG_F(ERROR, "commit failed: {}", failure.ToString());
  }
  throw PublishIOError(std::move(failures), std::move(rolled_back),
    std::move(rollback_failures), identity);
}

} // namespace vellum::publish
