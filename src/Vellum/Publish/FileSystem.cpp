//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <cerrno>
#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include <Vellum/Publish/FileSystem.h>

namespace fs = std::filesystem;

namespace {

auto LastStreamError(const fs::path& path, const char* what)
  -> vellum::publish::FileErrorInfo
{
  const std::error_code ec(errno, std::generic_category());
  auto info = vellum::publish::MakeFileError(path, ec);
  if (!ec) {
    info.code = vellum::publish::FileError::kIOError;
  }
  info.message = fmt::format("{}: {}", what, info.message);
  return info;
}

} // namespace

namespace vellum::publish {

auto LocalFileSystem::Exists(const fs::path& path) const -> bool
{
  std::error_code ec;
  return fs::exists(path, ec);
}

auto LocalFileSystem::CreateDirectories(
  const fs::path& directory, std::vector<fs::path>& created) -> FileErrorInfo
{
  if (directory.empty()) {
    return MakeFileError(directory, FileError::kInvalidPath, "empty path");
  }

  std::vector<fs::path> missing;
  std::error_code ec;
  for (auto current = directory; !current.empty();
    current = current.parent_path()) {
    if (fs::exists(current, ec)) {
      if (!fs::is_directory(current, ec)) {
        return MakeFileError(
          current, FileError::kNotDirectory, "not a directory");
      }
      break;
    }
    missing.push_back(current);
    if (current == current.parent_path()) {
      break;
    }
  }

  for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
    if (!fs::create_directory(*it, ec)) {
      if (ec) {
        return MakeFileError(*it, ec);
      }
      // Created concurrently by another publish; not ours to remove.
      continue;
    }
    created.push_back(*it);
  }
  return FileOk();
}

auto LocalFileSystem::CopyFile(const fs::path& source,
  const fs::path& destination, const Deadline deadline) -> FileErrorInfo
{
  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) {
    return MakeFileError(source, FileError::kNotFound, "source file not found");
  }
  if (fs::exists(destination, ec)) {
    return MakeFileError(
      destination, FileError::kAlreadyExists, "destination already exists");
  }

  std::ifstream in(source, std::ios::binary);
  if (!in) {
    return LastStreamError(source, "cannot open source");
  }
  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if (!out) {
    return LastStreamError(destination, "cannot create destination");
  }

  const auto discard = [&](FileErrorInfo error) {
    out.close();
    std::error_code remove_ec;
    fs::remove(destination, remove_ec);
    return error;
  };

  std::vector<char> buffer(chunk_size_);
  while (in) {
    if (std::chrono::steady_clock::now() > deadline) {
      return discard(MakeFileError(
        destination, FileError::kTimedOut, "copy deadline exceeded"));
    }
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto count = in.gcount();
    if (count > 0) {
      out.write(buffer.data(), count);
      if (!out) {
        return discard(LastStreamError(destination, "write failed"));
      }
    }
  }
  if (in.bad()) {
    return discard(LastStreamError(source, "read failed"));
  }
  out.flush();
  if (!out) {
    return discard(LastStreamError(destination, "flush failed"));
  }
  return FileOk();
}

auto LocalFileSystem::Rename(const fs::path& from, const fs::path& to)
  -> FileErrorInfo
{
  std::error_code ec;
  if (fs::exists(to, ec)) {
    return MakeFileError(
      to, FileError::kAlreadyExists, "destination already exists");
  }
  fs::rename(from, to, ec);
  if (ec) {
    return MakeFileError(from, ec);
  }
  return FileOk();
}

auto LocalFileSystem::RemoveFile(const fs::path& path) -> FileErrorInfo
{
  std::error_code ec;
  if (!fs::remove(path, ec) && ec) {
    return MakeFileError(path, ec);
  }
  return FileOk();
}

auto LocalFileSystem::RemoveEmptyDirectory(const fs::path& directory)
  -> FileErrorInfo
{
  std::error_code ec;
  if (!fs::is_empty(directory, ec)) {
    if (ec) {
      return MakeFileError(directory, ec);
    }
    return MakeFileError(
      directory, FileError::kIOError, "directory is not empty");
  }
  fs::remove(directory, ec);
  if (ec) {
    return MakeFileError(directory, ec);
  }
  return FileOk();
}

} // namespace vellum::publish
