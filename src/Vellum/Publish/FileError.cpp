//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

#ifdef _WIN32
#  include <Windows.h>
#endif

#include <fmt/format.h>

#include <Vellum/Publish/FileError.h>

using vellum::publish::FileError;

namespace {

constexpr std::array kPortableErrors {
  std::pair { std::errc::no_such_file_or_directory, FileError::kNotFound },
  std::pair { std::errc::file_exists, FileError::kAlreadyExists },
  std::pair { std::errc::is_a_directory, FileError::kIsDirectory },
  std::pair { std::errc::not_a_directory, FileError::kNotDirectory },
  std::pair { std::errc::permission_denied, FileError::kAccessDenied },
  std::pair { std::errc::operation_not_permitted, FileError::kAccessDenied },
  std::pair { std::errc::read_only_file_system, FileError::kReadOnly },
  std::pair { std::errc::too_many_files_open, FileError::kTooManyOpenFiles },
  std::pair {
    std::errc::too_many_files_open_in_system, FileError::kTooManyOpenFiles },
  std::pair { std::errc::no_space_on_device, FileError::kNoSpace },
  std::pair { std::errc::invalid_argument, FileError::kInvalidPath },
  std::pair { std::errc::filename_too_long, FileError::kPathTooLong },
  std::pair { std::errc::io_error, FileError::kIOError },
  std::pair { std::errc::timed_out, FileError::kTimedOut },
  std::pair { std::errc::operation_canceled, FileError::kCancelled },
};

#ifdef _WIN32
constexpr std::array<std::pair<int, FileError>, 18> kWindowsErrors { {
  { ERROR_FILE_NOT_FOUND, FileError::kNotFound },
  { ERROR_PATH_NOT_FOUND, FileError::kNotFound },
  { ERROR_BAD_NETPATH, FileError::kNotFound },
  { ERROR_FILE_EXISTS, FileError::kAlreadyExists },
  { ERROR_ALREADY_EXISTS, FileError::kAlreadyExists },
  { ERROR_DIRECTORY, FileError::kIsDirectory },
  { ERROR_ACCESS_DENIED, FileError::kAccessDenied },
  { ERROR_SHARING_VIOLATION, FileError::kAccessDenied },
  { ERROR_WRITE_PROTECT, FileError::kReadOnly },
  { ERROR_TOO_MANY_OPEN_FILES, FileError::kTooManyOpenFiles },
  { ERROR_DISK_FULL, FileError::kNoSpace },
  { ERROR_HANDLE_DISK_FULL, FileError::kNoSpace },
  { ERROR_INVALID_NAME, FileError::kInvalidPath },
  { ERROR_BAD_PATHNAME, FileError::kInvalidPath },
  { ERROR_FILENAME_EXCED_RANGE, FileError::kPathTooLong },
  { ERROR_SEM_TIMEOUT, FileError::kTimedOut },
  { ERROR_OPERATION_ABORTED, FileError::kCancelled },
  { ERROR_CANCELLED, FileError::kCancelled },
} };
#endif

template <typename Table, typename Value>
auto Lookup(const Table& table, const Value value) -> FileError
{
  const auto it = std::ranges::find(table, value, &Table::value_type::first);
  return it == table.end() ? FileError::kUnknown : it->second;
}

} // namespace

namespace vellum::publish {

auto to_string(const FileError value) -> const char*
{
  switch (value) {
  case FileError::kOk:
    return "OK";
  case FileError::kNotFound:
    return "NotFound";
  case FileError::kAlreadyExists:
    return "AlreadyExists";
  case FileError::kIsDirectory:
    return "IsDirectory";
  case FileError::kNotDirectory:
    return "NotDirectory";
  case FileError::kAccessDenied:
    return "AccessDenied";
  case FileError::kReadOnly:
    return "ReadOnly";
  case FileError::kTooManyOpenFiles:
    return "TooManyOpenFiles";
  case FileError::kNoSpace:
    return "NoSpace";
  case FileError::kInvalidPath:
    return "InvalidPath";
  case FileError::kPathTooLong:
    return "PathTooLong";
  case FileError::kIOError:
    return "IOError";
  case FileError::kTimedOut:
    return "TimedOut";
  case FileError::kCancelled:
    return "Cancelled";
  case FileError::kUnknown:
    return "Unknown";
  }
  return "__NotSupported__";
}

auto FileErrorInfo::ToString() const -> std::string
{
  if (!IsError()) {
    return to_string(code);
  }
  auto out = fmt::memory_buffer();
  fmt::format_to(std::back_inserter(out), "{}", to_string(code));
  if (!path.empty()) {
    fmt::format_to(std::back_inserter(out), ": '{}'", path.string());
  }
  if (!message.empty()) {
    fmt::format_to(std::back_inserter(out), " - {}", message);
  }
  if (system_error) {
    fmt::format_to(
      std::back_inserter(out), " (system: {})", system_error.message());
  }
  return fmt::to_string(out);
}

auto MapSystemError(const std::error_code ec) -> FileError
{
  if (!ec) {
    return FileError::kOk;
  }
#ifdef _WIN32
  if (ec.category() == std::system_category()) {
    return Lookup(kWindowsErrors, ec.value());
  }
#else
  // errno values also come back in the system category.
  if (ec.category() == std::system_category()) {
    return Lookup(kPortableErrors, static_cast<std::errc>(ec.value()));
  }
#endif
  if (ec.category() == std::generic_category()) {
    return Lookup(kPortableErrors, static_cast<std::errc>(ec.value()));
  }
  return FileError::kUnknown;
}

auto MakeFileError(const std::filesystem::path& path, const std::error_code ec)
  -> FileErrorInfo
{
  return {
    .code = MapSystemError(ec),
    .path = path,
    .system_error = ec,
    .message = ec.message(),
  };
}

auto MakeFileError(const std::filesystem::path& path, const FileError code,
  std::string message) -> FileErrorInfo
{
  return {
    .code = code,
    .path = path,
    .message = std::move(message),
  };
}

} // namespace vellum::publish
