//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include <Vellum/Base/Logging.h>
#include <Vellum/Publish/FilenamePattern.h>
#include <Vellum/Publish/PublishErrors.h>
#include <Vellum/Publish/Udim.h>

using vellum::publish::ExportScan;
using vellum::publish::ExportedFile;
using vellum::publish::FilenamePatternMatcher;
using vellum::publish::PatternMismatch;

namespace {

auto IsAlnum(const char ch) -> bool
{
  return std::isalnum(static_cast<unsigned char>(ch)) != 0;
}

auto IsSpace(const char ch) -> bool
{
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

auto IsDigit(const char ch) -> bool
{
  return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

//! A `<map>_<color_space>` tail: two non-empty segments, one underscore.
auto SplitMapAndColorSpace(const std::string_view tail)
  -> std::optional<std::pair<std::string_view, std::string_view>>
{
  const auto sep = tail.find('_');
  if (sep == std::string_view::npos || sep == 0 || sep + 1 == tail.size()) {
    return std::nullopt;
  }
  if (tail.find('_', sep + 1) != std::string_view::npos) {
    return std::nullopt;
  }
  return std::pair { tail.substr(0, sep), tail.substr(sep + 1) };
}

auto ParseUdim(const std::string_view text) -> std::optional<uint32_t>
{
  if (text.size() != 4 || !std::ranges::all_of(text, IsDigit)) {
    return std::nullopt;
  }
  uint32_t tile = 0;
  for (const char ch : text) {
    tile = tile * 10 + static_cast<uint32_t>(ch - '0');
  }
  if (!vellum::publish::IsValidUdim(tile)) {
    return std::nullopt;
  }
  return tile;
}

auto SortByFileName(ExportScan& scan) -> void
{
  std::ranges::sort(scan.matched, {},
    [](const ExportedFile& file) { return file.path.filename(); });
  std::ranges::sort(scan.mismatched, {},
    [](const PatternMismatch& mismatch) { return mismatch.path.filename(); });
}

} // namespace

namespace vellum::publish {

FilenamePatternMatcher::FilenamePatternMatcher(Options options)
  : known_texture_sets_(std::move(options.known_texture_sets))
{
  std::erase_if(known_texture_sets_,
    [](const std::string& name) { return name.empty(); });
  std::ranges::stable_sort(known_texture_sets_,
    [](const std::string& a, const std::string& b) {
      return a.size() > b.size();
    });
}

auto FilenamePatternMatcher::Match(const std::filesystem::path& path) const
  -> std::expected<ExportedFile, PatternMismatch>
{
  const auto file_name = path.filename().string();
  const auto mismatch = [&](std::string reason) {
    return std::unexpected(
      PatternMismatch { .path = path, .reason = std::move(reason) });
  };

  if (file_name.empty()) {
    return mismatch("empty file name");
  }
  if (std::ranges::any_of(file_name, IsSpace)) {
    return mismatch("file name contains whitespace");
  }

  const auto ext_dot = file_name.rfind('.');
  if (ext_dot == std::string::npos || ext_dot + 1 == file_name.size()) {
    return mismatch("missing extension");
  }
  const std::string_view name(file_name);
  const auto extension = name.substr(ext_dot + 1);
  if (!std::ranges::all_of(extension, IsAlnum)) {
    return mismatch(fmt::format("extension '{}' is not alphanumeric", extension));
  }

  auto stem = name.substr(0, ext_dot);
  std::optional<uint32_t> udim;
  if (const auto dot = stem.find('.'); dot != std::string_view::npos) {
    const auto tile_text = stem.substr(dot + 1);
    udim = ParseUdim(tile_text);
    if (!udim) {
      return mismatch(fmt::format(
        "'{}' is not a UDIM tile (four digits, 1001 or more)", tile_text));
    }
    stem = stem.substr(0, dot);
  }
  if (stem.empty()) {
    return mismatch("empty stem");
  }

  std::string_view texture_set;
  std::optional<std::pair<std::string_view, std::string_view>> tail;
  for (const auto& known : known_texture_sets_) {
    if (stem.size() > known.size() && stem.starts_with(known)
      && stem[known.size()] == '_') {
      tail = SplitMapAndColorSpace(stem.substr(known.size() + 1));
      if (tail) {
        texture_set = stem.substr(0, known.size());
        break;
      }
    }
  }
  if (!tail) {
    const auto first = stem.find('_');
    if (first == 0 || first == std::string_view::npos) {
      return mismatch(
        "expected <texture_set>_<map_name>_<color_space> in the file stem");
    }
    tail = SplitMapAndColorSpace(stem.substr(first + 1));
    if (!tail) {
      return mismatch(
        "expected <texture_set>_<map_name>_<color_space> in the file stem");
    }
    texture_set = stem.substr(0, first);
  }

  return ExportedFile {
    .path = path,
    .texture_set = std::string(texture_set),
    .map_name = std::string(tail->first),
    .color_space = std::string(tail->second),
    .udim = udim,
    .extension = std::string(extension),
  };
}

auto FilenamePatternMatcher::Parse(const std::filesystem::path& path) const
  -> ExportedFile
{
  auto result = Match(path);
  if (!result) {
    throw PatternMismatchError({ std::move(result.error()) });
  }
  return std::move(*result);
}

auto FilenamePatternMatcher::MatchAll(
  const std::vector<std::filesystem::path>& paths) const -> ExportScan
{
  ExportScan scan;
  for (const auto& path : paths) {
    auto result = Match(path);
    if (result) {
      scan.matched.push_back(std::move(*result));
    } else {
      DLOG_F(1, "not an export file: '{}' ({})", path.string(),
        result.error().reason);
      scan.mismatched.push_back(std::move(result.error()));
    }
  }
  return scan;
}

auto FilenamePatternMatcher::ScanExportArea(
  const std::filesystem::path& directory,
  const std::chrono::milliseconds timeout) const -> ExportScan
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    DLOG_F(1, "export area '{}' does not exist", directory.string());
    return {};
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::vector<fs::path> files;
  fs::directory_iterator it(directory, ec);
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      throw ExportError(
        fmt::format("listing export area '{}' timed out after {} ms",
          directory.string(), timeout.count()));
    }
    const auto& entry = *it;
    if (entry.path().filename().string().starts_with('.')) {
      continue;
    }
    std::error_code type_ec;
    if (entry.is_regular_file(type_ec)) {
      files.push_back(entry.path());
    }
  }
  if (ec) {
    throw ExportError(fmt::format("cannot list export area '{}': {}",
      directory.string(), ec.message()));
  }

  auto scan = MatchAll(files);
  SortByFileName(scan);
  DLOG_F(1, "scanned '{}': {} matched, {} mismatched", directory.string(),
    scan.matched.size(), scan.mismatched.size());
  return scan;
}

} // namespace vellum::publish
