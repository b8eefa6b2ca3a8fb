//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <utility>

#include <Vellum/Base/Logging.h>
#include <Vellum/Path/PathMapper.h>

namespace {

auto IsSeparator(const char ch) -> bool { return ch == '/' || ch == '\\'; }

auto FoldChar(const char ch) -> char
{
  if (IsSeparator(ch)) {
    return '/';
  }
  if (ch >= 'A' && ch <= 'Z') {
    return static_cast<char>(ch - 'A' + 'a');
  }
  return ch;
}

auto MatchesPrefix(const std::string_view path, const std::string_view prefix)
  -> bool
{
  if (prefix.size() > path.size()) {
    return false;
  }
  for (std::size_t i = 0; i < prefix.size(); ++i) {
    if (FoldChar(path[i]) != FoldChar(prefix[i])) {
      return false;
    }
  }
  return path.size() == prefix.size() || IsSeparator(prefix.back())
    || IsSeparator(path[prefix.size()]);
}

auto SwapPrefix(const std::string_view path, const std::string_view from,
  const std::string_view to) -> std::string
{
  std::string result(to);
  result.append(path.substr(from.size()));
  return result;
}

} // namespace

namespace vellum::path {

PathMapper::PathMapper(std::vector<PathMapping> mappings)
{
  for (auto& mapping : mappings) {
    if (mapping.unc_prefix.empty() || mapping.mapped_drive_prefix.empty()) {
      LOG_F(WARNING, "ignoring incomplete path mapping '{}' <-> '{}'",
        mapping.unc_prefix, mapping.mapped_drive_prefix);
      continue;
    }
    mappings_.push_back(std::move(mapping));
  }
}

auto PathMapper::ToMappedDrive(const std::string_view path) const
  -> std::string
{
  const auto it = std::ranges::find_if(mappings_,
    [&](const PathMapping& m) { return MatchesPrefix(path, m.unc_prefix); });
  if (it == mappings_.end()) {
    return std::string(path);
  }
  auto mapped = SwapPrefix(path, it->unc_prefix, it->mapped_drive_prefix);
  DLOG_F(1, "mapped '{}' -> '{}'", path, mapped);
  return mapped;
}

auto PathMapper::ToUnc(const std::string_view path) const -> std::string
{
  const auto it = std::ranges::find_if(mappings_, [&](const PathMapping& m) {
    return MatchesPrefix(path, m.mapped_drive_prefix);
  });
  if (it == mappings_.end()) {
    return std::string(path);
  }
  return SwapPrefix(path, it->mapped_drive_prefix, it->unc_prefix);
}

} // namespace vellum::path
