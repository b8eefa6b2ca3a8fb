//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <limits>
#include <optional>
#include <set>
#include <system_error>
#include <utility>
#include <variant>

#include <fmt/format.h>

#include <Vellum/Base/Logging.h>
#include <Vellum/Publish/PublishErrors.h>
#include <Vellum/Publish/VersionResolver.h>

namespace fs = std::filesystem;

using vellum::path::Fields;
using vellum::path::Template;
using vellum::publish::VersionQuery;

namespace {

auto IsStrayTemp(const fs::path& path) -> bool
{
  return path.filename().string().ends_with(".vellum-tmp");
}

//! True if `extracted` agrees with every query field the template uses.
auto SameIdentity(const Template& tmpl, const VersionQuery& query,
  const Fields& extracted) -> bool
{
  for (const auto& name : tmpl.FieldNames()) {
    if (name == query.version_field) {
      continue;
    }
    const auto wanted = query.fields.find(name);
    if (wanted == query.fields.end()) {
      continue;
    }
    const auto found = extracted.find(name);
    if (found == extracted.end()
      || vellum::path::to_string(found->second)
        != vellum::path::to_string(wanted->second)) {
      return false;
    }
  }
  return true;
}

auto ScanVersions(const Template& tmpl, const VersionQuery& query)
  -> std::set<int>
{
  const auto root = tmpl.ResolvePrefix(query.fields);
  if (root.empty()) {
    throw vellum::publish::VersionQueryError(
      fmt::format("template '{}' does not determine a directory to scan",
        tmpl.Name()),
      query.identity);
  }

  std::set<int> versions;
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    DLOG_F(1, "version scan root '{}' does not exist", root);
    return versions;
  }

  const auto deadline = std::chrono::steady_clock::now() + query.timeout;
  fs::recursive_directory_iterator it(
    root, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (std::chrono::steady_clock::now() >= deadline) {
      throw vellum::publish::VersionQueryError(
        fmt::format("scan of '{}' timed out after {} ms", root,
          query.timeout.count()),
        query.identity);
    }
    const auto& path = it->path();
    if (path.filename().string().starts_with('.')) {
      if (IsStrayTemp(path)) {
        LOG_F(WARNING, "skipping stray temporary file '{}'", path.string());
      }
      std::error_code type_ec;
      if (it->is_directory(type_ec)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    const auto extracted = tmpl.TryExtract(path.generic_string());
    if (!extracted || !SameIdentity(tmpl, query, *extracted)) {
      continue;
    }
    const auto version = extracted->find(query.version_field);
    if (version == extracted->end()
      || !vellum::path::IsInteger(version->second)) {
      continue;
    }
    const auto value = std::get<std::int64_t>(version->second);
    if (value > std::numeric_limits<int>::max()) {
      LOG_F(WARNING, "skipping '{}': version {} is out of range",
        path.string(), value);
      continue;
    }
    versions.insert(static_cast<int>(value));
  }
  if (ec) {
    throw vellum::publish::VersionQueryError(
      fmt::format("cannot scan '{}': {}", root, ec.message()), query.identity);
  }
  return versions;
}

} // namespace

namespace vellum::publish {

VersionResolver::VersionResolver(
  std::shared_ptr<const path::TemplateRegistry> templates,
  std::shared_ptr<IRegistryClient> registry)
  : templates_(std::move(templates))
  , registry_(std::move(registry))
{
  CHECK_NOTNULL_F(templates_.get());
}

auto VersionResolver::CurrentVersions(const VersionQuery& query) const
  -> std::vector<int>
{
  const auto versions
    = ScanVersions(templates_->GetTemplate(query.template_name), query);
  return { versions.begin(), versions.end() };
}

auto VersionResolver::NextVersion(const VersionQuery& query) const -> int
{
  const auto on_disk
    = ScanVersions(templates_->GetTemplate(query.template_name), query);
  const int disk_max = on_disk.empty() ? 0 : *on_disk.rbegin();

  int registry_max = 0;
  if (registry_) {
    std::optional<int> reported;
    try {
      reported = registry_->QueryMaxVersion(query.identity);
    } catch (const std::exception& ex) {
      LOG_F(ERROR, "version query for {} failed: {}",
        to_string(query.identity), ex.what());
      throw VersionQueryError(
        fmt::format("registry could not report versions of {}: {}",
          to_string(query.identity), ex.what()),
        query.identity);
    }
    registry_max = reported.value_or(0);
    if (registry_max > disk_max) {
      LOG_F(WARNING,
        "registry knows version {} of {} but the publish area only has {}",
        registry_max, to_string(query.identity), disk_max);
    }
  }

  const auto next = std::max(disk_max, registry_max) + 1;
  DLOG_F(1, "next version of {} is {}", to_string(query.identity), next);
  return next;
}

} // namespace vellum::publish
