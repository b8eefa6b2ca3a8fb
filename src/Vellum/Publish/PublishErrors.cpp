//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <fmt/format.h>

#include <Vellum/Publish/PublishErrors.h>

namespace {

auto DescribeMismatches(
  const std::vector<vellum::publish::PatternMismatch>& mismatches)
  -> std::string
{
  auto message = fmt::format(
    "{} exported file(s) do not follow the naming convention "
    "'<textureSet>_<mapName>_<colorSpace>[.<udim>].<ext>'",
    mismatches.size());
  for (const auto& mismatch : mismatches) {
    message += fmt::format(
      "\n  {}: {}", mismatch.path.filename().string(), mismatch.reason);
  }
  return message;
}

auto DescribeCommitFailure(
  const std::vector<vellum::publish::FileErrorInfo>& failures,
  const std::size_t rolled_back,
  const std::vector<vellum::publish::FileErrorInfo>& rollback_failures)
  -> std::string
{
  auto message = fmt::format("commit failed with {} error(s)", failures.size());
  if (!failures.empty()) {
    message += fmt::format(" (first: {})", failures.front().ToString());
  }
  message += fmt::format("; {} file(s) rolled back", rolled_back);
  if (!rollback_failures.empty()) {
    message += fmt::format(
      "; {} rollback failure(s), publish area needs cleanup (first: {})",
      rollback_failures.size(), rollback_failures.front().ToString());
  }
  return message;
}

auto DescribeCancellation(
  const std::optional<vellum::publish::PublishIdentity>& identity,
  const std::vector<vellum::publish::FileErrorInfo>& rollback_failures)
  -> std::string
{
  auto message = identity
    ? fmt::format("publish {} was cancelled", to_string(*identity))
    : std::string("publish was cancelled");
  if (!rollback_failures.empty()) {
    message += fmt::format(
      "; {} rollback failure(s), publish area needs cleanup (first: {})",
      rollback_failures.size(), rollback_failures.front().ToString());
  }
  return message;
}

} // namespace

namespace vellum::publish {

PatternMismatchError::PatternMismatchError(
  std::vector<PatternMismatch> mismatches,
  std::optional<PublishIdentity> identity)
  : PublishError(DescribeMismatches(mismatches), std::move(identity))
  , mismatches_(std::move(mismatches))
{
}

InconsistentTextureSetError::InconsistentTextureSetError(
  std::string texture_set, std::string map_name,
  const std::optional<uint32_t> udim, std::string reason)
  : PublishError(fmt::format("texture set '{}', map '{}'{}: {}", texture_set,
      map_name, udim ? fmt::format(" (tile {})", *udim) : std::string {},
      reason))
  , texture_set_(std::move(texture_set))
  , map_name_(std::move(map_name))
  , udim_(udim)
  , reason_(std::move(reason))
{
}

PublishIOError::PublishIOError(std::vector<FileErrorInfo> failures,
  std::vector<std::filesystem::path> rolled_back,
  std::vector<FileErrorInfo> rollback_failures,
  std::optional<PublishIdentity> identity)
  : PublishError(
      DescribeCommitFailure(failures, rolled_back.size(), rollback_failures),
      std::move(identity))
  , failures_(std::move(failures))
  , rolled_back_(std::move(rolled_back))
  , rollback_failures_(std::move(rollback_failures))
{
}

RegistrationError::RegistrationError(
  const std::string& cause, PendingRegistration pending)
  : PublishError(fmt::format("registration of {} v{} failed after {} of {} "
                             "record(s); {} committed file(s) kept: {}",
                   to_string(pending.identity), pending.version,
                   pending.created.size(), pending.records.size(),
                   pending.copied.size(), cause),
      pending.identity)
  , pending_(std::move(pending))
{
}

PublishCancelledError::PublishCancelledError(
  std::optional<PublishIdentity> identity,
  std::vector<std::filesystem::path> rolled_back,
  std::vector<FileErrorInfo> rollback_failures)
  : PublishError(DescribeCancellation(identity, rollback_failures), identity)
  , rolled_back_(std::move(rolled_back))
  , rollback_failures_(std::move(rollback_failures))
{
}

} // namespace vellum::publish
