//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <Vellum/Publish/ExportedFile.h>
#include <Vellum/Publish/FileError.h>
#include <Vellum/Publish/PublishIdentity.h>
#include <Vellum/Publish/RegistryClient.h>
#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! Base class of all publish failures.
/*!
 Carries the identity of the publish when it was known at the time of the
 failure.
*/
class PublishError : public std::runtime_error {
public:
  explicit PublishError(const std::string& message,
    std::optional<PublishIdentity> identity = std::nullopt)
    : std::runtime_error(message)
    , identity_(std::move(identity))
  {
  }

  [[nodiscard]] auto Identity() const noexcept
    -> const std::optional<PublishIdentity>&
  {
    return identity_;
  }

private:
  std::optional<PublishIdentity> identity_;
};

//! Pre-flight check failed; nothing was exported, copied or registered.
class ValidationError final : public PublishError {
public:
  using PublishError::PublishError;
};

//! Exported files do not follow the naming convention.
class PatternMismatchError final : public PublishError {
public:
  VLLM_PUBL_API explicit PatternMismatchError(
    std::vector<PatternMismatch> mismatches,
    std::optional<PublishIdentity> identity = std::nullopt);

  //! Every offending file, not only the first.
  [[nodiscard]] auto Mismatches() const noexcept
    -> const std::vector<PatternMismatch>&
  {
    return mismatches_;
  }

private:
  std::vector<PatternMismatch> mismatches_;
};

//! Exported files cannot be grouped into a consistent texture set.
class InconsistentTextureSetError final : public PublishError {
public:
  VLLM_PUBL_API InconsistentTextureSetError(std::string texture_set,
    std::string map_name, std::optional<uint32_t> udim, std::string reason);

  [[nodiscard]] auto TextureSet() const noexcept -> const std::string&
  {
    return texture_set_;
  }

  [[nodiscard]] auto MapName() const noexcept -> const std::string&
  {
    return map_name_;
  }

  [[nodiscard]] auto Udim() const noexcept -> std::optional<uint32_t>
  {
    return udim_;
  }

  [[nodiscard]] auto Reason() const noexcept -> const std::string&
  {
    return reason_;
  }

private:
  std::string texture_set_;
  std::string map_name_;
  std::optional<uint32_t> udim_;
  std::string reason_;
};

//! File commit failed (or a lock timed out) and was rolled back.
/*!
 `RolledBack()` lists the destination paths removed by the rollback. When
 `RollbackFailures()` is not empty, some files or directories created by the
 operation could not be removed and the publish area needs attention.
*/
class PublishIOError final : public PublishError {
public:
  VLLM_PUBL_API PublishIOError(std::vector<FileErrorInfo> failures,
    std::vector<std::filesystem::path> rolled_back,
    std::vector<FileErrorInfo> rollback_failures,
    std::optional<PublishIdentity> identity = std::nullopt);

  [[nodiscard]] auto Failures() const noexcept
    -> const std::vector<FileErrorInfo>&
  {
    return failures_;
  }

  [[nodiscard]] auto RolledBack() const noexcept
    -> const std::vector<std::filesystem::path>&
  {
    return rolled_back_;
  }

  [[nodiscard]] auto RollbackFailures() const noexcept
    -> const std::vector<FileErrorInfo>&
  {
    return rollback_failures_;
  }

  //! True when no trace of the failed operation is left on disk.
  [[nodiscard]] auto IsClean() const noexcept -> bool
  {
    return rollback_failures_.empty();
  }

private:
  std::vector<FileErrorInfo> failures_;
  std::vector<std::filesystem::path> rolled_back_;
  std::vector<FileErrorInfo> rollback_failures_;
};

//! Files were committed but the registry could not record them.
/*!
 The committed files stay in place. Pass `Pending()` to
 `PublishOrchestrator::RetryRegistration()` to resume without copying again.
*/
class RegistrationError final : public PublishError {
public:
  VLLM_PUBL_API RegistrationError(
    const std::string& cause, PendingRegistration pending);

  [[nodiscard]] auto Pending() const noexcept -> const PendingRegistration&
  {
    return pending_;
  }

  //! Destination paths committed by the publish.
  [[nodiscard]] auto CopiedPaths() const noexcept
    -> const std::vector<std::filesystem::path>&
  {
    return pending_.copied;
  }

private:
  PendingRegistration pending_;
};

//! The registry could not report existing versions; no version was guessed.
class VersionQueryError final : public PublishError {
public:
  using PublishError::PublishError;
};

//! The export step failed or produced no file for the texture set.
class ExportError final : public PublishError {
public:
  using PublishError::PublishError;
};

//! The publish was cancelled and what it wrote was rolled back.
/*!
 When `RollbackFailures()` is not empty, some committed files or created
 directories could not be removed and remain in the publish area.
*/
class PublishCancelledError final : public PublishError {
public:
  VLLM_PUBL_API explicit PublishCancelledError(
    std::optional<PublishIdentity> identity = std::nullopt,
    std::vector<std::filesystem::path> rolled_back = {},
    std::vector<FileErrorInfo> rollback_failures = {});

  [[nodiscard]] auto RolledBack() const noexcept
    -> const std::vector<std::filesystem::path>&
  {
    return rolled_back_;
  }

  [[nodiscard]] auto RollbackFailures() const noexcept
    -> const std::vector<FileErrorInfo>&
  {
    return rollback_failures_;
  }

  //! True when nothing written by the cancelled publish is left on disk.
  [[nodiscard]] auto IsClean() const noexcept -> bool
  {
    return rollback_failures_.empty();
  }

private:
  std::vector<std::filesystem::path> rolled_back_;
  std::vector<FileErrorInfo> rollback_failures_;
};

} // namespace vellum::publish
