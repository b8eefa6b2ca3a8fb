//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <Vellum/Base/Macros.h>
#include <Vellum/Path/FieldValue.h>
#include <Vellum/Path/PathMapper.h>
#include <Vellum/Path/TemplateRegistry.h>
#include <Vellum/Publish/ExportPreset.h>
#include <Vellum/Publish/ExportTrigger.h>
#include <Vellum/Publish/FileCommitter.h>
#include <Vellum/Publish/FileSystem.h>
#include <Vellum/Publish/IdentityLock.h>
#include <Vellum/Publish/PublishIdentity.h>
#include <Vellum/Publish/PublishSettings.h>
#include <Vellum/Publish/RegistryClient.h>
#include <Vellum/Publish/TextureSet.h>
#include <Vellum/Publish/VersionResolver.h>
#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! Steps of a publish.
enum class PublishState : uint8_t {
  kValidate = 0,
  kExportScan,
  kStage,
  kCommit,
  kRegister,
  kDone,
  kFailed,
};

//! String representation of enum values in `PublishState`.
VLLM_PUBL_NDAPI auto to_string(PublishState value) -> const char*;

//! Called on every state change of a publish, on the publishing thread.
using StateObserver = std::function<void(PublishState)>;

//! Publish of a saved project file.
struct ProjectPublishRequest {
  //! Saved project file; must match the project work template.
  std::filesystem::path work_file;

  //! Fields not carried by the work path. Values read from the path win.
  path::Fields context;

  std::string comment;
  std::stop_token stop;
  StateObserver observer;
};

//! Export and publish of one texture set.
struct TextureSetPublishRequest {
  //! Texture set as named by the painting application.
  std::string texture_set;

  //! Layer stacks of the texture set, if it has several.
  std::vector<std::string> stacks;

  ExportPreset preset;

  //! Context fields: asset, task and whatever the templates need.
  path::Fields context;

  std::string comment;

  //! Project publish the textures derive from. When set, the texture set is
  //! published with the same version and linked to it.
  std::optional<PublishedRecord> project_publish;

  //! Every texture set of the project, used to split file names.
  std::vector<std::string> known_texture_sets;

  std::stop_token stop;
  StateObserver observer;
};

//! Outcome of a successful publish.
struct PublishResult {
  PublishIdentity identity;
  int version = 0;

  //! Committed destination files.
  std::vector<std::filesystem::path> files;

  //! Created records, in creation order. For a texture set, the map records
  //! come first and the texture set record last.
  std::vector<PublishedRecord> records;
};

//! Runs publishes through validate, export scan, stage, commit and register.
/*!
 ### Guarantees
 - Nothing is written before COMMIT. Failures and cancellation before COMMIT
   have no side effect.
 - COMMIT is all or nothing (see `FileCommitter`).
 - Version allocation and COMMIT run under the lock of the publish identity,
   so concurrent publishes of one identity get distinct, consecutive versions.
   Registration runs outside the lock.
 - A registration failure keeps the committed files and throws
   `RegistrationError`, which can be resumed with `RetryRegistration()`.

 ### Thread Safety
 Publishes may run concurrently from several threads on one orchestrator.
*/
class PublishOrchestrator {
public:
  VLLM_PUBL_API PublishOrchestrator(
    std::shared_ptr<const path::TemplateRegistry> templates,
    PublishSettings settings, std::shared_ptr<IRegistryClient> registry,
    std::shared_ptr<IExportTrigger> exporter,
    std::shared_ptr<IFileSystem> file_system
    = std::make_shared<LocalFileSystem>());

  ~PublishOrchestrator() = default;

  VELLUM_MAKE_NON_COPYABLE(PublishOrchestrator)
  VELLUM_MAKE_NON_MOVABLE(PublishOrchestrator)

  //! Copy a saved project file to its next versioned publish path and
  //! register it.
  /*!
   @throw ValidationError if the work file is missing or does not match the
     work template.
   @throw VersionQueryError, PublishIOError, PublishCancelledError,
     RegistrationError as described in the class documentation.
  */
  VLLM_PUBL_API auto PublishProject(const ProjectPublishRequest& request)
    -> PublishResult;

  //! Export a texture set, then publish every map and the texture set.
  /*!
   @throw ValidationError if the preset or the context is not usable.
   @throw ExportError if the export fails or yields no file of the set.
   @throw PatternMismatchError if any exported file is misnamed.
   @throw InconsistentTextureSetError if the maps cannot be grouped.
   @throw VersionQueryError, PublishIOError, PublishCancelledError,
     RegistrationError as described in the class documentation.
  */
  VLLM_PUBL_API auto PublishTextureSet(const TextureSetPublishRequest& request)
    -> PublishResult;

  //! Create the records a failed registration did not create.
  /*!
   @throw RegistrationError if the registry fails again; its payload can be
     retried in turn.
  */
  VLLM_PUBL_API auto RetryRegistration(PendingRegistration pending)
    -> PublishResult;

  [[nodiscard]] auto Settings() const noexcept -> const PublishSettings&
  {
    return settings_;
  }

private:
  struct StagedTextureSet;

  [[nodiscard]] auto ExportAndScan(const TextureSetPublishRequest& request,
    const PublishIdentity& identity) const -> TextureSet;

  [[nodiscard]] auto StageTextureSet(const TextureSetPublishRequest& request,
    const TextureSet& texture_set, int version) const -> StagedTextureSet;

  auto Register(PendingRegistration& pending) const -> void;

  std::shared_ptr<const path::TemplateRegistry> templates_;
  PublishSettings settings_;
  std::shared_ptr<IRegistryClient> registry_;
  std::shared_ptr<IExportTrigger> exporter_;
  std::shared_ptr<IFileSystem> file_system_;
  path::PathMapper path_mapper_;
  VersionResolver versions_;
  FileCommitter committer_;
  mutable IdentityLockTable locks_;
};

} // namespace vellum::publish
