//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <Vellum/Publish/PublishIdentity.h>
#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! Identifier assigned by the registry to a published record.
using RecordId = std::int64_t;

//! Metadata describing one published artifact.
struct RecordRequest {
  TemplateFamily family = TemplateFamily::kProject;

  //! Registry type label, e.g. `Texture` or `Texture Set`.
  std::string publish_type;

  //! Display name, e.g. `hull_texturing_hull_Normal`.
  std::string name;

  //! Published path. Tiled maps use their abstract `<UDIM>` path.
  std::string path;

  int version = 0;
  std::string comment;

  //! Record this artifact was derived from (the project publish).
  std::optional<RecordId> upstream;

  //! Records this artifact groups.
  std::vector<RecordId> children;

  //! Version scope of the artifact.
  PublishIdentity identity;

  //! When set, `children` is filled at registration time with every record
  //! created earlier in the same registration.
  bool links_previous = false;

  [[nodiscard]] auto operator==(const RecordRequest&) const -> bool = default;
};

//! A record as stored by the registry.
struct PublishedRecord {
  RecordId id = 0;
  RecordRequest request;
};

//! Registration state of a committed publish.
/*!
 Records are created in order. `created` holds the ids of the records already
 created, so `records[created.size()]` is the next one to create. A pending
 registration is carried by `RegistrationError` and handed back to
 `PublishOrchestrator::RetryRegistration()`; the files in `copied` are never
 copied again.
*/
struct PendingRegistration {
  PublishIdentity identity;
  int version = 0;
  std::vector<std::filesystem::path> copied;
  std::vector<RecordRequest> records;
  std::vector<RecordId> created;

  [[nodiscard]] auto IsComplete() const noexcept -> bool
  {
    return created.size() >= records.size();
  }
};

//! Client of the published-file metadata service.
/*!
 Calls may be slow or fail. Implementations report failures by throwing any
 `std::exception`; the publish layer translates them to `RegistrationError`
 or `VersionQueryError`.

 ### Thread Safety
 Implementations must accept concurrent calls from independent publishes.
*/
class IRegistryClient {
public:
  virtual ~IRegistryClient() = default;

  //! Create an immutable record and return its id.
  [[nodiscard]] virtual auto CreateRecord(const RecordRequest& request)
    -> RecordId
    = 0;

  //! Highest registered version for the identity, or nothing if none.
  [[nodiscard]] virtual auto QueryMaxVersion(const PublishIdentity& identity)
    -> std::optional<int>
    = 0;
};

//! Thread-safe registry kept in memory.
/*!
 Useful for tools running without a metadata service and as a reference
 implementation in tests. Ids start at 1 and increase by one per record.
*/
class InMemoryRegistryClient final : public IRegistryClient {
public:
  VLLM_PUBL_NDAPI auto CreateRecord(const RecordRequest& request)
    -> RecordId override;

  VLLM_PUBL_NDAPI auto QueryMaxVersion(const PublishIdentity& identity)
    -> std::optional<int> override;

  //! Snapshot of all records, ordered by id.
  VLLM_PUBL_NDAPI auto Records() const -> std::vector<PublishedRecord>;

  VLLM_PUBL_NDAPI auto Find(RecordId id) const
    -> std::optional<PublishedRecord>;

  VLLM_PUBL_NDAPI auto Size() const -> std::size_t;

private:
  mutable std::mutex mutex_;
  RecordId next_id_ = 1;
  std::map<RecordId, PublishedRecord> records_;
};

} // namespace vellum::publish
