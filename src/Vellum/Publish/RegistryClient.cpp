//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <Vellum/Base/Logging.h>
#include <Vellum/Publish/RegistryClient.h>

namespace vellum::publish {

auto InMemoryRegistryClient::CreateRecord(const RecordRequest& request)
  -> RecordId
{
  std::scoped_lock lock(mutex_);
  const auto id = next_id_++;
  records_.emplace(id, PublishedRecord { .id = id, .request = request });
  DLOG_F(1, "record {} created: {} '{}' v{}", id, request.publish_type,
    request.name, request.version);
  return id;
}

auto InMemoryRegistryClient::QueryMaxVersion(const PublishIdentity& identity)
  -> std::optional<int>
{
  std::scoped_lock lock(mutex_);
  std::optional<int> max_version;
  for (const auto& [id, record] : records_) {
    if (record.request.identity == identity) {
      max_version = std::max(max_version.value_or(0), record.request.version);
    }
  }
  return max_version;
}

auto InMemoryRegistryClient::Records() const -> std::vector<PublishedRecord>
{
  std::scoped_lock lock(mutex_);
  std::vector<PublishedRecord> records;
  records.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    records.push_back(record);
  }
  return records;
}

auto InMemoryRegistryClient::Find(const RecordId id) const
  -> std::optional<PublishedRecord>
{
  std::scoped_lock lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto InMemoryRegistryClient::Size() const -> std::size_t
{
  std::scoped_lock lock(mutex_);
  return records_.size();
}

} // namespace vellum::publish
