//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include <Vellum/Base/Macros.h>
#include <Vellum/Publish/PublishIdentity.h>
#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! One exclusive lock per publish identity.
/*!
 Serializes version allocation and file commit for publishes that share an
 identity. Publishes with different identities never wait on each other.

 ```cpp
 auto guard = locks.Acquire(identity, settings.io_timeout);
 const auto version = resolver.NextVersion(query);
 committer.Commit(items, stop, identity);
 // guard released here
 ```
*/
class IdentityLockTable {
public:
  //! Holds the lock of one identity until destroyed.
  class Guard {
  public:
    Guard() = default;
    ~Guard() { Release(); }

    VELLUM_MAKE_NON_COPYABLE(Guard)

    Guard(Guard&& other) noexcept
      : table_(std::exchange(other.table_, nullptr))
      , identity_(std::move(other.identity_))
      , mutex_(std::move(other.mutex_))
    {
    }

    auto operator=(Guard&& other) noexcept -> Guard&
    {
      if (this != &other) {
        Release();
        table_ = std::exchange(other.table_, nullptr);
        identity_ = std::move(other.identity_);
        mutex_ = std::move(other.mutex_);
      }
      return *this;
    }

    [[nodiscard]] auto OwnsLock() const noexcept -> bool
    {
      return mutex_ != nullptr;
    }

    //! Unlock, and drop the identity's slot when nobody else is waiting on it.
    VLLM_PUBL_API auto Release() noexcept -> void;

  private:
    friend class IdentityLockTable;
    Guard(IdentityLockTable* table, PublishIdentity identity,
      std::shared_ptr<std::timed_mutex> mutex)
      : table_(table)
      , identity_(std::move(identity))
      , mutex_(std::move(mutex))
    {
    }

    IdentityLockTable* table_ { nullptr };
    PublishIdentity identity_ {};
    std::shared_ptr<std::timed_mutex> mutex_;
  };

  IdentityLockTable() = default;
  ~IdentityLockTable() = default;

  VELLUM_MAKE_NON_COPYABLE(IdentityLockTable)
  VELLUM_MAKE_NON_MOVABLE(IdentityLockTable)

  //! Lock `identity`, waiting at most `timeout`.
  /*!
   @throw PublishIOError with a `kTimedOut` failure if the lock could not be
     acquired in time.
  */
  VLLM_PUBL_NDAPI auto Acquire(
    const PublishIdentity& identity, std::chrono::milliseconds timeout)
    -> Guard;

  //! Number of identities currently locked or waited on.
  VLLM_PUBL_NDAPI auto Size() -> std::size_t;

private:
  auto Forget(const PublishIdentity& identity,
    std::shared_ptr<std::timed_mutex>& mutex) noexcept -> void;

  std::mutex table_mutex_;
  std::unordered_map<PublishIdentity, std::shared_ptr<std::timed_mutex>,
    PublishIdentityHash>
    locks_;
};

} // namespace vellum::publish
