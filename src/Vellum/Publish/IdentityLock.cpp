//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <fmt/format.h>

#include <Vellum/Base/Logging.h>
#include <Vellum/Publish/IdentityLock.h>
#include <Vellum/Publish/PublishErrors.h>

namespace vellum::publish {

auto IdentityLockTable::Acquire(const PublishIdentity& identity,
  const std::chrono::milliseconds timeout) -> Guard
{
  std::shared_ptr<std::timed_mutex> mutex;
  {
    std::scoped_lock lock(table_mutex_);
    auto& slot = locks_[identity];
    if (!slot) {
      slot = std::make_shared<std::timed_mutex>();
    }
    mutex = slot;
  }

  if (!mutex->try_lock_for(timeout)) {
    Forget(identity, mutex);
    LOG_F(WARNING, "timed out after {} ms waiting for the lock of {}",
      timeout.count(), to_string(identity));
    throw PublishIOError(
      { MakeFileError({}, FileError::kTimedOut,
        fmt::format("another publish of {} holds the lock",
          to_string(identity))) },
      {}, {}, identity);
  }
  DLOG_F(2, "locked {}", to_string(identity));
  return Guard(this, identity, std::move(mutex));
}

auto IdentityLockTable::Size() -> std::size_t
{
  std::scoped_lock lock(table_mutex_);
  return locks_.size();
}

auto IdentityLockTable::Forget(const PublishIdentity& identity,
  std::shared_ptr<std::timed_mutex>& mutex) noexcept -> void
{
  std::scoped_lock lock(table_mutex_);
  mutex.reset();
  // Waiters copy the slot under `table_mutex_`, so a count of one means the
  // table holds the only reference.
  if (const auto it = locks_.find(identity);
    it != locks_.end() && it->second.use_count() == 1) {
    locks_.erase(it);
  }
}

auto IdentityLockTable::Guard::Release() noexcept -> void
{
  if (!mutex_) {
    return;
  }
  mutex_->unlock();
  if (table_ != nullptr) {
    table_->Forget(identity_, mutex_);
    table_ = nullptr;
  } else {
    mutex_.reset();
  }
}

} // namespace vellum::publish
