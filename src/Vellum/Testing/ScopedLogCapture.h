//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Vellum/Base/Logging.h>

namespace vellum::testing {

//! Captures loguru messages emitted while it is alive.
/*!
 Installs a loguru callback on construction and removes it on destruction.
 Messages may be logged from any thread; capture is synchronized.

 ```cpp
 ScopedLogCapture capture { "VersionDrift", loguru::Verbosity_WARNING };
 // ... code under test ...
 EXPECT_TRUE(capture.Contains("registry knows version"));
 ```
*/
class ScopedLogCapture {
public:
  //! Install the callback.
  /*!
   @param id Unique id of the callback registration.
   @param max_verbosity Least important verbosity captured (inclusive). Use
     `loguru::Verbosity_WARNING` to capture only warnings and errors.
  */
  explicit ScopedLogCapture(std::string id = "ScopedLogCapture",
    const loguru::Verbosity max_verbosity = loguru::Verbosity_MAX)
    : id_(std::move(id))
  {
    loguru::add_callback(
      id_.c_str(), &ScopedLogCapture::OnLog, this, max_verbosity);
  }

  ScopedLogCapture(const ScopedLogCapture&) = delete;
  auto operator=(const ScopedLogCapture&) -> ScopedLogCapture& = delete;
  ScopedLogCapture(ScopedLogCapture&&) = delete;
  auto operator=(ScopedLogCapture&&) -> ScopedLogCapture& = delete;

  ~ScopedLogCapture() { (void)loguru::remove_callback(id_.c_str()); }

  [[nodiscard]] auto Contains(const std::string_view needle) const -> bool
  {
    return Count(needle) > 0;
  }

  //! Number of captured messages containing `needle`.
  [[nodiscard]] auto Count(const std::string_view needle) const -> size_t
  {
    std::scoped_lock lock(mutex_);
    return static_cast<size_t>(
      std::ranges::count_if(messages_, [needle](const std::string& message) {
        return message.find(needle) != std::string::npos;
      }));
  }

  [[nodiscard]] auto Messages() const -> std::vector<std::string>
  {
    std::scoped_lock lock(mutex_);
    return messages_;
  }

  auto Clear() -> void
  {
    std::scoped_lock lock(mutex_);
    messages_.clear();
  }

private:
  static auto OnLog(void* user_data, const loguru::Message& message) -> void
  {
    auto* self = static_cast<ScopedLogCapture*>(user_data);
    if (self == nullptr || message.message == nullptr) {
      return;
    }
    std::scoped_lock lock(self->mutex_);
    self->messages_.emplace_back(message.message);
  }

  std::string id_;
  mutable std::mutex mutex_;
  std::vector<std::string> messages_;
};

} // namespace vellum::testing
