//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include <Vellum/Base/Macros.h>

namespace vellum::testing {

//! Fresh directory under the system temp directory, removed on destruction.
/*!
 Each instance gets a distinct directory, so tests may run in parallel
 processes without sharing state.
*/
class TempDirectory {
public:
  explicit TempDirectory(const std::string_view prefix = "vellum_tests")
  {
    static std::atomic<unsigned> counter { 0 };
    std::random_device entropy;
    const auto unique
      = fmt::format("{}_{:08x}_{}", prefix, entropy(), counter.fetch_add(1));
    path_ = std::filesystem::temp_directory_path() / unique;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::create_directories(path_);
  }

  VELLUM_MAKE_NON_COPYABLE(TempDirectory)
  VELLUM_MAKE_NON_MOVABLE(TempDirectory)

  ~TempDirectory()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  [[nodiscard]] auto Path() const noexcept -> const std::filesystem::path&
  {
    return path_;
  }

  //! Create a file (and its parent directories) holding `content`.
  auto WriteFile(const std::filesystem::path& relative,
    const std::string_view content = "data") const -> std::filesystem::path
  {
    const auto full = path_ / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return full;
  }

  //! Read a whole file back as a string.
  [[nodiscard]] static auto ReadFile(const std::filesystem::path& file)
    -> std::string
  {
    std::ifstream in(file, std::ios::binary);
    return { std::istreambuf_iterator<char>(in),
      std::istreambuf_iterator<char>() };
  }

private:
  std::filesystem::path path_;
};

} // namespace vellum::testing
