//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include <Vellum/Publish/ExportedFile.h>
#include <Vellum/Publish/api_export.h>

namespace vellum::publish {

//! Result of matching a batch of exported files.
struct ExportScan {
  std::vector<ExportedFile> matched;
  std::vector<PatternMismatch> mismatched;

  //! True when every file follows the naming convention.
  [[nodiscard]] auto Clean() const noexcept -> bool
  {
    return mismatched.empty();
  }
};

//! Parses exported texture file names.
/*!
 Exported files must be named

 ```text
 <texture_set>_<map_name>_<color_space>[.<udim>].<extension>
 ```

 `map_name` and `color_space` never contain `_` or `.`. The UDIM tile, when
 present, is exactly four digits and at least `1001`. The extension is
 alphanumeric. Whitespace is not allowed anywhere in the name.

 Texture set names may contain underscores. When the names of the texture
 sets of the project are known, pass them as `known_texture_sets`: a stem that
 starts with `<known>_` is split after the known name (longest names are tried
 first). Otherwise the stem must have exactly three non-empty
 underscore-separated segments.

 Matching is all-or-nothing: a file either yields a complete `ExportedFile`
 or a `PatternMismatch` with the reason.
*/
class FilenamePatternMatcher {
public:
  struct Options {
    std::vector<std::string> known_texture_sets;
  };

  FilenamePatternMatcher() = default;

  VLLM_PUBL_API explicit FilenamePatternMatcher(Options options);

  //! Match the file name part of `path`.
  VLLM_PUBL_NDAPI auto Match(const std::filesystem::path& path) const
    -> std::expected<ExportedFile, PatternMismatch>;

  //! Match the file name part of `path`.
  /*!
   @throw PatternMismatchError if the name does not follow the convention.
  */
  VLLM_PUBL_NDAPI auto Parse(const std::filesystem::path& path) const
    -> ExportedFile;

  //! Match every path, keeping all mismatches. Input order is preserved.
  VLLM_PUBL_NDAPI auto MatchAll(
    const std::vector<std::filesystem::path>& paths) const -> ExportScan;

  //! Match the regular files found directly in `directory`.
  /*!
   Sub-directories are not visited and files whose name starts with `.` are
   ignored. Results are sorted by file name. A directory that does not exist
   yields an empty scan.

   @throw ExportError if the directory cannot be listed within `timeout`.
  */
  VLLM_PUBL_NDAPI auto ScanExportArea(const std::filesystem::path& directory,
    std::chrono::milliseconds timeout = std::chrono::minutes(5)) const
    -> ExportScan;

private:
  std::vector<std::string> known_texture_sets_;
};

} // namespace vellum::publish
