//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>
#include <span>
#include <string_view>

#include <gtest/gtest.h>

#include <Vellum/Base/Logging.h>

namespace {

//! Owns loguru for the lifetime of a test run.
class LoggingEnvironment final : public ::testing::Environment {
public:
  LoggingEnvironment(int& argc, char** argv)
    : argc_(argc)
    , argv_(argv)
  {
  }

  void SetUp() override
  {
    loguru::g_preamble_date = false;
    loguru::g_preamble_time = false;
    loguru::g_preamble_uptime = false;
    loguru::g_preamble_verbose = false;
    loguru::g_preamble_header = false;
    loguru::g_preamble_file = true;
    loguru::g_preamble_thread = true;
#if !defined(NDEBUG)
    loguru::g_stderr_verbosity = loguru::Verbosity_1;
#else
    loguru::g_stderr_verbosity = loguru::Verbosity_WARNING;
#endif // !NDEBUG

    // Honors `-v <level>`.
    loguru::init(argc_, argv_);
    loguru::set_thread_name("main");
  }

  void TearDown() override
  {
    loguru::flush();
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF;
    loguru::shutdown();
  }

private:
  int& argc_;
  char** argv_;
};

auto IsDiscoveryRun(const int argc, char** argv) -> bool
{
  const std::span args(argv, static_cast<std::size_t>(argc));
  return std::ranges::any_of(args.subspan(1), [](const char* arg) {
    return std::string_view(arg) == "--gtest_list_tests";
  });
}

} // namespace

auto main(int argc, char** argv) -> int
{
  const bool discovery = IsDiscoveryRun(argc, argv);

  testing::InitGoogleTest(&argc, argv);
  if (!discovery) {
    testing::AddGlobalTestEnvironment(new LoggingEnvironment(argc, argv));
  }
  return RUN_ALL_TESTS();
}
