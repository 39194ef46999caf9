/**
 * @file ModuleSet_uTest.cpp
 * @brief Unit tests for modscout::modules::ModuleSet.
 *
 * Notes:
 *  - Each test builds its own module tree under the gtest temp dir.
 *  - The tree mixes raw, zstd and xz modules with one foreign file.
 */

#include "src/modules/inc/DependencyResolver.hpp"
#include "src/modules/inc/ModuleSet.hpp"
#include "src/object/utst/ElfFixture.hpp"

#include <gtest/gtest.h>

#include <unistd.h> // geteuid

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using modscout::helpers::log::LogLevel;
using modscout::helpers::log::LogSink;
using modscout::modules::buildModuleSet;
using modscout::modules::discoverModuleFiles;
using modscout::modules::KERNEL_MODULE_NAME;
using modscout::modules::loadModuleFiles;
using modscout::modules::LoadResult;
using modscout::modules::LoadStatus;
using modscout::modules::ModuleRecord;
using modscout::modules::ModuleSet;
using modscout::modules::ModuleSetConfig;
using modscout::modules::resolveLoadOrder;
using modscout::modules::ResolveResult;
using modscout::modules::ThreadSpawner;

namespace fs = std::filesystem;
namespace fx = modscout::elffixture;

class ModuleSetTest : public ::testing::Test {
protected:
  std::string root_{};
  std::string kernel_{};
  std::string modules_{};

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = ::testing::TempDir() + "modscout_set_" + info->name();
    fs::remove_all(root_);
    modules_ = root_ + "/lib/modules";
    fs::create_directories(modules_ + "/kernel/net/udp");
    fs::create_directories(modules_ + "/kernel/drivers/net");

    kernel_ = root_ + "/vmlinux";
    const fx::FixtureOptions EXEC{true, false, ET_EXEC};
    ASSERT_TRUE(fx::writeFile(
        kernel_, fx::buildElf({fx::exportedFunc("kmalloc"), fx::exportedFunc("printk")}, EXEC)));

    ASSERT_TRUE(fx::writeFile(modules_ + "/kernel/net/udp/udp_tunnel.ko",
                              fx::buildElf({fx::exportedFunc("setup_udp_tunnel_sock"),
                                            fx::undefinedRef("kmalloc")})));
    ASSERT_TRUE(fx::writeFile(modules_ + "/kernel/net/ip6_udp_tunnel.ko.zst",
                              fx::zstdCompress(fx::buildElf({fx::exportedFunc("udp_tunnel6_xmit"),
                                                             fx::undefinedRef("printk")}))));
    ASSERT_TRUE(fx::writeFile(
        modules_ + "/kernel/drivers/net/wireguard.ko.xz",
        fx::xzCompress(fx::buildElf({fx::exportedFunc("wg_init"),
                                     fx::undefinedRef("setup_udp_tunnel_sock"),
                                     fx::undefinedRef("udp_tunnel6_xmit")}))));

    const std::string JUNK = "#!/bin/sh\necho not a module\n";
    ASSERT_TRUE(fx::writeFile(modules_ + "/kernel/drivers/net/broken.ko",
                              std::vector<std::uint8_t>(JUNK.begin(), JUNK.end())));
    ASSERT_TRUE(fx::writeFile(modules_ + "/modules.dep", {'x', '\n'}));
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  ModuleSetConfig config() const {
    ModuleSetConfig cfg;
    cfg.kernelPath = kernel_;
    cfg.modulesPath = modules_;
    return cfg;
  }

  static std::vector<std::string> names(const ModuleSet& set) {
    std::vector<std::string> out;
    for (const ModuleRecord& rec : set.modules) {
      out.push_back(rec.name);
    }
    return out;
  }
};

/* ----------------------------- Discovery ----------------------------- */

/** @test Recursive discovery applies the pattern and sorts by path. */
TEST_F(ModuleSetTest, DiscoveryMatchesPatternSorted) {
  std::vector<std::string> paths;
  std::string error;
  ASSERT_TRUE(discoverModuleFiles(modules_, "*.ko*", paths, error)) << error;

  ASSERT_EQ(paths.size(), 4U);
  EXPECT_EQ(paths[0], modules_ + "/kernel/drivers/net/broken.ko");
  EXPECT_EQ(paths[1], modules_ + "/kernel/drivers/net/wireguard.ko.xz");
  EXPECT_EQ(paths[2], modules_ + "/kernel/net/ip6_udp_tunnel.ko.zst");
  EXPECT_EQ(paths[3], modules_ + "/kernel/net/udp/udp_tunnel.ko");
}

/** @test A narrower pattern selects a subset. */
TEST_F(ModuleSetTest, DiscoveryCustomPattern) {
  std::vector<std::string> paths;
  std::string error;
  ASSERT_TRUE(discoverModuleFiles(modules_, "*.ko.zst", paths, error)) << error;
  ASSERT_EQ(paths.size(), 1U);
  EXPECT_EQ(fs::path(paths[0]).filename().string(), "ip6_udp_tunnel.ko.zst");
}

/** @test A regular file root is the only candidate. */
TEST_F(ModuleSetTest, DiscoverySingleFile) {
  const std::string MODULE_FILE = modules_ + "/kernel/net/udp/udp_tunnel.ko";
  std::vector<std::string> paths;
  std::string error;
  ASSERT_TRUE(discoverModuleFiles(MODULE_FILE, "*.ko*", paths, error)) << error;
  EXPECT_EQ(paths, std::vector<std::string>{MODULE_FILE});
}

/** @test Missing root fails with a message naming it. */
TEST_F(ModuleSetTest, DiscoveryMissingRoot) {
  const std::string MISSING = root_ + "/nope";
  std::vector<std::string> paths;
  std::string error;
  EXPECT_FALSE(discoverModuleFiles(MISSING, "*.ko*", paths, error));
  EXPECT_NE(error.find(MISSING), std::string::npos);
  EXPECT_TRUE(paths.empty());
}

/** @test Symlinked directories are not followed, so a link loop terminates. */
TEST_F(ModuleSetTest, DiscoveryIgnoresDirectoryLinks) {
  std::error_code ec;
  fs::create_directory_symlink(modules_, modules_ + "/kernel/loop", ec);
  ASSERT_FALSE(ec) << ec.message();

  std::vector<std::string> paths;
  std::string error;
  ASSERT_TRUE(discoverModuleFiles(modules_, "*.ko*", paths, error)) << error;
  EXPECT_EQ(paths.size(), 4U);
}

/** @test An unreadable subdirectory is reported and its siblings are still walked. */
TEST_F(ModuleSetTest, DiscoveryContinuesPastUnreadableDirectory) {
  if (::geteuid() == 0) {
    GTEST_SKIP() << "directory permissions do not apply to root";
  }
  const std::string LOCKED = modules_ + "/kernel/aaa_locked";
  fs::create_directories(LOCKED);
  fs::permissions(LOCKED, fs::perms::none);

  std::vector<std::string> warnings;
  const LogSink SINK = [&warnings](LogLevel level, std::string_view msg) {
    if (level == LogLevel::WARN) {
      warnings.emplace_back(msg);
    }
  };

  std::vector<std::string> paths;
  std::string error;
  const bool OK = discoverModuleFiles(modules_, "*.ko*", paths, error, SINK);
  fs::permissions(LOCKED, fs::perms::owner_all);

  ASSERT_TRUE(OK) << error;
  EXPECT_EQ(paths.size(), 4U);
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_NE(warnings[0].find("aaa_locked"), std::string::npos) << warnings[0];
}

/* ----------------------------- Working Set ----------------------------- */

/** @test Kernel first, foreign file skipped, remaining modules in path order. */
TEST_F(ModuleSetTest, BuildSkipsForeignFile) {
  const ModuleSet SET = buildModuleSet(config());
  ASSERT_TRUE(SET.ok()) << SET.detail;

  EXPECT_EQ(SET.candidateCount, 4U);
  EXPECT_EQ(names(SET), (std::vector<std::string>{std::string(KERNEL_MODULE_NAME), "wireguard",
                                                  "ip6_udp_tunnel", "udp_tunnel"}));
  ASSERT_EQ(SET.failures.size(), 1U);
  EXPECT_EQ(SET.failures[0].status, LoadStatus::FORMAT_ERROR);
  EXPECT_EQ(fs::path(SET.failures[0].path).filename().string(), "broken.ko");

  ASSERT_NE(SET.find("udp_tunnel"), nullptr);
  EXPECT_EQ(SET.find("broken"), nullptr);
}

/** @test Resolution still succeeds with a foreign file in the tree. */
TEST_F(ModuleSetTest, ResolutionSurvivesForeignFile) {
  const ModuleSet SET = buildModuleSet(config());
  ASSERT_TRUE(SET.ok()) << SET.detail;

  const ResolveResult RES = resolveLoadOrder(SET.modules, "wireguard");
  ASSERT_TRUE(RES.ok()) << RES.detail;
  EXPECT_EQ(RES.names(), (std::vector<std::string>{std::string(KERNEL_MODULE_NAME),
                                                   "ip6_udp_tunnel", "udp_tunnel", "wireguard"}));
}

/** @test Kernel image failure is fatal. */
TEST_F(ModuleSetTest, KernelFailureIsFatal) {
  ModuleSetConfig cfg = config();
  cfg.kernelPath = modules_ + "/kernel/drivers/net/broken.ko";
  const ModuleSet SET = buildModuleSet(cfg);
  EXPECT_FALSE(SET.ok());
  EXPECT_EQ(SET.status, LoadStatus::FORMAT_ERROR);
  EXPECT_TRUE(SET.modules.empty());

  cfg.kernelPath = root_ + "/missing-vmlinux";
  const ModuleSet MISSING = buildModuleSet(cfg);
  EXPECT_EQ(MISSING.status, LoadStatus::IO_ERROR);
  EXPECT_NE(MISSING.detail.find("missing-vmlinux"), std::string::npos);
}

/** @test Missing modules root is fatal; empty modules path means kernel only. */
TEST_F(ModuleSetTest, ModulesRootHandling) {
  ModuleSetConfig cfg = config();
  cfg.modulesPath = root_ + "/no-such-dir";
  EXPECT_EQ(buildModuleSet(cfg).status, LoadStatus::IO_ERROR);

  cfg.modulesPath.clear();
  const ModuleSet SET = buildModuleSet(cfg);
  ASSERT_TRUE(SET.ok()) << SET.detail;
  EXPECT_EQ(names(SET), std::vector<std::string>{std::string(KERNEL_MODULE_NAME)});
}

/** @test Parallel loading yields the same working set as sequential loading. */
TEST_F(ModuleSetTest, ParallelMatchesSequential) {
  ModuleSetConfig cfg = config();
  cfg.jobs = 1;
  const ModuleSet SEQ = buildModuleSet(cfg);
  cfg.jobs = 4;
  const ModuleSet PAR = buildModuleSet(cfg);

  ASSERT_TRUE(SEQ.ok());
  ASSERT_TRUE(PAR.ok());
  ASSERT_EQ(SEQ.modules.size(), PAR.modules.size());
  for (std::size_t i = 0; i < SEQ.modules.size(); ++i) {
    EXPECT_EQ(SEQ.modules[i].name, PAR.modules[i].name);
    EXPECT_EQ(SEQ.modules[i].path, PAR.modules[i].path);
    EXPECT_EQ(SEQ.modules[i].providedSymbols, PAR.modules[i].providedSymbols);
    EXPECT_EQ(SEQ.modules[i].referencedSymbols, PAR.modules[i].referencedSymbols);
  }
  EXPECT_EQ(SEQ.failures.size(), PAR.failures.size());
}

/** @test Oversized job counts are clamped and still load everything. */
TEST_F(ModuleSetTest, JobCountClamped) {
  std::vector<std::string> paths;
  std::string error;
  ASSERT_TRUE(discoverModuleFiles(modules_, "*.ko*", paths, error));

  const std::vector<LoadResult> RESULTS = loadModuleFiles(paths, 1000);
  ASSERT_EQ(RESULTS.size(), paths.size());
  std::size_t okCount = 0;
  for (const LoadResult& res : RESULTS) {
    okCount += res.ok() ? 1U : 0U;
  }
  EXPECT_EQ(okCount, 3U);
}

/** @test Thread creation failure shrinks the pool instead of aborting. */
TEST_F(ModuleSetTest, SpawnFailureFallsBackToRunningWorkers) {
  std::vector<std::string> paths;
  std::string error;
  ASSERT_TRUE(discoverModuleFiles(modules_, "*.ko*", paths, error));

  std::size_t attempts = 0;
  const ThreadSpawner ONE_THREAD = [&attempts](std::function<void()> body) {
    if (++attempts > 1) {
      throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                              "thread limit");
    }
    return std::thread(std::move(body));
  };

  const std::vector<LoadResult> RESULTS = loadModuleFiles(paths, 4, nullptr, ONE_THREAD);
  EXPECT_EQ(attempts, 2U);
  ASSERT_EQ(RESULTS.size(), paths.size());
  std::size_t okCount = 0;
  for (const LoadResult& res : RESULTS) {
    okCount += res.ok() ? 1U : 0U;
  }
  EXPECT_EQ(okCount, 3U);
  EXPECT_EQ(RESULTS[0].status, LoadStatus::FORMAT_ERROR);
}

/** @test With no extra threads at all the caller loads every file. */
TEST_F(ModuleSetTest, NoSpawnedWorkersStillLoadsAll) {
  std::vector<std::string> paths;
  std::string error;
  ASSERT_TRUE(discoverModuleFiles(modules_, "*.ko*", paths, error));

  const ThreadSpawner NEVER = [](std::function<void()>) -> std::thread {
    throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                            "thread limit");
  };

  const std::vector<LoadResult> RESULTS = loadModuleFiles(paths, 8, nullptr, NEVER);
  ASSERT_EQ(RESULTS.size(), paths.size());
  std::size_t okCount = 0;
  for (const LoadResult& res : RESULTS) {
    okCount += res.ok() ? 1U : 0U;
  }
  EXPECT_EQ(okCount, 3U);
}

/** @test A raised cancel flag stops candidates from loading. */
TEST_F(ModuleSetTest, CancelledBeforeStart) {
  const std::atomic<bool> CANCEL{true};
  ModuleSetConfig cfg = config();
  cfg.jobs = 2;
  cfg.cancel = &CANCEL;

  const ModuleSet SET = buildModuleSet(cfg);
  ASSERT_TRUE(SET.ok()) << SET.detail;
  EXPECT_EQ(SET.modules.size(), 1U);
  ASSERT_EQ(SET.failures.size(), 4U);
  for (const auto& failure : SET.failures) {
    EXPECT_EQ(failure.status, LoadStatus::CANCELLED);
  }
}

/* ----------------------------- Logging ----------------------------- */

/** @test Skipped candidates are reported through the sink. */
TEST_F(ModuleSetTest, SinkReceivesSkipWarning) {
  std::vector<std::pair<LogLevel, std::string>> messages;
  ModuleSetConfig cfg = config();
  cfg.log = [&messages](LogLevel level, std::string_view msg) {
    messages.emplace_back(level, std::string(msg));
  };

  const ModuleSet SET = buildModuleSet(cfg);
  ASSERT_TRUE(SET.ok());

  std::size_t warnings = 0;
  for (const auto& [level, msg] : messages) {
    if (level == LogLevel::WARN) {
      ++warnings;
      EXPECT_NE(msg.find("broken.ko"), std::string::npos) << msg;
    }
  }
  EXPECT_EQ(warnings, 1U);
  EXPECT_GE(messages.size(), 3U);
}

/** @test No sink, no output, same result. */
TEST_F(ModuleSetTest, EmptySinkIsSilent) {
  ModuleSetConfig cfg = config();
  cfg.log = LogSink{};
  const ModuleSet SET = buildModuleSet(cfg);
  EXPECT_TRUE(SET.ok());
  EXPECT_EQ(SET.modules.size(), 4U);
}
