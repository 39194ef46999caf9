/**
 * @file DependencyResolver_uTest.cpp
 * @brief Unit tests for modscout::modules::DependencyResolver.
 *
 * Notes:
 *  - Working sets are built directly from ModuleRecords; no files involved.
 */

#include "src/modules/inc/DependencyResolver.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using modscout::modules::DependencyGraph;
using modscout::modules::KERNEL_MODULE_NAME;
using modscout::modules::ModuleRecord;
using modscout::modules::resolveLoadOrder;
using modscout::modules::ResolveResult;
using modscout::modules::ResolveStatus;

namespace {

using Names = std::vector<std::string>;

ModuleRecord rec(const std::string& name, Names provides, Names references) {
  ModuleRecord out;
  out.name = name;
  out.path = "/lib/modules/test/" + name + ".ko";
  out.providedSymbols = std::move(provides);
  out.referencedSymbols = std::move(references);
  return out;
}

/// Every provider of every emitted module is emitted earlier.
void expectTopological(const std::vector<ModuleRecord>& set, const ResolveResult& res) {
  std::unordered_map<std::string, std::size_t> position;
  for (std::size_t i = 0; i < res.order.size(); ++i) {
    EXPECT_TRUE(position.emplace(res.order[i]->name, i).second)
        << "duplicate " << res.order[i]->name;
  }
  for (std::size_t i = 0; i < res.order.size(); ++i) {
    const ModuleRecord& mod = *res.order[i];
    for (const std::string& sym : mod.referencedSymbols) {
      for (const ModuleRecord& provider : set) {
        if (provider.name == mod.name || !provider.provides(sym)) {
          continue;
        }
        const auto IT = position.find(provider.name);
        ASSERT_NE(IT, position.end()) << provider.name << " missing for " << mod.name;
        EXPECT_LT(IT->second, i) << provider.name << " must precede " << mod.name;
      }
    }
  }
}

} // namespace

/* ----------------------------- Basic Ordering ----------------------------- */

/** @test Simple chain: dependencies come first, target last. */
TEST(DependencyResolverTest, ChainOrder) {
  const std::vector<ModuleRecord> SET = {
      rec(std::string(KERNEL_MODULE_NAME), {"printk", "kmalloc"}, {}),
      rec("wireguard", {"wg_init"}, {"udp_tunnel_xmit_skb", "kmalloc"}),
      rec("udp_tunnel", {"udp_tunnel_xmit_skb"}, {"printk"}),
  };
  const ResolveResult RES = resolveLoadOrder(SET, "wireguard");
  ASSERT_TRUE(RES.ok()) << RES.detail;
  EXPECT_EQ(RES.names(), (Names{"vmlinux", "udp_tunnel", "wireguard"}));
  EXPECT_TRUE(RES.cycle.empty());
  EXPECT_TRUE(RES.detail.empty());
}

/** @test Module with no references resolves to itself alone. */
TEST(DependencyResolverTest, LeafTarget) {
  const std::vector<ModuleRecord> SET = {
      rec(std::string(KERNEL_MODULE_NAME), {"printk"}, {}),
      rec("crc16", {"crc16"}, {}),
  };
  const ResolveResult RES = resolveLoadOrder(SET, "crc16");
  ASSERT_TRUE(RES.ok());
  EXPECT_EQ(RES.names(), Names{"crc16"});
}

/** @test Modules the target does not reach are not emitted. */
TEST(DependencyResolverTest, UnrelatedModulesExcluded) {
  const std::vector<ModuleRecord> SET = {
      rec("a", {"a_fn"}, {"b_fn"}),
      rec("b", {"b_fn"}, {}),
      rec("c", {"c_fn"}, {"b_fn"}),
  };
  const ResolveResult RES = resolveLoadOrder(SET, "a");
  ASSERT_TRUE(RES.ok());
  EXPECT_EQ(RES.names(), (Names{"b", "a"}));
}

/** @test Kernel pseudo-module is part of the result when referenced. */
TEST(DependencyResolverTest, KernelIncluded) {
  const std::vector<ModuleRecord> SET = {
      rec(std::string(KERNEL_MODULE_NAME), {"printk"}, {}),
      rec("ext4", {"ext4_fn"}, {"printk"}),
  };
  const ResolveResult RES = resolveLoadOrder(SET, "ext4");
  ASSERT_TRUE(RES.ok());
  ASSERT_EQ(RES.order.size(), 2U);
  EXPECT_TRUE(RES.order[0]->isKernel());
  EXPECT_EQ(RES.order[0], &SET[0]);
}

/* ----------------------------- Deduplication ----------------------------- */

/** @test Diamond: shared dependency appears exactly once, before both users. */
TEST(DependencyResolverTest, DiamondDeduplicated) {
  const std::vector<ModuleRecord> SET = {
      rec("a", {"a_fn"}, {"b_fn", "c_fn"}),
      rec("b", {"b_fn"}, {"d_fn"}),
      rec("c", {"c_fn"}, {"d_fn"}),
      rec("d", {"d_fn"}, {}),
  };
  const ResolveResult RES = resolveLoadOrder(SET, "a");
  ASSERT_TRUE(RES.ok());
  EXPECT_EQ(RES.names(), (Names{"d", "b", "c", "a"}));
  expectTopological(SET, RES);
}

/** @test Several providers of one symbol all precede the user, in set order. */
TEST(DependencyResolverTest, MultipleProviders) {
  const std::vector<ModuleRecord> SET = {
      rec("user", {}, {"shared_fn"}),
      rec("second", {"shared_fn"}, {}),
      rec("first", {"shared_fn"}, {}),
  };
  const ResolveResult RES = resolveLoadOrder(SET, "user");
  ASSERT_TRUE(RES.ok());
  EXPECT_EQ(RES.names(), (Names{"second", "first", "user"}));
}

/** @test Repeated references to one provider give one edge. */
TEST(DependencyResolverTest, RepeatedReferencesOneEdge) {
  const std::vector<ModuleRecord> SET = {
      rec("a", {}, {"x", "y", "x"}),
      rec("b", {"x", "y", "x"}, {}),
  };
  const DependencyGraph GRAPH(SET);
  EXPECT_EQ(GRAPH.providersOf(0), std::vector<std::size_t>{1});
  EXPECT_EQ(GRAPH.resolve("a").names(), (Names{"b", "a"}));
}

/** @test Duplicate names collapse onto the first record. */
TEST(DependencyResolverTest, DuplicateNamesFirstWins) {
  std::vector<ModuleRecord> set = {
      rec("dup", {"f"}, {}),
      rec("dup", {"g"}, {}),
      rec("target", {}, {"g"}),
  };
  set[1].path = "/other/dup.ko";

  const DependencyGraph GRAPH(set);
  ASSERT_TRUE(GRAPH.indexOf("dup").has_value());
  EXPECT_EQ(*GRAPH.indexOf("dup"), 0U);
  EXPECT_TRUE(GRAPH.providersOf(1).empty());

  const ResolveResult RES = GRAPH.resolve("target");
  ASSERT_TRUE(RES.ok());
  ASSERT_EQ(RES.order.size(), 2U);
  EXPECT_EQ(RES.order[0], &set[0]);
  EXPECT_EQ(RES.order[1]->name, "target");
}

/* ----------------------------- Self Satisfaction ----------------------------- */

/** @test A module providing what it references does not depend on itself. */
TEST(DependencyResolverTest, SelfSatisfactionIsNotAnEdge) {
  const std::vector<ModuleRecord> SET = {
      rec("loop", {"loop_fn"}, {"loop_fn"}),
  };
  const DependencyGraph GRAPH(SET);
  EXPECT_TRUE(GRAPH.providersOf(0).empty());
  EXPECT_TRUE(GRAPH.unresolvedSymbols(0).empty());

  const ResolveResult RES = GRAPH.resolve("loop");
  ASSERT_TRUE(RES.ok()) << RES.detail;
  EXPECT_EQ(RES.names(), Names{"loop"});
}

/* ----------------------------- Errors ----------------------------- */

/** @test Unknown target is NOT_FOUND, not a crash. */
TEST(DependencyResolverTest, MissingTarget) {
  const std::vector<ModuleRecord> SET = {rec("a", {}, {})};
  const ResolveResult RES = resolveLoadOrder(SET, "nonexistent");
  EXPECT_EQ(RES.status, ResolveStatus::NOT_FOUND);
  EXPECT_TRUE(RES.order.empty());
  EXPECT_NE(RES.detail.find("nonexistent"), std::string::npos);
}

/** @test Empty working set is NOT_FOUND. */
TEST(DependencyResolverTest, EmptySet) {
  const ResolveResult RES = resolveLoadOrder({}, "a");
  EXPECT_EQ(RES.status, ResolveStatus::NOT_FOUND);
}

/** @test Two modules needing each other is a cycle naming both. */
TEST(DependencyResolverTest, TwoNodeCycle) {
  const std::vector<ModuleRecord> SET = {
      rec("a", {"a_fn"}, {"b_fn"}),
      rec("b", {"b_fn"}, {"a_fn"}),
  };
  const ResolveResult RES = resolveLoadOrder(SET, "a");
  EXPECT_EQ(RES.status, ResolveStatus::CYCLE_DETECTED);
  EXPECT_TRUE(RES.order.empty());
  EXPECT_EQ(RES.cycle, (Names{"a", "b", "a"}));
  EXPECT_NE(RES.detail.find("a -> b -> a"), std::string::npos) << RES.detail;
}

/** @test Cycle path starts at the looping module, not at the target. */
TEST(DependencyResolverTest, CycleBelowTarget) {
  const std::vector<ModuleRecord> SET = {
      rec("top", {}, {"x_fn"}),
      rec("x", {"x_fn"}, {"y_fn"}),
      rec("y", {"y_fn"}, {"z_fn"}),
      rec("z", {"z_fn"}, {"x_fn"}),
  };
  const ResolveResult RES = resolveLoadOrder(SET, "top");
  EXPECT_EQ(RES.status, ResolveStatus::CYCLE_DETECTED);
  EXPECT_EQ(RES.cycle, (Names{"x", "y", "z", "x"}));
}

/** @test A cycle not reachable from the target does not matter. */
TEST(DependencyResolverTest, UnreachableCycleIgnored) {
  const std::vector<ModuleRecord> SET = {
      rec("p", {"p_fn"}, {"q_fn"}),
      rec("q", {"q_fn"}, {"p_fn"}),
      rec("solo", {"solo_fn"}, {}),
  };
  EXPECT_TRUE(resolveLoadOrder(SET, "solo").ok());
}

/* ----------------------------- Properties ----------------------------- */

/** @test Pseudo-random acyclic sets: every target resolves topologically. */
TEST(DependencyResolverTest, TopologicalOnSyntheticSets) {
  std::uint32_t seed = 0x2545F491U;
  const auto NEXT = [&seed]() {
    seed = seed * 1664525U + 1013904223U;
    return seed >> 8;
  };

  for (int round = 0; round < 20; ++round) {
    const std::size_t N = 5 + NEXT() % 40;
    std::vector<ModuleRecord> set;
    for (std::size_t i = 0; i < N; ++i) {
      Names refs;
      const std::size_t FANOUT = (i == 0) ? 0 : NEXT() % 4;
      for (std::size_t k = 0; k < FANOUT; ++k) {
        refs.push_back("sym_" + std::to_string(NEXT() % i));
      }
      refs.push_back("external_" + std::to_string(i));
      set.push_back(rec("m" + std::to_string(i), {"sym_" + std::to_string(i)}, refs));
    }

    const DependencyGraph GRAPH(set);
    for (std::size_t t = 0; t < N; ++t) {
      const ResolveResult RES = GRAPH.resolve(set[t].name);
      ASSERT_TRUE(RES.ok()) << RES.detail;
      ASSERT_FALSE(RES.order.empty());
      EXPECT_EQ(RES.order.back()->name, set[t].name);
      expectTopological(set, RES);
    }
  }
}

/** @test Same input, same output. */
TEST(DependencyResolverTest, Deterministic) {
  const std::vector<ModuleRecord> SET = {
      rec(std::string(KERNEL_MODULE_NAME), {"k1", "k2"}, {}),
      rec("a", {"a1"}, {"b1", "c1", "k1"}),
      rec("b", {"b1"}, {"d1", "k2"}),
      rec("c", {"c1"}, {"d1", "b1"}),
      rec("d", {"d1"}, {"k1"}),
  };
  const ResolveResult FIRST = resolveLoadOrder(SET, "a");
  const ResolveResult SECOND = resolveLoadOrder(SET, "a");
  const DependencyGraph GRAPH(SET);
  const ResolveResult THIRD = GRAPH.resolve("a");
  const ResolveResult FOURTH = GRAPH.resolve("a");

  ASSERT_TRUE(FIRST.ok());
  EXPECT_EQ(FIRST.order, SECOND.order);
  EXPECT_EQ(FIRST.order, THIRD.order);
  EXPECT_EQ(THIRD.order, FOURTH.order);
  expectTopological(SET, FIRST);
}

/** @test Long dependency chains do not exhaust the call stack. */
TEST(DependencyResolverTest, DeepChain) {
  constexpr std::size_t DEPTH = 20000;
  std::vector<ModuleRecord> set;
  set.reserve(DEPTH);
  for (std::size_t i = 0; i < DEPTH; ++i) {
    Names refs;
    if (i > 0) {
      refs.push_back("fn_" + std::to_string(i - 1));
    }
    set.push_back(rec("m" + std::to_string(i), {"fn_" + std::to_string(i)}, refs));
  }

  const ResolveResult RES = resolveLoadOrder(set, "m" + std::to_string(DEPTH - 1));
  ASSERT_TRUE(RES.ok());
  ASSERT_EQ(RES.order.size(), DEPTH);
  EXPECT_EQ(RES.order.front()->name, "m0");
}

/* ----------------------------- Diagnostics ----------------------------- */

/** @test References nobody provides are reported once each, in order. */
TEST(DependencyResolverTest, UnresolvedSymbols) {
  const std::vector<ModuleRecord> SET = {
      rec("a", {}, {"ghost", "real", "phantom", "ghost"}),
      rec("b", {"real"}, {}),
  };
  const DependencyGraph GRAPH(SET);
  EXPECT_EQ(GRAPH.unresolvedSymbols(0), (Names{"ghost", "phantom"}));
  EXPECT_TRUE(GRAPH.unresolvedSymbols(1).empty());
  EXPECT_TRUE(resolveLoadOrder(SET, "a").ok());
}

/** @test Status strings. */
TEST(DependencyResolverTest, StatusToString) {
  EXPECT_STREQ(toString(ResolveStatus::OK), "OK");
  EXPECT_STREQ(toString(ResolveStatus::NOT_FOUND), "NOT_FOUND");
  EXPECT_STREQ(toString(ResolveStatus::CYCLE_DETECTED), "CYCLE_DETECTED");
}
