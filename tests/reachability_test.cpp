#include "depgraph/graph/reachability.hpp"

#include "gtest/gtest.h"

#include "test_utils.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <utility>

using namespace depgraph;
using namespace depgraph::test;

class ReachabilityTest : public ::testing::Test {
protected:
  // A depends on B and C, B depends on C, C depends on D.
  TaskCollection tasks_ = collection({
      task("A").deps({"B", "C"}),
      task("B").deps({"C"}),
      task("C").deps({"D"}),
      task("D"),
      task("E").deps({"ghost"}),
  });
};

TEST_F(ReachabilityTest, IndirectPathNeedsTwoEdges) {
  TaskGraph graph(tasks_);
  EXPECT_TRUE(Reachability::has_path(graph, task_id("A"), task_id("C")));
  EXPECT_FALSE(Reachability::has_path(graph, task_id("B"), task_id("C")));
  EXPECT_TRUE(Reachability::has_path(graph, task_id("B"), task_id("C"), false));
}

TEST_F(ReachabilityTest, FindIndirectPathReturnsShortestPath) {
  TaskGraph graph(tasks_);
  EXPECT_EQ(Reachability::find_indirect_path(graph, task_id("A"), task_id("C")),
            ids({"A", "B", "C"}));
  EXPECT_EQ(Reachability::find_indirect_path(graph, task_id("A"), task_id("D")),
            ids({"A", "C", "D"}));
  EXPECT_TRUE(
      Reachability::find_indirect_path(graph, task_id("C"), task_id("D")).empty());
  EXPECT_TRUE(
      Reachability::find_indirect_path(graph, task_id("D"), task_id("A")).empty());
}

TEST_F(ReachabilityTest, PathAvoidingExcludedTask) {
  TaskGraph graph(tasks_);
  EXPECT_TRUE(Reachability::has_path_avoiding(graph, task_id("A"), task_id("D"),
                                              task_id("B")));
  EXPECT_FALSE(Reachability::has_path_avoiding(graph, task_id("A"), task_id("D"),
                                               task_id("C")));
  EXPECT_FALSE(Reachability::has_path_avoiding(graph, task_id("C"), task_id("D"),
                                               task_id("C")));
}

TEST_F(ReachabilityTest, ChainLengthScenario) {
  auto tasks = collection({
      task("T1"),
      task("T2").deps({"T1"}),
      task("T3").deps({"T2"}),
  });
  TaskGraph graph(tasks);
  EXPECT_EQ(Reachability::chain_length(graph, task_id("T3")), 3);
  EXPECT_EQ(Reachability::chain_length(graph, task_id("T2")), 2);
  EXPECT_EQ(Reachability::chain_length(graph, task_id("T1")), 1);
}

TEST_F(ReachabilityTest, ChainLengthLeafDanglingAndUnknown) {
  TaskGraph graph(tasks_);
  EXPECT_EQ(Reachability::chain_length(graph, task_id("A")), 4);
  EXPECT_EQ(Reachability::chain_length(graph, task_id("D")), 1);
  EXPECT_EQ(Reachability::chain_length(graph, task_id("E")), 2);
  EXPECT_EQ(Reachability::chain_length(graph, task_id("nope")), 1);
}

TEST_F(ReachabilityTest, ChainLengthTerminatesOnCycles) {
  auto tasks = collection({
      task("A").deps({"B"}),
      task("B").deps({"C"}),
      task("C").deps({"A"}),
  });
  TaskGraph graph(tasks);
  EXPECT_EQ(Reachability::chain_length(graph, task_id("A")), 3);
  EXPECT_EQ(Reachability::chain_length(graph, task_id("C")), 3);

  auto all = Reachability::all_chain_lengths(graph);
  EXPECT_EQ(all, (std::vector<std::size_t>{3, 3, 3}));
}

// Levels of two tasks, each depending on both tasks of the next level. The
// bottom pair depends on each other.
[[nodiscard]] static auto ladder_with_bottom_cycle(std::size_t levels)
    -> TaskCollection {
  auto x = [](std::size_t i) { return task_id(std::format("x{}", i)); };
  auto y = [](std::size_t i) { return task_id(std::format("y{}", i)); };
  TaskCollection c;
  for (std::size_t i = 0; i < levels; ++i) {
    Task tx;
    Task ty;
    tx.id = x(i);
    ty.id = y(i);
    if (i + 1 < levels) {
      tx.dependencies = {x(i + 1), y(i + 1)};
      ty.dependencies = {x(i + 1), y(i + 1)};
    } else {
      tx.dependencies = {y(i)};
      ty.dependencies = {x(i)};
    }
    c.tasks.push_back(std::move(tx));
    c.tasks.push_back(std::move(ty));
  }
  c.recount_dependencies();
  return c;
}

TEST_F(ReachabilityTest, ChainLengthLinearAboveCycle) {
  constexpr std::size_t kLevels = 60;
  auto tasks = ladder_with_bottom_cycle(kLevels);
  TaskGraph graph(tasks);

  auto start = std::chrono::steady_clock::now();
  auto all = Reachability::all_chain_lengths(graph);
  auto top = Reachability::chain_length(graph, task_id("y0"));
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_LT(elapsed, std::chrono::seconds(1));
  EXPECT_EQ(top, kLevels + 1);
  ASSERT_EQ(all.size(), 2 * kLevels);
  EXPECT_EQ(all[graph.get_index(task_id("x0"))], kLevels + 1);
  EXPECT_EQ(all[graph.get_index(task_id("x59"))], 2u);
  EXPECT_EQ(all[graph.get_index(task_id("y59"))], 2u);
  EXPECT_EQ(all[graph.get_index(task_id("y30"))], 31u);
}

TEST_F(ReachabilityTest, ChainLengthSelfDependencyCountsOnce) {
  auto tasks = collection({task("A").deps({"A", "B"}), task("B")});
  TaskGraph graph(tasks);
  EXPECT_EQ(Reachability::chain_length(graph, task_id("A")), 2);
}

TEST_F(ReachabilityTest, AllChainLengthsMatchesSingleQueries) {
  TaskGraph graph(tasks_);
  auto all = Reachability::all_chain_lengths(graph);
  ASSERT_EQ(all.size(), graph.size());
  for (NodeIndex i = 0; i < graph.size(); ++i) {
    EXPECT_EQ(all[i], Reachability::chain_length(graph, graph.get_key(i)));
  }
}

TEST_F(ReachabilityTest, TransitiveDependenciesPreorder) {
  TaskGraph graph(tasks_);
  EXPECT_EQ(Reachability::transitive_dependencies(graph, task_id("A")),
            ids({"B", "C", "D"}));
  EXPECT_EQ(Reachability::transitive_dependencies(graph, task_id("E")),
            ids({"ghost"}));
  EXPECT_TRUE(Reachability::transitive_dependencies(graph, task_id("D")).empty());
}

TEST_F(ReachabilityTest, TransitiveDependentsExcludeSelf) {
  TaskGraph graph(tasks_);
  auto dependents = Reachability::transitive_dependents(graph, task_id("D"));
  std::ranges::sort(dependents);
  EXPECT_EQ(dependents, ids({"A", "B", "C"}));
  EXPECT_TRUE(Reachability::transitive_dependents(graph, task_id("A")).empty());
}
