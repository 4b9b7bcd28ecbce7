#include "depgraph/graph/task_graph.hpp"

#include "gtest/gtest.h"

#include "test_utils.hpp"

using namespace depgraph;
using namespace depgraph::test;

class TaskGraphTest : public ::testing::Test {
protected:
  TaskCollection tasks_ = collection({
      task("A"),
      task("B").deps({"A"}),
      task("C").deps({"A", "B"}),
      task("D").deps({"ghost"}),
  });
};

TEST_F(TaskGraphTest, EmptyCollection) {
  TaskCollection empty;
  TaskGraph graph(empty);
  EXPECT_TRUE(graph.empty());
  EXPECT_EQ(graph.size(), 0);
  EXPECT_TRUE(graph.dangling_edges().empty());
}

TEST_F(TaskGraphTest, IndexesTasksInCollectionOrder) {
  TaskGraph graph(tasks_);
  ASSERT_EQ(graph.size(), 4);
  EXPECT_EQ(graph.task_ids(), ids({"A", "B", "C", "D"}));
  EXPECT_EQ(graph.get_index(task_id("C")), 2);
  EXPECT_EQ(graph.get_key(2), task_id("C"));
  EXPECT_EQ(graph.get_index(task_id("missing")), kInvalidNode);
}

TEST_F(TaskGraphTest, NeighborsKeepInsertionOrderAndDanglingIds) {
  TaskGraph graph(tasks_);
  EXPECT_EQ(graph.neighbors(task_id("C")), ids({"A", "B"}));
  EXPECT_EQ(graph.neighbors(task_id("D")), ids({"ghost"}));
  EXPECT_TRUE(graph.neighbors(task_id("unknown")).empty());
}

TEST_F(TaskGraphTest, DependentsInCollectionOrder) {
  TaskGraph graph(tasks_);
  EXPECT_EQ(graph.dependents(task_id("A")), ids({"B", "C"}));
  EXPECT_EQ(graph.dependents(task_id("B")), ids({"C"}));
  EXPECT_TRUE(graph.dependents(task_id("D")).empty());
}

TEST_F(TaskGraphTest, ExistenceAndLookup) {
  TaskGraph graph(tasks_);
  EXPECT_TRUE(graph.task_exists(task_id("A")));
  EXPECT_FALSE(graph.task_exists(task_id("ghost")));
  ASSERT_NE(graph.find(task_id("B")), nullptr);
  EXPECT_EQ(graph.find(task_id("B"))->title, "B");
  EXPECT_EQ(graph.find(task_id("ghost")), nullptr);

  auto all = graph.all_task_ids();
  EXPECT_EQ(all.size(), 4);
  EXPECT_TRUE(all.contains(task_id("D")));
}

TEST_F(TaskGraphTest, DanglingEdgesAreReported) {
  TaskGraph graph(tasks_);
  ASSERT_EQ(graph.dangling_edges().size(), 1);
  EXPECT_EQ(graph.dangling_edges()[0].from, task_id("D"));
  EXPECT_EQ(graph.dangling_edges()[0].missing, task_id("ghost"));
  EXPECT_EQ(graph.edge_count(), 4);
}

TEST_F(TaskGraphTest, IndexViewsOnlyHoldExistingTasks) {
  TaskGraph graph(tasks_);
  auto d = graph.get_index(task_id("D"));
  EXPECT_TRUE(graph.deps_view(d).empty());
  EXPECT_EQ(graph.raw_deps(d).size(), 1);

  auto a = graph.get_index(task_id("A"));
  EXPECT_EQ(graph.dependents_view(a).size(), 2);
  EXPECT_TRUE(graph.deps_view(kInvalidNode).empty());
}

TEST_F(TaskGraphTest, DuplicateIdsKeepFirstOccurrence) {
  auto dup = collection({
      task("A").title("first"),
      task("A").title("second"),
  });
  TaskGraph graph(dup);
  EXPECT_EQ(graph.size(), 1);
  EXPECT_EQ(graph.find(task_id("A"))->title, "first");
}
