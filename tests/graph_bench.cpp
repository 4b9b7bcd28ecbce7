#include "depgraph/graph/auditor.hpp"
#include "depgraph/graph/cycle_detector.hpp"
#include "depgraph/graph/mutator.hpp"
#include "depgraph/graph/reachability.hpp"
#include "depgraph/graph/task_graph.hpp"
#include "depgraph/util/log.hpp"

#include <benchmark/benchmark.h>

#include "test_utils.hpp"

#include <format>

using namespace depgraph;

namespace {
[[nodiscard]] auto make_task_id(int i) -> TaskId {
  return depgraph::test::task_id(std::format("task_{}", i));
}

// Layered graph: every task depends on up to `fan_in` tasks of the previous
// layer of width `width`.
[[nodiscard]] auto make_layered(int num_tasks, int width, int fan_in)
    -> TaskCollection {
  TaskCollection tasks;
  tasks.tasks.reserve(num_tasks);
  for (int i = 0; i < num_tasks; ++i) {
    Task task;
    task.id = make_task_id(i);
    task.title = std::format("Task {}", i);
    int layer_start = (i / width - 1) * width;
    if (layer_start >= 0) {
      for (int k = 0; k < fan_in; ++k) {
        task.dependencies.push_back(make_task_id(layer_start + (i + k) % width));
      }
    }
    tasks.tasks.push_back(std::move(task));
  }
  tasks.recount_dependencies();
  return tasks;
}
}

static void BM_GraphBuild(benchmark::State& state) {
  auto tasks = make_layered(state.range(0), 16, 3);

  for (auto _ : state) {
    TaskGraph graph(tasks);
    benchmark::DoNotOptimize(graph);
  }

  state.SetItemsProcessed(state.range(0) * state.iterations());
}

static void BM_WouldCreateCycle(benchmark::State& state) {
  auto tasks = make_layered(state.range(0), 16, 3);
  TaskGraph graph(tasks);
  auto first = make_task_id(0);
  auto last = make_task_id(static_cast<int>(state.range(0)) - 1);

  for (auto _ : state) {
    auto check = CycleDetector::would_create_cycle(graph, first, last);
    benchmark::DoNotOptimize(check);
  }
}

static void BM_FindAllCycles(benchmark::State& state) {
  auto tasks = make_layered(state.range(0), 16, 3);
  TaskGraph graph(tasks);

  for (auto _ : state) {
    auto cycles = CycleDetector::find_all_cycles(graph);
    benchmark::DoNotOptimize(cycles);
  }
}

static void BM_AllChainLengths(benchmark::State& state) {
  auto tasks = make_layered(state.range(0), 16, 3);
  TaskGraph graph(tasks);

  for (auto _ : state) {
    auto chains = Reachability::all_chain_lengths(graph);
    benchmark::DoNotOptimize(chains);
  }

  state.SetItemsProcessed(state.range(0) * state.iterations());
}

static void BM_FullAudit(benchmark::State& state) {
  auto tasks = make_layered(state.range(0), 16, 3);
  DependencyAuditor auditor;

  for (auto _ : state) {
    auto report = auditor.audit(tasks);
    benchmark::DoNotOptimize(report);
  }
}

static void BM_AddRemoveDependency(benchmark::State& state) {
  auto tasks = make_layered(state.range(0), 16, 3);
  DependencyMutator mutator(tasks);
  auto from = make_task_id(static_cast<int>(state.range(0)) - 1);
  auto to = make_task_id(0);
  RemoveOptions remove{.force = true, .analyze_impact = false};
  log::set_level(log::Level::Off);

  for (auto _ : state) {
    auto added = mutator.add_dependency(from, to);
    benchmark::DoNotOptimize(added);
    auto removed = mutator.remove_dependency(from, to, remove);
    benchmark::DoNotOptimize(removed);
  }
}

BENCHMARK(BM_GraphBuild)->Range(64, 8192);
BENCHMARK(BM_WouldCreateCycle)->Range(64, 8192);
BENCHMARK(BM_FindAllCycles)->Range(64, 8192);
BENCHMARK(BM_AllChainLengths)->Range(64, 8192);
BENCHMARK(BM_FullAudit)->Range(64, 4096);
BENCHMARK(BM_AddRemoveDependency)->Range(64, 4096);
