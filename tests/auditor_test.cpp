#include "depgraph/graph/auditor.hpp"

#include "gtest/gtest.h"

#include "test_utils.hpp"

#include <algorithm>

using namespace depgraph;
using namespace depgraph::test;

class AuditorTest : public ::testing::Test {
protected:
  static auto only(bool AuditChecks::*check) -> AuditOptions {
    AuditOptions options;
    options.checks = AuditChecks::none();
    options.checks.*check = true;
    return options;
  }

  static auto titles(const AuditReport& report) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (const auto& issue : report.issues) {
      out.push_back(issue.title);
    }
    return out;
  }

  RecordingChangeLog log_;
};

TEST_F(AuditorTest, ChecksParse) {
  auto full = AuditChecks::parse("full");
  ASSERT_TRUE(full.has_value());
  EXPECT_TRUE(full->is_full());
  EXPECT_EQ(full->to_string(), "full");

  auto some = AuditChecks::parse(" cycles , redundant");
  ASSERT_TRUE(some.has_value());
  EXPECT_TRUE(some->cycles);
  EXPECT_TRUE(some->redundant);
  EXPECT_FALSE(some->logical);
  EXPECT_EQ(some->to_string(), "cycles,redundant");

  auto bad = AuditChecks::parse("cycles,typo");
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), Error::InvalidArgument);
  EXPECT_FALSE(AuditChecks::parse(" , ").has_value());
}

TEST_F(AuditorTest, SeverityNames) {
  EXPECT_EQ(parse_severity("warning"), Severity::Warning);
  EXPECT_EQ(parse_severity("all"), Severity::Info);
  EXPECT_FALSE(parse_severity("loud").has_value());
}

TEST_F(AuditorTest, CleanGraphHasNoCriticalIssues) {
  auto tasks = collection({
      task("A"),
      task("B").deps({"A"}),
      task("C").deps({"B"}),
  });
  auto report = DependencyAuditor{}.audit(tasks);
  EXPECT_FALSE(report.has_critical());
  EXPECT_TRUE(report.issues.empty());
  EXPECT_EQ(report.summary.total_tasks, 3u);
  EXPECT_EQ(report.summary.tasks_with_dependencies, 2u);
  EXPECT_EQ(report.summary.total_dependencies, 2u);
  EXPECT_EQ(report.checks.to_string(), "full");
  EXPECT_FALSE(report.validated_at.empty());
  EXPECT_FALSE(report.metrics.has_value());
}

TEST_F(AuditorTest, CyclesAreCritical) {
  auto tasks = collection({
      task("A").deps({"B"}),
      task("B").deps({"A"}),
  });
  auto report = DependencyAuditor{only(&AuditChecks::cycles)}.audit(tasks);
  ASSERT_EQ(report.issues.size(), 1u);
  const auto& issue = report.issues[0];
  EXPECT_EQ(issue.type, IssueType::Cycle);
  EXPECT_EQ(issue.severity, Severity::Critical);
  EXPECT_EQ(issue.title, "Circular Dependency Detected");
  EXPECT_EQ(issue.path, ids({"A", "B", "A"}));
  EXPECT_EQ(issue.affected_tasks, ids({"A", "B"}));
  EXPECT_FALSE(issue.auto_fixable());
  EXPECT_TRUE(report.has_critical());
}

TEST_F(AuditorTest, MissingReferenceIsFixed) {
  auto tasks = collection({task("A").deps({"ghost", "B"}), task("B")});
  DependencyAuditor auditor{only(&AuditChecks::logical), &log_};

  auto before = auditor.audit(tasks);
  ASSERT_EQ(before.count(IssueType::MissingDependency), 1u);
  EXPECT_EQ(before.summary.missing_references, 1u);
  EXPECT_TRUE(before.issues[0].auto_fixable());

  auto report = auditor.audit_and_fix(tasks);
  ASSERT_EQ(report.fixes.size(), 1u);
  EXPECT_TRUE(report.fixes[0].applied);
  EXPECT_EQ(report.fixes[0].action, FixAction::RemoveDependency);
  EXPECT_EQ(report.count(IssueType::MissingDependency), 0u);
  EXPECT_EQ(tasks.find(task_id("A"))->dependencies, ids({"B"}));
  EXPECT_EQ(tasks.total_dependencies(), 1);

  ASSERT_EQ(log_.records.size(), 1u);
  EXPECT_EQ(log_.records[0].action, ChangeAction::Remove);
  EXPECT_EQ(log_.records[0].depends_on, task_id("ghost"));
  EXPECT_EQ(log_.records[0].reason, "auto-fix: missing-dependency");
}

TEST_F(AuditorTest, StatusAndOrderInconsistencies) {
  auto tasks = collection({
      task("T").title("Test the parser").status(TaskStatus::Completed)
          .deps({"I"}),
      task("I").title("Implement parser").status(TaskStatus::InProgress)
          .deps({"S"}),
      task("S").title("Setup toolchain").status(TaskStatus::Pending),
  });
  auto report = DependencyAuditor{only(&AuditChecks::logical)}.audit(tasks);
  auto found = titles(report);
  EXPECT_EQ(found, (std::vector<std::string>{
                       "Questionable Dependency Order",
                       "Completed Task with Incomplete Dependency",
                       "Task Started Before Dependency",
                   }));
  EXPECT_EQ(report.summary.warning, 2u);
  EXPECT_EQ(report.summary.info, 1u);
}

TEST_F(AuditorTest, PriorityMismatchFixRaisesToMedium) {
  auto tasks = collection({
      task("H").priority(TaskPriority::High).deps({"L"}),
      task("L").priority(TaskPriority::Low),
  });
  DependencyAuditor auditor{only(&AuditChecks::logical)};
  auto report = auditor.audit_and_fix(tasks);

  ASSERT_EQ(report.fixes.size(), 1u);
  EXPECT_TRUE(report.fixes[0].applied);
  EXPECT_EQ(report.fixes[0].action, FixAction::RaisePriority);
  EXPECT_EQ(tasks.find(task_id("L"))->priority, TaskPriority::Medium);
  EXPECT_EQ(report.count(IssueType::PriorityInconsistency), 0u);
  EXPECT_EQ(tasks.find(task_id("H"))->dependencies, ids({"L"}));
}

TEST_F(AuditorTest, OrphanClearsOnceConnected) {
  auto tasks = collection({task("A"), task("B").deps({"C"}), task("C")});
  DependencyAuditor auditor{only(&AuditChecks::orphans)};

  auto before = auditor.audit(tasks);
  ASSERT_EQ(before.count(IssueType::OrphanedTask), 1u);
  EXPECT_EQ(before.issues[0].affected_tasks, ids({"A"}));
  EXPECT_EQ(before.summary.orphaned_tasks, 1u);

  tasks.find(task_id("A"))->dependencies.push_back(task_id("C"));
  auto after = auditor.audit(tasks);
  EXPECT_EQ(after.count(IssueType::OrphanedTask), 0u);
}

TEST_F(AuditorTest, RedundancyFixIsIdempotent) {
  auto tasks = collection({
      task("A").deps({"B", "C"}),
      task("B").deps({"C"}),
      task("C"),
  });
  DependencyAuditor auditor{only(&AuditChecks::redundant)};

  auto first = auditor.audit_and_fix(tasks);
  ASSERT_EQ(first.fixes.size(), 1u);
  EXPECT_TRUE(first.fixes[0].applied);
  EXPECT_EQ(first.fixes[0].task_id, task_id("A"));
  EXPECT_EQ(first.fixes[0].target, task_id("C"));
  EXPECT_EQ(tasks.find(task_id("A"))->dependencies, ids({"B"}));
  EXPECT_EQ(first.count(IssueType::RedundantDependency), 0u);

  auto second = auditor.audit_and_fix(tasks);
  EXPECT_TRUE(second.fixes.empty());
  EXPECT_EQ(tasks.find(task_id("A"))->dependencies, ids({"B"}));
}

TEST_F(AuditorTest, RedundancyReportsPath) {
  auto tasks = collection({
      task("A").deps({"B", "D"}),
      task("B").deps({"C"}),
      task("C").deps({"D"}),
      task("D"),
  });
  auto report = DependencyAuditor{only(&AuditChecks::redundant)}.audit(tasks);
  ASSERT_EQ(report.count(IssueType::RedundantDependency), 1u);
  const auto& issue = report.issues[0];
  EXPECT_EQ(issue.path, ids({"A", "B", "C", "D"}));
  EXPECT_TRUE(issue.description.ends_with("via path: A → B → C → D"));
  EXPECT_EQ(report.summary.redundant_dependencies, 1u);
}

TEST_F(AuditorTest, SingleDependencyIsNeverRedundant) {
  auto tasks = collection({
      task("A").deps({"B"}),
      task("B").deps({"A"}),
  });
  auto report = DependencyAuditor{only(&AuditChecks::redundant)}.audit(tasks);
  EXPECT_TRUE(report.issues.empty());
}

TEST_F(AuditorTest, BottleneckAndLongChain) {
  auto tasks = collection({
      task("root"),
      task("a").deps({"root"}),
      task("b").deps({"root"}),
      task("c").deps({"root"}),
      task("d").deps({"c"}),
      task("e").deps({"d"}),
      task("f").deps({"e"}),
  });
  auto report =
      DependencyAuditor{only(&AuditChecks::critical_path)}.audit(tasks);

  ASSERT_EQ(report.count(IssueType::Bottleneck), 1u);
  auto bottleneck = std::ranges::find(report.issues, IssueType::Bottleneck,
                                      &Issue::type);
  EXPECT_EQ(bottleneck->affected_tasks, ids({"root"}));
  EXPECT_EQ(bottleneck->severity, Severity::Warning);

  ASSERT_EQ(report.count(IssueType::LongChain), 1u);
  auto chain =
      std::ranges::find(report.issues, IssueType::LongChain, &Issue::type);
  EXPECT_EQ(chain->affected_tasks, ids({"f"}));
  EXPECT_NE(chain->description.find("5 tasks"), std::string::npos);
}

TEST_F(AuditorTest, MinimumSeverityFiltersIssues) {
  auto tasks = collection({
      task("A").deps({"ghost"}),
      task("B"),
  });
  AuditOptions options;
  options.min_severity = Severity::Critical;
  auto report = DependencyAuditor{options}.audit(tasks);
  ASSERT_EQ(report.issues.size(), 1u);
  EXPECT_EQ(report.issues[0].type, IssueType::MissingDependency);
  EXPECT_EQ(report.summary.info, 0u);
  EXPECT_EQ(report.summary.critical, 1u);
}

TEST_F(AuditorTest, NonFixableIssuesAreListedInFixes) {
  auto tasks = collection({
      task("A").deps({"B"}),
      task("B").deps({"A"}),
  });
  auto report = DependencyAuditor{only(&AuditChecks::cycles)}.audit_and_fix(tasks);
  ASSERT_EQ(report.fixes.size(), 1u);
  EXPECT_FALSE(report.fixes[0].applied);
  EXPECT_EQ(report.fixes[0].reason, "Issue is not auto-fixable");
  EXPECT_EQ(report.count(IssueType::Cycle), 1u);
}

TEST_F(AuditorTest, MetricsOnRequest) {
  auto tasks = collection({task("A"), task("B").deps({"A"})});
  AuditOptions options;
  options.include_metrics = true;
  auto report = DependencyAuditor{options}.audit(tasks);
  ASSERT_TRUE(report.metrics.has_value());
  EXPECT_EQ(report.metrics->total_tasks, 2u);
  EXPECT_EQ(report.metrics->longest_dependency_chain, 2u);
}
