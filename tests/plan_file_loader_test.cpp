#include "planq/config/plan_file_loader.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace planq;
using namespace planq::test;

namespace {

constexpr std::string_view kDiamondPlan = R"(
id = "auth-rework"
summary = "Rework authentication"
project_path = "/srv/app"

[[tasks]]
id = "schema"
title = "Add session table"
description = "Create the sessions table."
acceptance_criteria = ["migration runs", "rollback works"]

[[tasks]]
id = "api"
title = "Session API"
dependencies = ["schema"]
technical_notes = ["reuse the token helper"]

[[tasks]]
id = "ui"
title = "Login form"
dependencies = ["schema"]

[[tasks]]
id = "e2e"
title = "End to end test"
dependencies = ["api", "ui"]
)";

} // namespace

TEST(PlanFileLoaderTest, LoadsTasksInFileOrder) {
  auto plan = PlanFileLoader::load_from_string(kDiamondPlan);
  ASSERT_TRUE(plan.has_value()) << plan.error().message();

  EXPECT_EQ(plan->id, "auth-rework");
  EXPECT_EQ(plan->summary, "Rework authentication");
  EXPECT_EQ(plan->project_path, "/srv/app");
  EXPECT_EQ(plan->status, PlanStatus::Ready);
  ASSERT_EQ(plan->tasks.size(), 4U);

  EXPECT_EQ(plan->tasks[0].id, "schema");
  EXPECT_EQ(plan->tasks[0].ordinal, 0);
  EXPECT_EQ(plan->tasks[0].plan_id, "auth-rework");
  EXPECT_EQ(plan->tasks[0].acceptance_criteria.size(), 2U);
  EXPECT_EQ(plan->tasks[1].technical_notes,
            std::vector<std::string>{"reuse the token helper"});
  EXPECT_EQ(plan->tasks[3].ordinal, 3);
  ASSERT_EQ(plan->tasks[3].dependencies.size(), 2U);
  EXPECT_EQ(plan->tasks[3].dependencies[1], "ui");
  for (const auto &t : plan->tasks) {
    EXPECT_EQ(t.status, TaskStatus::Pending);
  }
}

TEST(PlanFileLoaderTest, LoadsFromFile) {
  const auto dir = make_temp_dir();
  ASSERT_FALSE(dir.empty());
  const auto path = std::filesystem::path(dir) / "plan.toml";
  write_file(path, kDiamondPlan);

  auto plan = PlanFileLoader::load_from_file(path.string());
  ASSERT_TRUE(plan.has_value()) << plan.error().message();
  EXPECT_EQ(plan->tasks.size(), 4U);
  std::filesystem::remove_all(dir);
}

TEST(PlanFileLoaderTest, MissingFileReportsPath) {
  std::string diagnostic;
  auto plan =
      PlanFileLoader::load_from_file("/nonexistent/plan.toml", &diagnostic);
  ASSERT_FALSE(plan.has_value());
  EXPECT_EQ(plan.error(), make_error_code(Error::FileNotFound));
  EXPECT_NE(diagnostic.find("/nonexistent/plan.toml"), std::string::npos);
}

TEST(PlanFileLoaderTest, RejectsUnknownAndSelfDependencies) {
  std::string diagnostic;
  auto plan = PlanFileLoader::load_from_string(R"(
id = "p"
project_path = "/srv/app"

[[tasks]]
id = "a"
dependencies = ["a"]

[[tasks]]
id = "b"
dependencies = ["missing"]
)",
                                               &diagnostic);
  ASSERT_FALSE(plan.has_value());
  EXPECT_EQ(plan.error(), make_error_code(Error::InvalidArgument));
  EXPECT_NE(diagnostic.find("task 'a' depends on itself"), std::string::npos);
  EXPECT_NE(diagnostic.find("task 'b' depends on unknown task 'missing'"),
            std::string::npos);
}

TEST(PlanFileLoaderTest, RejectsDuplicateIds) {
  std::string diagnostic;
  auto plan = PlanFileLoader::load_from_string(R"(
id = "p"
project_path = "/srv/app"

[[tasks]]
id = "a"

[[tasks]]
id = "a"
)",
                                               &diagnostic);
  ASSERT_FALSE(plan.has_value());
  EXPECT_NE(diagnostic.find("duplicate task id 'a'"), std::string::npos);
}

TEST(PlanFileLoaderTest, RejectsCycles) {
  std::string diagnostic;
  auto plan = PlanFileLoader::load_from_string(R"(
id = "p"
project_path = "/srv/app"

[[tasks]]
id = "a"
dependencies = ["c"]

[[tasks]]
id = "b"
dependencies = ["a"]

[[tasks]]
id = "c"
dependencies = ["b"]
)",
                                               &diagnostic);
  ASSERT_FALSE(plan.has_value());
  EXPECT_EQ(plan.error(), make_error_code(Error::CycleDetected));
  EXPECT_EQ(diagnostic, "dependency cycle: a -> c -> b -> a");
}

TEST(PlanFileLoaderTest, FindCycleOnAcyclicGraphIsEmpty) {
  std::vector<Task> tasks{make_task("p", "a", 0), make_task("p", "b", 1, {"a"}),
                          make_task("p", "c", 2, {"a", "b"})};
  EXPECT_TRUE(PlanFileLoader::find_cycle(tasks).empty());
}

TEST(PlanFileLoaderTest, RequiresProjectPathAndTasks) {
  auto errors = PlanFileLoader::validate(make_plan("p", "", {}));
  EXPECT_EQ(errors.size(), 2U);
}
