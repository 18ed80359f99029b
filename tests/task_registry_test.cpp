#include "stagehand/scheduler/task_registry.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <string>
#include <vector>

using namespace stagehand;
using stagehand::test::make_task;

class TaskRegistryTest : public ::testing::Test {
protected:
  TaskRegistry registry_;
};

TEST_F(TaskRegistryTest, AddTaskRegistersNode) {
  ASSERT_TRUE(registry_.add_task(make_task("build")).has_value());
  EXPECT_EQ(registry_.size(), 1);
  EXPECT_EQ(registry_.definition(0).name, TaskId{"build"});
  EXPECT_TRUE(registry_.graph().has_node(TaskId{"build"}));
}

TEST_F(TaskRegistryTest, DuplicateNameFails) {
  ASSERT_TRUE(registry_.add_task(make_task("build")).has_value());
  auto r = registry_.add_task(make_task("build"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::DuplicateTask);
  EXPECT_EQ(registry_.size(), 1);
}

TEST_F(TaskRegistryTest, EmptyNameOrMissingOperationFails) {
  auto unnamed = registry_.add_task(make_task(""));
  ASSERT_FALSE(unnamed.has_value());
  EXPECT_EQ(unnamed.error(), Error::InvalidArgument);

  auto no_op = registry_.add_task(TaskDefinition{.name = TaskId{"idle"}});
  ASSERT_FALSE(no_op.has_value());
  EXPECT_EQ(no_op.error(), Error::InvalidArgument);
  EXPECT_EQ(registry_.size(), 0);
}

TEST_F(TaskRegistryTest, DependenciesOfUnknownTaskFail) {
  auto r = registry_.add_dependencies("foo", {});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::UnknownTask);
  EXPECT_EQ(r.error().message(), "The task \"foo\" has not been registered");
}

TEST_F(TaskRegistryTest, UnknownDependencyFails) {
  ASSERT_TRUE(registry_.add_task(make_task("foo")).has_value());
  auto r = registry_.add_dependencies("foo", {"bar"});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), Error::UnknownDependency);
  EXPECT_EQ(r.error().message(),
            "The task \"foo\" depends on \"bar\", which has not been "
            "registered");
}

TEST_F(TaskRegistryTest, FailedCallInsertsNoEdges) {
  ASSERT_TRUE(registry_.add_task(make_task("app")).has_value());
  ASSERT_TRUE(registry_.add_task(make_task("lib")).has_value());
  auto r = registry_.add_dependencies("app", {"lib", "ghost"});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(registry_.graph().edge_count(), 0);
}

TEST_F(TaskRegistryTest, DependenciesFromOwnedStrings) {
  ASSERT_TRUE(registry_.add_task(make_task("app")).has_value());
  ASSERT_TRUE(registry_.add_task(make_task("lib")).has_value());
  ASSERT_TRUE(registry_.add_task(make_task("gen")).has_value());
  const std::vector<std::string> deps{"lib", "gen"};
  ASSERT_TRUE(registry_.add_dependencies("app", deps).has_value());

  const auto &graph = registry_.graph();
  EXPECT_TRUE(graph.has_edge(graph.index_of("lib"), graph.index_of("app")));
  EXPECT_TRUE(graph.has_edge(graph.index_of("gen"), graph.index_of("app")));
}

TEST_F(TaskRegistryTest, RepeatedDependencyIsStoredOnce) {
  ASSERT_TRUE(registry_.add_task(make_task("a")).has_value());
  ASSERT_TRUE(registry_.add_task(make_task("b")).has_value());
  ASSERT_TRUE(registry_.add_dependencies("b", {"a", "a"}).has_value());
  ASSERT_TRUE(registry_.add_dependencies("b", {"a"}).has_value());
  EXPECT_EQ(registry_.graph().edge_count(), 1);
}

TEST_F(TaskRegistryTest, SealedRegistryIsReadOnly) {
  ASSERT_TRUE(registry_.add_task(make_task("a")).has_value());
  ASSERT_TRUE(registry_.add_task(make_task("b")).has_value());
  EXPECT_FALSE(registry_.is_sealed());
  registry_.seal();
  EXPECT_TRUE(registry_.is_sealed());

  auto add = registry_.add_task(make_task("c"));
  ASSERT_FALSE(add.has_value());
  EXPECT_EQ(add.error(), Error::ReadOnly);

  auto link = registry_.add_dependencies("b", {"a"});
  ASSERT_FALSE(link.has_value());
  EXPECT_EQ(link.error(), Error::ReadOnly);
}

TEST(TaskStatusTest, NamesRoundTripThroughSnakeCase) {
  EXPECT_EQ(to_string_view(TaskStatus::SuccessWithWarning),
            "success_with_warning");
  EXPECT_EQ(to_string_view(TaskState::Pending), "pending");
  EXPECT_EQ(parse<TaskStatus>("success_with_warning"),
            TaskStatus::SuccessWithWarning);
  EXPECT_EQ(parse<TaskStatus>("Blocked"), TaskStatus::Blocked);
  EXPECT_FALSE(parse<TaskStatus>("skipped").has_value());
}
