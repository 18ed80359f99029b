#include "stagehand/core/runtime.hpp"
#include "stagehand/scheduler/execution_engine.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

using namespace stagehand;
using namespace std::chrono_literals;
using stagehand::test::make_task;

namespace {

// Shared by the tasks of one random DAG. Each task checks on start that all
// of its dependencies have already finished.
struct OrderLedger {
  std::mutex mutex;
  std::unordered_set<int> finished;
  std::vector<std::string> violations;
};

auto build_random_dag(TaskRegistry &registry, OrderLedger &ledger,
                      unsigned seed, int count) -> void {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> fan_in(0, 3);
  std::uniform_int_distribution<int> jitter_ms(0, 4);
  std::vector<std::vector<int>> deps(count);
  for (int i = 1; i < count; ++i) {
    std::uniform_int_distribution<int> pick(0, i - 1);
    for (int k = fan_in(rng); k > 0; --k) {
      deps[i].push_back(pick(rng));
    }
  }

  for (int i = 0; i < count; ++i) {
    const auto delay = std::chrono::milliseconds(jitter_ms(rng));
    auto added = registry.add_task(make_task(
        std::format("t{}", i),
        [&ledger, i, delay, needs = deps[i]](TaskWriter &)
            -> task<TaskStatus> {
          {
            std::lock_guard lock(ledger.mutex);
            for (int dep : needs) {
              if (!ledger.finished.contains(dep)) {
                ledger.violations.push_back(
                    std::format("t{} started before t{} finished", i, dep));
              }
            }
          }
          co_await test::sleep_for(delay);
          std::lock_guard lock(ledger.mutex);
          ledger.finished.insert(i);
          co_return TaskStatus::Success;
        }));
    ASSERT_TRUE(added.has_value());
  }
  for (int i = 0; i < count; ++i) {
    for (int dep : deps[i]) {
      auto linked = registry.add_dependencies(std::format("t{}", i),
                                              {std::format("t{}", dep)});
      ASSERT_TRUE(linked.has_value());
    }
  }
}

} // namespace

class ExecutionEngineTest : public ::testing::Test {
protected:
  // A task that logs its start, yields once, logs its end and then finishes
  // with `status`.
  auto recording(std::string name, TaskStatus status = TaskStatus::Success)
      -> TaskDefinition {
    return make_task(name, [this, name, status](TaskWriter &writer)
                               -> task<TaskStatus> {
      {
        std::lock_guard lock(mutex_);
        started_.push_back(name);
        events_.push_back("start " + name);
      }
      writer.write_line(std::format("ran {}", name));
      co_await test::sleep_for(1ms);
      {
        std::lock_guard lock(mutex_);
        events_.push_back("end " + name);
      }
      co_return status;
    });
  }

  auto add(TaskDefinition def) -> void {
    ASSERT_TRUE(registry_.add_task(std::move(def)).has_value());
  }

  auto depends(std::string_view task, std::string_view dependency) -> void {
    ASSERT_TRUE(registry_.add_dependencies(task, {dependency}).has_value());
  }

  auto run(Parallelism parallelism = Parallelism::unbounded())
      -> Result<EngineStats> {
    ExecutionEngine engine(registry_, parallelism, false,
                           [this](const TaskOutcome &outcome) {
                             outcomes_.push_back(outcome);
                           });
    auto result = test::run_coro(engine.run());
    for (NodeIndex i = 0; i < registry_.size(); ++i) {
      states_.push_back(engine.state(i));
    }
    return result;
  }

  auto outcome_of(std::string_view name) const -> const TaskOutcome * {
    auto it = std::ranges::find_if(
        outcomes_, [name](const auto &o) { return o.name == name; });
    return it == outcomes_.end() ? nullptr : &*it;
  }

  auto position(std::string_view name) const -> std::ptrdiff_t {
    return std::ranges::find(started_, name) - started_.begin();
  }

  TaskRegistry registry_;
  std::mutex mutex_;
  std::vector<std::string> started_;
  std::vector<std::string> events_;
  std::vector<TaskOutcome> outcomes_;
  std::vector<TaskState> states_;
};

TEST_F(ExecutionEngineTest, EmptyRegistryFinishesImmediately) {
  auto stats = run();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->dispatched, 0);
  EXPECT_TRUE(outcomes_.empty());
}

TEST_F(ExecutionEngineTest, ChainRunsInDependencyOrder) {
  add(recording("1"));
  add(recording("2"));
  depends("2", "1");

  ASSERT_TRUE(run().has_value());
  EXPECT_EQ(events_,
            (std::vector<std::string>{"start 1", "end 1", "start 2", "end 2"}));
  ASSERT_EQ(outcomes_.size(), 2);
  EXPECT_EQ(outcomes_[0].std_output, "ran 1\n");
}

TEST(ExecutionEngineOrderTest, RandomDagsNeverStartATaskBeforeItsDependencies) {
  constexpr int kTasks = 40;
  const std::vector<Parallelism> limits{Parallelism::from_count(1).value(),
                                        Parallelism::from_count(4).value(),
                                        Parallelism::unbounded()};
  for (unsigned seed : {1U, 7U, 42U, 2024U, 12345U}) {
    for (const auto &limit : limits) {
      SCOPED_TRACE(std::format("seed {} parallelism {}", seed,
                               limit.to_string()));
      TaskRegistry registry;
      OrderLedger ledger;
      build_random_dag(registry, ledger, seed, kTasks);

      ExecutionEngine engine(registry, limit, false, {});
      auto stats = test::run_coro(engine.run());
      ASSERT_TRUE(stats.has_value());
      EXPECT_EQ(stats->dispatched, static_cast<std::size_t>(kTasks));
      EXPECT_EQ(ledger.finished.size(), static_cast<std::size_t>(kTasks));
      EXPECT_TRUE(ledger.violations.empty()) << ledger.violations.front();
    }
  }
}

TEST(ExecutionEngineOrderTest, RandomDagKeepsOrderOnThreadPool) {
  constexpr int kTasks = 60;
  TaskRegistry registry;
  OrderLedger ledger;
  build_random_dag(registry, ledger, 99U, kTasks);

  Runtime runtime(4);
  ASSERT_TRUE(runtime.start().has_value());
  ExecutionEngine engine(registry, Parallelism::from_count(4).value(), false,
                         {});
  auto stats = runtime.block_on(engine.run());
  runtime.stop();

  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->dispatched, static_cast<std::size_t>(kTasks));
  std::lock_guard lock(ledger.mutex);
  EXPECT_EQ(ledger.finished.size(), static_cast<std::size_t>(kTasks));
  EXPECT_TRUE(ledger.violations.empty()) << ledger.violations.front();
}

TEST_F(ExecutionEngineTest, DiamondDependentRunsExactlyOnce) {
  add(recording("root"));
  add(recording("left"));
  add(recording("right"));
  add(recording("join"));
  depends("left", "root");
  depends("right", "root");
  depends("join", "left");
  depends("join", "right");

  auto stats = run();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->dispatched, 4);
  EXPECT_EQ(std::ranges::count(started_, std::string{"join"}), 1);
  EXPECT_EQ(started_.back(), "join");
}

TEST_F(ExecutionEngineTest, FailureBlocksTransitiveDependentsOnly) {
  add(recording("compile", TaskStatus::Failure));
  add(recording("link"));
  add(recording("package"));
  add(recording("docs"));
  depends("link", "compile");
  depends("package", "link");

  ASSERT_TRUE(run().has_value());
  EXPECT_EQ(states_[0], TaskState::Failure);
  EXPECT_EQ(states_[1], TaskState::Blocked);
  EXPECT_EQ(states_[2], TaskState::Blocked);
  EXPECT_EQ(states_[3], TaskState::Success);
  EXPECT_EQ(position("link"), static_cast<std::ptrdiff_t>(started_.size()));
  EXPECT_EQ(position("package"), static_cast<std::ptrdiff_t>(started_.size()));

  const auto *package = outcome_of("package");
  ASSERT_NE(package, nullptr);
  EXPECT_EQ(package->status, TaskStatus::Blocked);
  ASSERT_TRUE(package->blocked_by.has_value());
  EXPECT_EQ(*package->blocked_by, TaskId{"compile"});
  EXPECT_TRUE(package->std_output.empty());
}

TEST_F(ExecutionEngineTest, WarningDoesNotBlockDependents) {
  add(recording("lint", TaskStatus::SuccessWithWarning));
  add(recording("test"));
  depends("test", "lint");

  ASSERT_TRUE(run().has_value());
  EXPECT_EQ(states_[0], TaskState::SuccessWithWarning);
  EXPECT_EQ(states_[1], TaskState::Success);
}

TEST_F(ExecutionEngineTest, ThrowingTaskBecomesFailure) {
  add(make_task("explode", [](TaskWriter &) -> task<TaskStatus> {
    throw std::runtime_error("kaboom");
    co_return TaskStatus::Success;
  }));
  add(recording("after"));
  depends("after", "explode");

  ASSERT_TRUE(run().has_value());
  const auto *explode = outcome_of("explode");
  ASSERT_NE(explode, nullptr);
  EXPECT_EQ(explode->status, TaskStatus::Failure);
  EXPECT_NE(explode->std_error.find("kaboom"), std::string::npos);
  EXPECT_EQ(states_[1], TaskState::Blocked);
}

TEST_F(ExecutionEngineTest, ReturnedBlockedIsRecordedAsFailure) {
  add(recording("odd", TaskStatus::Blocked));
  ASSERT_TRUE(run().has_value());
  ASSERT_EQ(outcomes_.size(), 1);
  EXPECT_EQ(outcomes_[0].status, TaskStatus::Failure);
}

TEST_F(ExecutionEngineTest, LongestChainIsDispatchedFirst) {
  add(recording("short"));
  add(recording("long"));
  add(recording("long_tail"));
  depends("long_tail", "long");

  ASSERT_TRUE(run(Parallelism::from_count(1).value()).has_value());
  EXPECT_EQ(started_,
            (std::vector<std::string>{"long", "short", "long_tail"}));
}

TEST_F(ExecutionEngineTest, WriterCarriesTaskContext) {
  bool incremental = false;
  bool changed_only = false;
  auto def = make_task("ctx", [&](TaskWriter &writer) -> task<TaskStatus> {
    incremental = writer.context().is_incremental_build_allowed;
    changed_only = writer.context().changed_projects_only;
    co_return TaskStatus::Success;
  });
  def.is_incremental_build_allowed = true;
  add(std::move(def));

  ExecutionEngine engine(registry_, Parallelism::unbounded(), true, {});
  ASSERT_TRUE(test::run_coro(engine.run()).has_value());
  EXPECT_TRUE(incremental);
  EXPECT_TRUE(changed_only);
}

TEST_F(ExecutionEngineTest, UnboundedDispatchesAllReadyTasksAtOnce) {
  for (int i = 0; i < 10; ++i) {
    add(make_task(std::format("sleep{}", i),
                  [](TaskWriter &) -> task<TaskStatus> {
                    co_await test::sleep_for(20ms);
                    co_return TaskStatus::Success;
                  }));
  }
  auto stats = run();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->peak_running, 10);
}

TEST_F(ExecutionEngineTest, ParallelismBoundHoldsOnThreadPool) {
  constexpr int kTasks = 24;
  constexpr std::size_t kLimit = 3;
  std::atomic<int> current{0};
  std::atomic<int> peak{0};

  for (int i = 0; i < kTasks; ++i) {
    add(make_task(std::format("job{}", i),
                  [&current, &peak](TaskWriter &) -> task<TaskStatus> {
                    int now = ++current;
                    int seen = peak.load();
                    while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                    }
                    co_await test::sleep_for(5ms);
                    --current;
                    co_return TaskStatus::Success;
                  }));
  }

  Runtime runtime(4);
  ASSERT_TRUE(runtime.start().has_value());
  ExecutionEngine engine(registry_, Parallelism::from_count(kLimit).value(),
                         false, {});
  auto stats = runtime.block_on(engine.run());
  runtime.stop();

  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->dispatched, kTasks);
  EXPECT_LE(stats->peak_running, kLimit);
  EXPECT_LE(peak.load(), static_cast<int>(kLimit));
  EXPECT_GE(peak.load(), 1);
}

TEST(TaskWriterTest, WritesAfterCloseAreDropped) {
  TaskWriter writer(TaskContext{.name = TaskId{"late"}});
  writer.write("first ");
  writer.write_line("line");
  writer.write_error_line("oops");
  writer.close();
  writer.write_line("after close");
  writer.write_error("after close");

  EXPECT_EQ(writer.std_output(), "first line\n");
  EXPECT_EQ(writer.std_error(), "oops\n");
}
