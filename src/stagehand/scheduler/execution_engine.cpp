#include "stagehand/scheduler/execution_engine.hpp"

#include "stagehand/core/asio_awaitable.hpp"
#include "stagehand/util/log.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <exception>
#include <queue>
#include <ranges>
#include <utility>

namespace stagehand {

struct ExecutionEngine::Completion {
  NodeIndex node{kInvalidNode};
  TaskStatus status{TaskStatus::Failure};
  std::exception_ptr error;
};

struct ExecutionEngine::ChannelHolder {
  using Channel = boost::asio::experimental::concurrent_channel<void(
      boost::system::error_code, Completion)>;

  ChannelHolder(boost::asio::any_io_executor ex, std::size_t capacity)
      : channel(ex, capacity) {}

  Channel channel;
};

// Ready tasks ordered by the length of the chain they unblock, longest first;
// equal lengths go in registration order.
class ExecutionEngine::ReadyQueue {
public:
  explicit ReadyQueue(std::vector<std::uint32_t> priority)
      : priority_(std::move(priority)), heap_(Lower{&priority_}) {}

  auto push(NodeIndex idx) -> void { heap_.push(idx); }
  [[nodiscard]] auto pop() -> NodeIndex {
    auto top = heap_.top();
    heap_.pop();
    return top;
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return heap_.empty(); }

private:
  struct Lower {
    const std::vector<std::uint32_t> *priority;
    auto operator()(NodeIndex a, NodeIndex b) const -> bool {
      const auto pa = (*priority)[a];
      const auto pb = (*priority)[b];
      if (pa != pb) {
        return pa < pb;
      }
      return a > b;
    }
  };

  std::vector<std::uint32_t> priority_;
  std::priority_queue<NodeIndex, std::vector<NodeIndex>, Lower> heap_;
};

namespace {

[[nodiscard]] auto invoke_task(TaskFunction &fn, TaskWriter &writer)
    -> task<TaskStatus> {
  co_return co_await fn(writer);
}

} // namespace

ExecutionEngine::ExecutionEngine(TaskRegistry &registry,
                                 Parallelism parallelism,
                                 bool changed_projects_only,
                                 OutcomeHandler on_outcome)
    : registry_(registry), parallelism_(parallelism),
      changed_projects_only_(changed_projects_only),
      on_outcome_(std::move(on_outcome)) {}

ExecutionEngine::~ExecutionEngine() = default;

auto ExecutionEngine::run() -> task<Result<EngineStats>> {
  const auto &graph = registry_.graph();
  const auto count = graph.size();
  auto executor = co_await boost::asio::this_coro::executor;

  // Every task posts exactly once, so sends never wait for the receiver.
  channel_ =
      std::make_shared<ChannelHolder>(executor, std::max<std::size_t>(count, 1));

  states_.assign(count, TaskState::Pending);
  pending_deps_.assign(count, 0);
  writers_.clear();
  writers_.resize(count);
  started_at_.assign(count, {});
  elapsed_.assign(count, std::chrono::milliseconds{0});
  ready_ = std::make_unique<ReadyQueue>(graph.critical_path_lengths());
  running_ = 0;
  finished_ = 0;
  stats_ = {};

  for (auto idx : std::views::iota(NodeIndex{0}, static_cast<NodeIndex>(count))) {
    pending_deps_[idx] = graph.deps_view(idx).size();
    if (pending_deps_[idx] == 0) {
      states_[idx] = TaskState::Ready;
      ready_->push(idx);
    }
  }

  log::debug("executing {} tasks, parallelism {}", count,
             parallelism_.to_string());

  while (finished_ < count) {
    while (running_ < parallelism_.limit() && !ready_->empty()) {
      dispatch(ready_->pop());
    }
    if (running_ == 0) {
      log::error("{} tasks can never become ready", count - finished_);
      co_return fail(Error::InvalidState,
                     "Tasks remain that can never become ready");
    }

    auto [ec, completion] =
        co_await channel_->channel.async_receive(use_nothrow);
    if (ec) {
      log::error("completion channel failed: {}", ec.message());
      co_return fail(ec);
    }
    on_completed(std::move(completion));
  }

  channel_->channel.close();
  co_return ok(stats_);
}

auto ExecutionEngine::dispatch(NodeIndex idx) -> void {
  auto &def = registry_.definition(idx);
  writers_[idx] = std::make_unique<TaskWriter>(
      TaskContext{.name = def.name,
                  .is_incremental_build_allowed =
                      def.is_incremental_build_allowed,
                  .changed_projects_only = changed_projects_only_});
  states_[idx] = TaskState::Running;
  started_at_[idx] = std::chrono::steady_clock::now();
  ++running_;
  ++stats_.dispatched;
  stats_.peak_running = std::max(stats_.peak_running, running_);

  log::debug("starting task '{}' ({} running)", def.name, running_);

  co_spawn(channel_->channel.get_executor(),
           invoke_task(def.execute, *writers_[idx]),
           [channel = channel_, idx](std::exception_ptr error,
                                     TaskStatus status) {
             if (!channel->channel.try_send(
                     boost::system::error_code{},
                     Completion{.node = idx,
                                .status = status,
                                .error = std::move(error)})) {
               log::error("dropped completion for task index {}", idx);
             }
           });
}

auto ExecutionEngine::on_completed(Completion completion) -> void {
  const auto idx = completion.node;
  --running_;
  elapsed_[idx] = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started_at_[idx]);

  auto status = completion.status;
  auto &writer = *writers_[idx];
  if (completion.error) {
    status = TaskStatus::Failure;
    try {
      std::rethrow_exception(completion.error);
    } catch (const std::exception &e) {
      writer.write_error_line(e.what());
      log::warn("task '{}' threw: {}", writer.name(), e.what());
    } catch (...) {
      writer.write_error_line("Task threw a non-standard exception");
      log::warn("task '{}' threw a non-standard exception", writer.name());
    }
  } else if (status == TaskStatus::Blocked) {
    log::warn("task '{}' returned Blocked; recording it as a failure",
              writer.name());
    status = TaskStatus::Failure;
  }

  log::debug("task '{}' finished: {} in {}ms", writer.name(),
             to_string_view(status), elapsed_[idx].count());
  finish(idx, status, std::nullopt);

  if (!unblocks_dependents(status)) {
    block_dependents(idx);
    return;
  }
  for (NodeIndex dependent : registry_.graph().dependents_view(idx)) {
    if (--pending_deps_[dependent] == 0 &&
        states_[dependent] == TaskState::Pending) {
      states_[dependent] = TaskState::Ready;
      ready_->push(dependent);
    }
  }
}

auto ExecutionEngine::finish(NodeIndex idx, TaskStatus status,
                             std::optional<NodeIndex> blocked_by) -> void {
  const auto &graph = registry_.graph();
  states_[idx] = to_state(status);
  ++finished_;

  TaskOutcome outcome;
  outcome.name = graph.key_of(idx);
  outcome.status = status;
  outcome.elapsed = elapsed_[idx];
  outcome.had_empty_script = registry_.definition(idx).had_empty_script;
  if (auto &writer = writers_[idx]) {
    writer->close();
    outcome.std_output = writer->std_output();
    outcome.std_error = writer->std_error();
  }
  if (blocked_by) {
    outcome.blocked_by = graph.key_of(*blocked_by);
  }
  if (on_outcome_) {
    on_outcome_(outcome);
  }
}

auto ExecutionEngine::block_dependents(NodeIndex failed) -> void {
  const auto &graph = registry_.graph();
  std::vector<NodeIndex> frontier{failed};
  while (!frontier.empty()) {
    NodeIndex current = frontier.back();
    frontier.pop_back();
    for (NodeIndex dependent : graph.dependents_view(current)) {
      if (states_[dependent] != TaskState::Pending) {
        continue;
      }
      log::warn("task '{}' blocked by failure of '{}'", graph.key_of(dependent),
                graph.key_of(failed));
      finish(dependent, TaskStatus::Blocked, failed);
      frontier.push_back(dependent);
    }
  }
}

} // namespace stagehand
