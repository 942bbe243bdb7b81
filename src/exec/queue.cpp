#include "cmdgate/exec/queue.hpp"

#include "cmdgate/observability/global.hpp"

#include <exception>

namespace cmdgate::exec {

ExecutionQueue::ExecutionQueue(std::shared_ptr<const CommandRunner> runner, QueueOptions options)
    : runner_(std::move(runner)), options_(options) {
  if (runner_ == nullptr) {
    runner_ = std::make_shared<const CommandRunner>();
  }
  const std::size_t count = options_.workers == 0 ? 1 : options_.workers;
  workers_.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this] { worker_loop(); });
  }
}

ExecutionQueue::~ExecutionQueue() { shutdown(); }

common::Result<std::future<ExecutionResult>> ExecutionQueue::submit(std::string command,
                                                                    Completion on_complete) {
  using Out = common::Result<std::future<ExecutionResult>>;
  std::future<ExecutionResult> future;
  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      return Out::failure("execution queue is stopped");
    }
    if (jobs_.size() >= options_.capacity) {
      return Out::failure("execution queue is full");
    }
    Job job{.command = std::move(command), .promise = {}, .on_complete = std::move(on_complete)};
    future = job.promise.get_future();
    jobs_.push_back(std::move(job));
    depth = jobs_.size();
  }
  cv_.notify_one();
  observability::record_metric(observability::QueueDepthMetric{.depth = depth});
  return Out::success(std::move(future));
}

std::size_t ExecutionQueue::depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

void ExecutionQueue::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

void ExecutionQueue::worker_loop() {
  while (true) {
    Job job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (jobs_.empty()) {
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }

    ExecutionResult result = runner_->run(job.command);
    observability::record_command_executed(job.command, result.exit_code, result.succeeded,
                                           result.timed_out, result.duration);
    if (job.on_complete) {
      try {
        job.on_complete(result);
      } catch (const std::exception &err) {
        observability::record_error("exec", std::string("completion handler failed: ") +
                                                err.what());
      }
    }
    job.promise.set_value(std::move(result));
  }
}

} // namespace cmdgate::exec
