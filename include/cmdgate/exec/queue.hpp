#pragma once

#include "cmdgate/common/result.hpp"
#include "cmdgate/exec/runner.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cmdgate::exec {

struct QueueOptions {
  std::size_t workers = 2;
  std::size_t capacity = 32;
};

/// Fixed worker pool that runs commands off the request thread. The timeout lives in
/// the runner; the queue only bounds how much work may wait.
class ExecutionQueue {
public:
  using Completion = std::function<void(const ExecutionResult &)>;

  ExecutionQueue(std::shared_ptr<const CommandRunner> runner, QueueOptions options = {});
  ~ExecutionQueue();

  ExecutionQueue(const ExecutionQueue &) = delete;
  ExecutionQueue &operator=(const ExecutionQueue &) = delete;

  /// `on_complete` runs on the worker thread before the future becomes ready.
  [[nodiscard]] common::Result<std::future<ExecutionResult>> submit(std::string command,
                                                                    Completion on_complete = {});

  [[nodiscard]] std::size_t depth() const;
  /// Stops accepting work, finishes what is queued and joins the workers.
  void shutdown();

private:
  struct Job {
    std::string command;
    std::promise<ExecutionResult> promise;
    Completion on_complete;
  };

  void worker_loop();

  std::shared_ptr<const CommandRunner> runner_;
  QueueOptions options_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool stopping_ = false;
  std::vector<std::thread> workers_;
};

} // namespace cmdgate::exec
