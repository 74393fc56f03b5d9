// pks/scan/task_queue.hpp - Phased parallel task queue
#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace pks
{

/**
 * A fixed-size worker pool executing a batch of independent tasks.
 *
 * Adding tasks and running them are separate phases: every task is added
 * first, then run_and_wait() starts min(task_count, jobs) threads that each
 * repeatedly take the highest-priority remaining task. Results come back
 * through the futures returned by add_task(), so tasks never share output
 * state. Tasks must not be added while the queue is running.
 */
class TaskQueue
{
public:
  /// Starts one worker thread running the given loop
  using Spawner = std::function<std::thread(std::function<void()>)>;

  /**
   * @param jobs Maximum worker threads; 0 is treated as 1
   * @param spawner Thread factory; empty constructs std::thread directly
   */
  explicit TaskQueue(size_t jobs, Spawner spawner = {})
  : jobs_(jobs > 0 ? jobs : 1), spawner_(std::move(spawner))
  {
    if (!spawner_) {
      spawner_ = [](std::function<void()> fn) { return std::thread(std::move(fn)); };
    }
  }

  TaskQueue(const TaskQueue &) = delete;
  TaskQueue & operator=(const TaskQueue &) = delete;

  ~TaskQueue() { join_all(); }

  /// Number of hardware threads, at least 1
  [[nodiscard]] static size_t default_jobs() noexcept
  {
    const unsigned n = std::thread::hardware_concurrency();
    return n > 0 ? n : 1;
  }

  /**
   * Add a task. Not thread-safe; call before run_and_wait().
   *
   * @param fn Work to execute
   * @param priority Larger values run earlier
   * @return Future holding the task's result (or its exception)
   */
  template <typename TRes>
  [[nodiscard]] std::future<TRes> add_task(std::function<TRes()> fn, uint64_t priority = 0)
  {
    auto task = std::make_shared<std::packaged_task<TRes()>>(std::move(fn));
    std::future<TRes> result = task->get_future();
    tasks_.push(Entry{[task]() { (*task)(); }, priority});
    return result;
  }

  [[nodiscard]] size_t pending() const noexcept { return tasks_.size(); }

  /**
   * Run every queued task and block until all of them finished.
   *
   * If a thread cannot be started, the workers already running drain the
   * queue. Throws std::system_error only when no worker could be started.
   */
  void run_and_wait()
  {
    if (tasks_.empty()) return;

    const size_t thread_count = std::min(tasks_.size(), jobs_);
    threads_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
      try {
        threads_.push_back(spawner_([this] { work(); }));
      } catch (const std::system_error &) {
        if (threads_.empty()) throw;
        break;
      }
    }
    join_all();
  }

private:
  struct Entry
  {
    std::function<void()> fn;
    uint64_t priority = 0;

    bool operator<(const Entry & other) const { return priority < other.priority; }
  };

  void work()
  {
    while (true) {
      std::unique_lock<std::mutex> lock(mutex_);
      if (tasks_.empty()) return;
      Entry entry = tasks_.top();
      tasks_.pop();
      lock.unlock();
      entry.fn();
    }
  }

  void join_all()
  {
    for (auto & t : threads_) {
      if (t.joinable()) t.join();
    }
    threads_.clear();
  }

  size_t jobs_;
  Spawner spawner_;
  std::priority_queue<Entry> tasks_;
  std::mutex mutex_;
  std::vector<std::thread> threads_;
};

}  // namespace pks
