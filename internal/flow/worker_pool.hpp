#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace flowcheck::flow {

using Job = std::function<void()>;

/*
  Thread-safe blocking queue feeding the pool workers.
*/
class JobQueue {
 public:
  void Enqueue(Job job);

  // blocking wait; nullopt once shut down and drained
  std::optional<Job> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Job>         queue_;
  bool                    shutdown_ = false;
};

/*
  Fixed set of worker threads.

  RunAll() is the layer barrier: it hands every job to the workers and
  returns only when all of them have finished. Jobs must not throw.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  std::size_t Size() const {
    return threads_.size();
  }

  void RunAll(std::vector<Job> jobs);

 private:
  void Run();

  JobQueue                 queue_;
  std::vector<std::thread> threads_;

  std::mutex              done_mutex_;
  std::condition_variable done_cv_;
  std::size_t             outstanding_ = 0;
};

} // namespace flowcheck::flow
