#include "worker_pool.hpp"

namespace flowcheck::flow {

void JobQueue::Enqueue(Job job) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(job));
  }
  cv_.notify_one();
}

std::optional<Job> JobQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Job job = std::move(queue_.front());
  queue_.pop();
  return job;
}

void JobQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

WorkerPool::WorkerPool(std::size_t workers) {
  if (workers == 0) workers = 1;
  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  queue_.Shutdown();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
}

void WorkerPool::RunAll(std::vector<Job> jobs) {
  if (jobs.empty()) return;

  {
    std::lock_guard lock(done_mutex_);
    outstanding_ += jobs.size();
  }
  for (auto& job : jobs) {
    queue_.Enqueue(std::move(job));
  }

  std::unique_lock lock(done_mutex_);
  done_cv_.wait(lock, [&] { return outstanding_ == 0; });
}

void WorkerPool::Run() {
  while (auto job = queue_.Dequeue()) {
    (*job)();

    std::lock_guard lock(done_mutex_);
    if (--outstanding_ == 0) done_cv_.notify_all();
  }
}

} // namespace flowcheck::flow
