#include "entity_worker_pool.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace snapmig::migration {

EntityWorkerPool::EntityWorkerPool(std::size_t workers, std::size_t queue_capacity, Handler handler)
    : handler_(std::move(handler)) {
  workers = std::max<std::size_t>(workers, 1);

  queues_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    queues_.push_back(std::make_unique<EntityQueue>(queue_capacity));
  }

  threads_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&EntityWorkerPool::Run, this, i);
  }
}

EntityWorkerPool::~EntityWorkerPool() {
  for (auto& queue : queues_) {
    queue->Abort();
  }
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
}

std::size_t EntityWorkerPool::WorkerFor(const std::string& persistence_id, std::size_t workers) {
  return std::hash<std::string>{}(persistence_id) % workers;
}

void EntityWorkerPool::Submit(db::model::LegacySnapshotRow row) {
  RethrowIfFailed();

  const auto index = WorkerFor(row.persistence_id, queues_.size());
  {
    std::lock_guard lock(mutex_);
    ++pending_;
  }

  if (!queues_[index]->Enqueue(std::move(row))) {
    Settle(1);
    RethrowIfFailed();
    throw util::InvalidState("migration worker pool is shut down");
  }
}

void EntityWorkerPool::Drain() {
  {
    std::unique_lock lock(mutex_);
    settled_cv_.wait(lock, [&] { return pending_ == 0; });
  }
  RethrowIfFailed();
}

void EntityWorkerPool::Run(std::size_t index) {
  auto& queue = *queues_[index];

  while (auto row = queue.Dequeue()) {
    if (!failed_.load()) {
      try {
        handler_(*row);
      } catch (...) {
        Fail(std::current_exception());
      }
    }
    Settle(1);
  }
}

void EntityWorkerPool::Fail(std::exception_ptr error) {
  {
    std::lock_guard lock(mutex_);
    if (!error_) error_ = std::move(error);
  }
  failed_ = true;

  std::size_t dropped = 0;
  for (auto& queue : queues_) {
    dropped += queue->Abort();
  }
  Settle(dropped);
}

void EntityWorkerPool::Settle(std::size_t count) {
  if (count == 0) return;
  {
    std::lock_guard lock(mutex_);
    pending_ -= count;
  }
  settled_cv_.notify_all();
}

void EntityWorkerPool::RethrowIfFailed() {
  std::exception_ptr error;
  {
    std::lock_guard lock(mutex_);
    error = error_;
  }
  if (error) std::rethrow_exception(error);
}

} // namespace snapmig::migration
