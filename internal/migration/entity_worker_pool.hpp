#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "entity_queue.hpp"

namespace snapmig::migration {

/*
  EntityWorkerPool

  N workers, each draining its own bounded EntityQueue. A row is routed
  by hash of its persistence_id, so all rows of one entity are handled
  by the same worker in submission order.

  Failure:
    The first exception thrown by the handler is kept. Every queue is
    aborted (queued rows are dropped), later rows are not handled, and
    the exception is rethrown from the next Submit() / Drain().
*/
class EntityWorkerPool {
 public:
  using Handler = std::function<void(const db::model::LegacySnapshotRow&)>;

  EntityWorkerPool(std::size_t workers, std::size_t queue_capacity, Handler handler);
  ~EntityWorkerPool();

  EntityWorkerPool(const EntityWorkerPool&)            = delete;
  EntityWorkerPool& operator=(const EntityWorkerPool&) = delete;

  // blocks while the target worker's queue is full
  void Submit(db::model::LegacySnapshotRow row);

  // waits until every submitted row has been handled or dropped
  void Drain();

  static std::size_t WorkerFor(const std::string& persistence_id, std::size_t workers);

 private:
  void Run(std::size_t index);
  void Fail(std::exception_ptr error);
  void Settle(std::size_t count);
  void RethrowIfFailed();

  Handler handler_;

  std::vector<std::unique_ptr<EntityQueue>> queues_;
  std::vector<std::thread>                  threads_;

  std::mutex              mutex_;
  std::condition_variable settled_cv_;
  std::size_t             pending_ = 0;
  std::exception_ptr      error_;
  std::atomic<bool>       failed_{false};
};

} // namespace snapmig::migration
