#include "entity_queue.hpp"

#include <algorithm>

namespace snapmig::migration {

EntityQueue::EntityQueue(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool EntityQueue::Enqueue(db::model::LegacySnapshotRow row) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return aborted_ || queue_.size() < capacity_; });

    if (aborted_) return false;

    queue_.push_back(std::move(row));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<db::model::LegacySnapshotRow> EntityQueue::Dequeue() {
  std::optional<db::model::LegacySnapshotRow> row;
  {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [&] { return aborted_ || !queue_.empty(); });

    if (aborted_) return std::nullopt;

    row = std::move(queue_.front());
    queue_.pop_front();
  }
  not_full_.notify_one();
  return row;
}

std::size_t EntityQueue::Abort() {
  std::size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    aborted_ = true;
    dropped  = queue_.size();
    queue_.clear();
  }
  not_empty_.notify_all();
  not_full_.notify_all();
  return dropped;
}

} // namespace snapmig::migration
