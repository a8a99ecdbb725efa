#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/db/model/legacy_snapshot_row.hpp"

namespace snapmig::migration {

/*
  Bounded blocking queue feeding one migration worker.
*/
class EntityQueue {
 public:
  explicit EntityQueue(std::size_t capacity);

  // blocks while full; false once aborted
  bool Enqueue(db::model::LegacySnapshotRow row);

  // blocking wait; nullopt once aborted
  std::optional<db::model::LegacySnapshotRow> Dequeue();

  // Stops the queue and drops whatever is still queued.
  // Returns the number of dropped rows.
  std::size_t Abort();

 private:
  std::mutex                               mutex_;
  std::condition_variable                  not_empty_;
  std::condition_variable                  not_full_;
  std::deque<db::model::LegacySnapshotRow> queue_;
  std::size_t                              capacity_;
  bool                                     aborted_ = false;
};

} // namespace snapmig::migration
