#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_target_repository.hpp"

namespace snapmig::db::memory {

/*
  Transaction = exclusive lock + working copy
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryTargetRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryTargetRepository::State& Mutable() {
    return working_;
  }
  const MemoryTargetRepository::State& View() const {
    return working_;
  }

 private:
  MemoryTargetRepository&       repo_;
  std::unique_lock<std::mutex>  lock_;
  MemoryTargetRepository::State working_;
  bool                          committed_   = false;
  bool                          rolled_back_ = false;
};

} // namespace snapmig::db::memory
