#include "memory_tx.hpp"

namespace snapmig::db::memory {

MemoryTransaction::MemoryTransaction(MemoryTargetRepository& repo) : repo_(repo), lock_(repo.tx_mutex_) {
  std::scoped_lock state_lock(repo_.state_mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  std::scoped_lock state_lock(repo_.state_mutex_);
  repo_.committed_ = std::move(working_);
  committed_       = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace snapmig::db::memory
