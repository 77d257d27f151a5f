#include "memory_tx.hpp"

#include <stdexcept>

namespace cirrus::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.tx_mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_) {
    throw std::logic_error("transaction already finished");
  }
  if (working_) {
    repo_.committed_ = std::move(*working_);
    working_.reset();
  }
  committed_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  working_.reset();
  committed_ = true;
  if (lock_.owns_lock()) lock_.unlock();
}

} // namespace cirrus::db::memory
