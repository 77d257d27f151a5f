#pragma once

#include <mutex>
#include <optional>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace cirrus::db::memory {

/*
  Transaction = writer lock + write set

  Reads go straight to the committed state while the lock is held. The
  first write copies it, so read-only transactions never pay for a copy.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    if (!working_) working_ = repo_.committed_;
    return *working_;
  }
  const MemoryRepository::State& View() const {
    return working_ ? *working_ : repo_.committed_;
  }

  // True once a write has copied the committed state.
  bool HasWrites() const {
    return working_.has_value();
  }

 private:
  MemoryRepository&                      repo_;
  std::unique_lock<std::mutex>           lock_;
  std::optional<MemoryRepository::State> working_;
  bool                                   committed_ = false;
};

} // namespace cirrus::db::memory
