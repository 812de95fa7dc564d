#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace telemetry::db::memory {

/*
  Transaction = exclusive lock + undo log.

  Writes land in the shared state immediately; the lock keeps them
  invisible to other transactions until Commit() releases it.
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

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const;

  // Registers the inverse of a write that has just been applied.
  void OnRollback(std::function<void(MemoryRepository::State&)> undo);

 private:
  void EnsureOpen() const;

  MemoryRepository&                                            repo_;
  std::unique_lock<std::mutex>                                 lock_;
  std::vector<std::function<void(MemoryRepository::State&)>> undo_;
  bool                                                         committed_   = false;
  bool                                                         rolled_back_ = false;
};

} // namespace telemetry::db::memory
