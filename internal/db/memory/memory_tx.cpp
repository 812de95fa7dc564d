#include "memory_tx.hpp"

#include <stdexcept>

namespace telemetry::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  EnsureOpen();
  undo_.clear();
  committed_ = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;

  for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
    (*it)(repo_.state_);
  }
  undo_.clear();
  rolled_back_ = true;
  lock_.unlock();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  EnsureOpen();
  return repo_.state_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  EnsureOpen();
  return repo_.state_;
}

void MemoryTransaction::OnRollback(std::function<void(MemoryRepository::State&)> undo) {
  undo_.push_back(std::move(undo));
}

void MemoryTransaction::EnsureOpen() const {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
}

} // namespace telemetry::db::memory
