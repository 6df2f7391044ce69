#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace catalog::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (committed_ || rolled_back_) {
    throw util::StorageError("memory transaction is no longer active");
  }
  return working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  if (committed_ || rolled_back_) {
    throw util::StorageError("memory transaction is no longer active");
  }
  return working_;
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw util::StorageError("cannot commit a rolled back transaction");
  }
  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw util::StorageError("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_     = {};
  rolled_back_ = true;
}

} // namespace catalog::db::memory
