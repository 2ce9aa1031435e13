#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace relations::db::memory {

/*
  Transaction = repository lock + undo log

  The lock is held from Begin() until Commit()/Rollback(), so transactions
  are fully serialized. Writes go straight to the shared state and record
  an inverse operation; Rollback() replays the inverses newest first.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Undo = std::function<void(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  MemoryRepository::State& Mutable(Undo undo) {
    undo_.push_back(std::move(undo));
    return repo_.state_;
  }
  const MemoryRepository::State& View() const {
    return repo_.state_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  std::vector<Undo>            undo_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace relations::db::memory
