#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace kinship::db::memory {

/*
  Transaction = shared snapshot + private copy made on first write
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
  const MemoryRepository::State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

 private:
  MemoryRepository&                        repo_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::unique_ptr<MemoryRepository::State>  working_;
  uint64_t                                 snapshot_version_ = 0;
  bool                                     committed_        = false;
  bool                                     rolled_back_      = false;
};

} // namespace kinship::db::memory
