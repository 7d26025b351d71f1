#pragma once

#include "ledger/store/i_durable_store.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// TransactionalStore
// -----------------------------------------------------------------------------
//
// @brief  Write-buffering overlay over a backing IDurableStore. Gives one
//         engine invocation all-or-nothing visibility of its writes.
//
// @details
// set()/remove() go into a pending map (a removal is a pending nullopt).
// get()/has() consult the pending map first, so an invocation reads its own
// writes. commit() applies the pending map to the backing store in key
// order and clears it; rollback() discards it.
//
// The overlay does not flush the backing store; the engine flushes after
// commit.
// -----------------------------------------------------------------------------
class TransactionalStore final : public IDurableStore {
 public:
  explicit TransactionalStore(IDurableStore& backing) : backing_(backing) {}

  std::optional<nlohmann::json> get(const std::string& key) const override;
  void set(const std::string& key, nlohmann::json value) override;
  bool has(const std::string& key) const override;
  void remove(const std::string& key) override;

  // Flushes the backing store. Pending writes are not included.
  void flush() override { backing_.flush(); }

  void commit();
  void rollback();

  // Number of buffered, uncommitted writes.
  std::size_t pendingCount() const { return pending_.size(); }

  IDurableStore& backing() { return backing_; }

 private:
  IDurableStore& backing_;
  std::map<std::string, std::optional<nlohmann::json>> pending_;
};

}  // namespace ledger
