#pragma once

#include "ledger/store/i_durable_store.hpp"
#include "ledger/transfer/i_value_transfer.hpp"

#include <optional>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// JournalValueTransfer: deterministic IValueTransfer kept in the ledger store
// -----------------------------------------------------------------------------
//
// @brief  Records every accepted movement as a journal entry and keeps a
//         running balance per party, both in the store it is given.
//
// @details
// Reference format: "<action>/<kind>/<id>", e.g. "release/escrow/7". The
// reference depends only on the request, so a replayed script yields the
// same confirmation tokens.
//
// Storage:
//   balance/<address>     decimal string, absent = 0
//   journal/<reference>   {"from","to","amount","memo"}
// The engine hands it the per-invocation overlay, so balances and entries
// commit or roll back together with the records of the same invocation and
// reach the durable store (and the snapshot file) at the same time.
//
// Balance model:
//   - With enforcement off (default) balances may go negative, so tests
//     can move value without funding parties first.
//   - With enforcement on, a movement whose sender holds less than the
//     amount is refused with InsufficientBalance and nothing changes.
// -----------------------------------------------------------------------------
class JournalValueTransfer final : public IValueTransfer {
 public:
  struct Entry {
    domain::Party from;
    domain::Party to;
    domain::Amount amount{0};
    std::string memo;
  };

  explicit JournalValueTransfer(IDurableStore& store,
                                bool enforce_balances = false)
      : store_(store), enforce_balances_(enforce_balances) {}

  Result<std::string> transfer(const TransferRequest& request) override;

  // Adds amount to party's balance outside of any workflow (funding).
  void credit(const domain::Party& party, domain::Amount amount);

  domain::Amount balanceOf(const domain::Party& party) const;

  // Journal entry issued under reference, if any.
  std::optional<Entry> lookup(const std::string& reference) const;

  void setEnforceBalances(bool value) { enforce_balances_ = value; }

 private:
  void adjust(const domain::Party& party, domain::Amount delta);

  IDurableStore& store_;
  bool enforce_balances_;
};

}  // namespace ledger
