#pragma once

#include "ledger/domain/escrow.hpp"
#include "ledger/domain/invoice.hpp"
#include "ledger/domain/party.hpp"
#include "ledger/domain/transaction.hpp"
#include "ledger/store/i_durable_store.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// RecordStore
// -----------------------------------------------------------------------------
//
// @brief  Typed view over an IDurableStore: loads and saves whole entity
//         snapshots keyed by (kind, id), the admin singleton and the party
//         history index.
//
// @details
// Every save is a whole-record overwrite. The store never relates records of
// different kinds to each other; that belongs to the workflows.
//
// The underlying store is injected at construction. Workflows use a
// RecordStore over the invocation's TransactionalStore so that every record,
// index and status write of one operation lands together.
//
// Exceptions: load*() propagate codec exceptions for corrupt records.
// -----------------------------------------------------------------------------
class RecordStore {
 public:
  explicit RecordStore(IDurableStore& store) : store_(store) {}

  std::optional<domain::Transaction> loadTransaction(domain::EntityId id) const;
  void saveTransaction(const domain::Transaction& tx);

  std::optional<domain::Escrow> loadEscrow(domain::EntityId id) const;
  void saveEscrow(const domain::Escrow& escrow);

  std::optional<domain::Invoice> loadInvoice(domain::EntityId id) const;
  void saveInvoice(const domain::Invoice& invoice);

  std::optional<domain::Party> loadAdmin() const;
  void saveAdmin(const domain::Party& admin);

  // -------------------------------------------------------------------------
  // Party history index
  // -------------------------------------------------------------------------
  // appendHistory() adds id to the party's list if not already present.
  // Ids are appended in allocation order, so the list is ascending.
  // -------------------------------------------------------------------------
  std::vector<domain::EntityId> historyIds(const domain::Party& party) const;
  void appendHistory(const domain::Party& party, domain::EntityId id);

 private:
  IDurableStore& store_;
};

}  // namespace ledger
