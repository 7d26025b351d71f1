#include "ledger/store/record_store.hpp"

#include "ledger/store/record_codec.hpp"
#include "ledger/store/storage_keys.hpp"

#include <algorithm>

namespace ledger {

namespace {

// Loads and decodes the record at key, or nullopt if absent.
template <typename Record>
std::optional<Record> loadAs(const IDurableStore& store,
                             const std::string& key) {
  auto stored = store.get(key);
  if (!stored) {
    return std::nullopt;
  }
  return stored->get<Record>();
}

}  // namespace

std::optional<domain::Transaction> RecordStore::loadTransaction(
    domain::EntityId id) const {
  return loadAs<domain::Transaction>(
      store_, keys::record(domain::EntityKind::Transaction, id));
}

void RecordStore::saveTransaction(const domain::Transaction& tx) {
  store_.set(keys::record(domain::EntityKind::Transaction, tx.id), tx);
}

std::optional<domain::Escrow> RecordStore::loadEscrow(
    domain::EntityId id) const {
  return loadAs<domain::Escrow>(store_,
                                keys::record(domain::EntityKind::Escrow, id));
}

void RecordStore::saveEscrow(const domain::Escrow& escrow) {
  store_.set(keys::record(domain::EntityKind::Escrow, escrow.id), escrow);
}

std::optional<domain::Invoice> RecordStore::loadInvoice(
    domain::EntityId id) const {
  return loadAs<domain::Invoice>(
      store_, keys::record(domain::EntityKind::Invoice, id));
}

void RecordStore::saveInvoice(const domain::Invoice& invoice) {
  store_.set(keys::record(domain::EntityKind::Invoice, invoice.id), invoice);
}

std::optional<domain::Party> RecordStore::loadAdmin() const {
  return loadAs<domain::Party>(store_, keys::admin());
}

void RecordStore::saveAdmin(const domain::Party& admin) {
  store_.set(keys::admin(), admin);
}

std::vector<domain::EntityId> RecordStore::historyIds(
    const domain::Party& party) const {
  auto ids = loadAs<std::vector<domain::EntityId>>(store_,
                                                   keys::partyHistory(party));
  return ids.value_or(std::vector<domain::EntityId>{});
}

void RecordStore::appendHistory(const domain::Party& party,
                                domain::EntityId id) {
  std::vector<domain::EntityId> ids = historyIds(party);
  if (std::find(ids.begin(), ids.end(), id) != ids.end()) {
    return;
  }
  ids.push_back(id);
  store_.set(keys::partyHistory(party), ids);
}

}  // namespace ledger
