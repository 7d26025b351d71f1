#include "ledger/transfer/journal_value_transfer.hpp"

#include "ledger/domain/lifecycle.hpp"
#include "ledger/store/record_codec.hpp"
#include "ledger/store/storage_keys.hpp"

#include <iostream>

namespace ledger {

// -----------------------------------------------------------------------------
// transfer(): check, debit/credit, journal entry, reference
// -----------------------------------------------------------------------------
Result<std::string> JournalValueTransfer::transfer(
    const TransferRequest& request) {
  if (enforce_balances_ && balanceOf(request.from) < request.amount) {
    std::cerr << "[JournalValueTransfer] WARNING: " << request.from.address
              << " cannot cover " << domain::amountToString(request.amount)
              << " for " << request.action << "\n";
    return ContractError::InsufficientBalance;
  }

  adjust(request.from, -request.amount);
  adjust(request.to, request.amount);

  std::string reference = request.action + "/" +
                          domain::to_string(request.kind) + "/" +
                          std::to_string(request.id);
  store_.set(keys::journalEntry(reference),
             nlohmann::json{{"from", request.from},
                            {"to", request.to},
                            {"amount", domain::amountToJson(request.amount)},
                            {"memo", request.memo}});

  return reference;
}

void JournalValueTransfer::credit(const domain::Party& party,
                                  domain::Amount amount) {
  adjust(party, amount);
}

domain::Amount JournalValueTransfer::balanceOf(
    const domain::Party& party) const {
  auto stored = store_.get(keys::balance(party));
  return stored ? domain::amountFromJson(*stored) : domain::Amount{0};
}

std::optional<JournalValueTransfer::Entry> JournalValueTransfer::lookup(
    const std::string& reference) const {
  auto stored = store_.get(keys::journalEntry(reference));
  if (!stored) {
    return std::nullopt;
  }
  return Entry{stored->at("from").get<domain::Party>(),
               stored->at("to").get<domain::Party>(),
               domain::amountFromJson(stored->at("amount")),
               stored->value("memo", std::string{})};
}

void JournalValueTransfer::adjust(const domain::Party& party,
                                  domain::Amount delta) {
  store_.set(keys::balance(party),
             domain::amountToJson(balanceOf(party) + delta));
}

}  // namespace ledger
