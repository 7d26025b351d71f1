#include "ledger/store/record_codec.hpp"

#include "ledger/domain/lifecycle.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace ledger {
namespace domain {

namespace {

// Decodes an enum stored by name; unknown names are a corrupt record.
template <typename Enum, typename Parser>
Enum enumFromJson(const nlohmann::json& j, const char* field, Parser parse) {
  const std::string name = j.at(field).get<std::string>();
  std::optional<Enum> value = parse(name);
  if (!value) {
    throw std::runtime_error(std::string("record_codec: unknown ") + field +
                             " '" + name + "'");
  }
  return *value;
}

}  // namespace

// -----------------------------------------------------------------------------
// Amount
// -----------------------------------------------------------------------------
nlohmann::json amountToJson(Amount amount) { return amountToString(amount); }

// Accepts the persisted decimal string, and plain JSON integers for
// hand-written command scripts.
Amount amountFromJson(const nlohmann::json& j) {
  if (j.is_number_unsigned()) {
    return static_cast<Amount>(j.get<std::uint64_t>());
  }
  if (j.is_number_integer()) {
    return static_cast<Amount>(j.get<std::int64_t>());
  }
  if (!j.is_string()) {
    throw std::runtime_error("record_codec: amount must be a string or integer");
  }
  std::optional<Amount> amount = parseAmount(j.get<std::string>());
  if (!amount) {
    throw std::runtime_error("record_codec: malformed amount '" +
                             j.get<std::string>() + "'");
  }
  return *amount;
}

// -----------------------------------------------------------------------------
// Party: stored as the bare address string
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Party& party) { j = party.address; }

void from_json(const nlohmann::json& j, Party& party) {
  party.address = j.get<std::string>();
}

// -----------------------------------------------------------------------------
// Condition: {"kind": ..., "validator": ..., <payload fields>}
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Condition& condition) {
  j = nlohmann::json{{"kind", to_string(condition.kind())},
                     {"validator", condition.validator}};

  if (const auto* time = std::get_if<TimeBasedCondition>(&condition.spec)) {
    j["not_before"] = time->not_before;
  } else if (const auto* oracle =
                 std::get_if<OracleBasedCondition>(&condition.spec)) {
    j["feed"] = oracle->feed;
    j["expected"] = oracle->expected;
  }
}

void from_json(const nlohmann::json& j, Condition& condition) {
  ConditionKind kind =
      enumFromJson<ConditionKind>(j, "kind", parseConditionKind);

  switch (kind) {
    case ConditionKind::TimeBased:
      condition.spec =
          TimeBasedCondition{j.value("not_before", LedgerTime{0})};
      break;
    case ConditionKind::OracleBased:
      condition.spec = OracleBasedCondition{j.at("feed").get<std::string>(),
                                            j.at("expected").get<std::string>()};
      break;
    case ConditionKind::ManualApproval:
      condition.spec = ManualApprovalCondition{};
      break;
  }

  condition.validator = j.value("validator", Party{});
}

// -----------------------------------------------------------------------------
// Transaction
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Transaction& tx) {
  j = nlohmann::json{{"id", tx.id},
                     {"kind", to_string(tx.kind)},
                     {"sender", tx.sender},
                     {"recipient", tx.recipient},
                     {"amount", amountToJson(tx.amount)},
                     {"status", to_string(tx.status)},
                     {"created_at", tx.created_at},
                     {"metadata", tx.metadata}};
}

void from_json(const nlohmann::json& j, Transaction& tx) {
  tx.id = j.at("id").get<EntityId>();
  tx.kind = enumFromJson<TransactionKind>(j, "kind", parseTransactionKind);
  tx.sender = j.at("sender").get<Party>();
  tx.recipient = j.at("recipient").get<Party>();
  tx.amount = amountFromJson(j.at("amount"));
  tx.status =
      enumFromJson<TransactionStatus>(j, "status", parseTransactionStatus);
  tx.created_at = j.at("created_at").get<LedgerTime>();
  tx.metadata = j.value("metadata", std::string{});
}

// -----------------------------------------------------------------------------
// Escrow
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Escrow& escrow) {
  j = nlohmann::json{{"id", escrow.id},
                     {"sender", escrow.sender},
                     {"recipient", escrow.recipient},
                     {"amount", amountToJson(escrow.amount)},
                     {"conditions", escrow.conditions},
                     {"status", to_string(escrow.status)},
                     {"created_at", escrow.created_at},
                     {"expires_at", escrow.expires_at}};
}

void from_json(const nlohmann::json& j, Escrow& escrow) {
  escrow.id = j.at("id").get<EntityId>();
  escrow.sender = j.at("sender").get<Party>();
  escrow.recipient = j.at("recipient").get<Party>();
  escrow.amount = amountFromJson(j.at("amount"));
  escrow.conditions = j.at("conditions").get<std::vector<Condition>>();
  escrow.status = enumFromJson<EscrowStatus>(j, "status", parseEscrowStatus);
  escrow.created_at = j.at("created_at").get<LedgerTime>();
  escrow.expires_at = j.at("expires_at").get<LedgerTime>();
}

// -----------------------------------------------------------------------------
// Invoice
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const Invoice& invoice) {
  j = nlohmann::json{{"id", invoice.id},
                     {"creator", invoice.creator},
                     {"client", invoice.client},
                     {"amount", amountToJson(invoice.amount)},
                     {"description", invoice.description},
                     {"status", to_string(invoice.status)},
                     {"created_at", invoice.created_at},
                     {"due_date", invoice.due_date}};

  j["approved_at"] = invoice.approved_at
                         ? nlohmann::json(*invoice.approved_at)
                         : nlohmann::json(nullptr);
  j["rejection_reason"] = invoice.rejection_reason
                              ? nlohmann::json(*invoice.rejection_reason)
                              : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, Invoice& invoice) {
  invoice.id = j.at("id").get<EntityId>();
  invoice.creator = j.at("creator").get<Party>();
  invoice.client = j.at("client").get<Party>();
  invoice.amount = amountFromJson(j.at("amount"));
  invoice.description = j.value("description", std::string{});
  invoice.status = enumFromJson<InvoiceStatus>(j, "status", parseInvoiceStatus);
  invoice.created_at = j.at("created_at").get<LedgerTime>();
  invoice.due_date = j.at("due_date").get<LedgerTime>();

  invoice.approved_at.reset();
  if (j.contains("approved_at") && !j.at("approved_at").is_null()) {
    invoice.approved_at = j.at("approved_at").get<LedgerTime>();
  }

  invoice.rejection_reason.reset();
  if (j.contains("rejection_reason") && !j.at("rejection_reason").is_null()) {
    invoice.rejection_reason = j.at("rejection_reason").get<std::string>();
  }
}

}  // namespace domain
}  // namespace ledger
