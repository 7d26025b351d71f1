#include "ledger/domain/lifecycle.hpp"

#include <cstddef>

namespace ledger {
namespace domain {

// -----------------------------------------------------------------------------
// canTransition: transaction graph
// -----------------------------------------------------------------------------
bool canTransition(TransactionStatus current, TransactionStatus next) {
  using S = TransactionStatus;

  switch (current) {
    case S::Pending:
      return next == S::Confirmed ||
             next == S::Failed ||
             next == S::Cancelled;

    case S::Confirmed:
    case S::Failed:
    case S::Cancelled:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// canTransition: escrow graph
// -----------------------------------------------------------------------------
bool canTransition(EscrowStatus current, EscrowStatus next) {
  using S = EscrowStatus;

  switch (current) {
    case S::Active:
      return next == S::Released ||
             next == S::Refunded;

    case S::Released:
    case S::Refunded:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// canTransition: invoice graph
// -----------------------------------------------------------------------------
bool canTransition(InvoiceStatus current, InvoiceStatus next) {
  using S = InvoiceStatus;

  switch (current) {
    case S::Draft:
      return next == S::Sent ||
             next == S::Approved ||
             next == S::Rejected ||
             next == S::Expired;

    case S::Sent:
      return next == S::Approved ||
             next == S::Rejected ||
             next == S::Expired;

    case S::Approved:
      return next == S::Executed ||
             next == S::Expired;

    case S::Executed:
    case S::Rejected:
    case S::Expired:
      return false;
  }

  return false;
}

bool isTerminal(EscrowStatus status) {
  return status == EscrowStatus::Released ||
         status == EscrowStatus::Refunded;
}

bool isTerminal(InvoiceStatus status) {
  using S = InvoiceStatus;
  return status == S::Executed ||
         status == S::Rejected ||
         status == S::Expired;
}

// -----------------------------------------------------------------------------
// Names
// -----------------------------------------------------------------------------
const char* to_string(TransactionKind kind) {
  switch (kind) {
    case TransactionKind::Basic: return "Basic";
    case TransactionKind::P2P:   return "P2P";
  }
  return "Unknown";
}

const char* to_string(TransactionStatus status) {
  using S = TransactionStatus;
  switch (status) {
    case S::Pending:   return "Pending";
    case S::Confirmed: return "Confirmed";
    case S::Failed:    return "Failed";
    case S::Cancelled: return "Cancelled";
  }
  return "Unknown";
}

const char* to_string(EscrowStatus status) {
  using S = EscrowStatus;
  switch (status) {
    case S::Active:   return "Active";
    case S::Released: return "Released";
    case S::Refunded: return "Refunded";
  }
  return "Unknown";
}

const char* to_string(InvoiceStatus status) {
  using S = InvoiceStatus;
  switch (status) {
    case S::Draft:    return "Draft";
    case S::Sent:     return "Sent";
    case S::Approved: return "Approved";
    case S::Executed: return "Executed";
    case S::Rejected: return "Rejected";
    case S::Expired:  return "Expired";
  }
  return "Unknown";
}

const char* to_string(ConditionKind kind) {
  using K = ConditionKind;
  switch (kind) {
    case K::TimeBased:      return "TimeBased";
    case K::OracleBased:    return "OracleBased";
    case K::ManualApproval: return "ManualApproval";
  }
  return "Unknown";
}

const char* to_string(EntityKind kind) {
  switch (kind) {
    case EntityKind::Transaction: return "transaction";
    case EntityKind::Escrow:      return "escrow";
    case EntityKind::Invoice:     return "invoice";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// Parsers: linear scan over the enumerators, matched against to_string()
// -----------------------------------------------------------------------------
namespace {

template <typename Enum, std::size_t N>
std::optional<Enum> parseByName(const std::string& name,
                                const Enum (&values)[N]) {
  for (Enum value : values) {
    if (name == to_string(value)) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<TransactionKind> parseTransactionKind(const std::string& name) {
  static const TransactionKind kAll[] = {TransactionKind::Basic,
                                         TransactionKind::P2P};
  return parseByName(name, kAll);
}

std::optional<TransactionStatus> parseTransactionStatus(
    const std::string& name) {
  using S = TransactionStatus;
  static const S kAll[] = {S::Pending, S::Confirmed, S::Failed, S::Cancelled};
  return parseByName(name, kAll);
}

std::optional<EscrowStatus> parseEscrowStatus(const std::string& name) {
  using S = EscrowStatus;
  static const S kAll[] = {S::Active, S::Released, S::Refunded};
  return parseByName(name, kAll);
}

std::optional<InvoiceStatus> parseInvoiceStatus(const std::string& name) {
  using S = InvoiceStatus;
  static const S kAll[] = {S::Draft,    S::Sent,     S::Approved,
                           S::Executed, S::Rejected, S::Expired};
  return parseByName(name, kAll);
}

std::optional<ConditionKind> parseConditionKind(const std::string& name) {
  using K = ConditionKind;
  static const K kAll[] = {K::TimeBased, K::OracleBased, K::ManualApproval};
  return parseByName(name, kAll);
}

}  // namespace domain
}  // namespace ledger
