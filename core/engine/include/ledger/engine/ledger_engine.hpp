#pragma once

#include "ledger/condition/condition_evaluator.hpp"
#include "ledger/condition/in_memory_backends.hpp"
#include "ledger/config/engine_config.hpp"
#include "ledger/domain/escrow.hpp"
#include "ledger/domain/invoice.hpp"
#include "ledger/domain/result.hpp"
#include "ledger/domain/transaction.hpp"
#include "ledger/eventbus/event_bus.hpp"
#include "ledger/guard/reentrancy_guard.hpp"
#include "ledger/identity/static_identity_verifier.hpp"
#include "ledger/store/i_durable_store.hpp"
#include "ledger/store/id_allocator.hpp"
#include "ledger/store/record_store.hpp"
#include "ledger/store/transactional_store.hpp"
#include "ledger/time/simulation_ledger_clock.hpp"
#include "ledger/time/system_ledger_clock.hpp"
#include "ledger/transfer/journal_value_transfer.hpp"
#include "ledger/workflow/escrow_workflow.hpp"
#include "ledger/workflow/invocation_context.hpp"
#include "ledger/workflow/invoice_workflow.hpp"
#include "ledger/workflow/transaction_workflow.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace ledger {

// -----------------------------------------------------------------------------
// LedgerCollaborators
// -----------------------------------------------------------------------------
// Optional replacements for the engine's built-in collaborators. A null
// pointer selects the in-process default. Non-null objects are not owned and
// must outlive the engine.
// -----------------------------------------------------------------------------
struct LedgerCollaborators {
  IDurableStore* store{nullptr};
  const ILedgerClock* clock{nullptr};
  const IIdentityVerifier* identity{nullptr};
  IValueTransfer* transfer{nullptr};
  const IOracleBackend* oracle{nullptr};
  const IApprovalRegistry* approvals{nullptr};
};

// -----------------------------------------------------------------------------
// LedgerEngine
// -----------------------------------------------------------------------------
//
// @brief  Host-facing facade: owns the stores, guard, clock, collaborators
//         and the three workflows, and exposes every ledger operation.
//
// @details
// Invocation model:
//   The host calls one operation at a time. Each mutating operation opens an
//   InvocationScope (guard + write batch) inside its workflow; when the
//   operation returns, the batch has been committed to the durable store and
//   the engine flushes it. Read operations take no guard.
//
// Defaults built from EngineConfig:
//   store     : JsonFileStore at store_path, or MemoryStore when empty
//   clock     : SimulationLedgerClock at genesis_time, or SystemLedgerClock
//   identity  : StaticIdentityVerifier (authorize_all, authorized_parties)
//   transfer  : JournalValueTransfer over the write overlay (enforce_balances)
//   oracle    : InMemoryOracle
//   approvals : InMemoryApprovalRegistry
// Any of them can be replaced through LedgerCollaborators.
//
// Ownership:
//   LedgerEngine
//    ├── owned_store_          (unique_ptr<IDurableStore>, null if injected)
//    ├── overlay_              (TransactionalStore over the durable store)
//    ├── sim_clock_ / system_clock_
//    ├── default_identity_, default_transfer_ (over overlay_),
//    │   default_oracle_, default_approvals_
//    │                         (value members, always constructed)
//    ├── records_              (RecordStore over overlay_)
//    ├── ids_                  (IdAllocator over the durable store)
//    ├── guard_, events_, evaluator_
//    ├── transactions_, escrows_, invoices_
//    └── ctx_                  (InvocationContext referencing the above)
//
// Thread model: not thread-safe. EventBus subscription is the only call that
// may come from another thread.
// -----------------------------------------------------------------------------
class LedgerEngine {
 public:
  static constexpr std::uint32_t kVersion = 1;

  // @throws std::runtime_error if the configured store file is corrupt.
  explicit LedgerEngine(const EngineConfig& config = EngineConfig{},
                        LedgerCollaborators collaborators = LedgerCollaborators{});

  LedgerEngine(const LedgerEngine&) = delete;
  LedgerEngine& operator=(const LedgerEngine&) = delete;

  // -------------------------------------------------------------------------
  // Administration
  // -------------------------------------------------------------------------
  // initialize() records the admin party once. A second call fails with
  // Unauthorized; an invalid party fails with InvalidAddress.
  // -------------------------------------------------------------------------
  Status initialize(const domain::Party& admin);
  std::uint32_t version() const { return kVersion; }

  // -------------------------------------------------------------------------
  // Transactions
  // -------------------------------------------------------------------------
  Result<domain::TransactionResult> executeTransaction(
      const domain::Party& sender, const domain::Party& recipient,
      domain::Amount amount, const std::string& metadata);

  Result<domain::TransactionResult> executeP2PTransaction(
      const domain::Party& sender, const domain::Party& recipient,
      domain::Amount amount, const std::string& memo);

  Result<domain::Transaction> getTransaction(domain::EntityId id);

  // Ascending by id. limit 0 = everything from offset on.
  Result<std::vector<domain::Transaction>> getTransactionHistory(
      const domain::Party& party, std::size_t offset = 0,
      std::size_t limit = 0);

  // -------------------------------------------------------------------------
  // Escrows
  // -------------------------------------------------------------------------
  Result<domain::EscrowResult> createEscrow(
      const domain::Party& sender, const domain::Party& recipient,
      domain::Amount amount, const std::vector<domain::Condition>& conditions,
      domain::LedgerTime expires_at);

  Result<bool> checkEscrowConditions(domain::EntityId id);
  Result<domain::EscrowResult> releaseEscrow(domain::EntityId id);
  Result<domain::EscrowResult> refundEscrow(domain::EntityId id);
  Result<domain::EscrowResult> processEscrow(domain::EntityId id);
  Result<domain::Escrow> getEscrowDetails(domain::EntityId id);

  // -------------------------------------------------------------------------
  // Invoices
  // -------------------------------------------------------------------------
  Result<domain::InvoiceResult> createInvoice(const domain::Party& creator,
                                              const domain::Party& client,
                                              domain::Amount amount,
                                              const std::string& description,
                                              domain::LedgerTime due_date);

  Result<domain::InvoiceResult> markInvoiceSent(domain::EntityId id,
                                                const domain::Party& creator);
  Result<domain::InvoiceResult> approveInvoice(domain::EntityId id,
                                               const domain::Party& client);
  Result<domain::InvoiceResult> executeInvoice(domain::EntityId id);
  Result<domain::InvoiceResult> rejectInvoice(domain::EntityId id,
                                              const domain::Party& client,
                                              const std::string& reason);
  Result<domain::InvoiceResult> checkInvoiceExpiration(domain::EntityId id);
  Result<domain::Invoice> getInvoice(domain::EntityId id);

  // -------------------------------------------------------------------------
  // Sweeps
  // -------------------------------------------------------------------------
  //
  // @brief  Periodic passes over every issued id of one kind, for hosts that
  //         run a scheduler instead of reacting to each escrow or invoice.
  //
  // @details
  // processActiveEscrows() runs processEscrow() on every Active escrow:
  // expired ones are refunded, ones whose conditions hold are released, the
  // rest stay Active. expireDueInvoices() runs checkInvoiceExpiration() on
  // every non-terminal invoice.
  //
  // Each id is its own guarded invocation, flushed on its own; a refused id
  // is reported in `failed` and does not stop the sweep.
  // -------------------------------------------------------------------------
  struct SweepReport {
    std::size_t scanned{0};
    std::vector<domain::EntityId> changed;
    std::vector<std::pair<domain::EntityId, ContractError>> failed;
  };

  SweepReport processActiveEscrows();
  SweepReport expireDueInvoices();

  // -------------------------------------------------------------------------
  // credit(party, amount)
  // -------------------------------------------------------------------------
  // Funds a party on the built-in journal as one guarded invocation, so the
  // balance lands in the durable store. InvalidAddress / InvalidAmount on
  // bad input.
  // -------------------------------------------------------------------------
  Status credit(const domain::Party& party, domain::Amount amount);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  JSON front door used by the replay driver. cmd is a JSON object
  //         {"op": "<operation>", ...arguments}; the reply is a JSON object.
  //
  // @details
  // Replies:
  //   {"status":"ok","result":...}
  //   {"status":"error","error":"<ContractError>","code":<n>}
  //   {"status":"error","response":"<message>"}   malformed / unknown op
  //
  // Operations are the snake_case names of the facade calls
  // (execute_transaction, create_escrow, approve_invoice, ...), the sweeps
  //   process_active_escrows, expire_due_invoices
  //     -> {"scanned":n,"changed":[ids],"failed":[{"id","error","code"}]}
  // and three feeds for the default collaborators:
  //   publish_oracle  {oracle, feed, value}
  //   record_approval {validator, escrow_id}
  //   credit          {party, amount}
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);
  nlohmann::json dispatch(const nlohmann::json& cmd);

  // -------------------------------------------------------------------------
  // Accessors
  // -------------------------------------------------------------------------
  EventBus& eventBus() { return events_; }
  const ReentrancyGuard& guard() const { return guard_; }
  const ILedgerClock& clock() const { return *clock_; }

  // Built-in collaborators. They exist even when an override is active, but
  // only affect the engine when the corresponding override is null.
  SimulationLedgerClock& simulationClock() { return sim_clock_; }
  StaticIdentityVerifier& identity() { return default_identity_; }
  JournalValueTransfer& journal() { return default_transfer_; }
  InMemoryOracle& oracle() { return default_oracle_; }
  InMemoryApprovalRegistry& approvals() { return default_approvals_; }

 private:
  // Flushes the durable store and passes the result through.
  template <typename R>
  R finish(R result) {
    durable_->flush();
    return result;
  }

  nlohmann::json runCommand(const std::string& op, const nlohmann::json& cmd);

  EngineConfig config_;

  std::unique_ptr<IDurableStore> owned_store_;
  IDurableStore* durable_;
  TransactionalStore overlay_;

  SimulationLedgerClock sim_clock_;
  SystemLedgerClock system_clock_;
  StaticIdentityVerifier default_identity_;
  JournalValueTransfer default_transfer_;
  InMemoryOracle default_oracle_;
  InMemoryApprovalRegistry default_approvals_;

  const ILedgerClock* clock_;
  const IIdentityVerifier* identity_;
  IValueTransfer* transfer_;

  RecordStore records_;
  IdAllocator ids_;
  ReentrancyGuard guard_;
  EventBus events_;
  ConditionEvaluator evaluator_;

  TransactionWorkflow transactions_;
  EscrowWorkflow escrows_;
  InvoiceWorkflow invoices_;

  InvocationContext ctx_;
};

}  // namespace ledger
