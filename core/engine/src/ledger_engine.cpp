#include "ledger/engine/ledger_engine.hpp"

#include "ledger/domain/lifecycle.hpp"
#include "ledger/store/json_file_store.hpp"
#include "ledger/store/memory_store.hpp"
#include "ledger/store/record_codec.hpp"

#include <iostream>
#include <set>
#include <stdexcept>

namespace ledger {

namespace {

std::unique_ptr<IDurableStore> makeStore(const EngineConfig& config) {
  if (config.store_path.empty()) {
    return std::make_unique<MemoryStore>();
  }
  return std::make_unique<JsonFileStore>(config.store_path);
}

// -----------------------------------------------------------------------------
// Command argument errors: reported in the reply, never thrown to the host
// -----------------------------------------------------------------------------
class CommandError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

const nlohmann::json& requireArg(const nlohmann::json& cmd, const char* key) {
  auto it = cmd.find(key);
  if (it == cmd.end()) {
    throw CommandError(std::string("missing argument '") + key + "'");
  }
  return *it;
}

domain::Party partyArg(const nlohmann::json& cmd, const char* key) {
  const nlohmann::json& value = requireArg(cmd, key);
  if (!value.is_string()) {
    throw CommandError(std::string("argument '") + key + "' must be a string");
  }
  return domain::Party{value.get<std::string>()};
}

std::string textArg(const nlohmann::json& cmd, const char* key) {
  auto it = cmd.find(key);
  if (it == cmd.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    throw CommandError(std::string("argument '") + key + "' must be a string");
  }
  return it->get<std::string>();
}

std::uint64_t uintArg(const nlohmann::json& cmd, const char* key) {
  const nlohmann::json& value = requireArg(cmd, key);
  if (!value.is_number_unsigned()) {
    throw CommandError(std::string("argument '") + key +
                       "' must be a non-negative integer");
  }
  return value.get<std::uint64_t>();
}

std::uint64_t uintArgOr(const nlohmann::json& cmd, const char* key,
                        std::uint64_t fallback) {
  return cmd.contains(key) ? uintArg(cmd, key) : fallback;
}

domain::Amount amountArg(const nlohmann::json& cmd, const char* key) {
  try {
    return domain::amountFromJson(requireArg(cmd, key));
  } catch (const std::runtime_error& e) {
    throw CommandError(std::string("argument '") + key + "': " + e.what());
  }
}

std::vector<domain::Condition> conditionsArg(const nlohmann::json& cmd) {
  auto it = cmd.find("conditions");
  if (it == cmd.end() || it->is_null()) {
    return {};
  }
  try {
    return it->get<std::vector<domain::Condition>>();
  } catch (const std::runtime_error& e) {
    throw CommandError(std::string("argument 'conditions': ") + e.what());
  } catch (const nlohmann::json::exception& e) {
    throw CommandError(std::string("argument 'conditions': ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// Reply encoding
// -----------------------------------------------------------------------------
nlohmann::json optionalText(const std::optional<std::string>& text) {
  return text ? nlohmann::json(*text) : nlohmann::json(nullptr);
}

nlohmann::json toJson(const domain::TransactionResult& r) {
  return {{"transaction_id", r.transaction_id},
          {"status", domain::to_string(r.status)},
          {"confirmation", r.confirmation}};
}

nlohmann::json toJson(const domain::EscrowResult& r) {
  return {{"escrow_id", r.escrow_id},
          {"status", domain::to_string(r.status)},
          {"confirmation", optionalText(r.confirmation)}};
}

nlohmann::json toJson(const domain::InvoiceResult& r) {
  return {{"invoice_id", r.invoice_id},
          {"status", domain::to_string(r.status)},
          {"confirmation", optionalText(r.confirmation)}};
}

template <typename T>
nlohmann::json toJson(const T& record) {
  return nlohmann::json(record);
}

nlohmann::json okReply(nlohmann::json result) {
  return {{"status", "ok"}, {"result", std::move(result)}};
}

nlohmann::json errorReply(ContractError error) {
  return {{"status", "error"},
          {"error", to_string(error)},
          {"code", static_cast<std::uint32_t>(error)}};
}

nlohmann::json messageReply(const std::string& message) {
  return {{"status", "error"}, {"response", message}};
}

template <typename T>
nlohmann::json reply(const Result<T>& result) {
  if (!result.ok()) {
    return errorReply(result.error());
  }
  return okReply(toJson(result.value()));
}

nlohmann::json reply(const LedgerEngine::SweepReport& report) {
  nlohmann::json failed = nlohmann::json::array();
  for (const auto& [id, error] : report.failed) {
    failed.push_back(nlohmann::json{{"id", id},
                                    {"error", to_string(error)},
                                    {"code", static_cast<std::uint32_t>(error)}});
  }
  return okReply({{"scanned", report.scanned},
                  {"changed", report.changed},
                  {"failed", std::move(failed)}});
}

nlohmann::json reply(const Status& status) {
  return status.ok() ? okReply(nullptr) : errorReply(status.error());
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: defaults first, then the pointers selecting active
// collaborators, then everything built on top of them
// -----------------------------------------------------------------------------
LedgerEngine::LedgerEngine(const EngineConfig& config,
                           LedgerCollaborators collaborators)
    : config_(config),
      owned_store_(collaborators.store ? nullptr : makeStore(config)),
      durable_(collaborators.store ? collaborators.store : owned_store_.get()),
      overlay_(*durable_),
      sim_clock_(config.genesis_time),
      default_identity_(config.authorize_all),
      default_transfer_(overlay_, config.enforce_balances),
      clock_(collaborators.clock
                 ? collaborators.clock
                 : (config.clock == ClockMode::System
                        ? static_cast<const ILedgerClock*>(&system_clock_)
                        : static_cast<const ILedgerClock*>(&sim_clock_))),
      identity_(collaborators.identity ? collaborators.identity
                                       : &default_identity_),
      transfer_(collaborators.transfer ? collaborators.transfer
                                       : &default_transfer_),
      records_(overlay_),
      ids_(*durable_),
      evaluator_(collaborators.oracle
                     ? *collaborators.oracle
                     : static_cast<const IOracleBackend&>(default_oracle_),
                 collaborators.approvals
                     ? *collaborators.approvals
                     : static_cast<const IApprovalRegistry&>(
                           default_approvals_)),
      escrows_(evaluator_,
               std::set<domain::Party>(config.trusted_validators.begin(),
                                       config.trusted_validators.end())),
      ctx_{guard_,  overlay_,    records_,   ids_,
           *clock_, *identity_, *transfer_, &events_} {
  for (const auto& party : config.authorized_parties) {
    default_identity_.authorize(party);
  }

  std::cout << "[LedgerEngine] ready. store="
            << (config.store_path.empty() ? "memory" : config.store_path)
            << " clock="
            << (config.clock == ClockMode::System ? "system" : "simulation")
            << " now=" << clock_->now() << "\n";
}

// -----------------------------------------------------------------------------
// initialize()
// -----------------------------------------------------------------------------
Status LedgerEngine::initialize(const domain::Party& admin) {
  Status status = [&]() -> Status {
    InvocationScope scope(ctx_);
    if (!scope.admitted()) {
      return ContractError::ReentrancyDetected;
    }
    if (!identity_->isValidParty(admin)) {
      return rejectWith("LedgerEngine", "initialize", 0,
                        ContractError::InvalidAddress);
    }
    if (records_.loadAdmin()) {
      return rejectWith("LedgerEngine", "initialize", 0,
                        ContractError::Unauthorized);
    }
    records_.saveAdmin(admin);
    std::cout << "[LedgerEngine] initialized, admin=" << admin.address << "\n";
    return okStatus();
  }();
  return finish(std::move(status));
}

// -----------------------------------------------------------------------------
// Transactions
// -----------------------------------------------------------------------------
Result<domain::TransactionResult> LedgerEngine::executeTransaction(
    const domain::Party& sender, const domain::Party& recipient,
    domain::Amount amount, const std::string& metadata) {
  return finish(transactions_.create(ctx_, sender, recipient, amount, metadata,
                                     domain::TransactionKind::Basic));
}

Result<domain::TransactionResult> LedgerEngine::executeP2PTransaction(
    const domain::Party& sender, const domain::Party& recipient,
    domain::Amount amount, const std::string& memo) {
  return finish(transactions_.create(ctx_, sender, recipient, amount, memo,
                                     domain::TransactionKind::P2P));
}

Result<domain::Transaction> LedgerEngine::getTransaction(domain::EntityId id) {
  return transactions_.get(ctx_, id);
}

Result<std::vector<domain::Transaction>> LedgerEngine::getTransactionHistory(
    const domain::Party& party, std::size_t offset, std::size_t limit) {
  return transactions_.history(ctx_, party, offset, limit);
}

// -----------------------------------------------------------------------------
// Escrows
// -----------------------------------------------------------------------------
Result<domain::EscrowResult> LedgerEngine::createEscrow(
    const domain::Party& sender, const domain::Party& recipient,
    domain::Amount amount, const std::vector<domain::Condition>& conditions,
    domain::LedgerTime expires_at) {
  return finish(escrows_.create(ctx_, sender, recipient, amount, conditions,
                                expires_at));
}

Result<bool> LedgerEngine::checkEscrowConditions(domain::EntityId id) {
  return escrows_.conditionsMet(ctx_, id);
}

Result<domain::EscrowResult> LedgerEngine::releaseEscrow(domain::EntityId id) {
  return finish(escrows_.release(ctx_, id));
}

Result<domain::EscrowResult> LedgerEngine::refundEscrow(domain::EntityId id) {
  return finish(escrows_.refund(ctx_, id));
}

Result<domain::EscrowResult> LedgerEngine::processEscrow(domain::EntityId id) {
  return finish(escrows_.process(ctx_, id));
}

Result<domain::Escrow> LedgerEngine::getEscrowDetails(domain::EntityId id) {
  return escrows_.get(ctx_, id);
}

// -----------------------------------------------------------------------------
// Invoices
// -----------------------------------------------------------------------------
Result<domain::InvoiceResult> LedgerEngine::createInvoice(
    const domain::Party& creator, const domain::Party& client,
    domain::Amount amount, const std::string& description,
    domain::LedgerTime due_date) {
  return finish(
      invoices_.create(ctx_, creator, client, amount, description, due_date));
}

Result<domain::InvoiceResult> LedgerEngine::markInvoiceSent(
    domain::EntityId id, const domain::Party& creator) {
  return finish(invoices_.markSent(ctx_, id, creator));
}

Result<domain::InvoiceResult> LedgerEngine::approveInvoice(
    domain::EntityId id, const domain::Party& client) {
  return finish(invoices_.approve(ctx_, id, client));
}

Result<domain::InvoiceResult> LedgerEngine::executeInvoice(
    domain::EntityId id) {
  return finish(invoices_.execute(ctx_, id));
}

Result<domain::InvoiceResult> LedgerEngine::rejectInvoice(
    domain::EntityId id, const domain::Party& client,
    const std::string& reason) {
  return finish(invoices_.reject(ctx_, id, client, reason));
}

Result<domain::InvoiceResult> LedgerEngine::checkInvoiceExpiration(
    domain::EntityId id) {
  return finish(invoices_.checkExpiration(ctx_, id));
}

Result<domain::Invoice> LedgerEngine::getInvoice(domain::EntityId id) {
  return invoices_.get(ctx_, id);
}

// -----------------------------------------------------------------------------
// Sweeps: one invocation per id, ids 1..current
// -----------------------------------------------------------------------------
LedgerEngine::SweepReport LedgerEngine::processActiveEscrows() {
  SweepReport report;
  const domain::EntityId last = ids_.current(domain::EntityKind::Escrow);

  for (domain::EntityId id = 1; id <= last; ++id) {
    auto escrow = records_.loadEscrow(id);
    if (!escrow || domain::isTerminal(escrow->status)) {
      continue;
    }
    ++report.scanned;

    auto result = processEscrow(id);
    if (!result.ok()) {
      report.failed.emplace_back(id, result.error());
    } else if (result.value().status != escrow->status) {
      report.changed.push_back(id);
    }
  }

  std::cout << "[LedgerEngine] escrow sweep: scanned=" << report.scanned
            << " settled=" << report.changed.size()
            << " failed=" << report.failed.size() << "\n";
  return report;
}

LedgerEngine::SweepReport LedgerEngine::expireDueInvoices() {
  SweepReport report;
  const domain::EntityId last = ids_.current(domain::EntityKind::Invoice);

  for (domain::EntityId id = 1; id <= last; ++id) {
    auto invoice = records_.loadInvoice(id);
    if (!invoice || domain::isTerminal(invoice->status)) {
      continue;
    }
    ++report.scanned;

    auto result = checkInvoiceExpiration(id);
    if (!result.ok()) {
      report.failed.emplace_back(id, result.error());
    } else if (result.value().status != invoice->status) {
      report.changed.push_back(id);
    }
  }

  std::cout << "[LedgerEngine] invoice sweep: scanned=" << report.scanned
            << " expired=" << report.changed.size()
            << " failed=" << report.failed.size() << "\n";
  return report;
}

// -----------------------------------------------------------------------------
// credit(): funding through the built-in journal
// -----------------------------------------------------------------------------
Status LedgerEngine::credit(const domain::Party& party, domain::Amount amount) {
  Status status = [&]() -> Status {
    InvocationScope scope(ctx_);
    if (!scope.admitted()) {
      return ContractError::ReentrancyDetected;
    }
    if (!identity_->isValidParty(party)) {
      return rejectWith("LedgerEngine", "credit", 0,
                        ContractError::InvalidAddress);
    }
    if (!domain::isValidAmount(amount)) {
      return rejectWith("LedgerEngine", "credit", 0,
                        ContractError::InvalidAmount);
    }
    default_transfer_.credit(party, amount);
    return okStatus();
  }();
  return finish(std::move(status));
}

// -----------------------------------------------------------------------------
// executeCommand(): string in, string out
// -----------------------------------------------------------------------------
std::string LedgerEngine::executeCommand(const std::string& cmd) {
  nlohmann::json parsed = nlohmann::json::parse(cmd, nullptr, false);
  if (parsed.is_discarded()) {
    return messageReply("Malformed command: not JSON").dump();
  }
  return dispatch(parsed).dump();
}

// -----------------------------------------------------------------------------
// dispatch(): validate the envelope, then route by "op"
// -----------------------------------------------------------------------------
nlohmann::json LedgerEngine::dispatch(const nlohmann::json& cmd) {
  if (!cmd.is_object() || !cmd.contains("op") || !cmd.at("op").is_string()) {
    return messageReply("Malformed command: expected {\"op\": ...}");
  }

  const std::string op = cmd.at("op").get<std::string>();
  try {
    return runCommand(op, cmd);
  } catch (const CommandError& e) {
    std::cerr << "[LedgerEngine] WARNING: " << op << ": " << e.what() << "\n";
    return messageReply(op + ": " + e.what());
  }
}

nlohmann::json LedgerEngine::runCommand(const std::string& op,
                                        const nlohmann::json& cmd) {
  using domain::Party;

  // --- Administration -------------------------------------------------------
  if (op == "initialize") {
    return reply(initialize(partyArg(cmd, "admin")));
  }
  if (op == "version") {
    return okReply(version());
  }

  // --- Transactions ---------------------------------------------------------
  if (op == "execute_transaction") {
    return reply(executeTransaction(partyArg(cmd, "sender"),
                                    partyArg(cmd, "recipient"),
                                    amountArg(cmd, "amount"),
                                    textArg(cmd, "metadata")));
  }
  if (op == "execute_p2p_transaction") {
    return reply(executeP2PTransaction(partyArg(cmd, "sender"),
                                       partyArg(cmd, "recipient"),
                                       amountArg(cmd, "amount"),
                                       textArg(cmd, "memo")));
  }
  if (op == "get_transaction") {
    return reply(getTransaction(uintArg(cmd, "id")));
  }
  if (op == "get_transaction_history") {
    auto history = getTransactionHistory(
        partyArg(cmd, "party"),
        static_cast<std::size_t>(uintArgOr(cmd, "offset", 0)),
        static_cast<std::size_t>(uintArgOr(cmd, "limit", 0)));
    if (!history.ok()) {
      return errorReply(history.error());
    }
    return okReply(nlohmann::json(history.value()));
  }

  // --- Escrows --------------------------------------------------------------
  if (op == "create_escrow") {
    return reply(createEscrow(partyArg(cmd, "sender"),
                              partyArg(cmd, "recipient"),
                              amountArg(cmd, "amount"), conditionsArg(cmd),
                              uintArg(cmd, "expires_at")));
  }
  if (op == "check_escrow_conditions") {
    return reply(checkEscrowConditions(uintArg(cmd, "id")));
  }
  if (op == "release_escrow") {
    return reply(releaseEscrow(uintArg(cmd, "id")));
  }
  if (op == "refund_escrow") {
    return reply(refundEscrow(uintArg(cmd, "id")));
  }
  if (op == "process_escrow") {
    return reply(processEscrow(uintArg(cmd, "id")));
  }
  if (op == "get_escrow_details") {
    return reply(getEscrowDetails(uintArg(cmd, "id")));
  }

  // --- Invoices -------------------------------------------------------------
  if (op == "create_invoice") {
    return reply(createInvoice(partyArg(cmd, "creator"),
                               partyArg(cmd, "client"),
                               amountArg(cmd, "amount"),
                               textArg(cmd, "description"),
                               uintArg(cmd, "due_date")));
  }
  if (op == "mark_invoice_sent") {
    return reply(markInvoiceSent(uintArg(cmd, "id"), partyArg(cmd, "creator")));
  }
  if (op == "approve_invoice") {
    return reply(approveInvoice(uintArg(cmd, "id"), partyArg(cmd, "client")));
  }
  if (op == "execute_invoice") {
    return reply(executeInvoice(uintArg(cmd, "id")));
  }
  if (op == "reject_invoice") {
    return reply(rejectInvoice(uintArg(cmd, "id"), partyArg(cmd, "client"),
                               textArg(cmd, "reason")));
  }
  if (op == "check_invoice_expiration") {
    return reply(checkInvoiceExpiration(uintArg(cmd, "id")));
  }
  if (op == "get_invoice") {
    return reply(getInvoice(uintArg(cmd, "id")));
  }

  // --- Sweeps --------------------------------------------------------------
  if (op == "process_active_escrows") {
    return reply(processActiveEscrows());
  }
  if (op == "expire_due_invoices") {
    return reply(expireDueInvoices());
  }

  // --- Feeds for the default collaborators ---------------------------------
  if (op == "credit") {
    return reply(credit(partyArg(cmd, "party"), amountArg(cmd, "amount")));
  }
  if (op == "publish_oracle") {
    default_oracle_.publish(partyArg(cmd, "oracle"), textArg(cmd, "feed"),
                            textArg(cmd, "value"));
    return okReply(nullptr);
  }
  if (op == "record_approval") {
    default_approvals_.approve(partyArg(cmd, "validator"),
                               uintArg(cmd, "escrow_id"));
    return okReply(nullptr);
  }

  return messageReply("Unknown command: " + op);
}

}  // namespace ledger
