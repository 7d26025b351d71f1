// -----------------------------------------------------------------------------
// ledger_replay: single executable entry point.
//
// Replays a JSON-lines command script against a LedgerEngine:
//   1) Load the engine configuration (optional; defaults when omitted).
//   2) Build the LedgerEngine. With a store_path the engine reloads the
//      previous snapshot, so successive replays continue the same ledger.
//   3) Subscribe a logging callback for every ledger event.
//   4) For each script line: advance the simulation clock to "at" (if
//      given), run the command, print the reply as one JSON line.
//
// Usage:
//   ledger_replay <script.jsonl> [config.json]
//   ledger_replay -              [config.json]     (script from stdin)
//
// Script line example:
//   {"at": 1000, "op": "create_escrow", "sender": "alice", ...}
//
// Blank lines and lines starting with '#' are skipped. Exit status is 0 when
// every line was processed (including lines whose command was refused), 1 on
// a usage error or a host fault.
// -----------------------------------------------------------------------------

#include "ledger/config/engine_config.hpp"
#include "ledger/domain/lifecycle.hpp"
#include "ledger/engine/ledger_engine.hpp"
#include "ledger/events/event.hpp"

#include <fstream>
#include <iostream>
#include <string>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " <script.jsonl|-> [config.json]\n";
}

// Logs every ledger event on stdout, prefixed like the other components.
void attachEventLog(ledger::LedgerEngine& engine) {
  engine.eventBus().subscribe<ledger::TransactionEvent>(
      [](const ledger::TransactionEvent& e) {
        std::cout << "[Event] transaction #" << e.transaction.id << " "
                  << ledger::domain::to_string(e.transaction.status) << "\n";
      });

  engine.eventBus().subscribe<ledger::EscrowUpdateEvent>(
      [](const ledger::EscrowUpdateEvent& e) {
        std::cout << "[Event] escrow #" << e.escrow_id << " "
                  << ledger::domain::to_string(e.previous_status) << " -> "
                  << ledger::domain::to_string(e.status) << "\n";
      });

  engine.eventBus().subscribe<ledger::InvoiceUpdateEvent>(
      [](const ledger::InvoiceUpdateEvent& e) {
        std::cout << "[Event] invoice #" << e.invoice_id << " "
                  << ledger::domain::to_string(e.previous_status) << " -> "
                  << ledger::domain::to_string(e.status);
        if (e.reason) {
          std::cout << " reason=\"" << *e.reason << "\"";
        }
        std::cout << "\n";
      });
}

// Runs every line of `script`. Returns the number of lines processed.
std::size_t replay(ledger::LedgerEngine& engine, std::istream& script) {
  std::size_t processed = 0;
  std::size_t line_no = 0;
  std::string line;

  while (std::getline(script, line)) {
    ++line_no;
    if (line.empty() || line[0] == '#') {
      continue;
    }

    nlohmann::json cmd = nlohmann::json::parse(line, nullptr, false);
    if (cmd.is_discarded() || !cmd.is_object()) {
      std::cerr << "[main] WARNING: line " << line_no
                << " is not a JSON object. Skipping.\n";
      continue;
    }

    if (cmd.contains("at") && cmd.at("at").is_number_unsigned()) {
      const auto at = cmd.at("at").get<ledger::domain::LedgerTime>();
      if (!engine.simulationClock().advance_to(at)) {
        std::cerr << "[main] WARNING: line " << line_no << " moves time back to "
                  << at << "; clock stays at "
                  << engine.simulationClock().now() << "\n";
      }
    }

    std::cout << engine.dispatch(cmd).dump() << "\n";
    ++processed;
  }

  return processed;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    printUsage(argv[0]);
    return 1;
  }

  try {
    // -------------------------------------------------------------------------
    // 1) Configuration
    // -------------------------------------------------------------------------
    ledger::EngineConfig config;
    if (argc == 3) {
      config = ledger::loadEngineConfig(argv[2]);
    }
    if (config.clock != ledger::ClockMode::Simulation) {
      std::cerr << "[main] WARNING: replay with a system clock ignores \"at\"\n";
    }

    // -------------------------------------------------------------------------
    // 2) Engine + event log
    // -------------------------------------------------------------------------
    ledger::LedgerEngine engine(config);
    attachEventLog(engine);

    // -------------------------------------------------------------------------
    // 3) Script
    // -------------------------------------------------------------------------
    const std::string script_path = argv[1];
    std::size_t processed = 0;
    if (script_path == "-") {
      processed = replay(engine, std::cin);
    } else {
      std::ifstream script(script_path);
      if (!script.is_open()) {
        std::cerr << "[main] cannot open script " << script_path << "\n";
        return 1;
      }
      processed = replay(engine, script);
    }

    std::cout << "[main] Replayed " << processed << " command(s). Ledger time "
              << engine.clock().now() << ".\n";
  } catch (const std::exception& e) {
    std::cerr << "[main] fatal: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
