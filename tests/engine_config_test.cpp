// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for parseEngineConfig / loadEngineConfig.
//
// Validates:
//   - {} yields the defaults
//   - Every key is read
//   - Wrong types and unknown clock modes throw, naming the key
//   - Missing or unparsable files throw
// =============================================================================

#include "ledger/config/engine_config.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

// Expects parseEngineConfig(doc) to throw with `key` in the message.
void expectRejected(const nlohmann::json& doc, const std::string& key) {
  try {
    ledger::parseEngineConfig(doc);
    FAIL() << "expected rejection of " << doc.dump();
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find(key), std::string::npos) << e.what();
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Empty object: defaults.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, EmptyObjectGivesDefaults) {
  auto config = ledger::parseEngineConfig(nlohmann::json::object());

  EXPECT_TRUE(config.store_path.empty());
  EXPECT_EQ(config.clock, ledger::ClockMode::Simulation);
  EXPECT_EQ(config.genesis_time, 0u);
  EXPECT_FALSE(config.authorize_all);
  EXPECT_TRUE(config.authorized_parties.empty());
  EXPECT_TRUE(config.trusted_validators.empty());
  EXPECT_FALSE(config.enforce_balances);
}

// -----------------------------------------------------------------------------
// 2. All keys.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, ReadsEveryKey) {
  auto config = ledger::parseEngineConfig(nlohmann::json{
      {"store_path", "/tmp/ledger.json"},
      {"clock", "system"},
      {"genesis_time", 42},
      {"authorize_all", true},
      {"authorized_parties", {"alice", "bob"}},
      {"trusted_validators", {"notary"}},
      {"enforce_balances", true},
  });

  EXPECT_EQ(config.store_path, "/tmp/ledger.json");
  EXPECT_EQ(config.clock, ledger::ClockMode::System);
  EXPECT_EQ(config.genesis_time, 42u);
  EXPECT_TRUE(config.authorize_all);
  ASSERT_EQ(config.authorized_parties.size(), 2u);
  EXPECT_EQ(config.authorized_parties[1].address, "bob");
  ASSERT_EQ(config.trusted_validators.size(), 1u);
  EXPECT_EQ(config.trusted_validators[0].address, "notary");
  EXPECT_TRUE(config.enforce_balances);
}

// -----------------------------------------------------------------------------
// 3. Bad values name the key.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, BadValuesAreRejected) {
  expectRejected({{"store_path", 7}}, "store_path");
  expectRejected({{"genesis_time", "soon"}}, "genesis_time");
  expectRejected({{"authorize_all", "yes"}}, "authorize_all");
  expectRejected({{"authorized_parties", "alice"}}, "authorized_parties");
  expectRejected({{"clock", "lunar"}}, "clock");

  EXPECT_THROW(ledger::parseEngineConfig(nlohmann::json::array()),
               std::runtime_error);
}

// -----------------------------------------------------------------------------
// 4. Files.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, LoadFromFile) {
  const std::string path = ::testing::TempDir() + "engine_config_test.json";
  {
    std::ofstream out(path);
    out << R"({"genesis_time": 10, "authorize_all": true})";
  }
  auto config = ledger::loadEngineConfig(path);
  EXPECT_EQ(config.genesis_time, 10u);
  EXPECT_TRUE(config.authorize_all);

  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_THROW(ledger::loadEngineConfig(path), std::runtime_error);
  std::remove(path.c_str());

  EXPECT_THROW(ledger::loadEngineConfig(path + ".missing"), std::runtime_error);
}
