#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// IDurableStore
// -----------------------------------------------------------------------------
//
// @brief  Key-value store the engine persists every record, counter and index
//         into. Keys are composite strings built by storage_keys.hpp; values
//         are JSON documents produced by record_codec.hpp.
//
// @details
// Implementations:
//   - MemoryStore       : process-local map, used by tests and in-memory runs.
//   - JsonFileStore     : map mirrored to a JSON file; survives restarts.
//   - TransactionalStore: overlay that buffers one invocation's writes and
//                         applies them to a backing store on commit().
//
// All operations are synchronous. No implementation is thread-safe; the
// engine serializes access through the invocation model.
// -----------------------------------------------------------------------------
class IDurableStore {
 public:
  virtual ~IDurableStore() = default;

  // Returns the value stored at key, or std::nullopt if absent.
  virtual std::optional<nlohmann::json> get(const std::string& key) const = 0;

  // Inserts or overwrites key.
  virtual void set(const std::string& key, nlohmann::json value) = 0;

  virtual bool has(const std::string& key) const = 0;

  // Removes key. Absent keys are ignored.
  virtual void remove(const std::string& key) = 0;

  // -------------------------------------------------------------------------
  // flush()
  // -------------------------------------------------------------------------
  // @brief  Makes all previous writes durable. No-op for memory-backed
  //         stores.
  //
  // @throws std::runtime_error if the backing medium cannot be written.
  // -------------------------------------------------------------------------
  virtual void flush() = 0;
};

}  // namespace ledger
