#pragma once

#include "ledger/store/memory_store.hpp"

#include <string>

namespace ledger {

// -----------------------------------------------------------------------------
// JsonFileStore
// -----------------------------------------------------------------------------
//
// @brief  MemoryStore whose contents are mirrored to a single JSON object on
//         disk. The file is read once at construction and rewritten on every
//         flush().
//
// @details
// flush() writes "<path>.tmp" and renames it over <path>, so a crash during
// the write leaves the previous snapshot intact. Writes between flushes live
// only in memory.
//
// A missing file is treated as an empty store. A file that exists but is
// not a JSON object is a host fault and throws.
// -----------------------------------------------------------------------------
class JsonFileStore final : public MemoryStore {
 public:
  // @throws std::runtime_error if the file exists but cannot be parsed.
  explicit JsonFileStore(std::string path);

  void set(const std::string& key, nlohmann::json value) override;
  void remove(const std::string& key) override;

  // @throws std::runtime_error if the snapshot cannot be written.
  void flush() override;

  const std::string& path() const { return path_; }

 private:
  void load();

  std::string path_;
  bool dirty_{false};  // Writes since the last flush
};

}  // namespace ledger
