#include "ledger/store/json_file_store.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace ledger {

JsonFileStore::JsonFileStore(std::string path) : path_(std::move(path)) {
  load();
}

// -----------------------------------------------------------------------------
// load(): missing file = empty store; anything else must be a JSON object
// -----------------------------------------------------------------------------
void JsonFileStore::load() {
  std::ifstream in(path_);
  if (!in.is_open()) {
    std::cout << "[JsonFileStore] No snapshot at " << path_
              << ", starting empty\n";
    return;
  }

  nlohmann::json snapshot;
  try {
    in >> snapshot;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("JsonFileStore: cannot parse " + path_ + ": " +
                             e.what());
  }

  if (!snapshot.is_object()) {
    throw std::runtime_error("JsonFileStore: " + path_ +
                             " does not contain a JSON object");
  }

  for (auto it = snapshot.begin(); it != snapshot.end(); ++it) {
    entries_[it.key()] = it.value();
  }

  std::cout << "[JsonFileStore] Loaded " << entries_.size() << " keys from "
            << path_ << "\n";
}

void JsonFileStore::set(const std::string& key, nlohmann::json value) {
  MemoryStore::set(key, std::move(value));
  dirty_ = true;
}

void JsonFileStore::remove(const std::string& key) {
  MemoryStore::remove(key);
  dirty_ = true;
}

// -----------------------------------------------------------------------------
// flush(): write-to-temp then rename over the snapshot
// -----------------------------------------------------------------------------
void JsonFileStore::flush() {
  if (!dirty_) {
    return;
  }

  nlohmann::json snapshot = nlohmann::json::object();
  for (const auto& [key, value] : entries_) {
    snapshot[key] = value;
  }

  const std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("JsonFileStore: cannot open " + tmp_path);
    }
    out << snapshot.dump(2) << '\n';
    if (!out.good()) {
      throw std::runtime_error("JsonFileStore: write failed for " + tmp_path);
    }
  }

  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    throw std::runtime_error("JsonFileStore: cannot replace " + path_);
  }

  dirty_ = false;
}

}  // namespace ledger
