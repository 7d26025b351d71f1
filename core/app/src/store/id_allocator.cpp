#include "ledger/store/id_allocator.hpp"

#include "ledger/store/storage_keys.hpp"

namespace ledger {

domain::EntityId IdAllocator::current(domain::EntityKind kind) const {
  auto stored = store_.get(keys::counter(kind));
  if (!stored) {
    return 0;
  }
  return stored->get<domain::EntityId>();
}

domain::EntityId IdAllocator::next(domain::EntityKind kind) {
  domain::EntityId id = current(kind) + 1;
  store_.set(keys::counter(kind), id);
  return id;
}

}  // namespace ledger
