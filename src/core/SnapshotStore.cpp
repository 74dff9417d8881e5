// src/core/SnapshotStore.cpp
#include "wsb/SnapshotStore.hpp"

#include <mutex>

namespace wsb {

SnapshotStore::SnapshotStore()
  : _doc(emptyDocument()) {}

DocumentPtr SnapshotStore::current() const {
  std::shared_lock lock(_mutex);
  return _doc;
}

void SnapshotStore::replace(DocumentPtr doc) {
  if (!doc) return;
  {
    std::unique_lock lock(_mutex);
    _doc.swap(doc);
  }
  _seeded.store(true, std::memory_order_release);
  // previous snapshot is released here, outside the lock
}

} // namespace wsb
