// include/wsb/SnapshotStore.hpp
#pragma once
#include "wsb/Document.hpp"

#include <atomic>
#include <shared_mutex>

namespace wsb {

/// Latest successfully fetched upstream document.
/// The Poller is the only writer; every reader gets a shared reference to an
/// immutable document, so a concurrent replace never shows a torn value.
class SnapshotStore {
public:
  SnapshotStore();

  DocumentPtr current() const;

  /// Swap in a new snapshot. A null document is ignored.
  void replace(DocumentPtr doc);

  /// False until the first replace().
  bool hasSnapshot() const { return _seeded.load(std::memory_order_acquire); }

private:
  mutable std::shared_mutex _mutex;
  DocumentPtr _doc;
  std::atomic<bool> _seeded{false};
};

} // namespace wsb
