#pragma once

#include "wsb/Document.hpp"
#include "wsb/Result.hpp"

namespace wsb {

/// Source of upstream snapshots. fetch() reports failures through Result;
/// a successful result always holds a JSON object.
class IFetcher {
public:
  virtual ~IFetcher() = default;
  virtual Result<DocumentPtr> fetch() = 0;
};

} // namespace wsb
