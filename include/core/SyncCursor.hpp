#pragma once

#include <atomic>
#include <cstdint>

namespace ddns::core {

/// Last authoritative height whose events have been enqueued.
/// Only moves forward once set; safe to read from any thread.
/// Class abbreviation: sc
class SyncCursor {
 public:
  SyncCursor();
  ~SyncCursor();

  uint64_t get() const;

  /// Unconditional set, used only at startup.
  void reset(uint64_t uHeight);

  /// Move to uHeight if it is ahead. Returns true if the cursor moved.
  bool advanceTo(uint64_t uHeight);

 private:
  std::atomic<uint64_t> _uHeight{0};
};

}  // namespace ddns::core
