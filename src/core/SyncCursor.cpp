#include "core/SyncCursor.hpp"

namespace ddns::core {

SyncCursor::SyncCursor() = default;

SyncCursor::~SyncCursor() = default;

uint64_t SyncCursor::get() const { return _uHeight.load(std::memory_order_acquire); }

void SyncCursor::reset(uint64_t uHeight) { _uHeight.store(uHeight, std::memory_order_release); }

bool SyncCursor::advanceTo(uint64_t uHeight) {
  uint64_t uCurrent = _uHeight.load(std::memory_order_acquire);
  while (uHeight > uCurrent) {
    if (_uHeight.compare_exchange_weak(uCurrent, uHeight, std::memory_order_acq_rel)) {
      return true;
    }
  }
  return false;
}

}  // namespace ddns::core
