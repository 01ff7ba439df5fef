#include "core/ResolutionCache.hpp"

namespace ddns::core {

ResolutionCache::ResolutionCache() = default;
ResolutionCache::~ResolutionCache() = default;

std::string ResolutionCache::makeKey(const std::string& sDomainKey, const std::string& sType) {
  return sDomainKey + "-" + sType;
}

std::optional<common::CacheEntry> ResolutionCache::get(const std::string& sDomainKey,
                                                       const std::string& sType) const {
  return get(sDomainKey, sType, std::chrono::system_clock::now());
}

std::optional<common::CacheEntry> ResolutionCache::get(
    const std::string& sDomainKey, const std::string& sType,
    std::chrono::system_clock::time_point tpNow) const {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mEntries.find(makeKey(sDomainKey, sType));
  if (it == _mEntries.end()) {
    return std::nullopt;
  }

  const auto& ceEntry = it->second;
  if (tpNow >= ceEntry.tpStoredAt + std::chrono::seconds(ceEntry.uTtl)) {
    return std::nullopt;  // stale
  }
  return ceEntry;
}

void ResolutionCache::put(const std::string& sDomainKey, const std::string& sType,
                          common::CacheEntry ceEntry) {
  std::lock_guard<std::mutex> lock(_mtx);
  _mEntries.insert_or_assign(makeKey(sDomainKey, sType), std::move(ceEntry));
}

void ResolutionCache::clear() {
  std::lock_guard<std::mutex> lock(_mtx);
  _mEntries.clear();
}

size_t ResolutionCache::size() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _mEntries.size();
}

}  // namespace ddns::core
