#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "common/Types.hpp"

namespace ddns::core {

/// Lookaside cache of resolution results keyed by (domain key, record type).
/// An entry is live while now < storedAt + ttl; stale entries are ignored on
/// read and overwritten on the next put. No other eviction.
/// Class abbreviation: rc
class ResolutionCache {
 public:
  ResolutionCache();
  ~ResolutionCache();

  /// Live entry for the key at the current time, or nullopt.
  std::optional<common::CacheEntry> get(const std::string& sDomainKey,
                                        const std::string& sType) const;

  /// Live entry for the key as of tpNow, or nullopt.
  std::optional<common::CacheEntry> get(const std::string& sDomainKey,
                                        const std::string& sType,
                                        std::chrono::system_clock::time_point tpNow) const;

  /// Store ceEntry, replacing any previous entry for the key.
  void put(const std::string& sDomainKey, const std::string& sType,
           common::CacheEntry ceEntry);

  void clear();

  /// Number of stored entries, stale ones included.
  size_t size() const;

 private:
  static std::string makeKey(const std::string& sDomainKey, const std::string& sType);

  std::unordered_map<std::string, common::CacheEntry> _mEntries;
  mutable std::mutex _mtx;
};

}  // namespace ddns::core
