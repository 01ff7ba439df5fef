#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include "providers/IContentStore.hpp"

namespace ddns::providers {

/// In-process content store keyed by locator.
/// Class abbreviation: imcs
class InMemoryContentStore : public IContentStore {
 public:
  InMemoryContentStore();
  ~InMemoryContentStore() override;

  std::string name() const override;
  std::string fetch(const std::string& sLocator) override;

  void put(const std::string& sLocator, std::string sDocument);
  bool remove(const std::string& sLocator);

  /// Number of fetch() calls, successful or not.
  uint64_t fetchCount() const;

 private:
  mutable std::mutex _mtx;
  std::map<std::string, std::string> _mDocuments;
  uint64_t _uFetchCount = 0;
};

}  // namespace ddns::providers
