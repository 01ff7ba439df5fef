#include "providers/InMemoryContentStore.hpp"

#include "common/Errors.hpp"

namespace ddns::providers {

InMemoryContentStore::InMemoryContentStore() = default;

InMemoryContentStore::~InMemoryContentStore() = default;

std::string InMemoryContentStore::name() const { return "memory-content"; }

std::string InMemoryContentStore::fetch(const std::string& sLocator) {
  std::lock_guard<std::mutex> lock(_mtx);
  ++_uFetchCount;
  auto it = _mDocuments.find(sLocator);
  if (it == _mDocuments.end()) {
    throw common::NotFoundError("content_not_found", "No document for " + sLocator);
  }
  return it->second;
}

void InMemoryContentStore::put(const std::string& sLocator, std::string sDocument) {
  std::lock_guard<std::mutex> lock(_mtx);
  _mDocuments.insert_or_assign(sLocator, std::move(sDocument));
}

bool InMemoryContentStore::remove(const std::string& sLocator) {
  std::lock_guard<std::mutex> lock(_mtx);
  return _mDocuments.erase(sLocator) > 0;
}

uint64_t InMemoryContentStore::fetchCount() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _uFetchCount;
}

}  // namespace ddns::providers
