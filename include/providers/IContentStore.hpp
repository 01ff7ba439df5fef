#pragma once

#include <string>

namespace ddns::providers {

/// Content-addressed document store.
class IContentStore {
 public:
  virtual ~IContentStore() = default;

  virtual std::string name() const = 0;

  /// Raw document bytes for sLocator. Throws common::NotFoundError when the
  /// store has no such document, common::ContentStoreError on transport failure.
  virtual std::string fetch(const std::string& sLocator) = 0;
};

}  // namespace ddns::providers
