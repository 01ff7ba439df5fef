#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "providers/IAuthoritativeLedger.hpp"

namespace ddns::providers {

/// In-process registry ledger for memory mode and tests.
/// Every write mines one block: the height advances by one and the emitted
/// event is stamped with the new height. Reads are virtual so tests can
/// inject failures by subclassing.
/// Class abbreviation: imal
class InMemoryAuthoritativeLedger : public IAuthoritativeLedger {
 public:
  static constexpr int64_t kDefaultRenewalPeriodSeconds = 365 * 24 * 60 * 60;

  explicit InMemoryAuthoritativeLedger(int64_t iRenewalPeriodSeconds = kDefaultRenewalPeriodSeconds);
  ~InMemoryAuthoritativeLedger() override;

  std::string name() const override;
  uint64_t currentHeight() override;
  std::vector<common::UpdateEvent> queryUpdateEvents(uint64_t uFromHeight,
                                                     uint64_t uToHeight) override;
  std::vector<common::RegisterEvent> queryRegisterEvents(uint64_t uFromHeight,
                                                         uint64_t uToHeight) override;
  common::DomainRecordSet getDomainRecord(const std::string& sDomainKey) override;

  // ── Registry writes ─────────────────────────────────────────────────────

  /// Register an unowned domain with a zero content reference.
  /// Throws ValidationError when the domain is already registered.
  void registerDomain(const std::string& sDomainKey, const std::string& sOwner);

  /// Point the domain at new content. Only the owner may update.
  void updateDomain(const std::string& sDomainKey, const std::string& sCaller,
                    const std::string& sContentRef);

  /// Hand the domain to a new owner. Only the owner may transfer.
  void transferDomain(const std::string& sDomainKey, const std::string& sCaller,
                      const std::string& sNewOwner);

  /// Domains currently owned by sOwner, in registration order.
  std::vector<std::string> domainsOwnedBy(const std::string& sOwner) const;

  /// Overwrite the expiry timestamp (unix seconds).
  void setExpiry(const std::string& sDomainKey, int64_t iExpiry);

  /// Mine empty blocks.
  void advanceHeight(uint64_t uBlocks);

 private:
  common::DomainRecordSet& requireOwned(const std::string& sDomainKey, const std::string& sCaller);

  int64_t _iRenewalPeriodSeconds;
  mutable std::mutex _mtx;
  uint64_t _uHeight = 0;
  std::map<std::string, common::DomainRecordSet> _mDomains;
  std::vector<std::string> _vRegistrationOrder;
  std::vector<common::UpdateEvent> _vUpdateEvents;
  std::vector<common::RegisterEvent> _vRegisterEvents;
};

}  // namespace ddns::providers
