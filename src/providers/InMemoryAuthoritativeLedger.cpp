#include "providers/InMemoryAuthoritativeLedger.hpp"

#include <chrono>

#include "common/DomainHash.hpp"
#include "common/Errors.hpp"

namespace ddns::providers {

namespace {

const std::string kZeroContentRef = "0x" + std::string(64, '0');

int64_t nowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // anonymous namespace

InMemoryAuthoritativeLedger::InMemoryAuthoritativeLedger(int64_t iRenewalPeriodSeconds)
    : _iRenewalPeriodSeconds(iRenewalPeriodSeconds) {}

InMemoryAuthoritativeLedger::~InMemoryAuthoritativeLedger() = default;

std::string InMemoryAuthoritativeLedger::name() const { return "memory-registry"; }

uint64_t InMemoryAuthoritativeLedger::currentHeight() {
  std::lock_guard<std::mutex> lock(_mtx);
  return _uHeight;
}

std::vector<common::UpdateEvent> InMemoryAuthoritativeLedger::queryUpdateEvents(
    uint64_t uFromHeight, uint64_t uToHeight) {
  std::lock_guard<std::mutex> lock(_mtx);
  std::vector<common::UpdateEvent> vOut;
  for (const auto& ue : _vUpdateEvents) {
    if (ue.uHeight >= uFromHeight && ue.uHeight <= uToHeight) {
      vOut.push_back(ue);
    }
  }
  return vOut;
}

std::vector<common::RegisterEvent> InMemoryAuthoritativeLedger::queryRegisterEvents(
    uint64_t uFromHeight, uint64_t uToHeight) {
  std::lock_guard<std::mutex> lock(_mtx);
  std::vector<common::RegisterEvent> vOut;
  for (const auto& re : _vRegisterEvents) {
    if (re.uHeight >= uFromHeight && re.uHeight <= uToHeight) {
      vOut.push_back(re);
    }
  }
  return vOut;
}

common::DomainRecordSet InMemoryAuthoritativeLedger::getDomainRecord(
    const std::string& sDomainKey) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mDomains.find(sDomainKey);
  if (it == _mDomains.end()) {
    return {};
  }
  return it->second;
}

void InMemoryAuthoritativeLedger::registerDomain(const std::string& sDomainKey,
                                                 const std::string& sOwner) {
  if (common::DomainHash::isZero(sOwner)) {
    throw common::ValidationError("invalid_owner", "Owner must be a non-zero address");
  }

  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mDomains.find(sDomainKey);
  if (it != _mDomains.end() && !common::DomainHash::isZero(it->second.sOwner)) {
    throw common::ValidationError("domain_already_registered",
                                  "Domain " + sDomainKey + " is already registered");
  }

  const int64_t iNow = nowSeconds();
  common::DomainRecordSet drs;
  drs.sOwner = sOwner;
  drs.sContentRef = kZeroContentRef;
  drs.iLastUpdated = iNow;
  drs.iExpiry = iNow + _iRenewalPeriodSeconds;
  _mDomains.insert_or_assign(sDomainKey, drs);
  _vRegistrationOrder.push_back(sDomainKey);

  ++_uHeight;
  _vRegisterEvents.push_back({sDomainKey, _uHeight});
}

common::DomainRecordSet& InMemoryAuthoritativeLedger::requireOwned(const std::string& sDomainKey,
                                                                   const std::string& sCaller) {
  auto it = _mDomains.find(sDomainKey);
  if (it == _mDomains.end() || common::DomainHash::isZero(it->second.sOwner)) {
    throw common::NotFoundError("domain_not_registered",
                                "Domain " + sDomainKey + " is not registered");
  }
  if (it->second.sOwner != sCaller) {
    throw common::ValidationError("not_domain_owner",
                                  "Caller is not the owner of " + sDomainKey);
  }
  return it->second;
}

void InMemoryAuthoritativeLedger::updateDomain(const std::string& sDomainKey,
                                               const std::string& sCaller,
                                               const std::string& sContentRef) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto& drs = requireOwned(sDomainKey, sCaller);
  drs.sContentRef = sContentRef;
  drs.iLastUpdated = nowSeconds();

  ++_uHeight;
  _vUpdateEvents.push_back({sDomainKey, sContentRef, _uHeight});
}

void InMemoryAuthoritativeLedger::transferDomain(const std::string& sDomainKey,
                                                 const std::string& sCaller,
                                                 const std::string& sNewOwner) {
  if (common::DomainHash::isZero(sNewOwner)) {
    throw common::ValidationError("invalid_owner", "New owner must be a non-zero address");
  }

  std::lock_guard<std::mutex> lock(_mtx);
  auto& drs = requireOwned(sDomainKey, sCaller);
  drs.sOwner = sNewOwner;
  drs.iLastUpdated = nowSeconds();
  ++_uHeight;
}

std::vector<std::string> InMemoryAuthoritativeLedger::domainsOwnedBy(
    const std::string& sOwner) const {
  std::lock_guard<std::mutex> lock(_mtx);
  std::vector<std::string> vOut;
  for (const auto& sKey : _vRegistrationOrder) {
    auto it = _mDomains.find(sKey);
    if (it != _mDomains.end() && it->second.sOwner == sOwner) {
      vOut.push_back(sKey);
    }
  }
  return vOut;
}

void InMemoryAuthoritativeLedger::setExpiry(const std::string& sDomainKey, int64_t iExpiry) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mDomains.find(sDomainKey);
  if (it == _mDomains.end()) {
    throw common::NotFoundError("domain_not_registered",
                                "Domain " + sDomainKey + " is not registered");
  }
  it->second.iExpiry = iExpiry;
}

void InMemoryAuthoritativeLedger::advanceHeight(uint64_t uBlocks) {
  std::lock_guard<std::mutex> lock(_mtx);
  _uHeight += uBlocks;
}

}  // namespace ddns::providers
