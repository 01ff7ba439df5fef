#include "core/ResolutionCache.hpp"

#include <gtest/gtest.h>

#include <chrono>

using ddns::common::CacheEntry;
using ddns::common::ResolutionSource;
using ddns::core::ResolutionCache;
using namespace std::chrono_literals;

namespace {

CacheEntry makeEntry(const std::string& sValue, uint32_t uTtl,
                     std::chrono::system_clock::time_point tpStoredAt) {
  CacheEntry ce;
  ce.sValue = sValue;
  ce.uTtl = uTtl;
  ce.sContentRef = "0xabc";
  ce.source = ResolutionSource::Fast;
  ce.tpStoredAt = tpStoredAt;
  return ce;
}

}  // namespace

TEST(ResolutionCacheTest, MissOnEmpty) {
  ResolutionCache rc;
  EXPECT_FALSE(rc.get("0xkey", "A").has_value());
}

TEST(ResolutionCacheTest, EntryLiveJustBeforeTtlAndGoneJustAfter) {
  ResolutionCache rc;
  const auto tp0 = std::chrono::system_clock::now();
  rc.put("0xkey", "A", makeEntry("1.2.3.4", 60, tp0));

  auto oLive = rc.get("0xkey", "A", tp0 + 59s);
  ASSERT_TRUE(oLive.has_value());
  EXPECT_EQ(oLive->sValue, "1.2.3.4");
  EXPECT_EQ(oLive->sContentRef, "0xabc");

  EXPECT_FALSE(rc.get("0xkey", "A", tp0 + 60s).has_value());
  EXPECT_FALSE(rc.get("0xkey", "A", tp0 + 61s).has_value());
}

TEST(ResolutionCacheTest, KeyedByDomainAndType) {
  ResolutionCache rc;
  const auto tp0 = std::chrono::system_clock::now();
  rc.put("0xkey", "A", makeEntry("1.2.3.4", 60, tp0));
  rc.put("0xkey", "AAAA", makeEntry("2001:db8::1", 60, tp0));
  rc.put("0xother", "A", makeEntry("5.6.7.8", 60, tp0));

  EXPECT_EQ(rc.get("0xkey", "A", tp0)->sValue, "1.2.3.4");
  EXPECT_EQ(rc.get("0xkey", "AAAA", tp0)->sValue, "2001:db8::1");
  EXPECT_EQ(rc.get("0xother", "A", tp0)->sValue, "5.6.7.8");
  EXPECT_FALSE(rc.get("0xother", "AAAA", tp0).has_value());
}

TEST(ResolutionCacheTest, PutOverwritesStaleEntry) {
  ResolutionCache rc;
  const auto tp0 = std::chrono::system_clock::now();
  rc.put("0xkey", "A", makeEntry("old", 10, tp0 - 1h));
  EXPECT_FALSE(rc.get("0xkey", "A", tp0).has_value());

  rc.put("0xkey", "A", makeEntry("new", 10, tp0));
  EXPECT_EQ(rc.get("0xkey", "A", tp0)->sValue, "new");
  EXPECT_EQ(rc.size(), 1u);
}

TEST(ResolutionCacheTest, ClearDropsEverything) {
  ResolutionCache rc;
  const auto tp0 = std::chrono::system_clock::now();
  rc.put("0xkey", "A", makeEntry("1.2.3.4", 60, tp0));
  rc.put("0xkey", "MX", makeEntry("mx", 60, tp0));
  rc.clear();
  EXPECT_EQ(rc.size(), 0u);
  EXPECT_FALSE(rc.get("0xkey", "A", tp0).has_value());
}
