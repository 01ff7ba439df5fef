#include "common/DomainHash.hpp"

#include <gtest/gtest.h>

using ddns::common::DomainHash;

TEST(DomainHashTest, KnownSha3Vectors) {
  EXPECT_EQ(DomainHash::compute(""),
            "0xa7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
  EXPECT_EQ(DomainHash::compute("abc"),
            "0x3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(DomainHashTest, StableAndDistinct) {
  const auto sKey = DomainHash::compute("example.eth");
  EXPECT_EQ(sKey.size(), 66u);
  EXPECT_EQ(sKey, DomainHash::compute("example.eth"));
  EXPECT_NE(sKey, DomainHash::compute("example2.eth"));
}

TEST(DomainHashTest, ZeroDetection) {
  EXPECT_TRUE(DomainHash::isZero(""));
  EXPECT_TRUE(DomainHash::isZero("0x"));
  EXPECT_TRUE(DomainHash::isZero("0x" + std::string(64, '0')));
  EXPECT_TRUE(DomainHash::isZero("0x0000000000000000000000000000000000000000"));
  EXPECT_FALSE(DomainHash::isZero("0x01"));
  EXPECT_FALSE(DomainHash::isZero(DomainHash::compute("example.eth")));
}
