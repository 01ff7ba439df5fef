#include "providers/RpcFastLedger.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using ddns::common::LedgerError;
using ddns::common::ValidationError;
using ddns::providers::RpcFastLedger;
using json = nlohmann::json;

// ── resolver_getRecord ────────────────────────────────────────────────────

TEST(RpcFastLedgerParseTest, RecordReadsAllFields) {
  auto fr = RpcFastLedger::parseRecord(
      {{"value", "1.2.3.4"}, {"ttl", 300}, {"timestamp", 1700000000}, {"contentRef", "QmX"}});
  EXPECT_EQ(fr.sValue, "1.2.3.4");
  EXPECT_EQ(fr.uTtl, 300u);
  EXPECT_EQ(fr.iTimestamp, 1700000000);
  EXPECT_EQ(fr.sContentRef, "QmX");
}

TEST(RpcFastLedgerParseTest, RecordTreatsNullFieldsAsUnset) {
  auto fr = RpcFastLedger::parseRecord(
      {{"value", nullptr}, {"ttl", nullptr}, {"timestamp", nullptr}, {"contentRef", nullptr}});
  EXPECT_TRUE(fr.sValue.empty());
  EXPECT_EQ(fr.uTtl, 0u);
  EXPECT_EQ(fr.iTimestamp, 0);
  EXPECT_TRUE(fr.sContentRef.empty());
}

TEST(RpcFastLedgerParseTest, RecordMissingFieldsReadAsUnset) {
  auto fr = RpcFastLedger::parseRecord(json::object());
  EXPECT_TRUE(fr.sValue.empty());
  EXPECT_EQ(fr.uTtl, 0u);
}

TEST(RpcFastLedgerParseTest, RecordRejectsNonObject) {
  EXPECT_THROW(RpcFastLedger::parseRecord(json::array()), LedgerError);
  EXPECT_THROW(RpcFastLedger::parseRecord(nullptr), LedgerError);
}

TEST(RpcFastLedgerParseTest, RecordMistypedFieldIsLedgerError) {
  EXPECT_THROW(RpcFastLedger::parseRecord({{"value", 42}}), LedgerError);
}

// ── resolver_getBatchRecords ──────────────────────────────────────────────

TEST(RpcFastLedgerParseTest, BatchMapsNullSlotsToEmpty) {
  json jResult = {{"values", {"1.2.3.4", nullptr}},
                  {"ttls", {60, nullptr}},
                  {"timestamps", {nullptr, 5}},
                  {"contentRef", nullptr}};
  auto fb = RpcFastLedger::parseBatch(jResult, 2);
  ASSERT_EQ(fb.vValues.size(), 2u);
  EXPECT_EQ(fb.vValues[0], "1.2.3.4");
  EXPECT_TRUE(fb.vValues[1].empty());
  EXPECT_EQ(fb.vTtls[0], 60u);
  EXPECT_EQ(fb.vTtls[1], 0u);
  EXPECT_EQ(fb.vTimestamps[0], 0);
  EXPECT_EQ(fb.vTimestamps[1], 5);
  EXPECT_TRUE(fb.sContentRef.empty());
}

TEST(RpcFastLedgerParseTest, BatchLengthMismatchIsValidationError) {
  json jResult = {{"values", {"a"}}, {"ttls", {1}}, {"timestamps", {1}}};
  EXPECT_THROW(RpcFastLedger::parseBatch(jResult, 2), ValidationError);
}

TEST(RpcFastLedgerParseTest, BatchMissingArrayIsLedgerError) {
  json jResult = {{"values", {"a"}}, {"ttls", {1}}};
  EXPECT_THROW(RpcFastLedger::parseBatch(jResult, 1), LedgerError);
}
