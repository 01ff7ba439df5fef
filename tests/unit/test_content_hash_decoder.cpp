#include "providers/ContentHashDecoder.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

using ddns::common::ContentDecodeError;
using ddns::providers::ContentHashDecoder;

TEST(ContentHashDecoderTest, Base58KnownVectors) {
  EXPECT_EQ(ContentHashDecoder::base58Encode({0x00, 0x00, 0x01}), "112");
  EXPECT_EQ(ContentHashDecoder::base58Encode({'h', 'e', 'l', 'l', 'o'}), "Cn8eVZg");
  EXPECT_EQ(ContentHashDecoder::base58Encode({}), "");
}

TEST(ContentHashDecoderTest, DecodesIpfsNamespaceContentHash) {
  ContentHashDecoder chd;
  EXPECT_EQ(chd.decode("0xe3010170122029f2d17be6139079dc48696d1f582a8530eb9805b561eda517e22a892c7e3f1f"),
            "QmRAQB6YaCyidP37UdDnjFY5vQuiBrcqdyoW1CuDgwxkD4");
}

TEST(ContentHashDecoderTest, DecodesBareDigestAsSha256Multihash) {
  ContentHashDecoder chd;
  EXPECT_EQ(chd.decode("0x" + std::string(64, '2')),
            "QmQdtkyNprt8aLLivRsMoiYvxvot1SYoua5BgAg5vgc233");
}

TEST(ContentHashDecoderTest, PassesTextualCidsThrough) {
  ContentHashDecoder chd;
  const std::string sCid = "QmRAQB6YaCyidP37UdDnjFY5vQuiBrcqdyoW1CuDgwxkD4";
  EXPECT_EQ(chd.decode(sCid), sCid);
  EXPECT_EQ(chd.decode("ipfs://" + sCid), sCid);
  EXPECT_EQ(chd.decode("/ipfs/" + sCid), sCid);

  const std::string sCidV1 = "bafybeigdyrzt5sfp7udm7hu76uh7y26nf3efuylqabf3oclgtqy55fbzdi";
  EXPECT_EQ(chd.decode(sCidV1), sCidV1);
}

TEST(ContentHashDecoderTest, RejectsZeroReference) {
  ContentHashDecoder chd;
  EXPECT_THROW(chd.decode(""), ContentDecodeError);
  EXPECT_THROW(chd.decode("0x" + std::string(64, '0')), ContentDecodeError);
}

TEST(ContentHashDecoderTest, RejectsMalformedHex) {
  ContentHashDecoder chd;
  EXPECT_THROW(chd.decode("0xabc"), ContentDecodeError);
  EXPECT_THROW(chd.decode("0x" + std::string(64, 'z')), ContentDecodeError);
}

TEST(ContentHashDecoderTest, RejectsUnsupportedEncodings) {
  ContentHashDecoder chd;
  // swarm-ns prefix
  EXPECT_THROW(chd.decode("0xe40101fa011b20" + std::string(64, 'a')), ContentDecodeError);
  EXPECT_THROW(chd.decode("0x1234"), ContentDecodeError);
  EXPECT_THROW(chd.decode("not-a-cid"), ContentDecodeError);
}
