#include "protocol.hpp"
#include <gtest/gtest.h>
#include <random>
#include <vector>

using namespace rudp;

TEST(InternetChecksum, MatchesRfc1071Example) {
  const uint8_t buf[] = {0x00, 0x01, 0xf2, 0x03, 0xf4, 0xf5, 0xf6, 0xf7};
  EXPECT_EQ(internet_checksum(buf, 0, sizeof(buf)), 0x220d);
}

TEST(InternetChecksum, HonorsOffset) {
  const uint8_t buf[] = {0xaa, 0xbb, 0x00, 0x01, 0xf2, 0x03,
                         0xf4, 0xf5, 0xf6, 0xf7, 0xcc};
  EXPECT_EQ(internet_checksum(buf, 2, 8), 0x220d);
}

TEST(InternetChecksum, OddTrailingByteIsHighOrder) {
  const uint8_t one[] = {0x12};
  EXPECT_EQ(internet_checksum(one, 0, 1), 0xedff);
  const uint8_t three[] = {0x12, 0x34, 0x56};
  EXPECT_EQ(internet_checksum(three, 0, 3), 0x97cb);
}

TEST(InternetChecksum, EmptyRange) {
  const uint8_t buf[] = {0x12};
  EXPECT_EQ(internet_checksum(buf, 0, 0), 0xffff);
}

TEST(InternetChecksum, FoldsCarries) {
  const uint8_t a[] = {0xff, 0xff, 0xff, 0xff};
  EXPECT_EQ(internet_checksum(a, 0, 4), 0x0000);
  const uint8_t b[] = {0xff, 0xff, 0x00, 0x01};
  EXPECT_EQ(internet_checksum(b, 0, 4), 0xfffe);
}

TEST(InternetChecksum, LargeBufferStaysFolded) {
  std::vector<uint8_t> buf(65535, 0xff);
  // 32767 words of 0xffff plus 0xff00: all ones after folding
  EXPECT_EQ(internet_checksum(buf.data(), 0, buf.size()), 0x00ff);
}

TEST(Coverage, HeaderUnlessChk) {
  EXPECT_EQ(checksum_coverage(SF_ACK, 6, 100), 6u);
  EXPECT_EQ(checksum_coverage(SF_ACK | SF_CHK, 6, 100), 100u);
}

TEST(EmbedChecksum, RegionSumsToZero) {
  std::mt19937 rng(1234);
  for (size_t len = kHeaderLen; len < 80; len++) {
    std::vector<uint8_t> buf(len);
    for (auto &b : buf)
      b = (uint8_t)rng();
    // field at the end of the region, as with the header trailer
    embed_checksum(buf.data(), len - 2, len);
    EXPECT_EQ(internet_checksum(buf.data(), 0, len), 0) << "len " << len;
  }
}

TEST(EmbedChecksum, FieldInsideLargerRegion) {
  std::mt19937 rng(99);
  for (size_t field = 4; field < 12; field++) {
    std::vector<uint8_t> buf(31);
    for (auto &b : buf)
      b = (uint8_t)rng();
    embed_checksum(buf.data(), field, buf.size());
    EXPECT_EQ(internet_checksum(buf.data(), 0, buf.size()), 0)
        << "field " << field;
  }
}

TEST(EmbedChecksum, StoresBigEndianAtEvenOffset) {
  uint8_t buf[] = {0x40, 0x06, 0x05, 0x03, 0x11, 0x22};
  uint16_t sum = embed_checksum(buf, 4, sizeof(buf));
  EXPECT_EQ(sum, 0xbaf6);
  EXPECT_EQ(buf[4], 0xba);
  EXPECT_EQ(buf[5], 0xf6);
}
