#include "logging.hpp"
#include "util.hpp"
#include <cstdio>
#include <gtest/gtest.h>
#include <string>

using namespace rudp;

TEST(Util, ParseHostPort) {
  std::string host;
  uint16_t port = 0;
  EXPECT_TRUE(parse_host_port("127.0.0.1:46090", host, port));
  EXPECT_EQ(host, "127.0.0.1");
  EXPECT_EQ(port, 46090);
  EXPECT_FALSE(parse_host_port("localhost", host, port));
  EXPECT_FALSE(parse_host_port("localhost:70000", host, port));
  EXPECT_FALSE(parse_host_port("localhost:http", host, port));
}

TEST(Util, HexRoundTrip) {
  auto b = hex_to_bytes("4006050300FF");
  std::vector<uint8_t> expect = {0x40, 0x06, 0x05, 0x03, 0x00, 0xff};
  EXPECT_EQ(b, expect);
  EXPECT_EQ(bytes_to_hex(b), "4006050300ff");
}

TEST(Util, HexRejectsMalformed) {
  EXPECT_TRUE(hex_to_bytes("").empty());
  EXPECT_TRUE(hex_to_bytes("abc").empty());
  EXPECT_TRUE(hex_to_bytes("zz").empty());
  EXPECT_TRUE(hex_to_bytes("40 06").empty());
}

TEST(Logging, ParseLevel) {
  LogLevel lvl = LogLevel::INFO;
  EXPECT_TRUE(parse_log_level("debug", lvl));
  EXPECT_EQ(lvl, LogLevel::DEBUG);
  EXPECT_TRUE(parse_log_level("error", lvl));
  EXPECT_EQ(lvl, LogLevel::ERROR);
  EXPECT_FALSE(parse_log_level("verbose", lvl));
  EXPECT_EQ(lvl, LogLevel::ERROR);
}

TEST(Logging, ThresholdAndSink) {
  std::FILE *tmp = std::tmpfile();
  ASSERT_NE(tmp, nullptr);
  auto &log = Logger::instance();
  LogLevel saved = log.level();
  log.set_sink(tmp);
  log.set_level(LogLevel::WARN);
  log.log(LogLevel::INFO, "hidden %d", 1);
  log.log(LogLevel::WARN, "shown %d", 2);
  log.set_sink(nullptr);
  log.set_level(saved);

  std::rewind(tmp);
  std::string text;
  char buf[256];
  while (std::fgets(buf, sizeof(buf), tmp))
    text += buf;
  std::fclose(tmp);
  EXPECT_EQ(text.find("hidden"), std::string::npos);
  EXPECT_NE(text.find("[WARN] shown 2"), std::string::npos);
}
