#include "logging.hpp"
#include "probe.hpp"
#include "segment_listener.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace rudp;

namespace {

ProbeConfig probe_to(const SegmentListener &l, const std::string &kind) {
  ProbeConfig cfg;
  cfg.target_host = "127.0.0.1";
  cfg.target_port = l.local_endpoint().port();
  cfg.kind = kind;
  cfg.timeout_ms = 200;
  cfg.count = 3;
  return cfg;
}

} // namespace

TEST(Loopback, NulIsAcknowledged) {
  asio::io_context io;
  ListenerConfig lc;
  lc.listen_host = "127.0.0.1";
  lc.listen_port = 0;
  lc.auto_ack = true;
  SegmentListener listener(io, lc);
  listener.start();

  auto cfg = probe_to(listener, "nul");
  cfg.seq = 12;
  auto seg = make_segment(cfg);
  ASSERT_TRUE(seg.has_value());
  Probe probe(io, cfg, std::move(*seg));
  probe.start();
  io.run_for(std::chrono::seconds(3));

  ASSERT_EQ(probe.replies().size(), 1u);
  const Segment &r = probe.replies()[0];
  EXPECT_EQ(r.type(), SegmentType::ACK);
  EXPECT_EQ(r.acknowledgment_number(), std::optional<uint8_t>(12));
  EXPECT_EQ(listener.accepted(), 1u);
  listener.stop();
}

TEST(Loopback, SynGetsSynAck) {
  asio::io_context io;
  ListenerConfig lc;
  lc.listen_host = "127.0.0.1";
  lc.auto_ack = true;
  SegmentListener listener(io, lc);
  listener.start();

  auto cfg = probe_to(listener, "syn");
  cfg.seq = 40;
  Probe probe(io, cfg, *make_segment(cfg));
  probe.start();
  io.run_for(std::chrono::seconds(3));

  ASSERT_EQ(probe.replies().size(), 1u);
  const Segment &r = probe.replies()[0];
  EXPECT_EQ(r.type(), SegmentType::SYN);
  EXPECT_EQ(r.acknowledgment_number(), std::optional<uint8_t>(40));
  ASSERT_NE(r.syn_parameters(), nullptr);
  listener.stop();
}

TEST(Loopback, SilentPeerExhaustsRetransmissions) {
  asio::io_context io;
  ListenerConfig lc;
  lc.listen_host = "127.0.0.1";
  SegmentListener listener(io, lc);
  listener.start();

  auto cfg = probe_to(listener, "dat");
  cfg.data = {1, 2, 3};
  cfg.ack = 0;
  cfg.full_checksum = true;
  Probe probe(io, cfg, *make_segment(cfg));
  probe.start();
  io.run_for(std::chrono::seconds(3));

  EXPECT_TRUE(probe.replies().empty());
  EXPECT_EQ(probe.sends(), 3u);
  EXPECT_EQ(listener.accepted(), 3u);
  listener.stop();
}

TEST(MakeSegment, Kinds) {
  ProbeConfig cfg;
  cfg.kind = "eak";
  cfg.ack = 4;
  cfg.data = {6, 7};
  auto s = make_segment(cfg);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->type(), SegmentType::EAK);
  EXPECT_EQ(s->eak_acks()->size(), 2u);

  cfg.kind = "fin";
  s = make_segment(cfg);
  ASSERT_TRUE(s.has_value());
  EXPECT_EQ(s->flags(), SF_FIN | SF_ACK);

  cfg.kind = "bogus";
  EXPECT_FALSE(make_segment(cfg).has_value());
}

TEST(Loopback, StopFromAnotherThreadWhileServing) {
  asio::io_context io;
  ListenerConfig lc;
  lc.listen_host = "127.0.0.1";
  lc.auto_ack = true;
  SegmentListener listener(io, lc);
  listener.start();

  // keep the socket busy while it is closed from the main thread
  asio::io_context client_io;
  asio::ip::udp::socket client(client_io);
  client.open(asio::ip::udp::v4());
  auto wire = Segment::nul(3).to_bytes_with_checksum();
  for (int i = 0; i < 50; i++)
    client.send_to(asio::buffer(wire), listener.local_endpoint());

  std::vector<std::thread> th;
  for (int i = 0; i < 2; i++)
    th.emplace_back([&]() { io.run(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  listener.stop();
  // run() returns only once the close has aborted the pending receive
  for (auto &t : th)
    t.join();
  EXPECT_GT(listener.accepted(), 0u);
  EXPECT_EQ(listener.dropped(), 0u);
}
