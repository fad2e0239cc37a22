#pragma once
#include <asio.hpp>
#include <atomic>
#include <memory>
#include <vector>
#include "segment.hpp"

namespace rudp {

struct ListenerConfig {
    std::string listen_host;
    uint16_t listen_port{};
    int threads{2};
    bool auto_ack{false};
};

class SegmentListener {
public:
    using udp = asio::ip::udp;

    SegmentListener(asio::io_context& io, const ListenerConfig& cfg);
    void start();
    // Safe from any thread; the socket closes on its strand.
    void stop();
    udp::endpoint local_endpoint() const { return sock_.local_endpoint(); }
    uint64_t accepted() const { return accepted_; }
    uint64_t dropped() const { return dropped_; }

private:
    ListenerConfig cfg_;
    udp::socket sock_;
    udp::endpoint from_;
    std::vector<uint8_t> read_buf_;
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> dropped_{0};

    void do_receive();
    void handle_datagram(const udp::endpoint& from, const uint8_t* data, size_t n);
    void reply(const udp::endpoint& to, const Segment& seg);
};

} // namespace rudp
