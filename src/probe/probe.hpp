#pragma once
#include <asio.hpp>
#include <optional>
#include <string>
#include <vector>
#include "segment.hpp"

namespace rudp {

struct ProbeConfig {
    std::string target_host;
    uint16_t target_port{};
    std::string kind{"nul"}; // syn|nul|eak|rst|clz|fin|ack|dat
    uint8_t seq{0};
    std::optional<uint8_t> ack;
    std::vector<uint8_t> data;     // DAT payload or EAK list
    bool full_checksum{false};
    SynParameters syn;
    int timeout_ms{1000};
    int count{1};                  // first send plus retransmissions
};

// Builds the segment described by cfg; nullopt for an unknown kind.
std::optional<Segment> make_segment(const ProbeConfig& cfg);

// Sends one segment, retransmitting it every timeout until a reply decodes
// or count sends are spent.
class Probe {
public:
    using udp = asio::ip::udp;

    Probe(asio::io_context& io, const ProbeConfig& cfg, Segment seg);
    void start();
    const std::vector<Segment>& replies() const { return replies_; }
    uint32_t sends() const { return seg_.retransmission_counter() + 1; }

private:
    asio::io_context& io_;
    ProbeConfig cfg_;
    Segment seg_;
    udp::socket sock_;
    udp::endpoint target_;
    udp::endpoint from_;
    asio::steady_timer timer_;
    std::vector<uint8_t> read_buf_;
    std::vector<uint8_t> wire_;
    std::vector<Segment> replies_;
    bool done_{false};

    void send_once();
    void arm_timer();
    void do_receive();
    void finish();
};

} // namespace rudp
