#include "segment_listener.hpp"
#include "logging.hpp"
#include "parser.hpp"

namespace rudp {

SegmentListener::SegmentListener(asio::io_context &io,
                                 const ListenerConfig &cfg)
    : cfg_(cfg), sock_(asio::make_strand(io)), read_buf_(64 * 1024) {}

void SegmentListener::start() {
  udp::endpoint ep(asio::ip::make_address(cfg_.listen_host), cfg_.listen_port);
  sock_.open(ep.protocol());
  sock_.set_option(asio::socket_base::reuse_address(true));
  sock_.bind(ep);
  Logger::instance().log(LogLevel::INFO, "listening on %s:%u",
                         ep.address().to_string().c_str(),
                         (unsigned)sock_.local_endpoint().port());
  do_receive();
}

// Handlers run on the socket's strand; close there too.
void SegmentListener::stop() {
  asio::post(sock_.get_executor(), [this]() {
    std::error_code ec;
    sock_.close(ec);
  });
}

void SegmentListener::do_receive() {
  sock_.async_receive_from(
      asio::buffer(read_buf_), from_, [this](std::error_code ec, std::size_t n) {
        if (ec) {
          if (ec != asio::error::operation_aborted)
            Logger::instance().log(LogLevel::WARN, "receive error: %s",
                                   ec.message().c_str());
          return;
        }
        handle_datagram(from_, read_buf_.data(), n);
        do_receive();
      });
}

void SegmentListener::handle_datagram(const udp::endpoint &from,
                                      const uint8_t *data, size_t n) {
  auto seg = parse_segment(data, 0, n);
  if (!seg) {
    dropped_++;
    Logger::instance().log(LogLevel::WARN, "dropped %zu bytes from %s:%u", n,
                           from.address().to_string().c_str(),
                           (unsigned)from.port());
    return;
  }
  accepted_++;
  Logger::instance().log(LogLevel::INFO, "%s:%u %s",
                         from.address().to_string().c_str(),
                         (unsigned)from.port(), seg->describe().c_str());
  if (!cfg_.auto_ack)
    return;

  // ACK and EAK carry no sequence number of their own to acknowledge
  switch (seg->type()) {
  case SegmentType::ACK:
  case SegmentType::EAK:
    return;
  case SegmentType::SYN: {
    Segment r = Segment::syn(0, SynParameters::defaults());
    r.set_ack(seg->sequence_number());
    reply(from, r);
    return;
  }
  default:
    reply(from, Segment::ack(0, seg->sequence_number()));
    return;
  }
}

void SegmentListener::reply(const udp::endpoint &to, const Segment &seg) {
  auto buf = std::make_shared<std::vector<uint8_t>>(seg.to_bytes_with_checksum());
  Logger::instance().log(LogLevel::DEBUG, "reply %s", seg.describe().c_str());
  sock_.async_send_to(asio::buffer(*buf), to,
                      [buf](std::error_code ec, std::size_t) {
                        if (ec)
                          Logger::instance().log(LogLevel::WARN,
                                                 "send error: %s",
                                                 ec.message().c_str());
                      });
}

} // namespace rudp
