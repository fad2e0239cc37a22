#include "probe.hpp"
#include "logging.hpp"
#include "parser.hpp"

namespace rudp {

std::optional<Segment> make_segment(const ProbeConfig &cfg) {
  std::optional<Segment> seg;
  if (cfg.kind == "syn")
    seg = Segment::syn(cfg.seq, cfg.syn);
  else if (cfg.kind == "nul")
    seg = Segment::nul(cfg.seq);
  else if (cfg.kind == "eak")
    seg = Segment::eak(cfg.seq, cfg.ack.value_or(0), cfg.data);
  else if (cfg.kind == "rst")
    seg = Segment::rst(cfg.seq);
  else if (cfg.kind == "clz")
    seg = Segment::clz(cfg.seq);
  else if (cfg.kind == "fin")
    seg = Segment::fin(cfg.seq);
  else if (cfg.kind == "ack")
    seg = Segment::ack(cfg.seq, cfg.ack.value_or(0));
  else if (cfg.kind == "dat")
    seg = Segment::dat(cfg.seq, cfg.ack.value_or(0), cfg.data);
  else
    return std::nullopt;
  if (cfg.ack)
    seg->set_ack(*cfg.ack);
  seg->set_full_checksum(cfg.full_checksum);
  return seg;
}

Probe::Probe(asio::io_context &io, const ProbeConfig &cfg, Segment seg)
    : io_(io), cfg_(cfg), seg_(std::move(seg)), sock_(io), timer_(io),
      read_buf_(64 * 1024), wire_(seg_.to_bytes_with_checksum()) {}

void Probe::start() {
  udp::resolver res(io_);
  target_ = res.resolve(cfg_.target_host, std::to_string(cfg_.target_port))
                .begin()
                ->endpoint();
  sock_.open(target_.protocol());
  do_receive();
  send_once();
}

void Probe::send_once() {
  Logger::instance().log(LogLevel::INFO, "send %s (attempt %u)",
                         seg_.describe().c_str(),
                         (unsigned)seg_.retransmission_counter() + 1);
  sock_.async_send_to(asio::buffer(wire_), target_,
                      [this](std::error_code ec, std::size_t) {
                        if (ec) {
                          Logger::instance().log(LogLevel::WARN,
                                                 "send error: %s",
                                                 ec.message().c_str());
                          finish();
                          return;
                        }
                        arm_timer();
                      });
}

void Probe::arm_timer() {
  if (done_)
    return;
  timer_.expires_after(std::chrono::milliseconds(cfg_.timeout_ms));
  timer_.async_wait([this](std::error_code ec) {
    if (ec || done_)
      return;
    if ((int)seg_.retransmission_counter() + 1 >= cfg_.count) {
      Logger::instance().log(LogLevel::WARN, "no reply after %u sends",
                             (unsigned)sends());
      finish();
      return;
    }
    seg_.set_retransmission_counter(seg_.retransmission_counter() + 1);
    send_once();
  });
}

void Probe::do_receive() {
  sock_.async_receive_from(
      asio::buffer(read_buf_), from_, [this](std::error_code ec, std::size_t n) {
        if (ec) {
          if (ec != asio::error::operation_aborted)
            Logger::instance().log(LogLevel::WARN, "receive error: %s",
                                   ec.message().c_str());
          return;
        }
        auto seg = parse_segment(read_buf_.data(), 0, n);
        if (!seg) {
          Logger::instance().log(LogLevel::WARN, "dropped %zu byte reply", n);
          do_receive();
          return;
        }
        Logger::instance().log(LogLevel::INFO, "reply %s",
                               seg->describe().c_str());
        replies_.push_back(std::move(*seg));
        finish();
      });
}

void Probe::finish() {
  if (done_)
    return;
  done_ = true;
  timer_.cancel();
  std::error_code ec;
  sock_.close(ec);
}

} // namespace rudp
