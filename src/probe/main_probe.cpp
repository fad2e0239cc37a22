#include "logging.hpp"
#include "probe.hpp"
#include "util.hpp"
#include <algorithm>
#include <asio.hpp>
#include <iostream>
#include <stdexcept>

using namespace rudp;

int main(int argc, char **argv) {
  std::string target = "127.0.0.1:46090";
  std::string data_hex;
  std::string log_level = "info";
  ProbeConfig cfg;

  try {
    for (int i = 1; i < argc; i++) {
      std::string a = argv[i];
      auto next = [&](int &i) -> std::string {
        if (i + 1 < argc)
          return std::string(argv[++i]);
        std::cerr << "missing value for " << a << "\n";
        std::exit(1);
      };
      if (a == "--target")
        target = next(i);
      else if (a == "--kind")
        cfg.kind = next(i);
      else if (a == "--seq")
        cfg.seq = (uint8_t)std::stoi(next(i));
      else if (a == "--ack")
        cfg.ack = (uint8_t)std::stoi(next(i));
      else if (a == "--data")
        data_hex = next(i);
      else if (a == "--chk")
        cfg.full_checksum = true;
      else if (a == "--timeout-ms")
        cfg.timeout_ms = std::stoi(next(i));
      else if (a == "--count")
        cfg.count = std::stoi(next(i));
      else if (a == "--max-outstanding")
        cfg.syn.max_outstanding = (uint8_t)std::stoi(next(i));
      else if (a == "--max-segment-size")
        cfg.syn.max_segment_size = (uint16_t)std::stoi(next(i));
      else if (a == "--retransmission-timeout")
        cfg.syn.retransmission_timeout = (uint16_t)std::stoi(next(i));
      else if (a == "--cumulative-ack-timeout")
        cfg.syn.cumulative_ack_timeout = (uint16_t)std::stoi(next(i));
      else if (a == "--null-segment-timeout")
        cfg.syn.null_segment_timeout = (uint16_t)std::stoi(next(i));
      else if (a == "--log-level")
        log_level = next(i);
      else {
        std::cerr << "unknown option " << a << "\n";
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "bad numeric value: " << e.what() << std::endl;
    return 1;
  }

  LogLevel lvl;
  if (!parse_log_level(log_level, lvl)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  Logger::instance().set_level(lvl);

  if (!parse_host_port(target, cfg.target_host, cfg.target_port)) {
    std::cerr << "bad target" << std::endl;
    return 1;
  }
  if (!data_hex.empty()) {
    cfg.data = hex_to_bytes(data_hex);
    if (cfg.data.empty()) {
      std::cerr << "bad data hex" << std::endl;
      return 1;
    }
  }
  if (cfg.kind == "dat" && cfg.data.empty()) {
    std::cerr << "dat needs --data" << std::endl;
    return 1;
  }
  std::string err;
  if (cfg.kind == "syn" && !check_syn_parameters(cfg.syn, err)) {
    std::cerr << "bad syn parameters: " << err << std::endl;
    return 1;
  }
  cfg.count = std::max(1, cfg.count);

  std::optional<Segment> seg;
  try {
    seg = make_segment(cfg);
  } catch (const std::logic_error &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  if (!seg) {
    std::cerr << "unknown kind " << cfg.kind << std::endl;
    return 1;
  }

  asio::io_context io;
  Probe probe(io, cfg, std::move(*seg));
  try {
    probe.start();
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "probe %s failed: %s",
                           target.c_str(), e.what());
    return 1;
  }
  io.run();
  return probe.replies().empty() ? 2 : 0;
}
