#include "logging.hpp"
#include "segment_listener.hpp"
#include "util.hpp"
#include <algorithm>
#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <thread>

using namespace rudp;

int main(int argc, char **argv) {
  std::string listen = "0.0.0.0:46090";
  int threads = 2;
  bool auto_ack = false;
  std::string log_level = "info";

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--listen")
      listen = next(i);
    else if (a == "--threads")
      threads = std::stoi(next(i));
    else if (a == "--auto-ack")
      auto_ack = true;
    else if (a == "--log-level")
      log_level = next(i);
    else {
      std::cerr << "unknown option " << a << "\n";
      return 1;
    }
  }

  LogLevel lvl;
  if (!parse_log_level(log_level, lvl)) {
    std::cerr << "bad log level" << std::endl;
    return 1;
  }
  Logger::instance().set_level(lvl);

  std::string host;
  uint16_t port;
  if (!parse_host_port(listen, host, port)) {
    std::cerr << "bad listen" << std::endl;
    return 1;
  }

  ListenerConfig cfg;
  cfg.listen_host = host;
  cfg.listen_port = port;
  cfg.threads = std::max(1, threads);
  cfg.auto_ack = auto_ack;

  asio::io_context io;
  SegmentListener listener(io, cfg);
  try {
    listener.start();
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "bind %s failed: %s",
                           listen.c_str(), e.what());
    return 1;
  }

  asio::signal_set signals(asio::make_strand(io), SIGINT, SIGTERM);
  signals.async_wait([&](std::error_code, int) {
    Logger::instance().log(LogLevel::INFO, "accepted %llu, dropped %llu",
                           (unsigned long long)listener.accepted(),
                           (unsigned long long)listener.dropped());
    listener.stop();
  });

  std::vector<std::thread> th;
  th.reserve(cfg.threads);
  for (int i = 0; i < cfg.threads; i++)
    th.emplace_back([&]() { io.run(); });
  for (auto &t : th)
    t.join();
  return 0;
}
