#include "logging.hpp"
#include "parser.hpp"
#include "util.hpp"
#include <iostream>
#include <string>

using namespace rudp;

static bool dump_one(const std::string &hex) {
  auto bytes = hex_to_bytes(hex);
  if (bytes.empty()) {
    std::cout << hex << ": not hex" << std::endl;
    return false;
  }
  auto seg = parse_segment(bytes);
  if (!seg) {
    std::cout << hex << ": invalid segment" << std::endl;
    return false;
  }
  std::cout << seg->describe();
  if (seg->flags() & SF_CHK)
    std::cout << " CHK";
  if (auto sp = seg->syn_parameters()) {
    std::cout << " v" << (unsigned)sp->version
              << " outstanding=" << (unsigned)sp->max_outstanding
              << " mss=" << sp->max_segment_size
              << " rto=" << sp->retransmission_timeout
              << " cack=" << sp->cumulative_ack_timeout
              << " nul=" << sp->null_segment_timeout
              << " retx=" << (unsigned)sp->max_retransmissions
              << " maxcack=" << (unsigned)sp->max_cumulative_acks
              << " oos=" << (unsigned)sp->max_out_of_sequence
              << " autorst=" << (unsigned)sp->max_auto_reset;
  } else if (auto acks = seg->eak_acks()) {
    std::cout << " acks=";
    for (size_t i = 0; i < acks->size(); i++)
      std::cout << (i ? "," : "") << (unsigned)(*acks)[i];
  } else if (auto d = seg->data()) {
    std::cout << " data=" << bytes_to_hex(*d);
  }
  std::cout << std::endl;
  return true;
}

int main(int argc, char **argv) {
  bool ok = true;
  int first = 1;
  if (argc > 2 && std::string(argv[1]) == "--log-level") {
    LogLevel lvl;
    if (!parse_log_level(argv[2], lvl)) {
      std::cerr << "bad log level" << std::endl;
      return 1;
    }
    Logger::instance().set_level(lvl);
    first = 3;
  }
  if (first < argc) {
    for (int i = first; i < argc; i++)
      ok = dump_one(argv[i]) && ok;
  } else {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.empty())
        continue;
      ok = dump_one(line) && ok;
    }
  }
  return ok ? 0 : 1;
}
