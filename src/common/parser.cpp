#include "parser.hpp"
#include "logging.hpp"

namespace rudp {

std::optional<SegmentType> resolve_type(uint8_t flags, size_t len) {
  if (flags & SF_SYN)
    return SegmentType::SYN;
  if (flags & SF_NUL)
    return SegmentType::NUL;
  if (flags & SF_EAK)
    return SegmentType::EAK;
  if (flags & SF_RST)
    return SegmentType::RST;
  if (flags & SF_CLZ)
    return SegmentType::CLZ;
  if (flags & SF_FIN)
    return SegmentType::FIN;
  // ACK last: it may ride on any of the above
  if (flags & SF_ACK)
    return len == kHeaderLen ? SegmentType::ACK : SegmentType::DAT;
  return std::nullopt;
}

std::optional<Segment> parse_segment(const uint8_t *data, size_t off,
                                     size_t len) {
  if (len < kHeaderLen) {
    Logger::instance().log(LogLevel::DEBUG,
                           "invalid segment: %zu bytes, need %zu", len,
                           kHeaderLen);
    return std::nullopt;
  }
  const uint8_t *p = data + off;
  auto t = resolve_type(p[kFlagsOff], len);
  if (!t) {
    Logger::instance().log(LogLevel::DEBUG,
                           "invalid segment: no type in flags 0x%02x",
                           (unsigned)p[kFlagsOff]);
    return std::nullopt;
  }
  return Segment::decode(*t, p, len);
}

std::optional<Segment> parse_segment(const std::vector<uint8_t> &bytes) {
  return parse_segment(bytes.data(), 0, bytes.size());
}

} // namespace rudp
