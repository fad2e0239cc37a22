#include "segment.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace rudp {

const char *type_name(SegmentType t) {
  switch (t) {
  case SegmentType::SYN:
    return "SYN";
  case SegmentType::NUL:
    return "NUL";
  case SegmentType::EAK:
    return "EAK";
  case SegmentType::RST:
    return "RST";
  case SegmentType::CLZ:
    return "CLZ";
  case SegmentType::FIN:
    return "FIN";
  case SegmentType::ACK:
    return "ACK";
  case SegmentType::DAT:
    return "DAT";
  }
  return "???";
}

bool SynParameters::operator==(const SynParameters &o) const {
  return version == o.version && max_outstanding == o.max_outstanding &&
         option_flags == o.option_flags &&
         max_segment_size == o.max_segment_size &&
         retransmission_timeout == o.retransmission_timeout &&
         cumulative_ack_timeout == o.cumulative_ack_timeout &&
         null_segment_timeout == o.null_segment_timeout &&
         max_retransmissions == o.max_retransmissions &&
         max_cumulative_acks == o.max_cumulative_acks &&
         max_out_of_sequence == o.max_out_of_sequence &&
         max_auto_reset == o.max_auto_reset;
}

bool check_syn_parameters(const SynParameters &p, std::string &err) {
  if (p.version != kVersion) {
    err = "unsupported protocol version";
    return false;
  }
  if (p.max_outstanding < 1) {
    err = "max outstanding segments must be 1..255";
    return false;
  }
  if (p.max_segment_size < kSynHeaderLen) {
    err = "max segment size must be 22..65535";
    return false;
  }
  if (p.retransmission_timeout < 100) {
    err = "retransmission timeout must be 100..65535 ms";
    return false;
  }
  if (p.cumulative_ack_timeout < 100) {
    err = "cumulative ack timeout must be 100..65535 ms";
    return false;
  }
  return true;
}

Segment::Segment(SegmentType t, uint8_t flags, uint8_t seqn, uint8_t hlen,
                 Payload payload)
    : type_(t), flags_(flags), hlen_(hlen), seqn_(seqn),
      payload_(std::move(payload)) {}

Segment Segment::syn(uint8_t seqn, const SynParameters &params) {
  // the version nibble is checked on decode; anything else cannot round-trip
  if (params.version != kVersion)
    throw std::invalid_argument("unsupported SYN version");
  return Segment(SegmentType::SYN, SF_SYN, seqn, kSynHeaderLen, params);
}

Segment Segment::nul(uint8_t seqn) {
  return Segment(SegmentType::NUL, SF_NUL, seqn, kHeaderLen, std::monostate{});
}

Segment Segment::eak(uint8_t seqn, uint8_t ackn, std::vector<uint8_t> acks) {
  if (acks.size() > kMaxEakAcks)
    throw std::length_error("EAK list exceeds 249 entries");
  uint8_t hlen = (uint8_t)(kHeaderLen + acks.size());
  Segment s(SegmentType::EAK, SF_EAK, seqn, hlen, EakList{std::move(acks)});
  s.set_ack(ackn);
  return s;
}

Segment Segment::rst(uint8_t seqn) {
  return Segment(SegmentType::RST, SF_RST, seqn, kHeaderLen, std::monostate{});
}

Segment Segment::clz(uint8_t seqn) {
  return Segment(SegmentType::CLZ, SF_CLZ, seqn, kHeaderLen, std::monostate{});
}

Segment Segment::fin(uint8_t seqn) {
  return Segment(SegmentType::FIN, SF_FIN, seqn, kHeaderLen, std::monostate{});
}

Segment Segment::ack(uint8_t seqn, uint8_t ackn) {
  Segment s(SegmentType::ACK, 0, seqn, kHeaderLen, std::monostate{});
  s.set_ack(ackn);
  return s;
}

Segment Segment::dat(uint8_t seqn, uint8_t ackn, std::vector<uint8_t> data) {
  if (data.empty())
    throw std::length_error("DAT payload is empty");
  if (data.size() > kMaxDataLen)
    throw std::length_error("DAT payload exceeds 65529 bytes");
  Segment s(SegmentType::DAT, 0, seqn, kHeaderLen, DataPayload{std::move(data)});
  s.set_ack(ackn);
  return s;
}

std::optional<uint8_t> Segment::acknowledgment_number() const {
  if (flags_ & SF_ACK)
    return ackn_;
  return std::nullopt;
}

uint16_t Segment::length() const {
  if (auto d = data())
    return (uint16_t)(hlen_ + d->size());
  return hlen_;
}

void Segment::set_ack(uint8_t ackn) {
  flags_ |= SF_ACK;
  ackn_ = ackn;
}

void Segment::set_full_checksum(bool on) {
  if (on)
    flags_ |= SF_CHK;
  else
    flags_ &= (uint8_t)~SF_CHK;
}

const std::vector<uint8_t> *Segment::eak_acks() const {
  if (auto e = std::get_if<EakList>(&payload_))
    return &e->acks;
  return nullptr;
}

const std::vector<uint8_t> *Segment::data() const {
  if (auto d = std::get_if<DataPayload>(&payload_))
    return &d->bytes;
  return nullptr;
}

std::vector<uint8_t> Segment::to_bytes() const {
  std::vector<uint8_t> buf(length(), 0);
  buf[kFlagsOff] = flags_;
  buf[kHlenOff] = hlen_;
  buf[kSeqOff] = seqn_;
  buf[kAckOff] = (flags_ & SF_ACK) ? ackn_ : 0;

  if (auto sp = syn_parameters()) {
    buf[4] = (uint8_t)(sp->version << 4);
    buf[5] = sp->max_outstanding;
    buf[6] = sp->option_flags;
    buf[7] = 0; // spare
    put_u16(&buf[8], sp->max_segment_size);
    put_u16(&buf[10], sp->retransmission_timeout);
    put_u16(&buf[12], sp->cumulative_ack_timeout);
    put_u16(&buf[14], sp->null_segment_timeout);
    buf[16] = sp->max_retransmissions;
    buf[17] = sp->max_cumulative_acks;
    buf[18] = sp->max_out_of_sequence;
    buf[19] = sp->max_auto_reset;
  } else if (auto acks = eak_acks()) {
    std::copy(acks->begin(), acks->end(), buf.begin() + 4);
  } else if (auto d = data()) {
    std::copy(d->begin(), d->end(), buf.begin() + hlen_);
  }
  return buf;
}

std::vector<uint8_t> Segment::to_bytes_with_checksum() const {
  std::vector<uint8_t> buf = to_bytes();
  embed_checksum(buf.data(), hlen_ - 2,
                 checksum_coverage(flags_, hlen_, buf.size()));
  return buf;
}

std::string Segment::describe() const {
  char out[64];
  auto a = acknowledgment_number();
  if (a)
    std::snprintf(out, sizeof(out), "%s [ SEQ = %u, ACK = %u, LEN = %u ]",
                  type_name(type_), (unsigned)seqn_, (unsigned)*a,
                  (unsigned)length());
  else
    std::snprintf(out, sizeof(out), "%s [ SEQ = %u, ACK = N/A, LEN = %u ]",
                  type_name(type_), (unsigned)seqn_, (unsigned)length());
  return out;
}

bool Segment::operator==(const Segment &o) const {
  return type_ == o.type_ && flags_ == o.flags_ && seqn_ == o.seqn_ &&
         hlen_ == o.hlen_ &&
         acknowledgment_number() == o.acknowledgment_number() &&
         payload_ == o.payload_;
}

static std::nullopt_t reject(SegmentType t, const char *why) {
  Logger::instance().log(LogLevel::DEBUG, "invalid %s segment: %s",
                         type_name(t), why);
  return std::nullopt;
}

std::optional<Segment> Segment::decode(SegmentType t, const uint8_t *p,
                                       size_t len) {
  if (len < kHeaderLen)
    return reject(t, "shorter than header");
  if (len > 0xFFFF)
    return reject(t, "longer than 65535 bytes");
  size_t hlen = p[kHlenOff];
  if (hlen < kHeaderLen || hlen > len)
    return reject(t, "bad header length");
  uint8_t flags = p[kFlagsOff];
  if (internet_checksum(p, 0, checksum_coverage(flags, hlen, len)) != 0)
    return reject(t, "checksum mismatch");

  Payload payload;
  switch (t) {
  case SegmentType::SYN: {
    if (hlen != kSynHeaderLen || len != kSynHeaderLen)
      return reject(t, "length mismatch");
    SynParameters sp;
    sp.version = (uint8_t)(p[4] >> 4);
    if (sp.version != kVersion)
      return reject(t, "unsupported version");
    sp.max_outstanding = p[5];
    sp.option_flags = p[6];
    sp.max_segment_size = get_u16(p + 8);
    sp.retransmission_timeout = get_u16(p + 10);
    sp.cumulative_ack_timeout = get_u16(p + 12);
    sp.null_segment_timeout = get_u16(p + 14);
    sp.max_retransmissions = p[16];
    sp.max_cumulative_acks = p[17];
    sp.max_out_of_sequence = p[18];
    sp.max_auto_reset = p[19];
    payload = sp;
    break;
  }
  case SegmentType::EAK:
    if (len != hlen)
      return reject(t, "length mismatch");
    payload = EakList{std::vector<uint8_t>(p + 4, p + hlen - 2)};
    break;
  case SegmentType::DAT:
    if (hlen != kHeaderLen)
      return reject(t, "bad header length");
    if (len == hlen)
      return reject(t, "no payload");
    payload = DataPayload{std::vector<uint8_t>(p + hlen, p + len)};
    break;
  default:
    if (hlen != kHeaderLen || len != kHeaderLen)
      return reject(t, "length mismatch");
    break;
  }

  Segment s(t, flags, p[kSeqOff], (uint8_t)hlen, std::move(payload));
  s.ackn_ = p[kAckOff];
  return s;
}

} // namespace rudp
