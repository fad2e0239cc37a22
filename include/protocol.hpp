#pragma once
#include <cstdint>
#include <cstddef>

namespace rudp {

constexpr uint8_t kVersion = 1;

constexpr size_t kHeaderLen = 6;     // flags, hlen, seq, ack, checksum
constexpr size_t kSynHeaderLen = 22; // kHeaderLen + 16 bytes of parameters
// An odd number of EAK entries puts the checksum at an odd offset, where it
// is stored byte-swapped (see embed_checksum). Such segments validate by the
// zero-sum rule; a peer that compares the field as a big-endian value rejects
// them.
constexpr size_t kMaxEakAcks = 0xFF - kHeaderLen;
constexpr size_t kMaxDataLen = 0xFFFF - kHeaderLen;

/*
 *  0 1 2 3 4 5 6 7 8            15
 * +-+-+-+-+-+-+-+-+---------------+
 * |S|A|E|R|N|C|F|C| Header        |
 * |Y|C|A|S|U|H|I|L| Length        |
 * |N|K|K|T|L|K|N|Z|               |
 * +-+-+-+-+-+-+-+-+---------------+
 * | Sequence #    | Ack Number    |
 * +---------------+---------------+
 * | Variant fields ...            |
 * +---------------+---------------+
 * | Checksum                      |
 * +---------------+---------------+
 */
enum SegmentFlags : uint8_t {
    SF_SYN = 0x80,
    SF_ACK = 0x40,
    SF_EAK = 0x20,
    SF_RST = 0x10,
    SF_NUL = 0x08,
    SF_CHK = 0x04,
    SF_FIN = 0x02,
    SF_CLZ = 0x01
};

// Byte offsets of the shared header fields.
constexpr size_t kFlagsOff = 0;
constexpr size_t kHlenOff = 1;
constexpr size_t kSeqOff = 2;
constexpr size_t kAckOff = 3;

// One's complement of the folded 16-bit big-endian word sum of data[off, off+len).
uint16_t internet_checksum(const uint8_t* data, size_t off, size_t len);

// Bytes covered by the checksum: the whole segment with CHK, else the header.
inline size_t checksum_coverage(uint8_t flags, size_t header_length, size_t total) {
    return (flags & SF_CHK) ? total : header_length;
}

// Computes the checksum of data[0, coverage) with a zeroed field at
// field_off and stores it there so that the region sums to zero.
uint16_t embed_checksum(uint8_t* data, size_t field_off, size_t coverage);

inline uint16_t get_u16(const uint8_t* p) {
    return (uint16_t)((p[0] << 8) | p[1]);
}

inline void put_u16(uint8_t* p, uint16_t v) {
    p[0] = (uint8_t)(v >> 8);
    p[1] = (uint8_t)(v & 0xFF);
}

} // namespace rudp
