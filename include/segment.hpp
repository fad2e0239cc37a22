#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "protocol.hpp"

namespace rudp {

enum class SegmentType : uint8_t { SYN, NUL, EAK, RST, CLZ, FIN, ACK, DAT };

const char* type_name(SegmentType t);

// Connection parameters carried by a SYN (bytes 4..19).
struct SynParameters {
    uint8_t  version{kVersion};
    uint8_t  max_outstanding{3};
    uint8_t  option_flags{0x01};
    uint16_t max_segment_size{128};
    uint16_t retransmission_timeout{600};  // ms
    uint16_t cumulative_ack_timeout{300};  // ms
    uint16_t null_segment_timeout{2000};   // ms
    uint8_t  max_retransmissions{3};
    uint8_t  max_cumulative_acks{3};
    uint8_t  max_out_of_sequence{3};
    uint8_t  max_auto_reset{3};

    static SynParameters defaults() { return SynParameters{}; }
    bool operator==(const SynParameters& o) const;
    bool operator!=(const SynParameters& o) const { return !(*this == o); }
};

// Range check for locally configured parameters; fills err on failure.
bool check_syn_parameters(const SynParameters& p, std::string& err);

struct EakList {
    std::vector<uint8_t> acks; // out-of-sequence segments received
    bool operator==(const EakList& o) const { return acks == o.acks; }
};

struct DataPayload {
    std::vector<uint8_t> bytes;
    bool operator==(const DataPayload& o) const { return bytes == o.bytes; }
};

class Segment {
public:
    using Payload = std::variant<std::monostate, SynParameters, EakList, DataPayload>;

    // syn() throws std::invalid_argument unless params.version is kVersion;
    // eak() and dat() throw std::length_error outside 0..249 entries and
    // 1..65529 payload bytes.
    static Segment syn(uint8_t seqn, const SynParameters& params);
    static Segment nul(uint8_t seqn);
    static Segment eak(uint8_t seqn, uint8_t ackn, std::vector<uint8_t> acks);
    static Segment rst(uint8_t seqn);
    static Segment clz(uint8_t seqn);
    static Segment fin(uint8_t seqn);
    static Segment ack(uint8_t seqn, uint8_t ackn);
    static Segment dat(uint8_t seqn, uint8_t ackn, std::vector<uint8_t> data);

    SegmentType type() const { return type_; }
    uint8_t flags() const { return flags_; }
    uint8_t sequence_number() const { return seqn_; }
    std::optional<uint8_t> acknowledgment_number() const;
    uint8_t header_length() const { return hlen_; }
    uint16_t length() const;

    uint32_t retransmission_counter() const { return nretx_; }
    void set_retransmission_counter(uint32_t n) { nretx_ = n; }

    // Piggybacks an acknowledgment; the primary type is unchanged.
    void set_ack(uint8_t ackn);
    void set_full_checksum(bool on);

    const SynParameters* syn_parameters() const { return std::get_if<SynParameters>(&payload_); }
    const std::vector<uint8_t>* eak_acks() const;
    const std::vector<uint8_t>* data() const;

    // Header and payload with a zeroed checksum field.
    std::vector<uint8_t> to_bytes() const;
    // The only form that goes on the wire.
    std::vector<uint8_t> to_bytes_with_checksum() const;
    std::string describe() const;

    bool operator==(const Segment& o) const;
    bool operator!=(const Segment& o) const { return !(*this == o); }

    // Variant decode once the dispatcher has chosen t; p points at the
    // segment's first byte. Validates lengths and the checksum.
    static std::optional<Segment> decode(SegmentType t, const uint8_t* p, size_t len);

private:
    Segment(SegmentType t, uint8_t flags, uint8_t seqn, uint8_t hlen, Payload payload);

    SegmentType type_;
    uint8_t flags_;
    uint8_t hlen_;
    uint8_t seqn_;
    uint8_t ackn_{0};
    uint32_t nretx_{0};
    Payload payload_;
};

} // namespace rudp
