#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>
#include "segment.hpp"

namespace rudp {

// Selects the variant for a flags byte. Several control bits may be set;
// the first of SYN, NUL, EAK, RST, CLZ, FIN, ACK wins. ACK resolves to a
// pure ACK when len is exactly the header size and to DAT otherwise.
std::optional<SegmentType> resolve_type(uint8_t flags, size_t len);

// Decodes data[off, off+len). Returns nullopt for any invalid segment:
// truncated, untyped, inconsistent lengths or a bad checksum.
std::optional<Segment> parse_segment(const uint8_t* data, size_t off, size_t len);
std::optional<Segment> parse_segment(const std::vector<uint8_t>& bytes);

} // namespace rudp
