#include "protocol.hpp"

namespace rudp {

uint16_t internet_checksum(const uint8_t *data, size_t off, size_t len) {
  const uint8_t *p = data + off;
  uint32_t sum = 0;
  while (len > 1) {
    sum += (uint32_t)((p[0] << 8) | p[1]);
    p += 2;
    len -= 2;
  }
  if (len)
    sum += (uint32_t)p[0] << 8;
  while (sum >> 16)
    sum = (sum & 0xFFFF) + (sum >> 16);
  return (uint16_t)(~sum & 0xFFFF);
}

uint16_t embed_checksum(uint8_t *data, size_t field_off, size_t coverage) {
  data[field_off] = 0;
  data[field_off + 1] = 0;
  uint16_t sum = internet_checksum(data, 0, coverage);
  // at an odd offset the field straddles two words, so store it swapped
  if (field_off & 1)
    sum = (uint16_t)((sum << 8) | (sum >> 8));
  put_u16(data + field_off, sum);
  return sum;
}

} // namespace rudp
