#pragma once
#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace rudp {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
// Empty on odd length or a non-hex digit; separators are not accepted.
std::vector<uint8_t> hex_to_bytes(const std::string& hex);
std::string bytes_to_hex(const uint8_t* data, size_t len);
inline std::string bytes_to_hex(const std::vector<uint8_t>& v) {
    return bytes_to_hex(v.data(), v.size());
}

} // namespace rudp
