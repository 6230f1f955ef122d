#include "edfio/sample_codec.hpp"

namespace edfio {

int32_t decode_sample_le(const unsigned char* p, int data_size) {
  if (data_size == 3) {
    uint32_t u = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                 (static_cast<uint32_t>(p[2]) << 16);
    // Sign-extend 24-bit two's complement.
    if ((u & 0x00800000u) != 0) u |= 0xFF000000u;
    return static_cast<int32_t>(u);
  }
  const uint16_t u = static_cast<uint16_t>(static_cast<uint16_t>(p[0]) |
                                           (static_cast<uint16_t>(p[1]) << 8));
  return static_cast<int16_t>(u);
}

void encode_sample_le(long long v, int data_size, unsigned char* out) {
  const uint64_t u = static_cast<uint64_t>(v);
  out[0] = static_cast<unsigned char>(u & 0xFFu);
  out[1] = static_cast<unsigned char>((u >> 8) & 0xFFu);
  if (data_size == 3) {
    out[2] = static_cast<unsigned char>((u >> 16) & 0xFFu);
  }
}

} // namespace edfio
