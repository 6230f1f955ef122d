#pragma once

#include <cstdint>

namespace edfio {

// Little-endian two's complement sample encoding shared by the reader and
// writer. data_size is 2 (EDF, int16) or 3 (BDF, int24).

// Decode one sample starting at p.
int32_t decode_sample_le(const unsigned char* p, int data_size);

// Encode v into data_size bytes at out. Values outside the sample width wrap
// (the low 16 or 24 bits are kept).
void encode_sample_le(long long v, int data_size, unsigned char* out);

} // namespace edfio
