#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace genotrack {

// Decode 4 bytes as an unsigned 32-bit integer in either byte order.
uint32_t load_u32_le(const uint8_t* p);
uint32_t load_u32_be(const uint8_t* p);

// True if the first 4 bytes of buf hold the bigWig signature in either
// byte order. Returns false if size < 4.
bool is_bigwig_signature(const uint8_t* buf, size_t size);

// Read the first 4 bytes of path and test them against the bigWig signature.
// The file is read raw, even if it has a .gz suffix.
// Throws NotFoundError if path does not exist, IOError if fewer than
// 4 bytes can be read.
bool is_bigwig(const std::string& path);

} // namespace genotrack
