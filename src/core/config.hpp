#pragma once

#include <cstddef>
#include <cstdint>

namespace genotrack {

// bigWig container signature, checked in both byte orders at offset 0
inline constexpr uint32_t BIGWIG_SIGNATURE = 0x888FFC26;
inline constexpr size_t BIGWIG_SIGNATURE_SIZE = 4;

// Compressed-file suffix, without the extension separator
inline constexpr char EXT_GZ[] = "gz";
inline constexpr char EXT_SEP = '.';

// zlib level used when writing .gz files
inline constexpr int GZIP_WRITE_LEVEL = 1;

// Record-stream framing
inline constexpr char RECORD_SIGIL = '>';
inline constexpr char COMMENT_CHAR = '#';

} // namespace genotrack
