#pragma once

#include <cstddef>

namespace genotrack {

// Largest length handed to zlib in one gzread/gzwrite call; both take an
// unsigned length and return an int.
inline constexpr size_t GZ_MAX_CHUNK = size_t(1) << 30;

// Walk [0, n) in pieces of at most limit bytes, calling fn(offset, len).
// fn returns how many bytes it handled; a short count stops the walk.
// Returns the total handled.
template <typename Fn>
size_t for_each_chunk(size_t n, size_t limit, Fn fn) {
    size_t total = 0;
    while (total < n) {
        size_t want = n - total;
        if (want > limit) want = limit;
        size_t done = fn(total, want);
        total += done;
        if (done < want) break;
    }
    return total;
}

} // namespace genotrack
