#include "io/bigwig_sniffer.hpp"
#include "io/stream_handle.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

namespace genotrack {

uint32_t load_u32_le(const uint8_t* p) {
    uint32_t v = 0;
    for (int i = 3; i >= 0; i--)
        v = (v << 8) | p[i];
    return v;
}

uint32_t load_u32_be(const uint8_t* p) {
    uint32_t v = 0;
    for (int i = 0; i < 4; i++)
        v = (v << 8) | p[i];
    return v;
}

bool is_bigwig_signature(const uint8_t* buf, size_t size) {
    if (size < BIGWIG_SIGNATURE_SIZE) return false;

    // The kent reference accepts either byte order for the signature
    return load_u32_le(buf) == BIGWIG_SIGNATURE ||
           load_u32_be(buf) == BIGWIG_SIGNATURE;
}

bool is_bigwig(const std::string& path) {
    uint8_t sig[BIGWIG_SIGNATURE_SIZE];
    size_t got = 0;
    {
        auto in = open_plain(path, OpenMode::kRead);
        got = in->read(sig, sizeof(sig));
        in->close();
    }

    if (got < BIGWIG_SIGNATURE_SIZE) {
        throw IOError("'" + path + "' is too short for a bigWig signature ("
                      + std::to_string(got) + " bytes)");
    }
    return is_bigwig_signature(sig, got);
}

} // namespace genotrack
