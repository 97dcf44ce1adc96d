#pragma once

#include <cstddef>
#include <cstdint>

#include "util/error.hh"

namespace util {

// readle interprets len bytes at b as a little-endian unsigned integer. At
// most 8 bytes fit in the result.
static inline Error readle(
    const uint8_t* b,
    size_t len,
    uint64_t* x) {
    if (len > sizeof(uint64_t)) {
        return error_new(Error::INVALIDUSAGE)
            << "cannot decode " << len << " bytes into a 64-bit integer";
    }

    uint64_t value = 0;
    for (size_t i = len; i > 0; --i)
        value = (value << 8) | b[i - 1];

    *x = value;
    return Error();
}

// readbe interprets len bytes at b as a big-endian unsigned integer.
static inline Error readbe(
    const uint8_t* b,
    size_t len,
    uint64_t* x) {
    if (len > sizeof(uint64_t)) {
        return error_new(Error::INVALIDUSAGE)
            << "cannot decode " << len << " bytes into a 64-bit integer";
    }

    uint64_t value = 0;
    for (size_t i = 0; i < len; ++i)
        value = (value << 8) | b[i];

    *x = value;
    return Error();
}

// le16 and le32 decode fixed-width little-endian fields. Callers guarantee
// that the bytes exist.
static inline uint16_t le16(const uint8_t* b) {
    return static_cast<uint16_t>(b[0] | (b[1] << 8));
}

static inline uint32_t le32(const uint8_t* b) {
    return static_cast<uint32_t>(b[0])
        | (static_cast<uint32_t>(b[1]) << 8)
        | (static_cast<uint32_t>(b[2]) << 16)
        | (static_cast<uint32_t>(b[3]) << 24);
}

// roundup returns the smallest multiple of alignment that is >= value. An
// alignment of zero leaves value unchanged.
static inline uint64_t roundup(
    uint64_t value,
    uint64_t alignment) {
    if (alignment == 0)
        return value;

    uint64_t blocks = value / alignment;
    if (value % alignment != 0)
        ++blocks;

    return blocks * alignment;
}

}
