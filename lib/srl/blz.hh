#pragma once

#include <cstdint>
#include <vector>

#include "util/error.hh"
#include "srl/reconstructor.hh"

namespace srl {
namespace blz {

// FOOTER_SIZE is the size of the trailer describing a compressed buffer.
constexpr size_t FOOTER_SIZE = 8;

// decompress expands a BLZ ("bottom LZ") buffer. The trailer at the end of
// in gives the length of the encoded tail and how much longer the decoded
// buffer is; bytes before the encoded tail are copied as-is. A zero length
// increase means the buffer is stored uncompressed.
Error decompress(
        const std::vector<uint8_t>& in,
        std::vector<uint8_t>* out);

}

// BlzReconstructor reads an entry's stored bytes and decompresses them.
struct BlzReconstructor: Reconstructor {
    Error reconstruct(
            Source* source,
            const Entry::Reconstructed& entry,
            std::vector<uint8_t>* out) const override;
};

}
