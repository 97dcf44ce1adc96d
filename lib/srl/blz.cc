#include "srl/blz.hh"

#include <algorithm>

#include "util/bytes.hh"

namespace srl {
namespace blz {

Error decompress(
        const std::vector<uint8_t>& in,
        std::vector<uint8_t>* out) {
    const size_t len = in.size();
    if (len < FOOTER_SIZE)
        return error_new(Error::DECOMPRESSIONFAILED)
            << "buffer of " << len << " bytes is too short for a footer";

    const uint32_t bounds = util::le32(&in[len - 8]);
    const uint32_t increase = util::le32(&in[len - 4]);
    if (increase == 0) {
        *out = in;
        return Error();
    }

    const size_t header_len = bounds >> 24;
    const size_t encoded_len = bounds & 0xFFFFFF;
    if (header_len < FOOTER_SIZE || header_len > encoded_len || encoded_len > len)
        return error_new(Error::DECOMPRESSIONFAILED)
            << "invalid footer: header length 0x" << std::hex << header_len
            << ", encoded length 0x" << encoded_len
            << ", buffer length 0x" << len;

    const size_t decoded_len = len + increase;
    out->assign(decoded_len, 0);
    std::copy(in.begin(), in.begin() + (len - encoded_len), out->begin());

    // Both cursors move from the end of their buffers towards the start of
    // the encoded tail.
    const size_t limit = len - encoded_len;
    size_t src = len - header_len;
    size_t dst = decoded_len;
    uint8_t* o = out->data();

    while (src > limit) {
        uint8_t flags = in[--src];
        for (int i = 0; i < 8 && src > limit; ++i, flags <<= 1) {
            if (!(flags & 0x80)) {
                if (dst <= limit)
                    return error_new(Error::DECOMPRESSIONFAILED)
                        << "literal overruns the output at 0x" << std::hex << src;

                o[--dst] = in[--src];
                continue;
            }

            if (src - limit < 2)
                return error_new(Error::DECOMPRESSIONFAILED)
                    << "truncated back-reference at 0x" << std::hex << src;

            uint16_t pos = static_cast<uint16_t>(in[--src] << 8);
            pos |= in[--src];

            size_t count = (pos >> 12) + 3;
            size_t displacement = (pos & 0xFFF) + 3;
            if (dst - limit < count || dst + displacement > decoded_len)
                return error_new(Error::DECOMPRESSIONFAILED)
                    << "back-reference of " << std::dec << count << " bytes at distance "
                    << displacement << " is out of range";

            while (count--) {
                --dst;
                o[dst] = o[dst + displacement];
            }
        }
    }

    if (dst != limit)
        return error_new(Error::DECOMPRESSIONFAILED)
            << "encoded data ended with 0x" << std::hex << dst - limit
            << " bytes left to decode";

    return Error();
}

}

Error BlzReconstructor::reconstruct(
        Source* source,
        const Entry::Reconstructed& entry,
        std::vector<uint8_t>* out) const {
    if (entry.size > source->size() || entry.offset > source->size() - entry.size)
        return error_new(Error::RECONSTRUCTFAILED)
            << "stored range [0x" << std::hex << entry.offset << ", 0x"
            << entry.offset + entry.size << ") is outside of the container";

    std::vector<uint8_t> stored(entry.size);
    size_t n = 0;
    CHECK(source->read_at(entry.offset, stored.data(), stored.size(), &n),
        Error::RECONSTRUCTFAILED) << "failed to read stored bytes";
    if (n != stored.size())
        return error_new(Error::RECONSTRUCTFAILED)
            << "short read of stored bytes: " << n << " of " << stored.size();

    CHECK(blz::decompress(stored, out),
        Error::RECONSTRUCTFAILED) << "failed to decompress";

    return Error();
}

}
