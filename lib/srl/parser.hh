#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "util/error.hh"
#include "srl/extents.hh"

namespace srl {

// Parser reads little-endian fields out of a buffer that was read from the
// container. Every read is bounds checked against the buffer extents; an
// out of range read is an INVALIDOFFSET error and does not move the cursor.
struct Parser {
    Extents buffer;
    size_t offset;

    Error u8(uint8_t* x) {return primitive(x, sizeof(*x));}
    Error u16(uint16_t* x) {return primitive(x, sizeof(*x));}
    Error u32(uint32_t* x) {return primitive(x, sizeof(*x));}

    // at moves the cursor to an absolute offset in the buffer.
    Error at(size_t offset);

    // skip advances the cursor by count bytes.
    Error skip(size_t count);

    Error bytes(
            std::vector<uint8_t>* out,
            size_t len);
    Error string_fixedlength(
            std::string* s,
            size_t len);

    template<typename T>
        Error primitive(
                T* x,
                size_t width);

    static Parser of(const std::vector<uint8_t>& data) {
        Parser p;
        p.buffer.start = data.data();
        p.buffer.end = data.data() + data.size();
        p.offset = 0;
        return p;
    }
};

}
