#pragma once

#include <cstdint>
#include <vector>

#include "util/error.hh"
#include "srl/parser.hh"

namespace srl {

// FatEntry is one record of the file allocation table: the byte range
// [start, end) of a file in the container.
struct FatEntry {
    uint32_t start;
    uint32_t end;

    static constexpr size_t SIZE = 8;

    static Error parse(
            FatEntry* e,
            Parser* p);
};

// Overlay is one record of an ARM9 or ARM7 overlay table.
struct Overlay {
    uint32_t id;
    uint32_t ram_address;
    uint32_t ram_size;
    uint32_t bss_size;
    uint32_t sinit_start;
    uint32_t sinit_end;

    // file_id indexes the file allocation table.
    uint32_t file_id;

    // compressed_size is the stored size of a compressed overlay.
    uint32_t compressed_size;

    uint8_t flags;

    static constexpr size_t SIZE = 32;

    // compressed returns whether the overlay is stored BLZ-compressed.
    bool compressed() const {
        return flags & 0x01;
    }

    static Error parse(
            Overlay* o,
            Parser* p);
};

// parse_table parses every whole record in p. Trailing bytes that do not
// form a whole record are ignored.
template <typename T>
Error parse_table(
        std::vector<T>* out,
        Parser* p) {
    size_t count = (p->buffer.size() - p->offset) / T::SIZE;
    out->resize(count);

    for (size_t i = 0; i < count; ++i) {
        CHECK(T::parse(&(*out)[i], p),
            Error::BADREAD) << "failed to read table record " << i;
    }

    return Error();
}

}
