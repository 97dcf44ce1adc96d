#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>

namespace srl {

// Extents represents a memory address range, and provides a helper method for
// bounds checking.
struct Extents {
    // start is the first valid memory address in the range.
    const uint8_t* start;

    // end is the last valid memory address in the range + 1. That is, the range
    // is exclusive.
    const uint8_t* end;

    // valid returns whether a read of count bytes at offset stays inside the
    // range.
    bool valid(size_t offset, size_t count) const {
        size_t size = static_cast<size_t>(end - start);
        return offset <= size && count <= size - offset;
    }

    size_t size() const {
        return static_cast<size_t>(end - start);
    }
};

template <typename CharT>
std::basic_ostream<CharT>& operator<<(std::basic_ostream<CharT>& s, const Extents& e) {
    auto state = s.flags();
    s << std::hex << "[0x0, 0x" << e.size() << ")";
    s.flags(state);
    return s;
}

}
