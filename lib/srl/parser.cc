#include "srl/parser.hh"

#include "util/bytes.hh"

namespace srl {

template<typename T>
Error Parser::primitive(
    T* x,
    size_t width) {
    if (!buffer.valid(offset, width))
        return error_new(Error::INVALIDOFFSET)
        << "offset 0x" << std::hex << offset
        << " is outside of buffer extents " << buffer;

    uint64_t value = 0;
    CHECK(util::readle(buffer.start + offset, width, &value),
        Error::BADREAD) << "failed to decode field at 0x" << std::hex << offset;

    *x = static_cast<T>(value);
    offset += width;

    return Error();
}

template Error Parser::primitive<uint8_t>(uint8_t* x, size_t width);
template Error Parser::primitive<uint16_t>(uint16_t* x, size_t width);
template Error Parser::primitive<uint32_t>(uint32_t* x, size_t width);

Error Parser::at(size_t to) {
    if (to > buffer.size())
        return error_new(Error::INVALIDOFFSET)
        << "seek to 0x" << std::hex << to
        << " is outside of buffer extents " << buffer;

    offset = to;
    return Error();
}

Error Parser::skip(size_t count) {
    if (!buffer.valid(offset, count))
        return error_new(Error::INVALIDOFFSET)
        << "skip of " << count << " bytes at 0x" << std::hex << offset
        << " is outside of buffer extents " << buffer;

    offset += count;
    return Error();
}

Error Parser::bytes(
    std::vector<uint8_t>* out,
    size_t len) {
    if (!buffer.valid(offset, len))
        return error_new(Error::INVALIDOFFSET)
        << "read of " << len << " bytes at 0x" << std::hex << offset
        << " is outside of buffer extents " << buffer;

    out->assign(buffer.start + offset, buffer.start + offset + len);
    offset += len;

    return Error();
}

// string_fixedlength reads a fixed-width ASCII field. Trailing NULs are part
// of the field's padding and are dropped.
Error Parser::string_fixedlength(
    std::string* s,
    size_t len) {
    if (!buffer.valid(offset, len))
        return error_new(Error::INVALIDOFFSET)
        << "string of " << len << " bytes at 0x" << std::hex << offset
        << " is outside of buffer extents " << buffer;

    s->assign(reinterpret_cast<const char*>(buffer.start + offset), len);
    size_t last = s->find_last_not_of('\0');
    s->resize(last == std::string::npos ? 0 : last + 1);
    offset += len;

    return Error();
}

}
