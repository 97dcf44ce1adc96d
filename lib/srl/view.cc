#include "srl/view.hh"

#include <cstring>

namespace srl {

Error View::seek(
        int64_t offset,
        Whence whence,
        uint64_t* out) {
    if (closed)
        return error_new(Error::INVALIDUSAGE)
            << "seek on closed view";

    int64_t origin = 0;
    switch (whence) {
    case SET:
        origin = 0;
        break;
    case CUR:
        origin = static_cast<int64_t>(position);
        break;
    case END:
        origin = static_cast<int64_t>(size());
        break;
    }

    // origin is within [0, size()], so clamping before the addition keeps
    // the sum in range.
    uint64_t target = 0;
    if (offset >= 0) {
        uint64_t forward = static_cast<uint64_t>(offset);
        uint64_t room = size() - static_cast<uint64_t>(origin);
        target = forward > room ? size() : static_cast<uint64_t>(origin) + forward;
    } else {
        uint64_t back = static_cast<uint64_t>(-(offset + 1)) + 1;
        target = back > static_cast<uint64_t>(origin) ? 0 : static_cast<uint64_t>(origin) - back;
    }

    position = target;
    if (out)
        *out = position;

    return Error();
}

Error View::readall(std::vector<uint8_t>* out) {
    uint64_t remaining = size() - position;
    out->resize(remaining);

    size_t n = 0;
    CHECK(read(out->data(), out->size(), &n),
        Error::BADREAD) << "failed to read " << remaining << " bytes";
    out->resize(n);

    return Error();
}

Error SubsectionView::read(
        uint8_t* out,
        size_t count,
        size_t* read) {
    if (closed || !source)
        return error_new(Error::INVALIDUSAGE)
            << "read on closed view";

    *read = 0;
    if (position >= length)
        return Error();

    uint64_t available = length - position;
    if (count > available)
        count = static_cast<size_t>(available);

    size_t n = 0;
    CHECK(source->read_at(base + position, out, count, &n),
        Error::BADREAD) << "failed to read view [0x" << std::hex << base
        << ", 0x" << base + length << ") at 0x" << position;

    position += n;
    *read = n;
    return Error();
}

Error MemoryView::read(
        uint8_t* out,
        size_t count,
        size_t* read) {
    if (closed)
        return error_new(Error::INVALIDUSAGE)
            << "read on closed view";

    *read = 0;
    if (position >= data.size())
        return Error();

    size_t n = static_cast<size_t>(data.size() - position);
    if (n > count)
        n = count;

    std::memcpy(out, data.data() + position, n);
    position += n;
    *read = n;
    return Error();
}

}
