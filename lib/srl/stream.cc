#include "srl/stream.hh"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace srl {

Error FileStream::open(
        FileStream* s,
        const char* filename) {
    int fd = ::open(filename, O_RDONLY);
    if (fd < 0)
        return error_new(Error::OPENFAILED)
            << "failed to open " << filename << " for read: " << strerror(errno);

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return error_new(Error::OPENFAILED)
            << "failed to stat " << filename << ": " << strerror(err);
    }

    s->fd = fd;
    s->length = static_cast<uint64_t>(st.st_size);
    return Error();
}

Error FileStream::close() {
    if (fd < 0) return Error();

    int ret = ::close(fd);
    fd = -1;
    if (ret)
        return error_new(Error::CLOSEFAILED)
            << "failed to close file: " << strerror(errno);

    return Error();
}

FileStream::~FileStream() {
    if (Error e = close()) {
        e.print(std::wcerr);
    }
}

Error FileStream::seek(uint64_t offset) {
    if (fd < 0)
        return error_new(Error::INVALIDUSAGE)
            << "seek on closed file";

    if (::lseek(fd, static_cast<off_t>(offset), SEEK_SET) < 0)
        return error_new(Error::BADREAD)
            << "failed to seek to 0x" << std::hex << offset << ": " << strerror(errno);

    return Error();
}

Error FileStream::read(
        uint8_t* out,
        size_t count,
        size_t* read) {
    if (fd < 0)
        return error_new(Error::INVALIDUSAGE)
            << "read on closed file";

    size_t total = 0;
    while (total < count) {
        ssize_t ret = ::read(fd, out + total, count - total);
        if (ret < 0) {
            if (errno == EINTR)
                continue;

            return error_new(Error::BADREAD)
                << "failed to read " << count << " bytes: " << strerror(errno);
        }
        if (ret == 0)
            break;

        total += static_cast<size_t>(ret);
    }

    *read = total;
    return Error();
}

Error MemoryStream::seek(uint64_t offset) {
    position = offset;
    return Error();
}

Error MemoryStream::read(
        uint8_t* out,
        size_t count,
        size_t* read) {
    size_t n = 0;
    if (position < data.size()) {
        n = static_cast<size_t>(data.size() - position);
        if (n > count)
            n = count;

        std::memcpy(out, data.data() + position, n);
        position += n;
    }

    *read = n;
    return Error();
}

Error Source::read_at(
        uint64_t offset,
        uint8_t* out,
        size_t count,
        size_t* read) {
    if (!stream)
        return error_new(Error::INVALIDUSAGE)
            << "read from a source without a stream";

    std::lock_guard<std::mutex> guard(lock);
    CHECK(stream->seek(offset),
        Error::BADREAD) << "failed to seek source to 0x" << std::hex << offset;
    CHECK(stream->read(out, count, read),
        Error::BADREAD) << "failed to read " << std::dec << count
        << " bytes at 0x" << std::hex << offset;

    return Error();
}

}
