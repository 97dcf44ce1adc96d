#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "util/error.hh"

namespace srl {

// Stream is a seekable, readable byte stream. Streams are not synchronized;
// see Source.
struct Stream {
    virtual ~Stream() {}

    // seek moves the read cursor to an absolute offset. Seeking past the end
    // is allowed; subsequent reads return no bytes.
    virtual Error seek(uint64_t offset) = 0;

    // read transfers up to count bytes into out, and stores the number of
    // bytes transferred in read. A short read means end of stream.
    virtual Error read(
            uint8_t* out,
            size_t count,
            size_t* read) = 0;

    virtual uint64_t size() const = 0;
};

// FileStream is a Stream over an OS file descriptor.
struct FileStream: Stream {
    int fd;
    uint64_t length;

    static Error open(
            FileStream* s,
            const char* filename);

    // close closes the descriptor, if open.
    Error close();

    Error seek(uint64_t offset) override;
    Error read(
            uint8_t* out,
            size_t count,
            size_t* read) override;
    uint64_t size() const override {
        return length;
    }

    ~FileStream();

    FileStream():
        fd(-1),
        length(0) {}
    FileStream(const FileStream&) = delete;
};

// MemoryStream is a Stream over an owned byte buffer.
struct MemoryStream: Stream {
    std::vector<uint8_t> data;
    uint64_t position;

    Error seek(uint64_t offset) override;
    Error read(
            uint8_t* out,
            size_t count,
            size_t* read) override;
    uint64_t size() const override {
        return data.size();
    }

    explicit MemoryStream(std::vector<uint8_t> data):
        data(std::move(data)),
        position(0) {}
};

// Source is the exclusive owner of a container's stream. All access to the
// stream goes through read_at, which performs the seek and the transfer as
// one step under lock. Views borrow a Source and never touch the stream
// directly.
struct Source {
    std::unique_ptr<Stream> stream;

    // lock serializes every seek/read pair issued against stream.
    std::mutex lock;

    Error read_at(
            uint64_t offset,
            uint8_t* out,
            size_t count,
            size_t* read);

    uint64_t size() const {
        return stream ? stream->size() : 0;
    }

    explicit Source(std::unique_ptr<Stream> stream):
        stream(std::move(stream)) {}
    Source(const Source&) = delete;
};

}
