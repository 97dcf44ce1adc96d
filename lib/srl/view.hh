#pragma once

#include <cstdint>
#include <vector>

#include "p.hh"
#include "util/error.hh"
#include "srl/stream.hh"

namespace srl {

// View is a read-only, independently seekable handle onto part of a
// container. Views are not synchronized; one view must not be used from two
// threads at once. Distinct views may be used concurrently.
struct View {
    enum Whence {
        SET,
        CUR,
        END,
    };

    virtual ~View() {}

    // read transfers up to count bytes from the current position, never past
    // the end of the view.
    virtual Error read(
            uint8_t* out,
            size_t count,
            size_t* read) = 0;

    // seek moves the position. The result is clamped to [0, size()].
    Error seek(
            int64_t offset,
            Whence whence,
            uint64_t* position = nullptr);

    uint64_t tell() const {
        return position;
    }

    virtual uint64_t size() const = 0;

    // readall reads from the current position to the end of the view.
    Error readall(std::vector<uint8_t>* out);

    // close releases the view. It never affects the container.
    virtual void close() {
        closed = true;
    }

    bool is_closed() const {
        return closed;
    }

protected:
    uint64_t position = 0;
    bool closed = false;
};

// SubsectionView exposes the window [base, base + length) of a Source as its
// own stream. Positions are relative to base.
struct SubsectionView: View {
    P<Source> source;
    uint64_t base;
    uint64_t length;

    Error read(
            uint8_t* out,
            size_t count,
            size_t* read) override;

    uint64_t size() const override {
        return length;
    }

    void close() override {
        View::close();
        source = nullptr;
    }

    SubsectionView(
            Source* source,
            uint64_t base,
            uint64_t length):
        source(source),
        base(base),
        length(length) {}
    SubsectionView(const SubsectionView&) = delete;
};

// MemoryView is a View over bytes that were decoded rather than stored
// contiguously in the container.
struct MemoryView: View {
    std::vector<uint8_t> data;

    Error read(
            uint8_t* out,
            size_t count,
            size_t* read) override;

    uint64_t size() const override {
        return data.size();
    }

    explicit MemoryView(std::vector<uint8_t> data):
        data(std::move(data)) {}
};

}
