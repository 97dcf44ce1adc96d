#pragma once

#include <cstdint>
#include <vector>

#include "util/error.hh"
#include "srl/entry.hh"
#include "srl/stream.hh"

namespace srl {

// Reconstructor turns the stored bytes of a Reconstructed entry into its
// logical contents. Reconstructors are registered on a Reader by format
// name, and may be called from several threads at once.
struct Reconstructor {
    virtual ~Reconstructor() {}

    virtual Error reconstruct(
            Source* source,
            const Entry::Reconstructed& entry,
            std::vector<uint8_t>* out) const = 0;
};

}
