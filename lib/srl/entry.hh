#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

#include "util/error.hh"

namespace srl {

// Entry is a named sub-resource of a container.
struct Entry {
    // Direct entries are stored contiguously and are read as a byte range.
    struct Direct {
        uint64_t offset;
        uint64_t size;
    };

    // Reconstructed entries must be decoded before use. format names the
    // Reconstructor that understands the stored bytes at [offset, offset + size).
    struct Reconstructed {
        std::string format;
        uint64_t offset;
        uint64_t size;
    };

    std::string path;

    std::variant<
        Direct,
        Reconstructed> location;

    const Direct* direct() const {
        return std::get_if<Direct>(&location);
    }

    const Reconstructed* reconstructed() const {
        return std::get_if<Reconstructed>(&location);
    }
};

// normalize_path turns "/arm9.bin" and "arm9" into the same entry name: it
// drops leading separators and a trailing ".bin" suffix (any case). Applying
// it twice gives the same result as applying it once.
std::string normalize_path(std::string_view path);

// EntryTable maps entry names to entries.
struct EntryTable {
    std::map<std::string, Entry> entries;

    // resolve looks up path, normalizing it first if requested. A missing
    // entry is a NOTFOUND error.
    Error resolve(
            const std::string& path,
            const Entry** entry,
            bool normalize = true) const;

    // add inserts or replaces the entry named e.path.
    void add(Entry e) {
        std::string key = e.path;
        entries.insert_or_assign(std::move(key), std::move(e));
    }

    bool contains(const std::string& path) const {
        return entries.count(normalize_path(path)) > 0;
    }

    size_t size() const {
        return entries.size();
    }

    std::map<std::string, Entry>::const_iterator begin() const {
        return entries.begin();
    }

    std::map<std::string, Entry>::const_iterator end() const {
        return entries.end();
    }
};

}
