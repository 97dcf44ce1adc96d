#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "util/error.hh"
#include "srl/entry.hh"
#include "srl/header.hh"
#include "srl/icon.hh"
#include "srl/reconstructor.hh"
#include "srl/stream.hh"
#include "srl/view.hh"

namespace srl {

// ReaderOptions controls the optional parts of reading a container.
struct ReaderOptions {
    // load_icon decodes the icon/banner block while opening.
    bool load_icon = true;

    // load_overlays adds the ARM9/ARM7 overlays to the entry table.
    bool load_overlays = true;
};

// Reader is a read-only container reader. The header (and the extended
// header, if present) is decoded when the container is opened; the icon is
// decoded on a best-effort basis and is simply absent if it can't be read.
//
// Entries are read through views opened with open. Views borrow the Reader's
// Source, so the Reader must outlive every view it opened.
struct Reader {
    enum State {
        UNOPENED,
        HEADERPARSED,
        EXTENDEDHEADERPARSED,
        ICONATTEMPTED,
        READY,
    };

    State state;

    // source owns the container stream and the lock serializing access to it.
    std::unique_ptr<Source> source;

    Header header;

    // icon is the decoded icon block, if one was present and readable.
    std::optional<Icon> icon;

    EntryTable entries;

    // reconstructors decode Reconstructed entries, keyed by format. "blz" is
    // registered by default.
    std::map<std::string, std::unique_ptr<Reconstructor>> reconstructors;

    // openfile opens a container file from disk and parses it.
    static Error openfile(
            Reader* r,
            const char* filename,
            ReaderOptions options = ReaderOptions());

    // parse takes ownership of stream and parses the container in it.
    static Error parse(
            Reader* r,
            std::unique_ptr<Stream> stream,
            ReaderOptions options = ReaderOptions());

    // open returns a view of the entry at path. Direct entries are served
    // straight from the container; Reconstructed entries are decoded by the
    // reconstructor registered for their format. A missing entry is a
    // NOTFOUND error.
    Error open(
            const std::string& path,
            std::unique_ptr<View>* view,
            bool normalize = true) const;

    void register_reconstructor(
            const std::string& format,
            std::unique_ptr<Reconstructor> reconstructor) {
        reconstructors[format] = std::move(reconstructor);
    }

    // size returns the number of entries.
    size_t size() const {
        return entries.size();
    }

    Reader();
    Reader(Reader&&) = default;
    Reader(const Reader&) = delete;

private:
    Error read_exact(
            uint64_t offset,
            size_t len,
            std::vector<uint8_t>* out) const;

    void add_sections();
    Error load_overlays();
    void load_icon();
};

}
