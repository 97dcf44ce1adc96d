#include "srl/reader.hh"

#include <variant>

#include "logger.hh"
#include "util.hh"
#include "srl/blz.hh"
#include "srl/overlay.hh"
#include "srl/parser.hh"

namespace srl {

Reader::Reader():
    state(UNOPENED),
    source(),
    header(),
    icon(),
    entries(),
    reconstructors() {
    reconstructors["blz"] = std::make_unique<BlzReconstructor>();
}

Error Reader::openfile(
        Reader* r,
        const char* filename,
        ReaderOptions options) {
    auto stream = std::make_unique<FileStream>();
    CHECK(FileStream::open(stream.get(), filename),
        Error::OPENFAILED) << "failed to open container";

    CHECK(parse(r, std::move(stream), options),
        Error::BADREAD) << "failed to parse container " << filename;

    return Error();
}

Error Reader::read_exact(
        uint64_t offset,
        size_t len,
        std::vector<uint8_t>* out) const {
    out->resize(len);

    size_t n = 0;
    CHECK(source->read_at(offset, out->data(), len, &n),
        Error::BADREAD) << "failed to read 0x" << std::hex << len
        << " bytes at 0x" << offset;
    if (n != len)
        return error_new(Error::BADREAD)
            << "short read at 0x" << std::hex << offset
            << ": 0x" << n << " of 0x" << len << " bytes";

    return Error();
}

Error Reader::parse(
        Reader* r,
        std::unique_ptr<Stream> stream,
        ReaderOptions options) {
    r->source = std::make_unique<Source>(std::move(stream));

    std::vector<uint8_t> buffer;
    CHECK(r->read_exact(0, HEADER_SIZE, &buffer),
        Error::BADREAD) << "failed to read header";

    Parser p = Parser::of(buffer);
    CHECK(Header::parse(&r->header, &p),
        Error::BADREAD) << "failed to parse header";
    r->state = HEADERPARSED;

    if (r->header.has_extended_header()) {
        buffer.resize(EXTENDED_HEADER_SIZE);
        size_t n = 0;
        CHECK(r->source->read_at(HEADER_SIZE, buffer.data(), buffer.size(), &n),
            Error::BADREAD) << "failed to read extended header";
        if (n < buffer.size())
            LOG(WARN) << "extended header is truncated to 0x" << std::hex << n << " bytes";
        buffer.resize(n);

        Parser ep = Parser::of(buffer);
        CHECK(Header::parse_extended(&r->header, &ep),
            Error::BADREAD) << "failed to parse extended header";
        r->state = EXTENDEDHEADERPARSED;
    }

    r->add_sections();
    if (options.load_overlays) {
        if (Error e = r->load_overlays()) {
            LOG(WARN) << "ignoring unreadable overlay tables: " << e.str();
        }
    }

    if (options.load_icon) {
        r->load_icon();
        r->state = ICONATTEMPTED;
    }

    r->state = READY;
    return Error();
}

static void add_direct(
        EntryTable* t,
        const char* name,
        uint64_t offset,
        uint64_t size) {
    if (size == 0)
        return;

    t->add(Entry{ name, Entry::Direct{ offset, size } });
}

void Reader::add_sections() {
    const Header& h = header;

    add_direct(&entries, "header", 0,
        HEADER_SIZE + (h.extended ? EXTENDED_HEADER_SIZE : 0));
    add_direct(&entries, "arm9", h.arm9.rom_offset, h.arm9.size);
    add_direct(&entries, "arm7", h.arm7.rom_offset, h.arm7.size);
    add_direct(&entries, "fnt", h.fnt.offset, h.fnt.size);
    add_direct(&entries, "fat", h.fat.offset, h.fat.size);
    add_direct(&entries, "arm9ovt", h.arm9_overlays.offset, h.arm9_overlays.size);
    add_direct(&entries, "arm7ovt", h.arm7_overlays.offset, h.arm7_overlays.size);
    if (h.icon_offset != 0)
        add_direct(&entries, "icon", h.icon_offset, ICON_SIZE);

    if (h.extended) {
        add_direct(&entries, "arm9i", h.arm9i.rom_offset, h.arm9i.size);
        add_direct(&entries, "arm7i", h.arm7i.rom_offset, h.arm7i.size);
    }
}

Error Reader::load_overlays() {
    const Header& h = header;
    if (h.arm9_overlays.size == 0 && h.arm7_overlays.size == 0)
        return Error();

    const uint64_t limit = source->size();
    struct {
        const Section* table;
        const char* prefix;
    } tables[] = {
        { &h.arm9_overlays, "overlay9_" },
        { &h.arm7_overlays, "overlay7_" },
    };

    for (const auto& t : tables) {
        if (t.table->size > limit)
            return error_new(Error::INVALIDOFFSET)
                << t.prefix << " table of 0x" << std::hex << t.table->size
                << " bytes is larger than the container";
    }
    if (h.fat.size > limit)
        return error_new(Error::INVALIDOFFSET)
            << "file allocation table of 0x" << std::hex << h.fat.size
            << " bytes is larger than the container";

    std::vector<uint8_t> buffer;
    CHECK(read_exact(h.fat.offset, h.fat.size, &buffer),
        Error::BADREAD) << "failed to read file allocation table";

    std::vector<FatEntry> fat;
    Parser fp = Parser::of(buffer);
    CHECK(parse_table(&fat, &fp),
        Error::BADREAD) << "failed to parse file allocation table";

    for (const auto& t : tables) {
        if (t.table->size == 0)
            continue;

        CHECK(read_exact(t.table->offset, t.table->size, &buffer),
            Error::BADREAD) << "failed to read " << t.prefix << " table";

        std::vector<Overlay> overlays;
        Parser op = Parser::of(buffer);
        CHECK(parse_table(&overlays, &op),
            Error::BADREAD) << "failed to parse " << t.prefix << " table";

        for (const Overlay& o : overlays) {
            if (o.file_id >= fat.size()) {
                LOG(WARN) << "skipping " << t.prefix << o.id
                    << ": file id " << o.file_id << " is outside of the file allocation table";
                continue;
            }

            const FatEntry& f = fat[o.file_id];
            if (f.end < f.start) {
                LOG(WARN) << "skipping " << t.prefix << o.id
                    << ": file range [0x" << std::hex << f.start << ", 0x" << f.end << ") is inverted";
                continue;
            }

            Entry e;
            e.path = std::string(t.prefix) + std::to_string(o.id);
            if (o.compressed()) {
                e.location = Entry::Reconstructed{ "blz", f.start, f.end - f.start };
            } else {
                e.location = Entry::Direct{ f.start, f.end - f.start };
            }
            entries.add(std::move(e));
        }
    }

    return Error();
}

void Reader::load_icon() {
    if (header.icon_offset == 0) {
        LOG(INFO) << "container has no icon";
        return;
    }

    SubsectionView v(source.get(), header.icon_offset, ICON_SIZE);

    Icon loaded;
    if (Error e = Icon::load(&loaded, &v)) {
        LOG(WARN) << "ignoring unreadable icon at 0x" << std::hex << header.icon_offset
            << ": " << e.str();
        return;
    }

    icon = std::move(loaded);
}

Error Reader::open(
        const std::string& path,
        std::unique_ptr<View>* view,
        bool normalize) const {
    const Entry* entry = nullptr;
    CHECK(entries.resolve(path, &entry, normalize),
        Error::NOTFOUND) << "failed to open " << path.c_str();

    return std::visit(Visitor {
        [&](const Entry::Direct& d) -> Error {
            view->reset(new SubsectionView(source.get(), d.offset, d.size));
            return Error();
        },
        [&](const Entry::Reconstructed& r) -> Error {
            auto it = reconstructors.find(r.format);
            if (it == reconstructors.end())
                return error_new(Error::UNKNOWNFORMAT)
                    << "no reconstructor for format \"" << r.format.c_str()
                    << "\" of entry " << entry->path.c_str();

            LOG(DEBUG) << "reconstructing " << entry->path.c_str()
                << " from 0x" << std::hex << r.size << " stored bytes as " << r.format.c_str();

            std::vector<uint8_t> data;
            CHECK(it->second->reconstruct(source.get(), r, &data),
                Error::RECONSTRUCTFAILED) << "failed to reconstruct " << entry->path.c_str();

            view->reset(new MemoryView(std::move(data)));
            return Error();
        },
    }, entry->location);
}

}
