#include "srl/header.hh"

namespace srl {

static Error Binary_parse(
        Binary* b,
        Parser* p) {
    CHECK(p->u32(&b->rom_offset),
        Error::BADREAD) << "failed to read rom offset";
    CHECK(p->u32(&b->entry_address),
        Error::BADREAD) << "failed to read entry address";
    CHECK(p->u32(&b->load_address),
        Error::BADREAD) << "failed to read load address";
    CHECK(p->u32(&b->size),
        Error::BADREAD) << "failed to read size";

    return Error();
}

static Error Section_parse(
        Section* s,
        Parser* p) {
    CHECK(p->u32(&s->offset),
        Error::BADREAD) << "failed to read section offset";
    CHECK(p->u32(&s->size),
        Error::BADREAD) << "failed to read section size";

    return Error();
}

Error Header::parse(
        Header* h,
        Parser* p) {
    size_t start = p->offset;

    CHECK(p->bytes(&h->apptitle, 0x12),
        Error::BADREAD) << "failed to read app title";

    CHECK(p->at(start + 0x00),
        Error::BADREAD);
    CHECK(p->string_fixedlength(&h->game_title, 12),
        Error::BADREAD) << "failed to read game title";
    CHECK(p->string_fixedlength(&h->game_code, 4),
        Error::BADREAD) << "failed to read game code";
    CHECK(p->string_fixedlength(&h->maker_code, 2),
        Error::BADREAD) << "failed to read maker code";
    CHECK(p->u8(&h->unitcode),
        Error::BADREAD) << "failed to read unit code";

    CHECK(p->at(start + 0x1E),
        Error::BADREAD);
    CHECK(p->u8(&h->rom_version),
        Error::BADREAD) << "failed to read rom version";

    CHECK(p->at(start + 0x20),
        Error::BADREAD);
    CHECK(Binary_parse(&h->arm9, p),
        Error::BADREAD) << "failed to read arm9 binary";
    CHECK(Binary_parse(&h->arm7, p),
        Error::BADREAD) << "failed to read arm7 binary";
    CHECK(Section_parse(&h->fnt, p),
        Error::BADREAD) << "failed to read file name table";
    CHECK(Section_parse(&h->fat, p),
        Error::BADREAD) << "failed to read file allocation table";
    CHECK(Section_parse(&h->arm9_overlays, p),
        Error::BADREAD) << "failed to read arm9 overlay table";
    CHECK(Section_parse(&h->arm7_overlays, p),
        Error::BADREAD) << "failed to read arm7 overlay table";

    CHECK(p->at(start + 0x68),
        Error::BADREAD);
    CHECK(p->u32(&h->icon_offset),
        Error::BADREAD) << "failed to read icon offset";

    CHECK(p->at(start + HEADER_SIZE),
        Error::BADREAD) << "header is shorter than 0x" << std::hex << HEADER_SIZE;

    return Error();
}

Error Header::parse_extended(
        Header* h,
        Parser* p) {
    size_t start = p->offset;
    h->extended = true;

    // A short extended header is not an error. Fields past the end of the
    // buffer keep their defaults.
    h->region_lockout = 0;
    if (p->buffer.valid(start + 0x34, 1)) {
        CHECK(p->at(start + 0x34),
            Error::BADREAD);
        CHECK(p->u8(&h->region_lockout),
            Error::BADREAD) << "failed to read region lockout";
    }
    h->regionlocks = region_lockout_str(h->region_lockout);

    // The secondary binaries are described in the same layout as the
    // primary ones, with reserved words in place of entry addresses.
    if (!p->buffer.valid(start + 0x40, 0x20))
        return Error();

    CHECK(p->skip(0x40 - (p->offset - start)),
        Error::BADREAD);
    CHECK(Binary_parse(&h->arm9i, p),
        Error::BADREAD) << "failed to read arm9i binary";
    CHECK(Binary_parse(&h->arm7i, p),
        Error::BADREAD) << "failed to read arm7i binary";
    h->arm9i.entry_address = 0;
    h->arm7i.entry_address = 0;

    return Error();
}

std::string region_lockout_str(uint8_t raw) {
    switch (raw) {
    case 0x00:
        return "Normal";
    case 0x80:
        return "China";
    case 0x40:
        return "Korea";
    }

    return std::to_string(raw);
}

}
