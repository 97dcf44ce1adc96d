#include "srl/overlay.hh"

namespace srl {

Error FatEntry::parse(
        FatEntry* e,
        Parser* p) {
    CHECK(p->u32(&e->start),
        Error::BADREAD) << "failed to read file start";
    CHECK(p->u32(&e->end),
        Error::BADREAD) << "failed to read file end";

    return Error();
}

Error Overlay::parse(
        Overlay* o,
        Parser* p) {
    CHECK(p->u32(&o->id),
        Error::BADREAD) << "failed to read overlay id";
    CHECK(p->u32(&o->ram_address),
        Error::BADREAD) << "failed to read overlay ram address";
    CHECK(p->u32(&o->ram_size),
        Error::BADREAD) << "failed to read overlay ram size";
    CHECK(p->u32(&o->bss_size),
        Error::BADREAD) << "failed to read overlay bss size";
    CHECK(p->u32(&o->sinit_start),
        Error::BADREAD) << "failed to read overlay static initializer start";
    CHECK(p->u32(&o->sinit_end),
        Error::BADREAD) << "failed to read overlay static initializer end";
    CHECK(p->u32(&o->file_id),
        Error::BADREAD) << "failed to read overlay file id";

    uint32_t packed = 0;
    CHECK(p->u32(&packed),
        Error::BADREAD) << "failed to read overlay flags";
    o->compressed_size = packed & 0xFFFFFF;
    o->flags = static_cast<uint8_t>(packed >> 24);

    return Error();
}

}
