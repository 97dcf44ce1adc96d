#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "util/error.hh"
#include "srl/parser.hh"

namespace srl {

// HEADER_SIZE is the size of the primary header at the start of a container.
constexpr size_t HEADER_SIZE = 0x180;

// EXTENDED_HEADER_SIZE is the size of the extended header that immediately
// follows the primary header when bit 0 of the unit code is set.
constexpr size_t EXTENDED_HEADER_SIZE = 0xE80;

// Section is a byte range of the container named by the header.
struct Section {
    uint32_t offset;
    uint32_t size;
};

// Binary describes an executable image stored in the container.
struct Binary {
    uint32_t rom_offset;
    uint32_t entry_address;
    uint32_t load_address;
    uint32_t size;
};

// Header contains the fields of a container header that the reader uses.
struct Header {
    // apptitle is the raw first 0x12 bytes of the header: title, game code
    // and maker code.
    std::vector<uint8_t> apptitle;

    // game_title, game_code and maker_code are the ASCII fields that make up
    // apptitle, without padding.
    std::string game_title;
    std::string game_code;
    std::string maker_code;

    // unitcode selects the target hardware. Bit 0 means an extended header
    // is present.
    uint8_t unitcode;

    uint8_t rom_version;

    Binary arm9;
    Binary arm7;

    Section fnt;
    Section fat;
    Section arm9_overlays;
    Section arm7_overlays;

    // icon_offset is the offset of the icon/banner block, or 0 if there is
    // none.
    uint32_t icon_offset;

    // extended is set once the extended header has been parsed.
    bool extended;

    // region_lockout is the raw region-lockout byte of the extended header.
    uint8_t region_lockout;

    // regionlocks is the label of region_lockout, or empty when there is no
    // extended header.
    std::string regionlocks;

    Binary arm9i;
    Binary arm7i;

    bool has_extended_header() const {
        return unitcode & 0x01;
    }

    // parse reads the primary header. p must cover HEADER_SIZE bytes.
    static Error parse(
            Header* h,
            Parser* p);

    // parse_extended reads the extended header, starting at the cursor of p.
    // p may cover less than EXTENDED_HEADER_SIZE bytes; only the fields that
    // fit are read.
    static Error parse_extended(
            Header* h,
            Parser* p);

    Header():
        unitcode(0),
        rom_version(0),
        arm9(),
        arm7(),
        fnt(),
        fat(),
        arm9_overlays(),
        arm7_overlays(),
        icon_offset(0),
        extended(false),
        region_lockout(0),
        arm9i(),
        arm7i() {}
};

// region_lockout_str labels a raw region-lockout value. Values without a
// label are kept as their decimal string.
std::string region_lockout_str(uint8_t raw);

}
