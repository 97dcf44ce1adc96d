#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/error.hh"
#include "util/flags.hh"
#include "srl/view.hh"

namespace srl {

// ICON_SIZE is the size of the icon/banner block.
constexpr size_t ICON_SIZE = 0x2400;

// TITLE_SIZE is the size of one record of the banner's title table.
constexpr size_t TITLE_SIZE = 0x100;

// REGION_COUNT is the number of title table records in use. The table
// reserves room for 16.
constexpr size_t REGION_COUNT = 12;

// REGION_LOCK_ALL is the region-lock value that allows every region.
constexpr uint32_t REGION_LOCK_ALL = 0x7FFFFFFF;

// region_names lists the regions of the title table, in table order.
extern const std::array<const wchar_t*, REGION_COUNT> region_names;

// region_order_check is the default lookup order of get_app_title. English
// is checked before Japanese, even though Japanese comes first in the table.
extern const std::array<const wchar_t*, REGION_COUNT> region_order_check;

// region_lock_names labels the bits of the region-lock field. Europe has two
// bits.
extern const util::Flag<uint32_t> region_lock_names[8];

// AppTitle is the title of an application in one region.
struct AppTitle {
    std::wstring short_desc;
    std::wstring long_desc;
    std::wstring publisher;

    bool empty() const {
        return short_desc.empty() && long_desc.empty() && publisher.empty();
    }

    bool operator==(const AppTitle& rhs) const {
        return short_desc == rhs.short_desc
            && long_desc == rhs.long_desc
            && publisher == rhs.publisher;
    }
};

// split_lines splits s at line boundaries. A trailing line break does not
// start an empty line.
std::vector<std::wstring> split_lines(std::wstring_view s);

// decode_title decodes one UTF-16LE title table record. Records with three
// lines are "short, rest of long, publisher"; records with two are "title,
// publisher"; anything else decodes to an empty title.
Error decode_title(
        const uint8_t* record,
        size_t len,
        AppTitle* title);

// decode_region_locks labels a region-lock bitmask, e.g. "USA,JPN".
std::wstring decode_region_locks(uint32_t value);

// Icon is a decoded icon/banner block.
struct Icon {
    // names holds the title of each region, indexed like region_names. An
    // absent title was not stored in the block.
    std::array<std::optional<AppTitle>, REGION_COUNT> names;

    // regionlocks is the exposed region-lock label. It is always empty;
    // see region_lock_allowed for the decoded value.
    std::wstring regionlocks;

    // region_lock_allowed is the decoded region-lock bitmask.
    std::wstring region_lock_allowed;

    // region_lock_raw is the region-lock bitmask as stored.
    uint32_t region_lock_raw;

    std::vector<uint8_t> small_icon;
    std::vector<uint8_t> palette_icon;

    // name returns the title stored for region, or nullptr if the region is
    // unknown or has no title.
    const AppTitle* name(std::wstring_view region) const;

    // get_app_title returns the first non-empty title in order. It never
    // fails; without a title it returns ("unknown", "unknown", "unknown").
    AppTitle get_app_title() const;
    AppTitle get_app_title(const wchar_t* region) const;
    AppTitle get_app_title(const std::vector<std::wstring>& order) const;

    // parse decodes an icon block. block must hold at least ICON_SIZE bytes.
    static Error parse(
            Icon* icon,
            const std::vector<uint8_t>& block);

    // load reads and decodes an icon block from the current position of v.
    static Error load(
            Icon* icon,
            View* v);

    // from_file decodes a standalone icon block file.
    static Error from_file(
            Icon* icon,
            const char* filename);

    Icon():
        names(),
        regionlocks(),
        region_lock_allowed(),
        region_lock_raw(0) {}
};

}
