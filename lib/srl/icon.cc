#include "srl/icon.hh"

#include <memory>

#include "util/bytes.hh"
#include "srl/stream.hh"

namespace srl {

const std::array<const wchar_t*, REGION_COUNT> region_names = {
    L"Japanese",
    L"English",
    L"French",
    L"German",
    L"Italian",
    L"Spanish",
    L"Simplified Chinese",
    L"Korean",
    L"Dutch",
    L"Portuguese",
    L"Russian",
    L"Traditional Chinese",
};

const std::array<const wchar_t*, REGION_COUNT> region_order_check = {
    L"English",
    L"Japanese",
    L"French",
    L"German",
    L"Italian",
    L"Spanish",
    L"Simplified Chinese",
    L"Korean",
    L"Dutch",
    L"Portuguese",
    L"Russian",
    L"Traditional Chinese",
};

const util::Flag<uint32_t> region_lock_names[8] = {
    { L"JPN", 1u << 0 },
    { L"USA", 1u << 1 },
    { L"EUR", 1u << 2 },
    { L"EUR", 1u << 3 },
    { L"CHN", 1u << 4 },
    { L"KOR", 1u << 5 },
    { L"TWN", 1u << 6 },
    { L"FREE", 1u << 7 },
};

// Offsets inside the icon block.
static const size_t SMALL_ICON_OFFSET = 0x20;
static const size_t SMALL_ICON_SIZE = 0x200;
static const size_t PALETTE_OFFSET = 0x220;
static const size_t PALETTE_SIZE = 0x20;
static const size_t TITLES_OFFSET = 0x240;
static const size_t REGION_LOCK_OFFSET = 0x2018;

static bool is_line_break(wchar_t c) {
    switch (c) {
    case L'\n':
    case L'\r':
    case L'\v':
    case L'\f':
    case 0x1C:
    case 0x1D:
    case 0x1E:
    case 0x85:
    case 0x2028:
    case 0x2029:
        return true;
    }

    return false;
}

std::vector<std::wstring> split_lines(std::wstring_view s) {
    std::vector<std::wstring> lines;

    size_t start = 0;
    size_t i = 0;
    while (i < s.size()) {
        if (!is_line_break(s[i])) {
            ++i;
            continue;
        }

        lines.emplace_back(s.substr(start, i - start));
        if (s[i] == L'\r' && i + 1 < s.size() && s[i + 1] == L'\n')
            ++i;
        ++i;
        start = i;
    }

    if (start < s.size())
        lines.emplace_back(s.substr(start));

    return lines;
}

static Error utf16le_decode(
        const uint8_t* b,
        size_t len,
        std::wstring* s) {
    if (len % 2 != 0)
        return error_new(Error::MALFORMEDICON)
            << "odd UTF-16 length " << len;

    s->clear();
    for (size_t i = 0; i < len; i += 2) {
        uint32_t unit = util::le16(b + i);
        if (unit >= 0xDC00 && unit <= 0xDFFF)
            return error_new(Error::MALFORMEDICON)
                << "unpaired low surrogate at byte " << i;

        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 2 >= len)
                return error_new(Error::MALFORMEDICON)
                    << "unpaired high surrogate at byte " << i;

            uint32_t low = util::le16(b + i + 2);
            if (low < 0xDC00 || low > 0xDFFF)
                return error_new(Error::MALFORMEDICON)
                    << "unpaired high surrogate at byte " << i;

            i += 2;

            // A 16-bit wchar_t holds the pair as is.
            if constexpr (sizeof(wchar_t) == 2) {
                s->push_back(static_cast<wchar_t>(unit));
                s->push_back(static_cast<wchar_t>(low));
                continue;
            }

            unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
        }

        s->push_back(static_cast<wchar_t>(unit));
    }

    return Error();
}

Error decode_title(
        const uint8_t* record,
        size_t len,
        AppTitle* title) {
    std::wstring text;
    CHECK(utf16le_decode(record, len, &text),
        Error::MALFORMEDICON) << "failed to decode title text";

    std::wstring_view trimmed = text;
    while (!trimmed.empty() && trimmed.front() == L'\0')
        trimmed.remove_prefix(1);
    while (!trimmed.empty() && trimmed.back() == L'\0')
        trimmed.remove_suffix(1);

    std::vector<std::wstring> lines = split_lines(trimmed);
    if (lines.size() == 3) {
        title->short_desc = lines[0];
        title->long_desc = lines[0] + L" " + lines[1];
        title->publisher = lines[2];
    } else if (lines.size() == 2) {
        title->short_desc = lines[0];
        title->long_desc = lines[0];
        title->publisher = lines[1];
    } else {
        *title = AppTitle();
    }

    return Error();
}

std::wstring decode_region_locks(uint32_t value) {
    if (value == REGION_LOCK_ALL)
        return L"ALL";

    util::Decomposition<uint32_t> d = util::decompose(region_lock_names, value);

    std::vector<std::wstring_view> seen;
    std::wstring out;
    for (const util::Flag<uint32_t>* f : d.members) {
        std::wstring_view name = f->name;
        bool duplicate = false;
        for (std::wstring_view s : seen)
            duplicate = duplicate || s == name;
        if (duplicate)
            continue;

        if (!out.empty())
            out += L",";
        out += name;
        seen.push_back(name);
    }

    return out;
}

const AppTitle* Icon::name(std::wstring_view region) const {
    for (size_t i = 0; i < REGION_COUNT; ++i) {
        if (region == region_names[i])
            return names[i] ? &*names[i] : nullptr;
    }

    return nullptr;
}

static AppTitle unknown_title() {
    return AppTitle{ L"unknown", L"unknown", L"unknown" };
}

AppTitle Icon::get_app_title() const {
    for (const wchar_t* region : region_order_check) {
        const AppTitle* t = name(region);
        if (t && !t->empty())
            return *t;
    }

    return unknown_title();
}

AppTitle Icon::get_app_title(const wchar_t* region) const {
    const AppTitle* t = name(region);
    if (t && !t->empty())
        return *t;

    return unknown_title();
}

AppTitle Icon::get_app_title(const std::vector<std::wstring>& order) const {
    for (const std::wstring& region : order) {
        const AppTitle* t = name(region);
        if (t && !t->empty())
            return *t;
    }

    return unknown_title();
}

Error Icon::parse(
        Icon* icon,
        const std::vector<uint8_t>& block) {
    if (block.size() < ICON_SIZE)
        return error_new(Error::MALFORMEDICON)
            << "icon block is 0x" << std::hex << block.size()
            << " bytes, expected 0x" << ICON_SIZE;

    const uint8_t* b = block.data();
    for (size_t i = 0; i < REGION_COUNT; ++i) {
        AppTitle title;
        CHECK(decode_title(b + TITLES_OFFSET + i * TITLE_SIZE, TITLE_SIZE, &title),
            Error::MALFORMEDICON) << "failed to decode " << region_names[i] << " title";
        icon->names[i] = std::move(title);
    }

    icon->region_lock_raw = util::le32(b + REGION_LOCK_OFFSET);
    icon->region_lock_allowed = decode_region_locks(icon->region_lock_raw);
    icon->regionlocks.clear();

    icon->small_icon.assign(b + SMALL_ICON_OFFSET, b + SMALL_ICON_OFFSET + SMALL_ICON_SIZE);
    icon->palette_icon.assign(b + PALETTE_OFFSET, b + PALETTE_OFFSET + PALETTE_SIZE);

    return Error();
}

Error Icon::load(
        Icon* icon,
        View* v) {
    std::vector<uint8_t> block(ICON_SIZE);
    size_t total = 0;
    while (total < block.size()) {
        size_t n = 0;
        CHECK(v->read(block.data() + total, block.size() - total, &n),
            Error::MALFORMEDICON) << "failed to read icon block";
        if (n == 0)
            break;

        total += n;
    }
    block.resize(total);

    CHECK(parse(icon, block),
        Error::MALFORMEDICON) << "failed to parse icon block";

    return Error();
}

Error Icon::from_file(
        Icon* icon,
        const char* filename) {
    auto stream = std::make_unique<FileStream>();
    CHECK(FileStream::open(stream.get(), filename),
        Error::OPENFAILED) << "failed to open icon file";

    Source source(std::move(stream));
    SubsectionView v(&source, 0, source.size());
    CHECK(load(icon, &v),
        Error::MALFORMEDICON) << "failed to load icon from " << filename;

    return Error();
}

}
