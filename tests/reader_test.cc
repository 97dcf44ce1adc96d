#include <gtest/gtest.h>

#include <cctype>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "builder.hh"
#include "logger.hh"
#include "srl/reader.hh"

namespace {

std::vector<uint8_t> default_icon() {
    std::vector<std::u16string> titles(srl::REGION_COUNT, u"");
    titles[0] = u"テスト\n任天堂";
    titles[1] = u"Test Game\nDeluxe\nNintendo";
    return srltest::make_icon(titles, srl::REGION_LOCK_ALL);
}

Error parse(srl::Reader* r, std::vector<uint8_t> data, srl::ReaderOptions options = srl::ReaderOptions()) {
    return srl::Reader::parse(r, std::make_unique<srl::MemoryStream>(std::move(data)), options);
}

std::vector<uint8_t> read_entry(const srl::Reader& r, const std::string& path) {
    std::unique_ptr<srl::View> v;
    Error e = r.open(path, &v);
    EXPECT_FALSE(e) << e.str();
    if (e)
        return {};

    std::vector<uint8_t> out;
    e = v->readall(&out);
    EXPECT_FALSE(e) << e.str();
    return out;
}

// LogCapture routes the global logger into a string for the duration of a
// test.
struct LogCapture {
    std::wostringstream out;
    std::vector<std::wostream*> saved_targets;
    Logger::Level saved_threshold;

    LogCapture() {
        Logger& l = Logger::Global();
        saved_targets = l.targets;
        saved_threshold = l.threshold;
        l.targets = { &out };
        l.threshold = Logger::DEBUG;
    }

    ~LogCapture() {
        Logger& l = Logger::Global();
        l.targets = saved_targets;
        l.threshold = saved_threshold;
    }
};

}

TEST(ReaderTest, ParsesHeader) {
    srl::Reader r;
    Error e = parse(&r, srltest::make_container(0x00, 0, default_icon()));
    ASSERT_FALSE(e) << e.str();

    EXPECT_EQ(r.state, srl::Reader::READY);
    EXPECT_EQ(r.header.game_title, "TESTGAME");
    EXPECT_EQ(r.header.game_code, "ATSE");
    EXPECT_EQ(r.header.maker_code, "01");
    ASSERT_EQ(r.header.apptitle.size(), 0x12u);
    EXPECT_EQ(r.header.apptitle[0x0C], 'A');
    EXPECT_EQ(r.header.rom_version, 2);
    EXPECT_EQ(r.header.arm9.rom_offset, srltest::ARM9_OFFSET);
    EXPECT_EQ(r.header.arm9.entry_address, 0x02000800u);
    EXPECT_EQ(r.header.arm7.size, srltest::ARM7_SIZE);
    EXPECT_EQ(r.header.icon_offset, srltest::ICON_OFFSET);
    EXPECT_FALSE(r.header.extended);
    EXPECT_EQ(r.header.regionlocks, "");
}

TEST(ReaderTest, ExtendedHeaderRegionLockout) {
    const struct {
        uint8_t raw;
        const char* label;
    } cases[] = {
        { 0x00, "Normal" },
        { 0x80, "China" },
        { 0x40, "Korea" },
        { 0x01, "1" },
        { 0xC0, "192" },
    };

    for (const auto& c : cases) {
        srl::Reader r;
        Error e = parse(&r, srltest::make_container(0x03, c.raw, default_icon()));
        ASSERT_FALSE(e) << e.str();
        EXPECT_TRUE(r.header.extended);
        EXPECT_EQ(r.header.region_lockout, c.raw);
        EXPECT_EQ(r.header.regionlocks, c.label);
    }
}

TEST(ReaderTest, RegionLockoutLabels) {
    EXPECT_EQ(srl::region_lockout_str(0x80), "China");
    EXPECT_EQ(srl::region_lockout_str(0x40), "Korea");
    EXPECT_EQ(srl::region_lockout_str(0x00), "Normal");
    EXPECT_EQ(srl::region_lockout_str(0x7F), "127");
}

TEST(ReaderTest, TruncatedHeaderFails) {
    srl::Reader r;
    Error e = parse(&r, std::vector<uint8_t>(srl::HEADER_SIZE - 1, 0));
    ASSERT_TRUE(e);
    EXPECT_EQ(e.kind(), Error::BADREAD);
}

TEST(ReaderTest, TruncatedExtendedHeaderKeepsTheFieldsThatFit) {
    std::vector<uint8_t> data(srl::HEADER_SIZE + 0x100, 0);
    data[0x12] = 0x01;
    data[srl::HEADER_SIZE + 0x34] = 0x80;

    LogCapture log;
    srl::Reader r;
    Error e = parse(&r, data);
    ASSERT_FALSE(e) << e.str();
    EXPECT_EQ(r.state, srl::Reader::READY);
    EXPECT_TRUE(r.header.extended);
    EXPECT_EQ(r.header.regionlocks, "China");
    EXPECT_NE(log.out.str().find(L"extended header is truncated"), std::wstring::npos);
}

TEST(ReaderTest, MissingExtendedHeaderIsNormal) {
    std::vector<uint8_t> data(srl::HEADER_SIZE, 0);
    data[0x12] = 0x01;

    srl::Reader r;
    Error e = parse(&r, data);
    ASSERT_FALSE(e) << e.str();
    EXPECT_TRUE(r.header.extended);
    EXPECT_EQ(r.header.region_lockout, 0);
    EXPECT_EQ(r.header.regionlocks, "Normal");
    EXPECT_EQ(r.header.arm9i.size, 0u);
}

TEST(ReaderTest, DecodesIcon) {
    srl::Reader r;
    ASSERT_FALSE(parse(&r, srltest::make_container(0x00, 0, default_icon())));

    ASSERT_TRUE(r.icon.has_value());
    srl::AppTitle t = r.icon->get_app_title();
    EXPECT_EQ(t.short_desc, L"Test Game");
    EXPECT_EQ(t.long_desc, L"Test Game Deluxe");
    EXPECT_EQ(t.publisher, L"Nintendo");
    EXPECT_EQ(r.icon->get_app_title(L"Japanese").short_desc, L"テスト");
    EXPECT_EQ(r.icon->region_lock_allowed, L"ALL");
    EXPECT_EQ(r.icon->regionlocks, L"");
}

TEST(ReaderTest, IconIsOptional) {
    srl::ReaderOptions options;
    options.load_icon = false;

    srl::Reader r;
    ASSERT_FALSE(parse(&r, srltest::make_container(0x00, 0, default_icon()), options));
    EXPECT_FALSE(r.icon.has_value());
    EXPECT_EQ(r.state, srl::Reader::READY);
}

TEST(ReaderTest, ZeroIconOffsetMeansNoIcon) {
    std::vector<uint8_t> data = srltest::make_container(0x00, 0, default_icon());
    srltest::put32(data, 0x68, 0);

    LogCapture log;
    srl::Reader r;
    ASSERT_FALSE(parse(&r, data));
    EXPECT_FALSE(r.icon.has_value());
    EXPECT_FALSE(r.entries.contains("icon"));
    EXPECT_NE(log.out.str().find(L"no icon"), std::wstring::npos);
}

TEST(ReaderTest, TruncatedIconIsDroppedWithAWarning) {
    std::vector<uint8_t> data = srltest::make_container(0x00, 0, default_icon());
    data.resize(srltest::ICON_OFFSET + 0x100);

    LogCapture log;
    srl::Reader r;
    Error e = parse(&r, data);
    ASSERT_FALSE(e) << e.str();
    EXPECT_FALSE(r.icon.has_value());
    EXPECT_NE(log.out.str().find(L"[WARN ]"), std::wstring::npos);
    EXPECT_NE(log.out.str().find(L"MALFORMEDICON"), std::wstring::npos);
}

TEST(ReaderTest, UndecodableIconIsDropped) {
    std::vector<uint8_t> icon = default_icon();
    srltest::put16(icon, 0x240 + 3 * srl::TITLE_SIZE, 0xDC00);

    LogCapture log;
    srl::Reader r;
    ASSERT_FALSE(parse(&r, srltest::make_container(0x00, 0, icon)));
    EXPECT_FALSE(r.icon.has_value());
}

TEST(ReaderTest, BuildsEntryTable) {
    srl::Reader r;
    ASSERT_FALSE(parse(&r, srltest::make_container(0x01, 0, default_icon())));

    for (const char* name : { "header", "arm9", "arm7", "fat", "arm9ovt", "icon", "overlay9_0", "overlay9_1" })
        EXPECT_TRUE(r.entries.contains(name)) << name;
    EXPECT_FALSE(r.entries.contains("fnt"));
    EXPECT_FALSE(r.entries.contains("arm7ovt"));
    EXPECT_FALSE(r.entries.contains("arm9i"));
    EXPECT_EQ(r.size(), 8u);

    const srl::Entry* header = nullptr;
    ASSERT_FALSE(r.entries.resolve("header", &header));
    EXPECT_EQ(header->direct()->size, srl::HEADER_SIZE + srl::EXTENDED_HEADER_SIZE);

    const srl::Entry* plain = nullptr;
    ASSERT_FALSE(r.entries.resolve("overlay9_0", &plain));
    ASSERT_NE(plain->direct(), nullptr);
    EXPECT_EQ(plain->direct()->offset, srltest::OVERLAY0_OFFSET);

    const srl::Entry* packed = nullptr;
    ASSERT_FALSE(r.entries.resolve("overlay9_1", &packed));
    ASSERT_NE(packed->reconstructed(), nullptr);
    EXPECT_EQ(packed->reconstructed()->format, "blz");
    EXPECT_EQ(packed->reconstructed()->size, 14u);
}

TEST(ReaderTest, OpensDirectEntries) {
    srl::Reader r;
    ASSERT_FALSE(parse(&r, srltest::make_container(0x00, 0, default_icon())));

    std::vector<uint8_t> arm9 = read_entry(r, "/arm9.bin");
    ASSERT_EQ(arm9.size(), srltest::ARM9_SIZE);
    for (uint8_t b : arm9)
        EXPECT_EQ(b, 0xA9);

    EXPECT_EQ(read_entry(r, "arm9"), arm9);

    std::vector<uint8_t> overlay = read_entry(r, "overlay9_0");
    ASSERT_EQ(overlay.size(), srltest::OVERLAY0_SIZE);
    EXPECT_EQ(overlay[0], 0x50);
}

TEST(ReaderTest, ViewsStopAtTheEntrySize) {
    srl::Reader r;
    ASSERT_FALSE(parse(&r, srltest::make_container(0x00, 0, default_icon())));

    std::unique_ptr<srl::View> v;
    ASSERT_FALSE(r.open("arm7", &v));
    EXPECT_EQ(v->size(), srltest::ARM7_SIZE);

    std::vector<uint8_t> buf(0x1000, 0);
    size_t n = 0;
    ASSERT_FALSE(v->read(buf.data(), buf.size(), &n));
    EXPECT_EQ(n, srltest::ARM7_SIZE);
    EXPECT_EQ(buf[srltest::ARM7_SIZE - 1], 0xA7);
    EXPECT_EQ(buf[srltest::ARM7_SIZE], 0);
}

TEST(ReaderTest, OpensReconstructedEntries) {
    srl::Reader r;
    ASSERT_FALSE(parse(&r, srltest::make_container(0x00, 0, default_icon())));

    std::vector<uint8_t> overlay = read_entry(r, "overlay9_1.bin");
    std::string text(overlay.begin(), overlay.end());
    EXPECT_EQ(text, "ABCABCABCABCABCABCABC");
}

TEST(ReaderTest, ReconstructionNeedsARegisteredFormat) {
    srl::Reader r;
    ASSERT_FALSE(parse(&r, srltest::make_container(0x00, 0, default_icon())));
    r.reconstructors.erase("blz");

    std::unique_ptr<srl::View> v;
    Error e = r.open("overlay9_1", &v);
    EXPECT_EQ(e.kind(), Error::UNKNOWNFORMAT);
    EXPECT_EQ(v.get(), nullptr);
}

namespace {

// Upcase is a reconstructor that upper-cases the stored bytes.
struct Upcase: srl::Reconstructor {
    Error reconstruct(
            srl::Source* source,
            const srl::Entry::Reconstructed& entry,
            std::vector<uint8_t>* out) const override {
        out->resize(entry.size);
        size_t n = 0;
        CHECK(source->read_at(entry.offset, out->data(), out->size(), &n),
            Error::RECONSTRUCTFAILED);
        out->resize(n);
        for (uint8_t& b : *out)
            b = static_cast<uint8_t>(toupper(b));
        return Error();
    }
};

}

TEST(ReaderTest, ReconstructorsArePluggable) {
    srl::Reader r;
    ASSERT_FALSE(parse(&r, srltest::make_container(0x00, 0, default_icon())));
    r.register_reconstructor("upcase", std::make_unique<Upcase>());
    r.entries.add(srl::Entry{ "title", srl::Entry::Reconstructed{ "upcase", 0, 8 } });

    std::vector<uint8_t> title = read_entry(r, "title");
    EXPECT_EQ(std::string(title.begin(), title.end()), "TESTGAME");
}

TEST(ReaderTest, MissingEntryIsNotFound) {
    srl::Reader r;
    ASSERT_FALSE(parse(&r, srltest::make_container(0x00, 0, default_icon())));

    std::unique_ptr<srl::View> v;
    Error e = r.open("/nonexistent.bin", &v);
    ASSERT_TRUE(e);
    EXPECT_EQ(e.kind(), Error::NOTFOUND);
    EXPECT_EQ(v.get(), nullptr);
}

TEST(ReaderTest, BrokenOverlayTableIsIgnored) {
    std::vector<uint8_t> data = srltest::make_container(0x00, 0, default_icon());
    // Point the second overlay at a file id past the end of the FAT.
    srltest::put32(data, srltest::OVT9_OFFSET + 0x38, 9);

    LogCapture log;
    srl::Reader r;
    ASSERT_FALSE(parse(&r, data));
    EXPECT_TRUE(r.entries.contains("overlay9_0"));
    EXPECT_FALSE(r.entries.contains("overlay9_1"));
    EXPECT_NE(log.out.str().find(L"skipping overlay9_1"), std::wstring::npos);
}

TEST(ReaderTest, ViewsAreIndependentOfEachOther) {
    srl::Reader r;
    ASSERT_FALSE(parse(&r, srltest::make_container(0x00, 0, default_icon())));

    std::unique_ptr<srl::View> a;
    std::unique_ptr<srl::View> b;
    ASSERT_FALSE(r.open("arm9", &a));
    ASSERT_FALSE(r.open("arm7", &b));

    uint8_t x = 0;
    size_t n = 0;
    ASSERT_FALSE(a->seek(0x10, srl::View::SET));
    a->close();
    ASSERT_FALSE(b->read(&x, 1, &n));
    EXPECT_EQ(x, 0xA7);
    EXPECT_EQ(b->tell(), 1u);
}
