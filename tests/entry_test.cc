#include <gtest/gtest.h>

#include "srl/entry.hh"

TEST(EntryTest, NormalizesLeadingSeparatorAndSuffix) {
    EXPECT_EQ(srl::normalize_path("/arm9.bin"), "arm9");
    EXPECT_EQ(srl::normalize_path("arm9"), "arm9");
    EXPECT_EQ(srl::normalize_path("/icon.BIN"), "icon");
    EXPECT_EQ(srl::normalize_path("overlay9_12.bin"), "overlay9_12");
    EXPECT_EQ(srl::normalize_path("/foo.bin"), srl::normalize_path("foo"));
}

TEST(EntryTest, NormalizationIsIdempotent) {
    const char* paths[] = {
        "", "/", "//a", "a.bin", "/a.bin.bin", ".bin", "/x/.bin", "arm7i", "banner.Bin",
    };

    for (const char* p : paths) {
        std::string once = srl::normalize_path(p);
        EXPECT_EQ(srl::normalize_path(once), once) << "path " << p;
    }
}

TEST(EntryTest, ResolvesNormalizedNames) {
    srl::EntryTable t;
    t.add(srl::Entry{ "arm9", srl::Entry::Direct{ 0x4000, 0x100 } });
    t.add(srl::Entry{ "overlay9_1", srl::Entry::Reconstructed{ "blz", 0x8000, 0x40 } });

    const srl::Entry* e = nullptr;
    ASSERT_FALSE(t.resolve("/arm9.bin", &e));
    ASSERT_NE(e->direct(), nullptr);
    EXPECT_EQ(e->direct()->offset, 0x4000u);
    EXPECT_EQ(e->direct()->size, 0x100u);

    ASSERT_FALSE(t.resolve("overlay9_1", &e));
    ASSERT_NE(e->reconstructed(), nullptr);
    EXPECT_EQ(e->reconstructed()->format, "blz");
    EXPECT_EQ(t.size(), 2u);
}

TEST(EntryTest, MissingEntryIsNotFound) {
    srl::EntryTable t;
    t.add(srl::Entry{ "arm9", srl::Entry::Direct{ 0, 1 } });

    const srl::Entry* e = nullptr;
    Error err = t.resolve("arm7", &e);
    ASSERT_TRUE(err);
    EXPECT_EQ(err.kind(), Error::NOTFOUND);
    EXPECT_EQ(e, nullptr);

    // Without normalization the spelled-out name does not match.
    EXPECT_TRUE(t.resolve("/arm9.bin", &e, false).is(Error::NOTFOUND));
    EXPECT_FALSE(t.resolve("arm9", &e, false));
}
