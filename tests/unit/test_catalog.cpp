/**
 * @file test_catalog.cpp
 * @brief Tests for the platform-probed attribute catalog.
 */

#include <gtest/gtest.h>
#include <termattr/catalog.h>

#include <algorithm>
#include <set>
#include <string>

using namespace termattr;

namespace {

class CatalogTest : public ::testing::Test {
protected:
    const Catalog& catalog_ = Catalog::instance();

    const CatalogEntry& entry(std::string_view name) {
        auto result = catalog_.resolve(name);
        EXPECT_TRUE(result.has_value()) << name;
        return **result;
    }
};

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Resolution
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(CatalogTest, ResolvesKnownNames) {
    EXPECT_TRUE(catalog_.contains("echo"));
    EXPECT_TRUE(catalog_.contains("icanon"));
    EXPECT_TRUE(catalog_.contains("csize"));
    EXPECT_TRUE(catalog_.contains("ispeed"));
    EXPECT_TRUE(catalog_.contains("intr"));
    EXPECT_TRUE(catalog_.contains("min"));
}

TEST_F(CatalogTest, UnknownNameIsUnsupportedAttribute) {
    auto result = catalog_.resolve("bogus");

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::UnsupportedAttribute);
    EXPECT_NE(result.error().message().find("bogus"), std::string::npos);
    EXPECT_FALSE(catalog_.contains("bogus"));
}

TEST_F(CatalogTest, LooksUpNamesInsideLargerText) {
    std::string_view token = "echo=on";
    std::string_view name = token.substr(0, 4);

    EXPECT_TRUE(catalog_.contains(name));
    auto entry = catalog_.resolve(name);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ((*entry)->name, "echo");

    EXPECT_FALSE(catalog_.contains(token.substr(0, 3)));
}

TEST_F(CatalogTest, NamesAreUnique) {
    auto names = catalog_.names();
    std::set<std::string> unique(names.begin(), names.end());
    EXPECT_EQ(unique.size(), names.size());
    EXPECT_EQ(names.size(), catalog_.entries().size());
}

TEST_F(CatalogTest, InstanceIsStable) {
    EXPECT_EQ(&Catalog::instance(), &catalog_);
}

TEST_F(CatalogTest, ProbeMatchesInstance) {
    Catalog fresh = Catalog::probe();
    EXPECT_EQ(fresh.names(), catalog_.names());
}

// ─────────────────────────────────────────────────────────────────────────────
// Entry Descriptions
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(CatalogTest, BooleanEntryDescribesMask) {
    const auto& echo = entry("echo");
    EXPECT_EQ(echo.category, Category::BooleanFlag);
    EXPECT_EQ(echo.field, FieldSelector::LocalFlags);
    EXPECT_EQ(echo.mask, static_cast<tcflag_t>(ECHO));

    const auto& icrnl = entry("icrnl");
    EXPECT_EQ(icrnl.field, FieldSelector::InputFlags);
    EXPECT_EQ(icrnl.mask, static_cast<tcflag_t>(ICRNL));
}

TEST_F(CatalogTest, CsizeHasCharacterSizeMembers) {
    const auto& csize = entry("csize");
    EXPECT_EQ(csize.category, Category::EnumeratedFlag);
    EXPECT_EQ(csize.field, FieldSelector::ControlFlags);
    EXPECT_EQ(csize.mask, static_cast<tcflag_t>(CSIZE));

    ASSERT_NE(csize.find_member("cs8"), nullptr);
    EXPECT_EQ(csize.find_member("cs8")->raw, static_cast<tcflag_t>(CS8));
    ASSERT_NE(csize.find_member(static_cast<tcflag_t>(CS7)), nullptr);
    EXPECT_EQ(csize.find_member(static_cast<tcflag_t>(CS7))->name, "cs7");
    EXPECT_EQ(csize.find_member("cs99"), nullptr);
}

TEST_F(CatalogTest, EnumeratedMembersFitTheirMask) {
    for (const auto& e : catalog_.entries()) {
        if (e.category != Category::EnumeratedFlag) {
            continue;
        }
        EXPECT_FALSE(e.members.empty()) << e.name;
        std::set<tcflag_t> raws;
        for (const auto& member : e.members) {
            EXPECT_EQ(member.raw & ~e.mask, 0u) << e.name << "/" << member.name;
            raws.insert(member.raw);
        }
        EXPECT_EQ(raws.size(), e.members.size()) << e.name << " value table is not injective";
    }
}

TEST_F(CatalogTest, ControlCharacterIndexMatchesConstant) {
    const auto& intr = entry("intr");
    EXPECT_EQ(intr.category, Category::ControlCharacter);
    EXPECT_EQ(intr.index, static_cast<std::size_t>(VINTR));

    EXPECT_EQ(entry("min").category, Category::NonCanonicalCount);
    EXPECT_EQ(entry("min").index, static_cast<std::size_t>(VMIN));
    EXPECT_EQ(entry("time").index, static_cast<std::size_t>(VTIME));
}

TEST_F(CatalogTest, IndicesStayInsideControlCharArray) {
    for (const auto& e : catalog_.entries()) {
        if (e.category == Category::ControlCharacter || e.category == Category::NonCanonicalCount) {
            EXPECT_LT(e.index, kControlCharCount) << e.name;
        }
    }
}

TEST_F(CatalogTest, WindowGroupIsAllOrNothing) {
    bool rows = catalog_.contains("rows");
    bool cols = catalog_.contains("cols");
    EXPECT_EQ(rows, cols);
    EXPECT_EQ(rows, catalog_.has_window_size());
    EXPECT_EQ(catalog_.has_window_size(), kHaveWindowSize);
}

// ─────────────────────────────────────────────────────────────────────────────
// Ordering and Introspection
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(CatalogTest, CategoriesAppearInListingOrder) {
    auto rank = [](Category c) {
        switch (c) {
            case Category::BooleanFlag:       return 0;
            case Category::EnumeratedFlag:    return 1;
            case Category::Speed:             return 2;
            case Category::ControlCharacter:  return 3;
            case Category::NonCanonicalCount: return 4;
            case Category::WindowDimension:   return 5;
        }
        return 6;
    };

    const auto& entries = catalog_.entries();
    EXPECT_TRUE(std::is_sorted(entries.begin(), entries.end(),
                               [&](const CatalogEntry& a, const CatalogEntry& b) {
                                   return rank(a.category) < rank(b.category);
                               }));
}

TEST_F(CatalogTest, NamesByCategory) {
    auto speeds = catalog_.names(Category::Speed);
    ASSERT_EQ(speeds.size(), 2u);
    EXPECT_EQ(speeds[0], "ispeed");
    EXPECT_EQ(speeds[1], "ospeed");

    auto counts = catalog_.names(Category::NonCanonicalCount);
    EXPECT_EQ(counts, (std::vector<std::string>{"min", "time"}));
}

TEST_F(CatalogTest, BooleanNamesPerWord) {
    auto local = catalog_.boolean_names(FieldSelector::LocalFlags);
    EXPECT_NE(std::find(local.begin(), local.end(), "echo"), local.end());
    EXPECT_NE(std::find(local.begin(), local.end(), "icanon"), local.end());
    EXPECT_EQ(std::find(local.begin(), local.end(), "icrnl"), local.end());

    auto input = catalog_.boolean_names(FieldSelector::InputFlags);
    EXPECT_NE(std::find(input.begin(), input.end(), "icrnl"), input.end());
}

// ─────────────────────────────────────────────────────────────────────────────
// Speeds
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(CatalogTest, BaudRatesAscending) {
    const auto& rates = catalog_.baud_rates();
    ASSERT_FALSE(rates.empty());
    EXPECT_TRUE(std::is_sorted(rates.begin(), rates.end(),
                               [](const BaudRate& a, const BaudRate& b) { return a.rate < b.rate; }));
}

TEST_F(CatalogTest, EncodeDecodeSpeed) {
    auto code = catalog_.encode_speed(9600);
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, static_cast<speed_t>(B9600));

    auto rate = catalog_.decode_speed(B38400);
    ASSERT_TRUE(rate.has_value());
    EXPECT_EQ(*rate, 38400);
}

TEST_F(CatalogTest, UnsupportedSpeedHasNoEncoding) {
    EXPECT_FALSE(catalog_.encode_speed(12345).has_value());
    EXPECT_FALSE(catalog_.encode_speed(-1).has_value());
}

// ─────────────────────────────────────────────────────────────────────────────
// Enum Names
// ─────────────────────────────────────────────────────────────────────────────

TEST(CatalogEnumTest, CategoryAndFieldNames) {
    EXPECT_STREQ(to_string(Category::EnumeratedFlag), "enumerated-flag");
    EXPECT_STREQ(to_string(Category::WindowDimension), "window-dimension");
    EXPECT_STREQ(to_string(FieldSelector::LocalFlags), "lflag");
    EXPECT_STREQ(to_string(FieldSelector::ControlChars), "cc");
}
