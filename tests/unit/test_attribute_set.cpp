/**
 * @file test_attribute_set.cpp
 * @brief Tests for symbolic get/set, batch updates and device transfer.
 */

#include <gtest/gtest.h>
#include <termattr/attribute_set.h>
#include <termattr/control_char.h>
#include <termattr/memory_device.h>

#include <cerrno>
#include <string>

using namespace termattr;

namespace {

class AttributeSetTest : public ::testing::Test {
protected:
    void SetUp() override {
        device_.load_cooked_defaults();
        auto fetched = AttributeSet::from_device(device_);
        ASSERT_TRUE(fetched.has_value()) << fetched.error().format();
        attrs_ = std::move(*fetched);
    }

    Value get(std::string_view name) {
        auto result = attrs_.get(name);
        EXPECT_TRUE(result.has_value()) << name;
        return result.value_or(Value{});
    }

    /// Fresh derivation from the current raw blocks, as a fetch would do.
    Assignments rederived() {
        MemoryTerminalDevice copy;
        copy.set_stored_attributes(attrs_.raw_attributes());
        if (attrs_.raw_window_size()) {
            copy.set_stored_window_size(*attrs_.raw_window_size());
        }
        AttributeSet fresh;
        EXPECT_TRUE(fresh.fetch_from(copy).has_value());
        auto all = fresh.get_all();
        EXPECT_TRUE(all.has_value());
        return all.value_or(Assignments{});
    }

    MemoryTerminalDevice device_;
    AttributeSet attrs_;
};

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Reading
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(AttributeSetTest, FetchDerivesSymbolicValues) {
    EXPECT_EQ(get("echo"), Value{true});
    EXPECT_EQ(get("icanon"), Value{true});
    EXPECT_EQ(get("ixoff"), Value{false});
    EXPECT_EQ(get("csize"), Value{std::string("cs8")});
    EXPECT_EQ(get("ispeed"), Value{std::int64_t{38400}});
    EXPECT_EQ(get("intr"), Value{std::string("^C")});
    EXPECT_EQ(get("erase"), Value{std::string("^?")});
    EXPECT_EQ(get("min"), Value{std::int64_t{1}});
    EXPECT_EQ(get("time"), Value{std::int64_t{0}});
}

TEST_F(AttributeSetTest, FetchReadsWindowSize) {
    if (!Catalog::instance().has_window_size()) {
        GTEST_SKIP() << "no window-size support";
    }
    EXPECT_EQ(get("rows"), Value{std::int64_t{24}});
    EXPECT_EQ(get("cols"), Value{std::int64_t{80}});
}

TEST_F(AttributeSetTest, GetUnknownIsUnsupported) {
    auto result = attrs_.get("bogus");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::UnsupportedAttribute);
}

TEST_F(AttributeSetTest, GetAllFollowsCatalogOrder) {
    auto all = attrs_.get_all();
    ASSERT_TRUE(all.has_value());

    const auto& entries = Catalog::instance().entries();
    ASSERT_EQ(all->size(), entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        EXPECT_EQ((*all)[i].first, entries[i].name);
    }
}

TEST_F(AttributeSetTest, ToStringListsNameValuePairs) {
    std::string text = attrs_.to_string();
    EXPECT_NE(text.find("echo=true"), std::string::npos);
    EXPECT_NE(text.find("csize=cs8"), std::string::npos);
    EXPECT_NE(text.find("intr=^C"), std::string::npos);
}

TEST(AttributeSetEmptyTest, EmptySetIsAllZero) {
    AttributeSet attrs;

    EXPECT_EQ(attrs.raw_attributes(), RawAttributes{});
    EXPECT_EQ(attrs.raw_window_size().has_value(), Catalog::instance().has_window_size());
    EXPECT_EQ(attrs.get("echo").value(), Value{false});
}

// ─────────────────────────────────────────────────────────────────────────────
// Scenario
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(AttributeSetTest, EchoIcanonCsizeSpeedScenario) {
    ASSERT_TRUE(attrs_.set("echo", false).has_value());
    ASSERT_TRUE(attrs_.set("icanon", false).has_value());
    EXPECT_EQ(get("echo"), Value{false});
    EXPECT_EQ(get("icanon"), Value{false});

    ASSERT_TRUE(attrs_.set("csize", std::string("cs7")).has_value());
    EXPECT_EQ(get("csize"), Value{std::string("cs7")});

    ASSERT_TRUE(attrs_.set("ispeed", std::int64_t{9600}).has_value());
    EXPECT_EQ(get("ispeed"), Value{std::int64_t{9600}});

    auto bad = attrs_.set("csize", std::string("cs99"));
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidValue);
    EXPECT_EQ(get("csize"), Value{std::string("cs7")});
}

// ─────────────────────────────────────────────────────────────────────────────
// Boolean Flags
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(AttributeSetTest, BooleanTouchesOnlyItsMask) {
    tcflag_t before = attrs_.raw_attributes().lflag;

    ASSERT_TRUE(attrs_.set("echo", false).has_value());
    EXPECT_EQ(attrs_.raw_attributes().lflag, before & ~static_cast<tcflag_t>(ECHO));

    ASSERT_TRUE(attrs_.set("echo", true).has_value());
    EXPECT_EQ(attrs_.raw_attributes().lflag, before);
}

TEST_F(AttributeSetTest, BooleanUsesTruthyNormalization) {
    ASSERT_TRUE(attrs_.set("ixoff", std::string("yes")).has_value());
    EXPECT_EQ(get("ixoff"), Value{true});

    ASSERT_TRUE(attrs_.set("ixoff", std::int64_t{0}).has_value());
    EXPECT_EQ(get("ixoff"), Value{false});

    ASSERT_TRUE(attrs_.set("ixoff", std::int64_t{7}).has_value());
    EXPECT_EQ(get("ixoff"), Value{true});

    ASSERT_TRUE(attrs_.set("ixoff", Value{}).has_value());
    EXPECT_EQ(get("ixoff"), Value{false});
}

TEST_F(AttributeSetTest, EveryBooleanRoundTrips) {
    for (const auto& entry : Catalog::instance().entries()) {
        if (entry.category != Category::BooleanFlag) {
            continue;
        }
        for (bool v : {true, false}) {
            ASSERT_TRUE(attrs_.set(entry.name, v).has_value()) << entry.name;
            EXPECT_EQ(get(entry.name), Value{v}) << entry.name;
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Enumerated Flags
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(AttributeSetTest, EnumeratedAcceptsRawIntegerAndReadsBackName) {
    ASSERT_TRUE(attrs_.set("csize", std::int64_t{CS6}).has_value());
    EXPECT_EQ(get("csize"), Value{std::string("cs6")});
    EXPECT_EQ(attrs_.raw_attributes().cflag & CSIZE, static_cast<tcflag_t>(CS6));
}

TEST_F(AttributeSetTest, EnumeratedPreservesOtherBits) {
    tcflag_t others = attrs_.raw_attributes().cflag & ~static_cast<tcflag_t>(CSIZE);
    ASSERT_TRUE(attrs_.set("csize", std::string("cs5")).has_value());
    EXPECT_EQ(attrs_.raw_attributes().cflag & ~static_cast<tcflag_t>(CSIZE), others);
}

TEST_F(AttributeSetTest, EveryEnumeratedMemberRoundTrips) {
    for (const auto& entry : Catalog::instance().entries()) {
        if (entry.category != Category::EnumeratedFlag) {
            continue;
        }
        for (const auto& member : entry.members) {
            ASSERT_TRUE(attrs_.set(entry.name, member.name).has_value()) << member.name;
            EXPECT_EQ(get(entry.name), Value{member.name});
        }
    }
}

TEST_F(AttributeSetTest, EnumeratedRejectsNonMembers) {
    auto by_int = attrs_.set("csize", std::int64_t{0x7FFFFFFF});
    ASSERT_FALSE(by_int.has_value());
    EXPECT_EQ(by_int.error().code(), ErrorCode::InvalidValue);

    auto negative = attrs_.set("csize", std::int64_t{-1});
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code(), ErrorCode::InvalidValue);

    auto wrong_type = attrs_.set("csize", true);
    ASSERT_FALSE(wrong_type.has_value());
    EXPECT_EQ(wrong_type.error().code(), ErrorCode::InvalidType);
}

// ─────────────────────────────────────────────────────────────────────────────
// Speeds
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(AttributeSetTest, EverySupportedSpeedRoundTrips) {
    for (const auto& baud : Catalog::instance().baud_rates()) {
        ASSERT_TRUE(attrs_.set("ospeed", baud.rate).has_value()) << baud.rate;
        EXPECT_EQ(get("ospeed"), Value{baud.rate});
        EXPECT_EQ(attrs_.raw_attributes().ospeed, baud.code);
    }
}

TEST_F(AttributeSetTest, SpeedRejectsUnsupportedRate) {
    auto result = attrs_.set("ispeed", std::int64_t{12345});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidValue);
    EXPECT_EQ(get("ispeed"), Value{std::int64_t{38400}});
}

TEST_F(AttributeSetTest, SpeedRejectsNonInteger) {
    auto result = attrs_.set("ispeed", std::string("9600"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidType);
}

// ─────────────────────────────────────────────────────────────────────────────
// Control Characters
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(AttributeSetTest, ControlCharacterForms) {
    ASSERT_TRUE(attrs_.set("intr", std::string("^x")).has_value());
    EXPECT_EQ(get("intr"), Value{std::string("^X")});
    EXPECT_EQ(attrs_.raw_attributes().cc[VINTR], control_char('X'));

    ASSERT_TRUE(attrs_.set("intr", std::string("q")).has_value());
    EXPECT_EQ(attrs_.raw_attributes().cc[VINTR], 'q');

    ASSERT_TRUE(attrs_.set("intr", std::byte{3}).has_value());
    EXPECT_EQ(get("intr"), Value{std::string("^C")});

    ASSERT_TRUE(attrs_.set("intr", std::string("undef")).has_value());
    EXPECT_EQ(attrs_.raw_attributes().cc[VINTR], kDisabledChar);
    EXPECT_EQ(get("intr"), Value{std::string("undef")});

    ASSERT_TRUE(attrs_.set("quit", std::string("^-")).has_value());
    EXPECT_EQ(get("quit"), Value{std::string("undef")});
}

TEST_F(AttributeSetTest, ControlCharacterRejectsBadShapes) {
    auto bad_text = attrs_.set("intr", std::string("^C^C"));
    ASSERT_FALSE(bad_text.has_value());
    EXPECT_EQ(bad_text.error().code(), ErrorCode::InvalidValue);

    auto bad_type = attrs_.set("intr", std::int64_t{3});
    ASSERT_FALSE(bad_type.has_value());
    EXPECT_EQ(bad_type.error().code(), ErrorCode::InvalidType);

    EXPECT_EQ(get("intr"), Value{std::string("^C")});
}

// ─────────────────────────────────────────────────────────────────────────────
// Non-canonical Counts
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(AttributeSetTest, CountsAcceptByteRange) {
    ASSERT_TRUE(attrs_.set("min", std::int64_t{0}).has_value());
    EXPECT_EQ(get("min"), Value{std::int64_t{0}});

    ASSERT_TRUE(attrs_.set("time", std::int64_t{255}).has_value());
    EXPECT_EQ(get("time"), Value{std::int64_t{255}});
    EXPECT_EQ(attrs_.raw_attributes().cc[VTIME], 255);
}

TEST_F(AttributeSetTest, CountsRejectOutOfRange) {
    for (std::int64_t bad : {std::int64_t{-1}, std::int64_t{256}, std::int64_t{100000}}) {
        auto result = attrs_.set("min", bad);
        ASSERT_FALSE(result.has_value()) << bad;
        EXPECT_EQ(result.error().code(), ErrorCode::InvalidValue);
    }
    EXPECT_EQ(get("min"), Value{std::int64_t{1}});
}

TEST_F(AttributeSetTest, CountsRejectNonInteger) {
    auto result = attrs_.set("time", std::string("5"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidType);
}

// ─────────────────────────────────────────────────────────────────────────────
// Window Dimensions
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(AttributeSetTest, WindowDimensions) {
    if (!Catalog::instance().has_window_size()) {
        GTEST_SKIP() << "no window-size support";
    }

    ASSERT_TRUE(attrs_.set("rows", std::int64_t{50}).has_value());
    ASSERT_TRUE(attrs_.set("cols", std::int64_t{132}).has_value());
    EXPECT_EQ(attrs_.raw_window_size()->rows, 50);
    EXPECT_EQ(attrs_.raw_window_size()->cols, 132);

    auto negative = attrs_.set("rows", std::int64_t{-3});
    ASSERT_FALSE(negative.has_value());
    EXPECT_EQ(negative.error().code(), ErrorCode::InvalidValue);

    auto huge = attrs_.set("cols", std::int64_t{70000});
    ASSERT_FALSE(huge.has_value());
    EXPECT_EQ(huge.error().code(), ErrorCode::InvalidValue);

    auto text = attrs_.set("cols", std::string("80"));
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().code(), ErrorCode::InvalidType);

    EXPECT_EQ(get("rows"), Value{std::int64_t{50}});
    EXPECT_EQ(get("cols"), Value{std::int64_t{132}});
}

// ─────────────────────────────────────────────────────────────────────────────
// Failure Atomicity and Consistency
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(AttributeSetTest, SetUnknownIsUnsupportedAndChangesNothing) {
    AttributeSet before = attrs_;
    auto result = attrs_.set("bogus", true);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::UnsupportedAttribute);
    EXPECT_EQ(attrs_, before);
}

TEST_F(AttributeSetTest, FailedSetLeavesSetUnchanged) {
    AttributeSet before = attrs_;

    EXPECT_FALSE(attrs_.set("csize", std::string("cs99")).has_value());
    EXPECT_FALSE(attrs_.set("ispeed", std::int64_t{7}).has_value());
    EXPECT_FALSE(attrs_.set("intr", std::string("^^^")).has_value());
    EXPECT_FALSE(attrs_.set("min", std::int64_t{-1}).has_value());

    EXPECT_EQ(attrs_, before);
}

TEST_F(AttributeSetTest, LiveValuesMatchFreshDerivation) {
    ASSERT_TRUE(attrs_.set("echo", false).has_value());
    ASSERT_TRUE(attrs_.set("csize", std::string("cs7")).has_value());
    ASSERT_TRUE(attrs_.set("parenb", true).has_value());
    ASSERT_TRUE(attrs_.set("ospeed", std::int64_t{115200}).has_value());
    ASSERT_TRUE(attrs_.set("kill", std::string("^K")).has_value());
    ASSERT_TRUE(attrs_.set("time", std::int64_t{10}).has_value());

    auto live = attrs_.get_all();
    ASSERT_TRUE(live.has_value());
    EXPECT_EQ(*live, rederived());
}

// ─────────────────────────────────────────────────────────────────────────────
// set_many
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(AttributeSetTest, SetManyAppliesInOrder) {
    Assignments changes{
        {"echo", false},
        {"csize", std::string("cs7")},
        {"csize", std::string("cs6")},
    };
    ASSERT_TRUE(attrs_.set_many(changes).has_value());

    EXPECT_EQ(get("echo"), Value{false});
    EXPECT_EQ(get("csize"), Value{std::string("cs6")});
}

TEST_F(AttributeSetTest, SetManyWithUnknownNameChangesNothing) {
    AttributeSet before = attrs_;
    Assignments changes{{"echo", false}, {"bogus", std::int64_t{1}}, {"nonsense", true}};

    auto result = attrs_.set_many(changes);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::UnsupportedAttribute);
    EXPECT_NE(result.error().message().find("bogus"), std::string::npos);
    EXPECT_NE(result.error().message().find("nonsense"), std::string::npos);
    EXPECT_EQ(attrs_, before);
    EXPECT_EQ(get("echo"), Value{true});
}

TEST_F(AttributeSetTest, SetManyWithInvalidValueChangesNothing) {
    AttributeSet before = attrs_;
    Assignments changes{{"echo", false}, {"csize", std::string("cs99")}};

    auto result = attrs_.set_many(changes);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidValue);
    EXPECT_EQ(attrs_, before);
}

TEST_F(AttributeSetTest, SetManyEmptyIsNoOp) {
    AttributeSet before = attrs_;
    ASSERT_TRUE(attrs_.set_many({}).has_value());
    EXPECT_EQ(attrs_, before);
}

// ─────────────────────────────────────────────────────────────────────────────
// Device Transfer
// ─────────────────────────────────────────────────────────────────────────────

TEST_F(AttributeSetTest, ApplyWritesRawBlockWithTiming) {
    ASSERT_TRUE(attrs_.set("echo", false).has_value());

    ApplyOptions options;
    options.when = ApplyTiming::Drain;
    ASSERT_TRUE(attrs_.apply_to(device_, options).has_value());

    EXPECT_EQ(device_.attributes(), attrs_.raw_attributes());
    ASSERT_TRUE(device_.last_timing().has_value());
    EXPECT_EQ(*device_.last_timing(), ApplyTiming::Drain);
    EXPECT_EQ(device_.set_attributes_count(), 1u);
}

TEST_F(AttributeSetTest, ApplyWindowSizeOnly) {
    if (!Catalog::instance().has_window_size()) {
        GTEST_SKIP() << "no window-size support";
    }
    ASSERT_TRUE(attrs_.set("rows", std::int64_t{40}).has_value());

    ApplyOptions options;
    options.apply_attributes = false;
    ASSERT_TRUE(attrs_.apply_to(device_, options).has_value());

    EXPECT_EQ(device_.set_attributes_count(), 0u);
    EXPECT_EQ(device_.set_window_size_count(), 1u);
    EXPECT_EQ(device_.window_size().rows, 40);
}

TEST_F(AttributeSetTest, ApplyAttributesOnly) {
    ApplyOptions options;
    options.apply_window_size = false;
    ASSERT_TRUE(attrs_.apply_to(device_, options).has_value());

    EXPECT_EQ(device_.set_attributes_count(), 1u);
    EXPECT_EQ(device_.set_window_size_count(), 0u);
}

TEST_F(AttributeSetTest, ApplyPropagatesDeviceError) {
    device_.fail_next_call(EIO);
    auto result = attrs_.apply_to(device_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::DeviceError);
    EXPECT_EQ(result.error().native_errno(), EIO);
}

TEST_F(AttributeSetTest, FailedFetchLeavesSetUnchanged) {
    ASSERT_TRUE(attrs_.set("echo", false).has_value());
    AttributeSet before = attrs_;

    device_.fail_next_call(ENOTTY);
    auto result = attrs_.fetch_from(device_);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().native_errno(), ENOTTY);
    EXPECT_EQ(attrs_, before);
}

TEST_F(AttributeSetTest, FromDeviceAppliesInitialOptions) {
    auto attrs = AttributeSet::from_device(device_, {{"echo", false}, {"min", std::int64_t{4}}});
    ASSERT_TRUE(attrs.has_value());

    EXPECT_EQ(attrs->get("echo").value(), Value{false});
    EXPECT_EQ(attrs->get("min").value(), Value{std::int64_t{4}});
    EXPECT_EQ(attrs->get("icanon").value(), Value{true});
}

TEST_F(AttributeSetTest, FromDeviceRejectsUnknownInitialOption) {
    auto attrs = AttributeSet::from_device(device_, {{"bogus", true}});
    ASSERT_FALSE(attrs.has_value());
    EXPECT_EQ(attrs.error().code(), ErrorCode::UnsupportedAttribute);
}
