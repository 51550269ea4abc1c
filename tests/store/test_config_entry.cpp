#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "yconf/store/config_entry.hpp"

namespace yconf::store::test {

using type::Scalar;
using type::ScalarKind;
using type::ScalarStyle;

class ConfigEntryTest : public ::testing::Test {
protected:
    void SetUp() override {
        mixed = std::make_unique<ConfigEntry>(
            "mixed",
            std::vector<Scalar>{plain("1"),
                                Scalar("two", ScalarStyle::DoubleQuoted),
                                plain("3")},
            "", EntryOrigin::Parsed);
    }

    static auto plain(const std::string& text) -> Scalar {
        return {text, ScalarStyle::Plain};
    }

    std::unique_ptr<ConfigEntry> mixed;
};

TEST_F(ConfigEntryTest, ScalarEntry) {
    ConfigEntry entry("a%b", plain("42"), "answer");
    EXPECT_EQ(entry.path(), "a%b");
    EXPECT_EQ(entry.description(), "answer");
    EXPECT_EQ(entry.origin(), EntryOrigin::Api);
    EXPECT_FALSE(entry.is_array());
    EXPECT_EQ(entry.size(), 1U);
    EXPECT_EQ(entry.kind(), ScalarKind::Integer);
    EXPECT_EQ(entry.as<int>(), 42);
    EXPECT_EQ(entry.element_as<int>(0), 42);
    EXPECT_THROW((void)entry.as_array<int>(), error::TypeError);
}

TEST_F(ConfigEntryTest, HeterogeneousArrayReadsLazily) {
    EXPECT_TRUE(mixed->is_array());
    EXPECT_EQ(mixed->size(), 3U);
    EXPECT_FALSE(mixed->is_homogeneous());
    EXPECT_EQ(mixed->element_as<int>(0), 1);
    EXPECT_EQ(mixed->element_as<std::string>(1), "two");
    EXPECT_THROW((void)mixed->element_as<int>(1), error::TypeError);
    EXPECT_THROW((void)mixed->as_array<int>(), error::TypeError);
    EXPECT_THROW((void)mixed->kind(), error::TypeError);
    EXPECT_THROW((void)mixed->value(), error::TypeError);
}

TEST_F(ConfigEntryTest, OutOfBoundsElement) {
    try {
        (void)mixed->element(3);
        FAIL() << "expected a BoundsError";
    } catch (const error::BoundsError& e) {
        EXPECT_EQ(e.code(), error::ErrorCode::OutOfBounds);
    }
}

TEST_F(ConfigEntryTest, TypeErrorNamesThePath) {
    try {
        (void)mixed->element_as<int>(1);
        FAIL() << "expected a TypeError";
    } catch (const error::TypeError& e) {
        EXPECT_NE(e.getMessage().find("mixed"), std::string::npos);
    }
}

TEST_F(ConfigEntryTest, EmptyArrayReportsNull) {
    ConfigEntry entry("empty", std::vector<Scalar>{});
    EXPECT_EQ(entry.size(), 0U);
    EXPECT_EQ(entry.kind(), ScalarKind::Null);
    EXPECT_TRUE(entry.as_array<int>().empty());
}

TEST_F(ConfigEntryTest, AssignKeepsKind) {
    ConfigEntry entry("n", plain("1"));
    entry.assign(Scalar::from(5));
    EXPECT_EQ(entry.as<int>(), 5);
    EXPECT_THROW(entry.assign(Scalar::from(std::string("x"))),
                 error::TypeError);
    EXPECT_THROW(entry.assign(Scalar::from(1.5)), error::TypeError);
    EXPECT_THROW(entry.assign(std::vector<Scalar>{plain("1")}),
                 error::TypeError);
}

TEST_F(ConfigEntryTest, IntegerMayReplaceReal) {
    ConfigEntry entry("r", plain("1.5"));
    entry.assign(Scalar::from(2));
    EXPECT_EQ(entry.kind(), ScalarKind::Real);
    EXPECT_DOUBLE_EQ(entry.as<double>(), 2.0);
}

TEST_F(ConfigEntryTest, NullTakesAnyKind) {
    ConfigEntry entry("n", plain("~"));
    entry.assign(Scalar::from(std::string("now a string")));
    EXPECT_EQ(entry.as<std::string>(), "now a string");
}

TEST_F(ConfigEntryTest, ArrayAssignmentMayChangeLength) {
    ConfigEntry entry("a", std::vector<Scalar>{plain("1"), plain("2")});
    entry.assign(std::vector<Scalar>{plain("3"), plain("4"), plain("5")});
    EXPECT_EQ(entry.as_array<int>(), (std::vector<int>{3, 4, 5}));
    EXPECT_THROW(entry.assign(std::vector<Scalar>{plain("x")}),
                 error::TypeError);
    EXPECT_THROW(entry.assign(plain("1")), error::TypeError);

    mixed->assign(std::vector<Scalar>{plain("true")});
    EXPECT_TRUE(mixed->element_as<bool>(0));
}

TEST_F(ConfigEntryTest, SameValue) {
    ConfigEntry lhs("a", plain("0x10"));
    ConfigEntry rhs("a", plain("16"));
    EXPECT_TRUE(lhs.same_value(rhs));
    ConfigEntry array("a", std::vector<Scalar>{plain("16")});
    EXPECT_FALSE(lhs.same_value(array));
    EXPECT_EQ(to_string(EntryOrigin::Parsed), "parsed");
}

}  // namespace yconf::store::test
