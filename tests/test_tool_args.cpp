#include <gtest/gtest.h>
#include <mcp/tool_args.hpp>

TEST(ToolArgs, IntegerForms) {
    json args = {{"a", 42}, {"b", -7}, {"c", 12.9}, {"d", "200"}};
    EXPECT_EQ(optional_int(args, "a").value, std::optional<int>(42));
    EXPECT_EQ(optional_int(args, "b").value, std::optional<int>(-7));
    EXPECT_EQ(optional_int(args, "c").value, std::optional<int>(12));
    EXPECT_EQ(optional_int(args, "d").value, std::optional<int>(200));
    EXPECT_FALSE(optional_int(args, "missing").value.has_value());
}

TEST(ToolArgs, OutOfRangeIntegersAreRejected) {
    json args = {
        {"wraps", 4294967346LL},
        {"huge_unsigned", 18446744073709551615ULL},
        {"very_negative", -4294967296LL},
        {"huge_double", 1e300},
        {"tiny_double", -1e300},
        {"long_string", "99999999999"},
    };
    for (const char* key : {"wraps", "huge_unsigned", "very_negative", "huge_double",
                            "tiny_double", "long_string"}) {
        auto r = optional_int(args, key);
        EXPECT_TRUE(r.is_err()) << key;
        EXPECT_NE(r.error.find("must be a number"), std::string::npos) << key;
    }
}

TEST(ToolArgs, IntegerLimits) {
    json args = {{"max", INT_MAX}, {"min", INT_MIN}};
    EXPECT_EQ(optional_int(args, "max").value, std::optional<int>(INT_MAX));
    EXPECT_EQ(optional_int(args, "min").value, std::optional<int>(INT_MIN));
}

TEST(ToolArgs, NonNumbersAreRejected) {
    json args = {{"s", "12abc"}, {"b", true}, {"o", json::object()}};
    EXPECT_TRUE(optional_int(args, "s").is_err());
    EXPECT_TRUE(optional_int(args, "b").is_err());
    EXPECT_TRUE(optional_int(args, "o").is_err());
}

TEST(ToolArgs, RequiredStrings) {
    json args = {{"name", "main"}, {"n", 3}};
    EXPECT_EQ(require_string(args, "name").value, "main");
    EXPECT_TRUE(require_string(args, "n").is_err());
    EXPECT_EQ(require_string(args, "gone").error, "Missing required argument 'gone'");
}
