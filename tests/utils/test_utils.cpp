#include <gtest/gtest.h>

#include <cmath>

#include "../../src/utils/errors.hpp"
#include "../../src/utils/utils.hpp"

TEST(UtilsTest, FormatFloatMatchesShortestRepr) {
    EXPECT_EQ(utils::FormatFloat(0.004), "0.004");
    EXPECT_EQ(utils::FormatFloat(1.0), "1.0");
    EXPECT_EQ(utils::FormatFloat(100.0), "100.0");
    EXPECT_EQ(utils::FormatFloat(0.0), "0.0");
    EXPECT_EQ(utils::FormatFloat(-0.0), "-0.0");
    EXPECT_EQ(utils::FormatFloat(12.345), "12.345");
    EXPECT_EQ(utils::FormatFloat(0.0001), "0.0001");
    EXPECT_EQ(utils::FormatFloat(0.00001), "1e-05");
    EXPECT_EQ(utils::FormatFloat(1e15), "1000000000000000.0");
    EXPECT_EQ(utils::FormatFloat(1e16), "1e+16");
    EXPECT_EQ(utils::FormatFloat(1.5e300), "1.5e+300");
    EXPECT_EQ(utils::FormatFloat(INFINITY), "inf");
    EXPECT_EQ(utils::FormatFloat(NAN), "nan");
}

TEST(UtilsTest, ParseInt) {
    EXPECT_EQ(utils::ParseInt("42"), 42);
    EXPECT_EQ(utils::ParseInt(" 42 "), 42);
    EXPECT_EQ(utils::ParseInt("+7"), 7);
    EXPECT_EQ(utils::ParseInt("-3"), -3);
    EXPECT_EQ(utils::ParseInt("0042"), 42);
    EXPECT_FALSE(utils::ParseInt("-"));
    EXPECT_FALSE(utils::ParseInt(""));
    EXPECT_FALSE(utils::ParseInt("4x"));
    EXPECT_FALSE(utils::ParseInt("1.5"));
    EXPECT_FALSE(utils::ParseInt("99999999999999999999"));
}

TEST(UtilsTest, ParseFloat) {
    EXPECT_EQ(utils::ParseFloat("0.004"), 0.004);
    EXPECT_EQ(utils::ParseFloat("1"), 1.0);
    EXPECT_EQ(utils::ParseFloat("1e3"), 1000.0);
    EXPECT_EQ(utils::ParseFloat("-inf"), -INFINITY);
    auto nan = utils::ParseFloat("nan");
    ASSERT_TRUE(nan.has_value());
    EXPECT_TRUE(std::isnan(*nan));
    EXPECT_FALSE(utils::ParseFloat("-"));
    EXPECT_FALSE(utils::ParseFloat("abc"));
    EXPECT_FALSE(utils::ParseFloat("0x10"));
    EXPECT_FALSE(utils::ParseFloat("0.1,0.2"));
}

TEST(UtilsTest, SanitizeUtf8) {
    EXPECT_EQ(utils::SanitizeUtf8("plain"), "plain");
    EXPECT_EQ(utils::SanitizeUtf8("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(utils::SanitizeUtf8("\xFF"), "\xEF\xBF\xBD");
    EXPECT_EQ(utils::SanitizeUtf8("a\xE2\x82"), "a\xEF\xBF\xBD");
    EXPECT_EQ(utils::SanitizeUtf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(UtilsTest, PercentDecode) {
    EXPECT_EQ(utils::PercentDecode("a%20b"), "a b");
    EXPECT_EQ(utils::PercentDecode("%zz"), "%zz");
    EXPECT_EQ(utils::PercentDecode("50%"), "50%");
    EXPECT_EQ(utils::PercentDecode("%4"), "%4");
}

TEST(UtilsTest, SplitWhitespace) {
    EXPECT_EQ(utils::SplitWhitespace("  GET\t/ HTTP/1.1 "),
              (std::vector<std::string>{"GET", "/", "HTTP/1.1"}));
    EXPECT_TRUE(utils::SplitWhitespace("   ").empty());
}

TEST(UtilsTest, ExitCodes) {
    EXPECT_EQ(ExitCode(Err::Ok), 0);
    EXPECT_EQ(ExitCode(Err::InvalidArguments), 2);
    EXPECT_EQ(ExitCode(Err::FileNotFound), 2);
    EXPECT_EQ(ExitCode(Err::UnknownConfigOption), 2);
    EXPECT_EQ(ExitCode(Err::MalformedLine), 3);
    EXPECT_EQ(ExitCode(Err::OutputWriteFailed), 1);
    EXPECT_EQ(ExitCode(Err::PrivilegedUser), 1);
}
