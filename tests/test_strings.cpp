#include <gtest/gtest.h>
#include "common/util/strings.h"

class StringsTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(StringsTest, BeginsWith) {
    EXPECT_TRUE(Strings::BeginsWith("upload notes.txt 12", "upload "));
    EXPECT_TRUE(Strings::BeginsWith("abc", ""));
    EXPECT_FALSE(Strings::BeginsWith("upload", "upload "));
    EXPECT_FALSE(Strings::BeginsWith("", "x"));
}

TEST_F(StringsTest, Contains) {
    EXPECT_TRUE(Strings::Contains("Executing: ls\r\n$ ", "ls"));
    EXPECT_FALSE(Strings::Contains("ls", "Executing"));
}

TEST_F(StringsTest, Trim_RemovesLineEndings) {
    std::string s1 = "  ls -la\r\n";
    EXPECT_EQ(Strings::Trim(s1), "ls -la");

    std::string s2 = "\t\n";
    EXPECT_EQ(Strings::Trim(s2), "");

    std::string s3 = "exit";
    EXPECT_EQ(Strings::Trim(s3), "exit");
}

TEST_F(StringsTest, LTrimAndRTrim) {
    std::string left = "  value  ";
    EXPECT_EQ(Strings::LTrim(left), "value  ");

    std::string right = "  value  ";
    EXPECT_EQ(Strings::RTrim(right), "  value");
}

TEST_F(StringsTest, ToLower) {
    EXPECT_EQ(Strings::ToLower("EXIT"), "exit");
    EXPECT_EQ(Strings::ToLower("MixedCase 123"), "mixedcase 123");
}

TEST_F(StringsTest, EqualFold) {
    EXPECT_TRUE(Strings::EqualFold("exit", "EXIT"));
    EXPECT_TRUE(Strings::EqualFold("Exit", "eXiT"));
    EXPECT_FALSE(Strings::EqualFold("exit", "exit "));
}

TEST_F(StringsTest, Split) {
    auto parts = Strings::Split("upload notes.txt 1024");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "upload");
    EXPECT_EQ(parts[1], "notes.txt");
    EXPECT_EQ(parts[2], "1024");
}

TEST_F(StringsTest, Split_CustomDelimiter) {
    auto parts = Strings::Split("127.0.0.1:2223", ':');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "127.0.0.1");
    EXPECT_EQ(parts[1], "2223");
}

TEST_F(StringsTest, Split_EmptyString) {
    EXPECT_TRUE(Strings::Split("").empty());
}

TEST_F(StringsTest, IsNumber) {
    EXPECT_TRUE(Strings::IsNumber("2223"));
    EXPECT_TRUE(Strings::IsNumber("0"));
    EXPECT_FALSE(Strings::IsNumber(""));
    EXPECT_FALSE(Strings::IsNumber("-1"));
    EXPECT_FALSE(Strings::IsNumber("12a"));
    EXPECT_FALSE(Strings::IsNumber("1.5"));
}

TEST_F(StringsTest, ToUnsignedBigInt) {
    EXPECT_EQ(Strings::ToUnsignedBigInt("1048576"), 1048576u);
    EXPECT_EQ(Strings::ToUnsignedBigInt("18446744073709551615"), 18446744073709551615ull);
    EXPECT_EQ(Strings::ToUnsignedBigInt("abc", 7), 7u);
    EXPECT_EQ(Strings::ToUnsignedBigInt("99999999999999999999", 3), 3u);
}

TEST_F(StringsTest, ToPort) {
    int port = -1;
    EXPECT_TRUE(Strings::ToPort("2223", 1, port));
    EXPECT_EQ(port, 2223);
    EXPECT_TRUE(Strings::ToPort("65535", 1, port));
    EXPECT_EQ(port, 65535);
    EXPECT_TRUE(Strings::ToPort("0", 0, port));
    EXPECT_EQ(port, 0);
}

TEST_F(StringsTest, ToPort_RejectsOutOfRange) {
    int port = 42;
    EXPECT_FALSE(Strings::ToPort("99999", 1, port));
    EXPECT_FALSE(Strings::ToPort("65536", 0, port));
    EXPECT_FALSE(Strings::ToPort("0", 1, port));
    EXPECT_FALSE(Strings::ToPort("000002223", 1, port));
    EXPECT_FALSE(Strings::ToPort("-1", 0, port));
    EXPECT_FALSE(Strings::ToPort("", 0, port));
    EXPECT_EQ(port, 42);
}

TEST_F(StringsTest, Commify) {
    EXPECT_EQ(Strings::Commify("0"), "0");
    EXPECT_EQ(Strings::Commify("999"), "999");
    EXPECT_EQ(Strings::Commify("1000"), "1,000");
    EXPECT_EQ(Strings::Commify("1048576"), "1,048,576");
    EXPECT_EQ(Strings::Commify(uint64_t(123456)), "123,456");
}
