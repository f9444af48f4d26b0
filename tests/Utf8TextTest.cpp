#include "core/utils/Utf8Text.hpp"
#include <gtest/gtest.h>

using namespace core::utils;

TEST(Utf8TextTest, CountsCodePointsNotBytes) {
    EXPECT_EQ(codePointCount(""), 0u);
    EXPECT_EQ(codePointCount("Sousse"), 6u);
    EXPECT_EQ(codePointCount("\xC3\x89lodie"), 6u);          // Élodie
    EXPECT_EQ(codePointCount("\xD8\xB3\xD9\x88\xD8\xB3\xD8\xA9"), 4u);  // سوسة
}

TEST(Utf8TextTest, TruncateNeverSplitsASequence) {
    EXPECT_EQ(truncateCodePoints("\xC3\x89lodie", 1), "\xC3\x89");
    EXPECT_EQ(truncateCodePoints("abc", 10), "abc");
    EXPECT_EQ(truncateCodePoints("abc", 0), "");
}

TEST(Utf8TextTest, InvalidBytesCountAsOne) {
    std::string broken("a\xC3", 2);
    EXPECT_EQ(codePointCount(broken), 2u);
}

TEST(Utf8TextTest, Padding) {
    EXPECT_EQ(padStart("12", 6), "    12");
    EXPECT_EQ(padEnd("12", 6), "12    ");
    EXPECT_EQ(padStart("1234567", 6), "1234567");
    EXPECT_EQ(padEnd("\xC3\x89", 3, '.'), "\xC3\x89..");
}

TEST(Utf8TextTest, FitColumnIsExactWidth) {
    EXPECT_EQ(fitColumn("Mohamed Ali Trabelsi", 10), "Mohamed Al");
    EXPECT_EQ(fitColumn("Sami", 10), "Sami      ");
    EXPECT_EQ(codePointCount(fitColumn("\xC3\x89lodie Ben Amor", 10)), 10u);
}
