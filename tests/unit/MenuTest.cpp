/**
 * @file MenuTest.cpp
 * @brief Unit tests for the interactive conversion menu
 */

#include <gtest/gtest.h>
#include <sstream>

#include "Menu.hpp"

using LangJsonConverter::Mode;

TEST(MenuTest, SelectsEachMode) {
    const std::pair<const char*, Mode> cases[] = {
        {"1\n", Mode::LangToJson},
        {"2\n", Mode::JsonToLang},
        {"3\n", Mode::Both},
    };
    for (const auto& c : cases) {
        std::istringstream in(c.first);
        std::ostringstream out;
        Mode mode = Mode::Both;
        ASSERT_TRUE(promptForMode(in, out, mode)) << c.first;
        EXPECT_EQ(mode, c.second) << c.first;
    }
}

TEST(MenuTest, SurroundingWhitespaceIsIgnored) {
    std::istringstream in("  2 \n");
    std::ostringstream out;
    Mode mode = Mode::Both;

    ASSERT_TRUE(promptForMode(in, out, mode));
    EXPECT_EQ(mode, Mode::JsonToLang);
}

TEST(MenuTest, InvalidInputRepromptsWithUsage) {
    std::istringstream in("abc\n7\n3\n");
    std::ostringstream out;
    Mode mode = Mode::LangToJson;

    ASSERT_TRUE(promptForMode(in, out, mode));
    EXPECT_EQ(mode, Mode::Both);

    const auto text = out.str();
    size_t usageCount = 0;
    for (size_t pos = text.find("Invalid choice"); pos != std::string::npos; pos = text.find("Invalid choice", pos + 1))
        ++usageCount;
    EXPECT_EQ(usageCount, 2u);
}

TEST(MenuTest, ZeroExits) {
    std::istringstream in("0\n1\n");
    std::ostringstream out;
    Mode mode = Mode::Both;

    EXPECT_FALSE(promptForMode(in, out, mode));
    EXPECT_NE(out.str().find("Exiting"), std::string::npos);
}

TEST(MenuTest, EndOfInputExits) {
    std::istringstream in("");
    std::ostringstream out;
    Mode mode = Mode::Both;

    EXPECT_FALSE(promptForMode(in, out, mode));
}
