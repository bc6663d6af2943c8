#include <stdexcept>
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace testbox;

TEST(UtilsTest, IsNumber) {
    EXPECT_TRUE(is_number("0"));
    EXPECT_TRUE(is_number("1000"));
    EXPECT_FALSE(is_number(""));
    EXPECT_FALSE(is_number("-1"));
    EXPECT_FALSE(is_number("12a"));
    // bytes above 0x7f are negative as plain char
    EXPECT_FALSE(is_number("\xd9\xa3"));
    EXPECT_FALSE(is_number("1\xff"));
}

TEST(UtilsTest, ParseSeconds) {
    EXPECT_EQ(parse_seconds("1.5"), chrono::milliseconds(1500));
    EXPECT_EQ(parse_seconds("0"), chrono::milliseconds(0));
    EXPECT_THROW(parse_seconds("-1"), invalid_argument);
    EXPECT_THROW(parse_seconds("soon"), invalid_argument);
    EXPECT_THROW(parse_seconds("inf"), invalid_argument);
}

TEST(UtilsTest, SplitAssignment) {
    EXPECT_EQ(split_assignment("PATH=/bin:/usr/bin"), make_pair(string("PATH"), string("/bin:/usr/bin")));
    EXPECT_EQ(split_assignment("EMPTY="), make_pair(string("EMPTY"), string()));
    EXPECT_EQ(split_assignment("A=b=c"), make_pair(string("A"), string("b=c")));
    EXPECT_THROW(split_assignment("NOVALUE"), invalid_argument);
    EXPECT_THROW(split_assignment("=value"), invalid_argument);
}
