#include <gtest/gtest.h>
#include "core/JsonUtil.h"

namespace asset_scan {
namespace jsonutil {

TEST(JsonUtilTest, EscapeSpecialCharacters) {
    EXPECT_EQ(escape("plain"), "plain");
    EXPECT_EQ(escape("a\"b"), "a\\\"b");
    EXPECT_EQ(escape("back\\slash"), "back\\\\slash");
    EXPECT_EQ(escape("line\nbreak\ttab"), "line\\nbreak\\ttab");
    EXPECT_EQ(escape(std::string(1, '\x01')), "\\u0001");
}

TEST(JsonUtilTest, TimeToIso) {
    EXPECT_EQ(time_to_iso(std::chrono::system_clock::time_point{}), "");
    auto tp = std::chrono::system_clock::from_time_t(86400 + 3600 + 61);
    EXPECT_EQ(time_to_iso(tp), "1970-01-02T01:01:01Z");
}

TEST(JsonUtilTest, FormatDoubleIsFixedPrecision) {
    EXPECT_EQ(format_double(0.98), "0.980000");
    EXPECT_EQ(format_double(1.0), "1.000000");
    EXPECT_EQ(format_double(0.1234567), "0.123457");
}

}
}
