// =============================================================================
// Unit tests for command-line argument validation (src/adb_security.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "adb_security.hpp"

using namespace droid::security;

// ---------------------------------------------------------------------------
// Host addresses
// ---------------------------------------------------------------------------
TEST(AdbSecurityTest, ValidHostAddresses) {
    EXPECT_TRUE(isValidHostAddress("192.168.1.23"));
    EXPECT_TRUE(isValidHostAddress("10.0.0.1"));
    EXPECT_TRUE(isValidHostAddress("255.255.255.255"));
}

TEST(AdbSecurityTest, InvalidHostAddresses) {
    EXPECT_FALSE(isValidHostAddress(""));
    EXPECT_FALSE(isValidHostAddress("phone.local"));
    EXPECT_FALSE(isValidHostAddress("192.168.1"));
    EXPECT_FALSE(isValidHostAddress("192.168.1.256"));
    EXPECT_FALSE(isValidHostAddress("192.168.1.23;reboot"));
    EXPECT_FALSE(isValidHostAddress(" 192.168.1.23"));
    EXPECT_FALSE(isValidHostAddress("0192.168.1.23"));
}

// ---------------------------------------------------------------------------
// adb / scrcpy targets
// ---------------------------------------------------------------------------
TEST(AdbSecurityTest, TcpTargets) {
    EXPECT_TRUE(isValidTcpTarget("192.168.1.23:5555"));
    EXPECT_TRUE(isValidTcpTarget("10.0.0.1:1"));
    EXPECT_TRUE(isValidTcpTarget("10.0.0.1:65535"));

    EXPECT_FALSE(isValidTcpTarget("192.168.1.23"));
    EXPECT_FALSE(isValidTcpTarget("192.168.1.23:"));
    EXPECT_FALSE(isValidTcpTarget("192.168.1.23:0"));
    EXPECT_FALSE(isValidTcpTarget("192.168.1.23:65536"));
    EXPECT_FALSE(isValidTcpTarget("192.168.1.23:55a5"));
    EXPECT_FALSE(isValidTcpTarget("host:5555"));
    EXPECT_FALSE(isValidTcpTarget(":5555"));
}

TEST(AdbSecurityTest, FormatTcpTarget) {
    EXPECT_EQ(formatTcpTarget("192.168.1.23", 5555), "192.168.1.23:5555");
    EXPECT_TRUE(isValidTcpTarget(formatTcpTarget("10.1.2.3", 40000)));
}

// ---------------------------------------------------------------------------
// xdotool arguments
// ---------------------------------------------------------------------------
TEST(AdbSecurityTest, KeySpecs) {
    EXPECT_TRUE(isValidKeySpec("alt+o"));
    EXPECT_TRUE(isValidKeySpec("alt+shift+o"));
    EXPECT_TRUE(isValidKeySpec("Super_L+p"));
    EXPECT_TRUE(isValidKeySpec("F11"));

    EXPECT_FALSE(isValidKeySpec(""));
    EXPECT_FALSE(isValidKeySpec("+o"));
    EXPECT_FALSE(isValidKeySpec("alt+"));
    EXPECT_FALSE(isValidKeySpec("alt++o"));
    EXPECT_FALSE(isValidKeySpec("alt+o;id"));
    EXPECT_FALSE(isValidKeySpec("alt o"));
    EXPECT_FALSE(isValidKeySpec(std::string(65, 'a')));
}

TEST(AdbSecurityTest, WindowIds) {
    EXPECT_TRUE(isValidWindowId("12582913"));
    EXPECT_FALSE(isValidWindowId(""));
    EXPECT_FALSE(isValidWindowId("0x1a00001"));
    EXPECT_FALSE(isValidWindowId("123 456"));
    EXPECT_FALSE(isValidWindowId(std::string(21, '1')));
}

TEST(AdbSecurityTest, Metacharacters) {
    for (const char* s : {"a|b", "a;b", "a&b", "$(x)", "`x`", "a b", "a\nb", "'q'"}) {
        EXPECT_TRUE(containsMetacharacters(s)) << s;
    }
    EXPECT_FALSE(containsMetacharacters("192.168.1.23:5555"));
    EXPECT_FALSE(containsMetacharacters("alt+shift+o"));
}
