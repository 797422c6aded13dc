// =============================================================================
// Unit tests for shell security functions (src/shell_security.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "shell_security.hpp"

using namespace marionette::security;

// ===========================================================================
// isValidDeviceSerial
// ===========================================================================

TEST(ShellSecurityTest, ValidUsbSerial) {
    EXPECT_TRUE(isValidDeviceSerial("ABCDEF123456"));
    EXPECT_TRUE(isValidDeviceSerial("R5CT123ABCD"));
    EXPECT_TRUE(isValidDeviceSerial("device-1_test"));
}

TEST(ShellSecurityTest, ValidWifiId) {
    EXPECT_TRUE(isValidDeviceSerial("192.168.0.5:5555"));
    EXPECT_TRUE(isValidDeviceSerial("10.0.0.1:39867"));
}

TEST(ShellSecurityTest, InvalidAdbIdEmpty) {
    EXPECT_FALSE(isValidDeviceSerial(""));
}

TEST(ShellSecurityTest, InvalidAdbIdTooLong) {
    std::string long_id(65, 'A');
    EXPECT_FALSE(isValidDeviceSerial(long_id));
}

TEST(ShellSecurityTest, InvalidAdbIdShellInjection) {
    EXPECT_FALSE(isValidDeviceSerial("device; rm -rf /"));
    EXPECT_FALSE(isValidDeviceSerial("$(whoami)"));
    EXPECT_FALSE(isValidDeviceSerial("dev`id`"));
    EXPECT_FALSE(isValidDeviceSerial("dev|cat /etc/passwd"));
    EXPECT_FALSE(isValidDeviceSerial("dev&background"));
}

TEST(ShellSecurityTest, InvalidAdbIdSpecialChars) {
    EXPECT_FALSE(isValidDeviceSerial("dev ice")); // space
    EXPECT_FALSE(isValidDeviceSerial("dev\nice")); // newline
}

// ===========================================================================
// escapeShellArg
// ===========================================================================

TEST(ShellSecurityTest, EscapePlainString) {
    EXPECT_EQ(escapeShellArg("hello"), "hello");
}

TEST(ShellSecurityTest, EscapeMetacharacters) {
    std::string result = escapeShellArg("a;b|c");
    EXPECT_NE(result, "a;b|c"); // must be escaped
    // Semicolon and pipe should be preceded by backslash
    EXPECT_NE(result.find("\\;"), std::string::npos);
    EXPECT_NE(result.find("\\|"), std::string::npos);
}

// ===========================================================================
// quoteSingle
// ===========================================================================

TEST(ShellSecurityTest, QuotePlainString) {
    EXPECT_EQ(quoteSingle("hello world"), "'hello world'");
}

TEST(ShellSecurityTest, QuoteEmbeddedSingleQuote) {
    EXPECT_EQ(quoteSingle("it's"), "'it'\\''s'");
}

TEST(ShellSecurityTest, QuoteKeepsMetacharactersLiteral) {
    EXPECT_EQ(quoteSingle("a;b $(x)"), "'a;b $(x)'");
}

// ===========================================================================
// escapeShellArg for `input text`
// ===========================================================================

TEST(ShellSecurityTest, EscapeSpaces) {
    EXPECT_EQ(escapeShellArg("hello world"), "hello\\ world");
}

// ===========================================================================
// isValidVmIndex
// ===========================================================================

TEST(ShellSecurityTest, VmIndexRange) {
    EXPECT_TRUE(isValidVmIndex(0));
    EXPECT_TRUE(isValidVmIndex(12));
    EXPECT_FALSE(isValidVmIndex(-1));
    EXPECT_FALSE(isValidVmIndex(MAX_VM_INDEX));
}

TEST(ShellSecurityTest, EmulatorLoopbackSerial) {
    EXPECT_TRUE(isValidDeviceSerial("127.0.0.1:5557"));
    EXPECT_TRUE(isValidDeviceSerial("emulator-5554"));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
