// =============================================================================
// Unit tests for TextInputEngine (src/text_input_engine.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <stdexcept>
#include "text_codec.hpp"
#include "text_input_engine.hpp"
#include "fakes/fake_emulator.hpp"

using namespace marionette;
using marionette::fakes::FakeRemoteShell;

namespace {

bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

TextRequest broadcast(const std::string& text) {
    TextRequest r;
    r.text = text;
    r.mode = TextInputMode::BroadcastAll;
    return r;
}

} // namespace

// ---------------------------------------------------------------------------
// Mode names
// ---------------------------------------------------------------------------
TEST(TextInputModeTest, ParsesCanonicalAndLegacyNames) {
    EXPECT_EQ(parseTextInputMode("broadcast_all"), TextInputMode::BroadcastAll);
    EXPECT_EQ(parseTextInputMode("single_target"), TextInputMode::SingleTarget);
    EXPECT_EQ(parseTextInputMode("\xe5\x8d\x95\xe7\xbb\x84\xe6\x96\x87\xe6\x9c\xac"),
              TextInputMode::BroadcastAll);
    EXPECT_EQ(parseTextInputMode("\xe5\xa4\x9a\xe7\xbb\x84\xe6\x96\x87\xe6\x9c\xac"),
              TextInputMode::SingleTarget);
    EXPECT_FALSE(parseTextInputMode("everything").has_value());
    EXPECT_STREQ(textInputModeName(TextInputMode::SingleTarget), "single_target");
}

// ---------------------------------------------------------------------------
// Strategy chain
// ---------------------------------------------------------------------------
TEST(TextInputEngineTest, DefaultStrategyOrder) {
    FakeRemoteShell shell({"0"});
    TextInputEngine engine(shell);
    std::vector<std::string> expected = {"adb-keyboard", "adb-keyboard-b64", "adb-keyboard-chars",
                                         "input-text", "latin-ime-broadcast"};
    EXPECT_EQ(engine.strategy_names(), expected);
}

TEST(TextInputEngineTest, FirstStrategyWinsWhenKeyboardIsReady) {
    FakeRemoteShell shell({"0"});
    TextInputEngine engine(shell);

    auto report = engine.send_text(broadcast("hello"));
    ASSERT_TRUE(report.success);
    ASSERT_EQ(report.attempts.size(), 1u);
    EXPECT_EQ(report.attempts[0].strategy_name, "adb-keyboard");

    // pm list, ime enable, ime set, broadcast
    ASSERT_EQ(shell.calls.size(), 4u);
    EXPECT_EQ(shell.calls[1].second, "ime enable com.android.adbkeyboard/.AdbIME");
    EXPECT_EQ(shell.calls[2].second, "ime set com.android.adbkeyboard/.AdbIME");
    EXPECT_EQ(shell.calls[3].second, "am broadcast -a ADB_INPUT_TEXT --es msg 'hello'");
}

TEST(TextInputEngineTest, FallsThroughEveryStrategyInOrder) {
    FakeRemoteShell shell({"0"});
    shell.handler = [](const std::string&, const std::string& cmd) -> Result<std::string> {
        if (contains(cmd, "pm list packages")) return std::string("package:com.android.adbkeyboard");
        if (contains(cmd, "ADB_INPUT") || contains(cmd, "input text")) return Error("rejected");
        return std::string();
    };
    TextInputEngine engine(shell);

    auto report = engine.send_text(broadcast("\xe4\xbd\xa0\xe5\xa5\xbd"));   // 你好
    ASSERT_TRUE(report.success);
    ASSERT_EQ(report.attempts.size(), 5u);
    for (size_t i = 0; i < 4; i++) {
        EXPECT_FALSE(report.attempts[i].success) << report.attempts[i].strategy_name;
    }
    EXPECT_TRUE(report.attempts[4].success);
    EXPECT_EQ(report.attempts[4].strategy_name, "latin-ime-broadcast");
    EXPECT_EQ(report.summary(),
              "adb-keyboard:fail, adb-keyboard-b64:fail, adb-keyboard-chars:fail, "
              "input-text:fail, latin-ime-broadcast:ok");

    // A failed keyboard send drops the readiness cache, so each keyboard
    // strategy re-checks
    EXPECT_EQ(shell.count_containing("pm list packages"), 3u);
    EXPECT_EQ(shell.count_containing("ADB_INPUT_B64 --es msg " + base64Encode(std::string("\xe4\xbd\xa0\xe5\xa5\xbd"))), 1u);
    EXPECT_EQ(shell.count_containing("ADB_INPUT_CHARS --eia chars 20320,22909"), 1u);
}

TEST(TextInputEngineTest, AllStrategiesFail) {
    FakeRemoteShell shell({"0"});
    shell.handler = [](const std::string&, const std::string&) -> Result<std::string> {
        return Error("device offline");
    };
    TextInputEngine engine(shell);

    auto report = engine.send_text(broadcast("x"));
    EXPECT_FALSE(report.success);
    EXPECT_EQ(report.attempts.size(), 5u);
    EXPECT_TRUE(contains(report.attempts[3].diagnostic, "device offline"));
}

TEST(TextInputEngineTest, MissingKeyboardSkipsToInputText) {
    FakeRemoteShell shell({"0"});
    shell.handler = [](const std::string&, const std::string& cmd) -> Result<std::string> {
        if (contains(cmd, "pm list packages")) return std::string("");
        return std::string();
    };
    TextInputEngine engine(shell);

    auto report = engine.send_text(broadcast("abc def"));
    ASSERT_TRUE(report.success);
    ASSERT_EQ(report.attempts.size(), 4u);
    EXPECT_TRUE(contains(report.attempts[0].diagnostic, "not installed"));
    EXPECT_EQ(report.attempts[3].strategy_name, "input-text");
    EXPECT_EQ(shell.count_containing("ime enable"), 0u);
    EXPECT_EQ(shell.calls.back().second, "input text abc\\ def");
}

TEST(TextInputEngineTest, TextIsSingleQuotedForBroadcast) {
    FakeRemoteShell shell({"0"});
    TextInputEngine engine(shell);

    ASSERT_TRUE(engine.send_text(broadcast("it's; rm")).success);
    EXPECT_EQ(shell.calls.back().second,
              "am broadcast -a ADB_INPUT_TEXT --es msg 'it'\\''s; rm'");
}

TEST(TextInputEngineTest, NoInstancesFailsEveryStrategy) {
    FakeRemoteShell shell;
    TextInputEngine engine(shell);

    auto report = engine.send_text(broadcast("x"));
    EXPECT_FALSE(report.success);
    ASSERT_EQ(report.attempts.size(), 5u);
    EXPECT_EQ(report.attempts[0].diagnostic, "no instances");
    EXPECT_TRUE(shell.calls.empty());
}

TEST(TextInputEngineTest, ThrowingShellIsReportedNotPropagated) {
    FakeRemoteShell shell({"0"});
    shell.handler = [](const std::string&, const std::string&) -> Result<std::string> {
        throw std::runtime_error("pipe closed");
    };
    TextInputEngine engine(shell);

    TextInputReport report;
    EXPECT_NO_THROW(report = engine.send_text(broadcast("x")));
    EXPECT_FALSE(report.success);
    EXPECT_TRUE(contains(report.attempts[0].diagnostic, "pipe closed"));
}

// ---------------------------------------------------------------------------
// Target selection
// ---------------------------------------------------------------------------
TEST(TextInputEngineTest, BroadcastSucceedsIfAnyInstanceAccepts) {
    FakeRemoteShell shell({"0", "1", "2"});
    shell.handler = [](const std::string& instance, const std::string&) -> Result<std::string> {
        if (instance != "1") return Error("offline");
        return std::string("package:com.android.adbkeyboard");
    };
    TextInputEngine engine(shell);

    auto report = engine.send_text(broadcast("hi"));
    ASSERT_TRUE(report.success);
    ASSERT_EQ(report.attempts.size(), 1u);
    EXPECT_TRUE(contains(report.attempts[0].diagnostic, "1/3"));
}

TEST(TextInputEngineTest, SingleTargetUsesWindowIndexModulo) {
    FakeRemoteShell shell({"0", "1", "2"});
    TextInputEngine engine(shell);

    TextRequest req;
    req.text = "x";
    req.mode = TextInputMode::SingleTarget;
    req.window_index = 4;
    ASSERT_TRUE(engine.send_text(req).success);

    for (const auto& call : shell.calls) EXPECT_EQ(call.first, "1");
}

TEST(TextInputEngineTest, SingleTargetPrefersListedInstance) {
    FakeRemoteShell shell({"0", "1", "2"});
    TextInputEngine engine(shell);

    TextRequest req;
    req.text = "x";
    req.mode = TextInputMode::SingleTarget;
    req.window_index = 0;
    req.preferred_instance = std::string("2");
    ASSERT_TRUE(engine.send_text(req).success);
    for (const auto& call : shell.calls) EXPECT_EQ(call.first, "2");

    // Unknown preference falls back to the window index
    shell.calls.clear();
    req.preferred_instance = std::string("9");
    ASSERT_TRUE(engine.send_text(req).success);
    for (const auto& call : shell.calls) EXPECT_EQ(call.first, "0");
}

// ---------------------------------------------------------------------------
// Keyboard readiness cache
// ---------------------------------------------------------------------------
TEST(TextInputEngineTest, ReadinessCheckIsCachedPerInstance) {
    FakeRemoteShell shell({"0"});
    TextInputEngine engine(shell);

    engine.send_text(broadcast("a"));
    engine.send_text(broadcast("b"));
    EXPECT_EQ(shell.count_containing("pm list packages"), 1u);
    EXPECT_TRUE(engine.keyboard_cache().is_active("fake:0"));
}

TEST(TextInputEngineTest, SessionChangeClearsKeyboardCache) {
    FakeRemoteShell shell({"0"});
    EventBus bus;
    TextInputEngine engine(shell, config::TextInputConfig{}, &bus);

    engine.send_text(broadcast("a"));
    bus.publish_session_change("next");
    EXPECT_EQ(engine.keyboard_cache().size(), 0u);

    engine.send_text(broadcast("b"));
    EXPECT_EQ(shell.count_containing("pm list packages"), 2u);
}

TEST(TextInputEngineTest, AggressiveModeUsesShortTtl) {
    FakeRemoteShell shell;
    config::TextInputConfig cfg;
    cfg.aggressive = true;
    cfg.aggressive_cache_s = 10;
    TextInputEngine engine(shell, cfg);
    EXPECT_EQ(engine.keyboard_cache().ttl(), std::chrono::seconds(10));

    TextInputEngine relaxed(shell);
    EXPECT_EQ(relaxed.keyboard_cache().ttl(), std::chrono::seconds(300));
}

TEST(KeyboardStateCacheTest, EntriesExpire) {
    KeyboardStateCache cache(std::chrono::seconds(0));
    cache.mark_active("adb:emulator-5554");
    EXPECT_FALSE(cache.is_active("adb:emulator-5554"));

    cache.set_ttl(std::chrono::seconds(60));
    EXPECT_TRUE(cache.is_active("adb:emulator-5554"));
    cache.invalidate("adb:emulator-5554");
    EXPECT_FALSE(cache.is_active("adb:emulator-5554"));
}

// ---------------------------------------------------------------------------
// Custom chains
// ---------------------------------------------------------------------------
TEST(TextInputEngineTest, CustomStrategyChain) {
    FakeRemoteShell shell({"0"});
    TextInputEngine engine(shell);

    std::vector<std::unique_ptr<TextStrategy>> chain;
    chain.push_back(std::make_unique<InputTextStrategy>());
    engine.set_strategies(std::move(chain));

    auto report = engine.send_text(broadcast("ok"));
    ASSERT_TRUE(report.success);
    EXPECT_EQ(report.summary(), "input-text:ok");
    ASSERT_EQ(shell.calls.size(), 1u);
}

TEST(TextInputReportTest, EmptySummary) {
    TextInputReport report;
    EXPECT_EQ(report.summary(), "(no attempts)");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
