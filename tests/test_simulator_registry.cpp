// =============================================================================
// Unit tests for SimulatorRegistry and the simulators it builds
// =============================================================================
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include "simulator_registry.hpp"
#include "fakes/fake_emulator.hpp"
#include "fakes/fake_window_system.hpp"

using namespace marionette;
using marionette::fakes::FakeEmulatorDirectory;
using marionette::fakes::FakeInputInjector;
using marionette::fakes::FakeRemoteBridge;
using marionette::fakes::FakeRemoteShell;
using marionette::fakes::FakeWindowSystem;
using marionette::fakes::InjectedEvent;

class SimulatorRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ws.add_window(0x10, "Notepad", "Untitled - Notepad", 0, Point{500, 300});

        // LDPlayer: frame 0x100 > render 0x101, instance 0
        ws.add_window(0x100, "LDPlayerMainFrame", "LDPlayer");
        ws.add_window(0x101, "RenderWindow", "TheRender", 0x100);
        ld.add(0, 0x100, 0x101);

        // MuMu: main 0x200 > render 0x201, VM 0
        ws.add_window(0x200, "Qt5156QWindowIcon", "MuMu Player 12");
        ws.add_window(0x201, "nemuwin", "nemudisplay", 0x200);
        mumu.add(0, 0x200, 0x201);

        deps.window_system = &ws;
        deps.injector = &injector;
        deps.classifier = &classifier;
        deps.resolver = &resolver;
        deps.family_b_bridge = &bridge;
        deps.family_a_directory = &ld;
        deps.family_a_text = &ld_text;
        deps.family_b_text = &mumu_text;
        deps.index_table = &index_table;
        deps.bus = &bus;
    }

    SimulatorRegistry& registry() {
        if (!registry_) registry_ = std::make_unique<SimulatorRegistry>(deps);
        return *registry_;
    }

    FakeWindowSystem ws;
    FakeInputInjector injector;
    WindowClassifier classifier{ws};
    FakeEmulatorDirectory ld;
    FakeEmulatorDirectory mumu;
    FakeRemoteBridge bridge;
    EventBus bus;
    TargetResolver resolver{ws, &ld, &mumu, &bus};
    FakeRemoteShell adb_shell{{"127.0.0.1:5557", "127.0.0.1:5555"}};
    FakeRemoteShell mumu_shell{{"0"}};
    TextInputEngine ld_text{adb_shell};
    TextInputEngine mumu_text{mumu_shell};
    WindowIndexTable index_table;
    SimulatorRegistry::Dependencies deps;

private:
    std::unique_ptr<SimulatorRegistry> registry_;
};

// ---------------------------------------------------------------------------
// Mode names
// ---------------------------------------------------------------------------
TEST(SimulatorModeTest, ExecutionModeTags) {
    EXPECT_EQ(parseExecutionMode("foreground_driver"), ExecutionMode::Foreground);
    EXPECT_EQ(parseExecutionMode("background_post"), ExecutionMode::Background);
    EXPECT_EQ(parseExecutionMode("emulator_mumu"), ExecutionMode::Emulator);
    EXPECT_EQ(parseExecutionMode("whatever"), ExecutionMode::Background);
}

TEST(SimulatorModeTest, OperationModeNames) {
    EXPECT_EQ(parseOperationMode("standard_window"), OperationMode::StandardWindow);
    EXPECT_EQ(parseOperationMode("emulator_window"), OperationMode::EmulatorWindow);
    EXPECT_EQ(parseOperationMode("auto"), OperationMode::Auto);
    EXPECT_FALSE(parseOperationMode("robot").has_value());
    EXPECT_STREQ(operationModeName(OperationMode::EmulatorWindow), "emulator_window");
}

// ---------------------------------------------------------------------------
// Construction / defaults
// ---------------------------------------------------------------------------
TEST_F(SimulatorRegistryTest, MissingRequiredDependenciesThrow) {
    SimulatorRegistry::Dependencies empty;
    EXPECT_THROW(SimulatorRegistry r(empty), std::invalid_argument);
}

TEST_F(SimulatorRegistryTest, DefaultsComeFromConfig) {
    deps.input.operation_mode = "standard_window";
    deps.input.execution_mode = "emulator_ld";
    EXPECT_EQ(registry().default_operation_mode(), OperationMode::StandardWindow);
    EXPECT_EQ(registry().default_execution_mode(), ExecutionMode::Emulator);
}

TEST_F(SimulatorRegistryTest, StringOverloadParsesModes) {
    auto sim = registry().get_simulator(0x10, "standard_window", "foreground_sendinput");
    ASSERT_NE(sim, nullptr);
    EXPECT_EQ(sim->execution_mode(), ExecutionMode::Foreground);

    auto fallback = registry().get_simulator(0x10, "robot", "bogus");
    ASSERT_NE(fallback, nullptr);
    EXPECT_EQ(fallback->execution_mode(), ExecutionMode::Background);
}

// ---------------------------------------------------------------------------
// Cache behavior
// ---------------------------------------------------------------------------
TEST_F(SimulatorRegistryTest, SimulatorsAreCachedPerKey) {
    auto a = registry().get_simulator(0x10, OperationMode::Auto, ExecutionMode::Background);
    auto b = registry().get_simulator(0x10, OperationMode::Auto, ExecutionMode::Background);
    auto c = registry().get_simulator(0x10, OperationMode::Auto, ExecutionMode::Foreground);
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(registry().cache_size(), 2u);
}

TEST_F(SimulatorRegistryTest, ChangingDefaultModeClearsCache) {
    registry().get_simulator(0x10);
    ASSERT_EQ(registry().cache_size(), 1u);

    registry().set_default_execution_mode(ExecutionMode::Foreground);
    EXPECT_EQ(registry().cache_size(), 0u);

    registry().get_simulator(0x10);
    registry().set_default_execution_mode(ExecutionMode::Foreground);   // unchanged
    EXPECT_EQ(registry().cache_size(), 1u);

    registry().set_default_operation_mode(OperationMode::StandardWindow);
    EXPECT_EQ(registry().cache_size(), 0u);
}

TEST_F(SimulatorRegistryTest, DeadHandleYieldsNullAndEvicts) {
    EXPECT_EQ(registry().get_simulator(0xDEAD), nullptr);

    auto sim = registry().get_simulator(0x201, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_NE(sim, nullptr);

    ws.destroy(0x201);
    EXPECT_EQ(registry().get_simulator(0x201, OperationMode::Auto, ExecutionMode::Emulator), nullptr);
    EXPECT_EQ(registry().cache_size(), 0u);
    EXPECT_EQ(classifier.cache_size(), 0u);
}

TEST_F(SimulatorRegistryTest, CachedSimulatorOnDeadWindowReturnsFalse) {
    auto sim = registry().get_simulator(0x10);
    ASSERT_NE(sim, nullptr);
    ws.destroy(0x10);

    EXPECT_FALSE(sim->click(1, 1));
    EXPECT_FALSE(sim->send_text("x"));
    EXPECT_TRUE(ws.messages.empty());
}

TEST_F(SimulatorRegistryTest, RebindEventEvictsOneWindow) {
    registry().get_simulator(0x10);
    registry().get_simulator(0x201);
    ASSERT_EQ(registry().cache_size(), 2u);

    bus.publish_rebind(0x10);
    EXPECT_EQ(registry().cache_size(), 1u);
}

TEST_F(SimulatorRegistryTest, SessionEventClearsEverything) {
    registry().get_simulator(0x10);
    registry().get_simulator(0x201);

    bus.publish_session_change("rebound");
    EXPECT_EQ(registry().cache_size(), 0u);
}

// ---------------------------------------------------------------------------
// Simulator selection
// ---------------------------------------------------------------------------
TEST_F(SimulatorRegistryTest, StandardWindowModeSkipsClassification) {
    auto sim = registry().get_simulator(0x201, OperationMode::StandardWindow, ExecutionMode::Emulator);
    ASSERT_NE(sim, nullptr);
    EXPECT_STREQ(sim->kind(), "standard");
    EXPECT_EQ(classifier.cache_size(), 0u);
}

TEST_F(SimulatorRegistryTest, AutoPicksByCategory) {
    EXPECT_STREQ(registry().get_simulator(0x10)->kind(), "standard");
    EXPECT_STREQ(registry().get_simulator(0x101)->kind(), "emulator-a");
    EXPECT_STREQ(registry().get_simulator(0x201)->kind(), "emulator-b");
}

TEST_F(SimulatorRegistryTest, EmulatorModeOnStandardWindowFallsBack) {
    auto sim = registry().get_simulator(0x10, OperationMode::EmulatorWindow, ExecutionMode::Background);
    ASSERT_NE(sim, nullptr);
    EXPECT_STREQ(sim->kind(), "standard");
}

// ---------------------------------------------------------------------------
// Standard simulator
// ---------------------------------------------------------------------------
TEST_F(SimulatorRegistryTest, BackgroundClickPostsToHandle) {
    auto sim = registry().get_simulator(0x10, OperationMode::Auto, ExecutionMode::Background);
    ASSERT_TRUE(sim->click(100, 50));

    auto downs = ws.of(wm::LBUTTONDOWN);
    ASSERT_EQ(downs.size(), 1u);
    EXPECT_EQ(downs[0].hwnd, 0x10u);
    EXPECT_TRUE(downs[0].posted);
    EXPECT_EQ(downs[0].lparam, makeLParam(100, 50));
    EXPECT_EQ(ws.count(wm::LBUTTONUP), 1u);
    EXPECT_TRUE(injector.events.empty());
}

TEST_F(SimulatorRegistryTest, StandardWindowBackgroundClickByName) {
    auto sim = registry().get_simulator(0x10, "standard_window", "background");
    ASSERT_NE(sim, nullptr);
    ASSERT_TRUE(sim->click(100, 50, "left"));

    EXPECT_EQ(ws.of(wm::LBUTTONDOWN).size(), 1u);
    auto ups = ws.of(wm::LBUTTONUP);
    ASSERT_EQ(ups.size(), 1u);
    EXPECT_EQ(ups[0].lparam, makeLParam(100, 50));
    EXPECT_TRUE(ups[0].posted);
}

TEST_F(SimulatorRegistryTest, ForegroundClickInjectsScreenCoordinates) {
    auto sim = registry().get_simulator(0x10, OperationMode::Auto, ExecutionMode::Foreground);
    ASSERT_TRUE(sim->click(10, 20));

    ASSERT_EQ(ws.foreground_requests.size(), 1u);
    EXPECT_EQ(ws.foreground_requests[0], 0x10u);
    ASSERT_EQ(injector.events.size(), 3u);
    EXPECT_EQ(injector.events[0].type, InjectedEvent::Type::Move);
    EXPECT_EQ(injector.events[0].a, 510);
    EXPECT_EQ(injector.events[0].b, 320);
    EXPECT_TRUE(injector.events[1].down);
    EXPECT_FALSE(injector.events[2].down);
    EXPECT_TRUE(ws.messages.empty());
}

TEST_F(SimulatorRegistryTest, ForegroundWithoutInjectorPostsMessages) {
    injector.is_available = false;
    auto sim = registry().get_simulator(0x10, OperationMode::Auto, ExecutionMode::Foreground);
    ASSERT_TRUE(sim->click(10, 20));
    EXPECT_EQ(ws.count(wm::LBUTTONDOWN), 1u);
    EXPECT_TRUE(injector.events.empty());
}

TEST_F(SimulatorRegistryTest, InvalidArgumentsReturnFalse) {
    auto sim = registry().get_simulator(0x10);
    EXPECT_FALSE(sim->click(1, 1, "side"));
    EXPECT_FALSE(sim->send_key(std::string("no-such-key")));
    EXPECT_FALSE(sim->send_key_combination({}));
    EXPECT_TRUE(ws.messages.empty());
}

TEST_F(SimulatorRegistryTest, ChannelExceptionBecomesFalse) {
    ws.throw_on_mousemove = 1;
    auto sim = registry().get_simulator(0x10);
    bool ok = true;
    EXPECT_NO_THROW(ok = sim->drag(0, 0, 100, 0));
    EXPECT_FALSE(ok);
}

TEST_F(SimulatorRegistryTest, EmptyTextIsANoOp) {
    auto sim = registry().get_simulator(0x10);
    EXPECT_TRUE(sim->send_text(""));
    EXPECT_TRUE(ws.messages.empty());
}

// ---------------------------------------------------------------------------
// Emulator simulator, family A
// ---------------------------------------------------------------------------
TEST_F(SimulatorRegistryTest, FamilyAClickIsSentToRenderWindow) {
    auto sim = registry().get_simulator(0x101, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->click(5, 6));

    auto downs = ws.of(wm::LBUTTONDOWN);
    ASSERT_EQ(downs.size(), 1u);
    EXPECT_EQ(downs[0].hwnd, 0x101u);
    EXPECT_FALSE(downs[0].posted);
    EXPECT_EQ(ws.count(wm::LBUTTONUP), 1u);
}

TEST_F(SimulatorRegistryTest, FamilyADragIsSentToRenderWindow) {
    auto sim = registry().get_simulator(0x101, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->drag(1, 1, 50, 50));

    for (const auto& m : ws.messages) {
        EXPECT_EQ(m.hwnd, 0x101u);
        EXPECT_FALSE(m.posted);
    }
    EXPECT_EQ(ws.count(wm::LBUTTONUP), 1u);
}

TEST_F(SimulatorRegistryTest, FamilyAKeysArePostedToRenderWindow) {
    auto sim = registry().get_simulator(0x101, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->send_key(std::string("enter")));

    auto downs = ws.of(wm::KEYDOWN);
    ASSERT_EQ(downs.size(), 1u);
    EXPECT_EQ(downs[0].hwnd, 0x101u);
    EXPECT_TRUE(downs[0].posted);
}

TEST_F(SimulatorRegistryTest, FamilyAScrollIsPostedToFrame) {
    auto sim = registry().get_simulator(0x101, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->scroll(5, 6, 1));

    auto wheels = ws.of(wm::MOUSEWHEEL);
    ASSERT_EQ(wheels.size(), 1u);
    EXPECT_EQ(wheels[0].hwnd, 0x100u);
    EXPECT_TRUE(wheels[0].posted);
}

TEST_F(SimulatorRegistryTest, FamilyABackgroundModeKeepsTextAndScrollOnFamilyPath) {
    auto sim = registry().get_simulator(0x101, OperationMode::Auto, ExecutionMode::Background);
    ASSERT_TRUE(sim->send_text("hi"));
    EXPECT_FALSE(adb_shell.calls.empty());
    EXPECT_EQ(ws.count(wm::CHAR), 0u);

    ASSERT_TRUE(sim->scroll(5, 6, 1));
    auto wheels = ws.of(wm::MOUSEWHEEL);
    ASSERT_EQ(wheels.size(), 1u);
    EXPECT_EQ(wheels[0].hwnd, 0x100u);
}

TEST_F(SimulatorRegistryTest, FamilyATextPrefersMatchingAdbSerial) {
    deps.text_mode = TextInputMode::SingleTarget;
    auto sim = registry().get_simulator(0x101, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->send_text("hi"));

    ASSERT_FALSE(adb_shell.calls.empty());
    for (const auto& call : adb_shell.calls) EXPECT_EQ(call.first, "127.0.0.1:5555");
    EXPECT_EQ(ws.count(wm::CHAR), 0u);
}

// ---------------------------------------------------------------------------
// Emulator simulator, family B
// ---------------------------------------------------------------------------
TEST_F(SimulatorRegistryTest, FamilyBClickGoesThroughBridge) {
    auto sim = registry().get_simulator(0x201, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->click(30, 40));

    ASSERT_EQ(bridge.calls.size(), 1u);
    EXPECT_EQ(bridge.calls[0].index, 0);
    EXPECT_EQ(bridge.calls[0].command, "input tap 30 40");
    EXPECT_EQ(ws.count(wm::LBUTTONDOWN), 0u);
}

TEST_F(SimulatorRegistryTest, FamilyBKeyTapUsesShortcutOrKeyevent) {
    auto sim = registry().get_simulator(0x201, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->send_key(std::string("back")));
    ASSERT_TRUE(sim->send_key(std::string("enter")));

    ASSERT_EQ(bridge.calls.size(), 2u);
    EXPECT_TRUE(bridge.calls[0].shortcut);
    EXPECT_EQ(bridge.calls[0].command, "go_back");
    EXPECT_FALSE(bridge.calls[1].shortcut);
    EXPECT_EQ(bridge.calls[1].command, "input keyevent 66");
}

TEST_F(SimulatorRegistryTest, FamilyBKeyDownIsSentToDeviceWindow) {
    auto sim = registry().get_simulator(0x201, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->send_key_down(std::string("a")));

    auto downs = ws.of(wm::KEYDOWN);
    ASSERT_EQ(downs.size(), 1u);
    EXPECT_EQ(downs[0].hwnd, 0x200u);
    EXPECT_FALSE(downs[0].posted);
    EXPECT_TRUE(bridge.calls.empty());
}

TEST_F(SimulatorRegistryTest, FamilyBWithoutVmPostsToDeviceWindow) {
    mumu.is_available = false;
    bridge.is_available = false;
    auto sim = registry().get_simulator(0x201, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->click(30, 40));

    auto downs = ws.of(wm::LBUTTONDOWN);
    ASSERT_EQ(downs.size(), 1u);
    EXPECT_EQ(downs[0].hwnd, 0x200u);
    EXPECT_TRUE(downs[0].posted);
    EXPECT_TRUE(bridge.calls.empty());
}

TEST_F(SimulatorRegistryTest, FamilyBBackgroundModeOnlyChangesClicks) {
    auto sim = registry().get_simulator(0x201, OperationMode::Auto, ExecutionMode::Background);
    EXPECT_STREQ(sim->kind(), "emulator-b");
    ASSERT_TRUE(sim->click(30, 40));

    auto downs = ws.of(wm::LBUTTONDOWN);
    ASSERT_EQ(downs.size(), 1u);
    EXPECT_EQ(downs[0].hwnd, 0x201u);
    EXPECT_TRUE(bridge.calls.empty());

    ASSERT_TRUE(sim->send_key(std::string("enter")));
    ASSERT_TRUE(sim->drag(10, 20, 30, 40));
    ASSERT_EQ(bridge.calls.size(), 2u);
    EXPECT_EQ(bridge.calls[0].command, "input keyevent 66");
    EXPECT_EQ(bridge.calls[1].command.rfind("input swipe 10 20 30 40", 0), 0u);

    ASSERT_TRUE(sim->send_text("hello"));
    EXPECT_EQ(mumu_shell.count_containing("ADB_INPUT_TEXT"), 1u);
    EXPECT_EQ(ws.count(wm::CHAR), 0u);
}

TEST_F(SimulatorRegistryTest, DefaultModesRouteFamilyBTextThroughEngine) {
    auto sim = registry().get_simulator(0x201);
    ASSERT_NE(sim, nullptr);
    ASSERT_TRUE(sim->send_text("hello"));

    EXPECT_GE(mumu_shell.count_containing("ADB_INPUT_TEXT"), 1u);
    EXPECT_EQ(ws.count(wm::CHAR), 0u);
}

TEST_F(SimulatorRegistryTest, FamilyBTextUsesEngine) {
    auto sim = registry().get_simulator(0x201, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->send_text("hello"));

    EXPECT_EQ(mumu_shell.count_containing("ADB_INPUT_TEXT"), 1u);
    EXPECT_EQ(ws.count(wm::CHAR), 0u);
}

TEST_F(SimulatorRegistryTest, FamilyBTextFallsBackToCharMessages) {
    mumu_shell.handler = [](const std::string&, const std::string&) -> Result<std::string> {
        return Error("vm not running");
    };
    auto sim = registry().get_simulator(0x201, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->send_text("ab"));

    auto chars = ws.of(wm::CHAR);
    ASSERT_EQ(chars.size(), 2u);
    EXPECT_EQ(chars[0].hwnd, 0x200u);
    EXPECT_EQ(chars[0].wparam, static_cast<uint64_t>('a'));
    EXPECT_EQ(chars[1].wparam, static_cast<uint64_t>('b'));

    auto downs = ws.of(wm::KEYDOWN);
    ASSERT_EQ(downs.size(), 2u);
    EXPECT_EQ(downs[0].wparam, static_cast<uint64_t>('A'));
}

TEST_F(SimulatorRegistryTest, CharFallbackHoldsShiftForUppercase) {
    mumu_shell.handler = [](const std::string&, const std::string&) -> Result<std::string> {
        return Error("vm not running");
    };
    auto sim = registry().get_simulator(0x201, OperationMode::Auto, ExecutionMode::Emulator);
    ASSERT_TRUE(sim->send_text("Ab"));

    ASSERT_EQ(ws.messages.size(), 8u);
    EXPECT_EQ(ws.messages[0].msg, wm::KEYDOWN);
    EXPECT_EQ(ws.messages[0].wparam, static_cast<uint64_t>(vk::Shift));
    EXPECT_EQ(ws.messages[1].msg, wm::KEYDOWN);
    EXPECT_EQ(ws.messages[1].wparam, static_cast<uint64_t>('A'));
    EXPECT_EQ(ws.messages[2].msg, wm::CHAR);
    EXPECT_EQ(ws.messages[2].wparam, static_cast<uint64_t>('A'));
    EXPECT_EQ(ws.messages[3].msg, wm::KEYUP);
    EXPECT_EQ(ws.messages[3].wparam, static_cast<uint64_t>('A'));
    EXPECT_EQ(ws.messages[4].msg, wm::KEYUP);
    EXPECT_EQ(ws.messages[4].wparam, static_cast<uint64_t>(vk::Shift));

    // Lowercase needs no shift
    EXPECT_EQ(ws.messages[5].msg, wm::KEYDOWN);
    EXPECT_EQ(ws.messages[5].wparam, static_cast<uint64_t>('B'));
    for (const auto& m : ws.messages) EXPECT_EQ(m.hwnd, 0x200u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
