// =============================================================================
// Marionette - Emulator window simulator
// =============================================================================
// Emulator windows follow each family's path in every execution mode:
//   family A (LDPlayer): clicks/drags SendMessage and keys PostMessage to the
//                        render window itself, scroll posts to the resolved
//                        frame, text via adb then WM_CHAR
//   family B (MuMu):     clicks/drags/key taps through the manager's remote
//                        shell on the resolved VM index (PostMessage to the
//                        device window when no VM resolves), key down/up
//                        SendMessage to the device window, text via the
//                        manager bridge then WM_CHAR
// Click and double click are the exception: outside Emulator mode they behave
// like StandardSimulator (background post or foreground injection).
// =============================================================================
#pragma once

#include <optional>
#include "emulator_directory.hpp"
#include "standard_simulator.hpp"
#include "target_resolver.hpp"
#include "text_input_engine.hpp"
#include "window_classifier.hpp"
#include "window_index_table.hpp"

namespace marionette {

class EmulatorSimulator : public StandardSimulator {
public:
    struct Context {
        TargetResolver* resolver = nullptr;
        RemoteBridge* family_b_bridge = nullptr;        // MuMu manager
        EmulatorDirectory* family_a_directory = nullptr; // LDPlayer console
        TextInputEngine* family_a_text = nullptr;       // adb shell
        TextInputEngine* family_b_text = nullptr;       // MuMu shell
        WindowIndexTable* index_table = nullptr;
        TextInputMode text_mode = TextInputMode::BroadcastAll;
    };

    EmulatorSimulator(WindowSystem& ws, InputInjector* injector, WindowHandle hwnd,
                      ExecutionMode mode, WindowCategory category, Context context);

    const char* kind() const override;
    WindowCategory category() const { return category_; }

protected:
    bool do_click(int x, int y, MouseButton button) override;
    bool do_double_click(int x, int y, MouseButton button, int interval_ms) override;
    bool do_drag(int x1, int y1, int x2, int y2, MouseButton button, int duration_ms) override;
    bool do_drag_path(const std::vector<Point>& points, int duration_ms, MouseButton button) override;
    bool do_scroll(int x, int y, int notches) override;
    bool do_key_tap(const ResolvedKey& key) override;
    bool do_key_down(const ResolvedKey& key) override;
    bool do_key_up(const ResolvedKey& key) override;
    bool do_send_text(const std::string& text) override;
    bool do_key_combination(const std::vector<ResolvedKey>& keys, int hold_ms) override;

private:
    bool dedicated() const { return mode_ == ExecutionMode::Emulator; }
    bool familyA() const { return category_ == WindowCategory::EmulatorFamilyA; }

    std::optional<AutomationTarget> target();
    WindowHandle frameWindow();     // family A resolved window (or hwnd)
    WindowHandle deviceWindow();    // family B device window (or hwnd)

    // Pointer channel for the current target: Send to the family-A window,
    // remote shell on the family-B VM, or Post to the family-B device window
    std::unique_ptr<DeliveryChannel> pointerChannel();

    bool sendTextViaEngine(const std::string& text);
    bool sendTextViaMessages(const std::string& text, WindowHandle to);

    WindowCategory category_;
    Context ctx_;
};

} // namespace marionette
