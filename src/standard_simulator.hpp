// =============================================================================
// Marionette - Standard window simulator
// =============================================================================
// Background (and any non-foreground mode): posted window messages on the
// handle, client coordinates.
// Foreground: bring the window to the front, convert client -> screen once,
// inject through the OS. Without an injector, falls back to posted messages.
// =============================================================================
#pragma once

#include <memory>
#include "driver_channel.hpp"
#include "input_simulator.hpp"
#include "message_channel.hpp"

namespace marionette {

class StandardSimulator : public InputSimulator {
public:
    // injector may be null (background only)
    StandardSimulator(WindowSystem& ws, InputInjector* injector, WindowHandle hwnd,
                      ExecutionMode mode);

    const char* kind() const override { return "standard"; }

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

    // Driver channel when foreground injection is usable (window raised),
    // otherwise null and the posted-message channel applies
    DriverChannel* foreground();
    bool toScreen(Point& p);

    MessageChannel post_;
    std::unique_ptr<DriverChannel> driver_;
    InputInjector* injector_;
};

} // namespace marionette
