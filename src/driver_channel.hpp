// =============================================================================
// Marionette - Driver injection channel
// =============================================================================
// Foreground input through the OS input queue (SendInput on Windows).
// Coordinates are screen coordinates and final: the channel only clamps
// them onto the screen.
// =============================================================================
#pragma once

#include "delivery_channel.hpp"

namespace marionette {

class DriverChannel : public DeliveryChannel {
public:
    DriverChannel(WindowSystem& ws, InputInjector& injector, WindowHandle target);

    const char* name() const override { return "driver"; }

    bool click(int x, int y, MouseButton button) override;
    bool button_down(int x, int y, MouseButton button) override;
    bool move_to(int x, int y, MouseButton held) override;
    bool button_up(int x, int y, MouseButton button) override;
    bool scroll(int x, int y, int notches) override;
    bool key_down(const ResolvedKey& key) override;
    bool key_up(const ResolvedKey& key) override;
    bool send_text(const std::string& utf8) override;

    Point clamp(int x, int y);

private:
    InputInjector& injector_;
};

} // namespace marionette
