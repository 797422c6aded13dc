// =============================================================================
// Marionette - Win32 Window System
// =============================================================================
// Real WindowSystem / InputInjector on top of user32 (Windows only).
// =============================================================================
#pragma once

#include "window_system.hpp"

namespace marionette {

class Win32WindowSystem : public WindowSystem {
public:
    // SendMessageTimeout limit for the blocking channel
    static constexpr unsigned SEND_TIMEOUT_MS = 5000;

    bool is_window(WindowHandle hwnd) override;
    std::optional<std::string> class_name(WindowHandle hwnd) override;
    std::optional<std::string> window_title(WindowHandle hwnd) override;
    WindowHandle parent(WindowHandle hwnd) override;
    std::optional<Point> client_to_screen(WindowHandle hwnd, Point client) override;
    ScreenSize screen_size() override;
    bool bring_to_foreground(WindowHandle hwnd) override;

    bool post_message(WindowHandle hwnd, uint32_t msg, uint64_t wparam, int64_t lparam) override;
    bool send_message(WindowHandle hwnd, uint32_t msg, uint64_t wparam, int64_t lparam) override;

    uint32_t scan_code(uint32_t vk) override;
    std::optional<CharKey> key_for_char(char16_t unit) override;

    void sleep_ms(int ms) override;
};

/**
 * SendInput-based injector (foreground mode).
 * Works at the OS input queue: the target must be the foreground window and
 * coordinates are screen coordinates.
 */
class SendInputInjector : public InputInjector {
public:
    bool available() override { return true; }

    bool move_to(int x, int y) override;
    bool button(MouseButton button, bool down) override;
    bool wheel(int delta) override;
    bool key(uint32_t vk, uint32_t scan, bool extended, bool down) override;
    bool unicode(char16_t unit, bool down) override;
};

} // namespace marionette
