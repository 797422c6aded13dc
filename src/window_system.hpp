// =============================================================================
// Marionette - Window System Abstraction
// =============================================================================
// Everything the core needs from the OS, behind two interfaces:
//   WindowSystem  : window queries + message delivery + keyboard layout
//   InputInjector : hardware-equivalent injection at the OS input queue
// Win32 implementations live in win32_window_system.*; tests use fakes.
// =============================================================================
#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace marionette {

// Opaque native window handle (HWND value). Borrowed, never owned.
using WindowHandle = std::uintptr_t;

struct Point {
    int x = 0;
    int y = 0;
};

struct ScreenSize {
    int width = 0;
    int height = 0;
};

enum class MouseButton { Left, Right, Middle };

// "left" / "right" / "middle"; anything else is a caller error
inline std::optional<MouseButton> parseMouseButton(const std::string& name) {
    if (name == "left") return MouseButton::Left;
    if (name == "right") return MouseButton::Right;
    if (name == "middle") return MouseButton::Middle;
    return std::nullopt;
}

inline const char* mouseButtonName(MouseButton b) {
    switch (b) {
        case MouseButton::Left:   return "left";
        case MouseButton::Right:  return "right";
        case MouseButton::Middle: return "middle";
    }
    return "?";
}

// Win32 message ids / flags used by the message channels
namespace wm {
constexpr uint32_t SETTEXT     = 0x000C;
constexpr uint32_t KEYDOWN     = 0x0100;
constexpr uint32_t KEYUP       = 0x0101;
constexpr uint32_t CHAR        = 0x0102;
constexpr uint32_t MOUSEMOVE   = 0x0200;
constexpr uint32_t LBUTTONDOWN = 0x0201;
constexpr uint32_t LBUTTONUP   = 0x0202;
constexpr uint32_t RBUTTONDOWN = 0x0204;
constexpr uint32_t RBUTTONUP   = 0x0205;
constexpr uint32_t MBUTTONDOWN = 0x0207;
constexpr uint32_t MBUTTONUP   = 0x0208;
constexpr uint32_t MOUSEWHEEL  = 0x020A;

constexpr uint64_t MK_LBUTTON = 0x0001;
constexpr uint64_t MK_RBUTTON = 0x0002;
constexpr uint64_t MK_MBUTTON = 0x0010;

constexpr int WHEEL_DELTA = 120;
} // namespace wm

// MAKELONG / MAKELPARAM
inline int64_t makeLParam(int lo, int hi) {
    return static_cast<int64_t>(static_cast<uint32_t>(
        (static_cast<uint32_t>(lo) & 0xFFFFu) | ((static_cast<uint32_t>(hi) & 0xFFFFu) << 16)));
}

// VkKeyScan result: virtual key plus whether shift must be held
struct CharKey {
    uint32_t vk = 0;
    bool shift = false;
};

class WindowSystem {
public:
    virtual ~WindowSystem() = default;

    // --- Queries (nullopt / false / 0 once the window is gone) ---
    virtual bool is_window(WindowHandle hwnd) = 0;
    virtual std::optional<std::string> class_name(WindowHandle hwnd) = 0;   // UTF-8
    virtual std::optional<std::string> window_title(WindowHandle hwnd) = 0; // UTF-8
    virtual WindowHandle parent(WindowHandle hwnd) = 0;                     // 0 = none
    virtual std::optional<Point> client_to_screen(WindowHandle hwnd, Point client) = 0;
    virtual ScreenSize screen_size() = 0;
    virtual bool bring_to_foreground(WindowHandle hwnd) = 0;

    // --- Delivery ---
    // Fire-and-forget; never waits for the receiver
    virtual bool post_message(WindowHandle hwnd, uint32_t msg, uint64_t wparam, int64_t lparam) = 0;
    // Blocks until the receiver processed the message (OS-bounded)
    virtual bool send_message(WindowHandle hwnd, uint32_t msg, uint64_t wparam, int64_t lparam) = 0;

    // --- Keyboard layout ---
    virtual uint32_t scan_code(uint32_t vk) = 0;                       // MapVirtualKey
    virtual std::optional<CharKey> key_for_char(char16_t unit) = 0;    // VkKeyScanW

    virtual void sleep_ms(int ms) = 0;
};

class InputInjector {
public:
    virtual ~InputInjector() = default;

    virtual bool available() = 0;

    // Screen coordinates, already final
    virtual bool move_to(int x, int y) = 0;
    virtual bool button(MouseButton button, bool down) = 0;
    virtual bool wheel(int delta) = 0;
    virtual bool key(uint32_t vk, uint32_t scan, bool extended, bool down) = 0;
    virtual bool unicode(char16_t unit, bool down) = 0;
};

} // namespace marionette
