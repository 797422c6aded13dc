// =============================================================================
// Marionette - Win32 Window System
// =============================================================================
#include "win32_window_system.hpp"
#include "marionette_log.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>

#include <string>

namespace marionette {

namespace {

HWND toHwnd(WindowHandle h) { return reinterpret_cast<HWND>(h); }

std::string narrow(const wchar_t* w, int len) {
    if (len <= 0) return std::string();
    int n = WideCharToMultiByte(CP_UTF8, 0, w, len, nullptr, 0, nullptr, nullptr);
    std::string s(n, '\0');
    WideCharToMultiByte(CP_UTF8, 0, w, len, s.data(), n, nullptr, nullptr);
    return s;
}

bool sendOne(INPUT& input) {
    if (SendInput(1, &input, sizeof(INPUT)) != 1) {
        MNLOG_WARN("driver", "SendInput failed (err=%lu)", GetLastError());
        return false;
    }
    return true;
}

} // namespace

// =============================================================================
// Win32WindowSystem
// =============================================================================

bool Win32WindowSystem::is_window(WindowHandle hwnd) {
    return hwnd != 0 && IsWindow(toHwnd(hwnd)) != FALSE;
}

std::optional<std::string> Win32WindowSystem::class_name(WindowHandle hwnd) {
    wchar_t buf[256];
    int len = GetClassNameW(toHwnd(hwnd), buf, 256);
    if (len <= 0) return std::nullopt;
    return narrow(buf, len);
}

std::optional<std::string> Win32WindowSystem::window_title(WindowHandle hwnd) {
    if (!is_window(hwnd)) return std::nullopt;
    wchar_t buf[512];
    SetLastError(0);
    int len = GetWindowTextW(toHwnd(hwnd), buf, 512);
    if (len == 0 && GetLastError() != 0) return std::nullopt;
    return narrow(buf, len);
}

WindowHandle Win32WindowSystem::parent(WindowHandle hwnd) {
    return reinterpret_cast<WindowHandle>(GetParent(toHwnd(hwnd)));
}

std::optional<Point> Win32WindowSystem::client_to_screen(WindowHandle hwnd, Point client) {
    POINT pt = {client.x, client.y};
    if (!ClientToScreen(toHwnd(hwnd), &pt)) return std::nullopt;
    return Point{pt.x, pt.y};
}

ScreenSize Win32WindowSystem::screen_size() {
    return ScreenSize{GetSystemMetrics(SM_CXSCREEN), GetSystemMetrics(SM_CYSCREEN)};
}

bool Win32WindowSystem::bring_to_foreground(WindowHandle hwnd) {
    HWND h = toHwnd(hwnd);
    if (IsIconic(h)) ShowWindow(h, SW_RESTORE);
    return SetForegroundWindow(h) != FALSE;
}

bool Win32WindowSystem::post_message(WindowHandle hwnd, uint32_t msg, uint64_t wparam, int64_t lparam) {
    return PostMessageW(toHwnd(hwnd), msg, static_cast<WPARAM>(wparam),
                        static_cast<LPARAM>(lparam)) != FALSE;
}

bool Win32WindowSystem::send_message(WindowHandle hwnd, uint32_t msg, uint64_t wparam, int64_t lparam) {
    DWORD_PTR result = 0;
    LRESULT ok = SendMessageTimeoutW(toHwnd(hwnd), msg, static_cast<WPARAM>(wparam),
                                     static_cast<LPARAM>(lparam),
                                     SMTO_NORMAL | SMTO_ABORTIFHUNG, SEND_TIMEOUT_MS, &result);
    return ok != 0;
}

uint32_t Win32WindowSystem::scan_code(uint32_t vk) {
    return MapVirtualKeyW(vk, MAPVK_VK_TO_VSC);
}

std::optional<CharKey> Win32WindowSystem::key_for_char(char16_t unit) {
    SHORT r = VkKeyScanW(static_cast<WCHAR>(unit));
    if (r == -1) return std::nullopt;
    CharKey k;
    k.vk = static_cast<uint32_t>(LOBYTE(r));
    k.shift = (HIBYTE(r) & 1) != 0;
    return k;
}

void Win32WindowSystem::sleep_ms(int ms) {
    if (ms > 0) Sleep(static_cast<DWORD>(ms));
}

// =============================================================================
// SendInputInjector
// =============================================================================

bool SendInputInjector::move_to(int x, int y) {
    int width = GetSystemMetrics(SM_CXSCREEN);
    int height = GetSystemMetrics(SM_CYSCREEN);
    if (width <= 1 || height <= 1) return false;

    INPUT input = {};
    input.type = INPUT_MOUSE;
    input.mi.dx = (x * 65535) / (width - 1);
    input.mi.dy = (y * 65535) / (height - 1);
    input.mi.dwFlags = MOUSEEVENTF_MOVE | MOUSEEVENTF_ABSOLUTE;
    return sendOne(input);
}

bool SendInputInjector::button(MouseButton button, bool down) {
    INPUT input = {};
    input.type = INPUT_MOUSE;
    switch (button) {
        case MouseButton::Left:
            input.mi.dwFlags = down ? MOUSEEVENTF_LEFTDOWN : MOUSEEVENTF_LEFTUP;
            break;
        case MouseButton::Right:
            input.mi.dwFlags = down ? MOUSEEVENTF_RIGHTDOWN : MOUSEEVENTF_RIGHTUP;
            break;
        case MouseButton::Middle:
            input.mi.dwFlags = down ? MOUSEEVENTF_MIDDLEDOWN : MOUSEEVENTF_MIDDLEUP;
            break;
    }
    return sendOne(input);
}

bool SendInputInjector::wheel(int delta) {
    INPUT input = {};
    input.type = INPUT_MOUSE;
    input.mi.dwFlags = MOUSEEVENTF_WHEEL;
    input.mi.mouseData = static_cast<DWORD>(delta);
    return sendOne(input);
}

bool SendInputInjector::key(uint32_t vk, uint32_t scan, bool extended, bool down) {
    INPUT input = {};
    input.type = INPUT_KEYBOARD;
    input.ki.wVk = static_cast<WORD>(vk);
    input.ki.wScan = static_cast<WORD>(scan);
    input.ki.dwFlags = (down ? 0 : KEYEVENTF_KEYUP) | (extended ? KEYEVENTF_EXTENDEDKEY : 0);
    return sendOne(input);
}

bool SendInputInjector::unicode(char16_t unit, bool down) {
    INPUT input = {};
    input.type = INPUT_KEYBOARD;
    input.ki.wScan = static_cast<WORD>(unit);
    input.ki.dwFlags = KEYEVENTF_UNICODE | (down ? 0 : KEYEVENTF_KEYUP);
    return sendOne(input);
}

} // namespace marionette
