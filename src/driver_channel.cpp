// =============================================================================
// Marionette - Driver injection channel
// =============================================================================
#include "driver_channel.hpp"
#include "marionette_log.hpp"
#include "text_codec.hpp"

#include <algorithm>

namespace marionette {

DriverChannel::DriverChannel(WindowSystem& ws, InputInjector& injector, WindowHandle target)
    : DeliveryChannel(ws, target), injector_(injector) {}

Point DriverChannel::clamp(int x, int y) {
    ScreenSize s = ws_.screen_size();
    if (s.width <= 0 || s.height <= 0) return Point{x, y};
    return Point{std::clamp(x, 0, s.width - 1), std::clamp(y, 0, s.height - 1)};
}

bool DriverChannel::click(int x, int y, MouseButton button) {
    if (!button_down(x, y, button)) return false;
    return injector_.button(button, false);
}

bool DriverChannel::button_down(int x, int y, MouseButton button) {
    Point p = clamp(x, y);
    if (!injector_.move_to(p.x, p.y)) return false;
    return injector_.button(button, true);
}

bool DriverChannel::move_to(int x, int y, MouseButton /*held*/) {
    Point p = clamp(x, y);
    return injector_.move_to(p.x, p.y);
}

bool DriverChannel::button_up(int x, int y, MouseButton button) {
    Point p = clamp(x, y);
    // Release even if the final move is refused
    bool moved = injector_.move_to(p.x, p.y);
    bool released = injector_.button(button, false);
    return moved && released;
}

bool DriverChannel::scroll(int x, int y, int notches) {
    Point p = clamp(x, y);
    if (!injector_.move_to(p.x, p.y)) return false;
    return injector_.wheel(notches * wm::WHEEL_DELTA);
}

bool DriverChannel::key_down(const ResolvedKey& key) {
    if (key.vk == 0) {
        MNLOG_ERROR("channel", "[driver] key '%s' has no virtual-key code", key.name.c_str());
        return false;
    }
    return injector_.key(key.vk, ws_.scan_code(key.vk), key.extended, true);
}

bool DriverChannel::key_up(const ResolvedKey& key) {
    if (key.vk == 0) return false;
    return injector_.key(key.vk, ws_.scan_code(key.vk), key.extended, false);
}

bool DriverChannel::send_text(const std::string& utf8) {
    for (char16_t u : utf8ToUtf16(utf8)) {
        if (!injector_.unicode(u, true)) return false;
        if (!injector_.unicode(u, false)) return false;
    }
    return true;
}

} // namespace marionette
