// =============================================================================
// Marionette - Standard window simulator
// =============================================================================
#include "standard_simulator.hpp"
#include "marionette_log.hpp"

namespace marionette {

StandardSimulator::StandardSimulator(WindowSystem& ws, InputInjector* injector, WindowHandle hwnd,
                                     ExecutionMode mode)
    : InputSimulator(ws, hwnd, mode),
      post_(ws, hwnd, MessageDelivery::Post),
      injector_(injector) {
    if (injector_) driver_ = std::make_unique<DriverChannel>(ws, *injector_, hwnd);
}

DriverChannel* StandardSimulator::foreground() {
    if (mode_ != ExecutionMode::Foreground) return nullptr;
    if (!driver_ || !injector_->available()) {
        MNLOG_WARN("simulator", "[standard] no input injector, posting messages to hwnd=0x%llx",
                   (unsigned long long)hwnd_);
        return nullptr;
    }
    if (!ws_.bring_to_foreground(hwnd_)) {
        MNLOG_DEBUG("simulator", "[standard] hwnd=0x%llx refused foreground", (unsigned long long)hwnd_);
    }
    return driver_.get();
}

bool StandardSimulator::toScreen(Point& p) {
    auto screen = ws_.client_to_screen(hwnd_, p);
    if (!screen) {
        MNLOG_WARN("simulator", "[standard] client_to_screen failed for hwnd=0x%llx",
                   (unsigned long long)hwnd_);
        return false;
    }
    p = *screen;
    return true;
}

bool StandardSimulator::do_click(int x, int y, MouseButton button) {
    if (auto* drv = foreground()) {
        Point p{x, y};
        return toScreen(p) && drv->click(p.x, p.y, button);
    }
    return post_.click(x, y, button);
}

bool StandardSimulator::do_double_click(int x, int y, MouseButton button, int interval_ms) {
    if (auto* drv = foreground()) {
        Point p{x, y};
        return toScreen(p) && drv->double_click(p.x, p.y, button, interval_ms);
    }
    return post_.double_click(x, y, button, interval_ms);
}

bool StandardSimulator::do_drag(int x1, int y1, int x2, int y2, MouseButton button, int duration_ms) {
    if (auto* drv = foreground()) {
        Point a{x1, y1}, b{x2, y2};
        if (!toScreen(a) || !toScreen(b)) return false;
        return drv->drag(a.x, a.y, b.x, b.y, button, duration_ms);
    }
    return post_.drag(x1, y1, x2, y2, button, duration_ms);
}

bool StandardSimulator::do_drag_path(const std::vector<Point>& points, int duration_ms,
                                     MouseButton button) {
    if (auto* drv = foreground()) {
        std::vector<Point> screen = points;
        for (auto& p : screen) {
            if (!toScreen(p)) return false;
        }
        return drv->drag_path(screen, duration_ms, button);
    }
    return post_.drag_path(points, duration_ms, button);
}

bool StandardSimulator::do_scroll(int x, int y, int notches) {
    if (auto* drv = foreground()) {
        Point p{x, y};
        return toScreen(p) && drv->scroll(p.x, p.y, notches);
    }
    return post_.scroll(x, y, notches);
}

bool StandardSimulator::do_key_tap(const ResolvedKey& key) {
    if (auto* drv = foreground()) return drv->key_tap(key);
    return post_.key_tap(key);
}

bool StandardSimulator::do_key_down(const ResolvedKey& key) {
    if (auto* drv = foreground()) return drv->key_down(key);
    return post_.key_down(key);
}

bool StandardSimulator::do_key_up(const ResolvedKey& key) {
    if (auto* drv = foreground()) return drv->key_up(key);
    return post_.key_up(key);
}

bool StandardSimulator::do_send_text(const std::string& text) {
    if (auto* drv = foreground()) return drv->send_text(text);
    return post_.send_text(text);
}

bool StandardSimulator::do_key_combination(const std::vector<ResolvedKey>& keys, int hold_ms) {
    if (auto* drv = foreground()) return drv->send_combination(keys, hold_ms);
    return post_.send_combination(keys, hold_ms);
}

} // namespace marionette
