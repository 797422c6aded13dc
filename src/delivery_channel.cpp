// =============================================================================
// Marionette - Delivery channel base
// =============================================================================
#include "delivery_channel.hpp"
#include "marionette_log.hpp"

#include <algorithm>

namespace marionette {

const char* gestureStateName(GestureState s) {
    switch (s) {
        case GestureState::Idle:        return "idle";
        case GestureState::PressedDown: return "pressed";
        case GestureState::Moving:      return "moving";
        case GestureState::ReleasedUp:  return "released";
    }
    return "?";
}

int DeliveryChannel::dragSteps(int duration_ms) {
    return std::max(MIN_DRAG_STEPS, duration_ms * DRAG_STEPS_PER_SECOND / 1000);
}

bool DeliveryChannel::double_click(int x, int y, MouseButton button, int interval_ms) {
    if (!click(x, y, button)) return false;
    pause(interval_ms);
    return click(x, y, button);
}

bool DeliveryChannel::drag(int x1, int y1, int x2, int y2, MouseButton button, int duration_ms) {
    gesture_ = GestureState::Idle;
    if (!button_down(x1, y1, button)) {
        MNLOG_WARN("channel", "[%s] drag: press at (%d,%d) failed", name(), x1, y1);
        return false;
    }
    gesture_ = GestureState::PressedDown;

    const int steps = dragSteps(duration_ms);
    const int step_ms = std::max(0, duration_ms) / steps;
    int last_x = x1, last_y = y1;
    bool moved = true;

    try {
        gesture_ = GestureState::Moving;
        for (int i = 1; i <= steps; ++i) {
            int x = x1 + (x2 - x1) * i / steps;
            int y = y1 + (y2 - y1) * i / steps;
            if (!move_to(x, y, button)) {
                MNLOG_WARN("channel", "[%s] drag: move %d/%d failed", name(), i, steps);
                moved = false;
                break;
            }
            last_x = x;
            last_y = y;
            if (step_ms > 0) pause(step_ms);
        }
    } catch (const std::exception& e) {
        MNLOG_WARN("channel", "[%s] drag: move threw: %s", name(), e.what());
        moved = false;
    }

    // Release exactly once, where the pointer actually is
    gesture_ = GestureState::ReleasedUp;
    bool released = button_up(last_x, last_y, button);
    if (!released) {
        MNLOG_WARN("channel", "[%s] drag: release at (%d,%d) failed", name(), last_x, last_y);
    }
    return moved && released;
}

bool DeliveryChannel::drag_path(const std::vector<Point>& points, int duration_ms,
                                MouseButton button) {
    if (points.size() < 2) {
        MNLOG_ERROR("channel", "[%s] drag_path needs at least 2 points (got %zu)",
                    name(), points.size());
        return false;
    }

    const int segments = static_cast<int>(points.size()) - 1;
    const int segment_ms = duration_ms / segments;
    int succeeded = 0;

    for (int i = 0; i < segments; ++i) {
        const Point& a = points[i];
        const Point& b = points[i + 1];
        if (drag(a.x, a.y, b.x, b.y, button, segment_ms)) ++succeeded;
    }

    bool ok = succeeded * 100 >= segments * DRAG_PATH_SUCCESS_PERCENT;
    if (!ok) {
        MNLOG_WARN("channel", "[%s] drag_path: only %d/%d segments delivered",
                   name(), succeeded, segments);
    }
    return ok;
}

bool DeliveryChannel::key_tap(const ResolvedKey& key) {
    if (!key_down(key)) return false;
    return key_up(key);
}

bool DeliveryChannel::send_combination(const std::vector<ResolvedKey>& keys, int hold_ms) {
    if (keys.empty()) return false;

    std::vector<const ResolvedKey*> pressed;
    pressed.reserve(keys.size());
    bool ok = true;

    try {
        for (const auto& key : keys) {
            if (!key_down(key)) {
                MNLOG_WARN("channel", "[%s] combination: press of %s failed", name(), key.name.c_str());
                ok = false;
                break;
            }
            pressed.push_back(&key);
        }
        if (ok) pause(hold_ms);
    } catch (const std::exception& e) {
        MNLOG_WARN("channel", "[%s] combination: press threw: %s", name(), e.what());
        ok = false;
    }

    for (auto it = pressed.rbegin(); it != pressed.rend(); ++it) {
        bool released = false;
        try {
            released = key_up(**it);
        } catch (const std::exception& e) {
            MNLOG_WARN("channel", "[%s] combination: release threw: %s", name(), e.what());
        }
        if (!released) {
            MNLOG_WARN("channel", "[%s] combination: release of %s failed", name(), (*it)->name.c_str());
            ok = false;
        }
    }
    return ok;
}

} // namespace marionette
