// =============================================================================
// Marionette - Delivery channel base
// =============================================================================
// A DeliveryChannel turns one input operation into one concrete mechanism
// (posted messages, sent messages, OS injection, remote shell). Subclasses
// implement the primitives; the composed operations (double click, drag,
// drag path, key tap, combination) live here so every channel gets the same
// retry-safe behavior:
//   - a successful down is always followed by its up
//   - a drag releases the button exactly once, even when a move fails/throws
//   - a combination releases every key it pressed, in reverse order
// =============================================================================
#pragma once

#include <string>
#include <vector>
#include "key_tables.hpp"
#include "window_system.hpp"

namespace marionette {

enum class GestureState {
    Idle,
    PressedDown,
    Moving,
    ReleasedUp
};

const char* gestureStateName(GestureState s);

class DeliveryChannel {
public:
    static constexpr int MIN_DRAG_STEPS = 10;
    static constexpr int DRAG_STEPS_PER_SECOND = 30;
    static constexpr int DRAG_PATH_SUCCESS_PERCENT = 70;
    static constexpr int DEFAULT_COMBINATION_HOLD_MS = 100;

    DeliveryChannel(WindowSystem& ws, WindowHandle target) : ws_(ws), target_(target) {}
    virtual ~DeliveryChannel() = default;

    DeliveryChannel(const DeliveryChannel&) = delete;
    DeliveryChannel& operator=(const DeliveryChannel&) = delete;

    virtual const char* name() const = 0;
    WindowHandle target() const { return target_; }

    // --- Primitives ---
    virtual bool click(int x, int y, MouseButton button) = 0;
    virtual bool button_down(int x, int y, MouseButton button) = 0;
    virtual bool move_to(int x, int y, MouseButton held) = 0;
    virtual bool button_up(int x, int y, MouseButton button) = 0;
    virtual bool scroll(int x, int y, int notches) = 0;
    virtual bool key_down(const ResolvedKey& key) = 0;
    virtual bool key_up(const ResolvedKey& key) = 0;
    virtual bool send_text(const std::string& utf8) = 0;

    // --- Composed ---
    virtual bool double_click(int x, int y, MouseButton button, int interval_ms);
    virtual bool drag(int x1, int y1, int x2, int y2, MouseButton button, int duration_ms);
    virtual bool drag_path(const std::vector<Point>& points, int duration_ms, MouseButton button);
    virtual bool key_tap(const ResolvedKey& key);
    virtual bool send_combination(const std::vector<ResolvedKey>& keys,
                                  int hold_ms = DEFAULT_COMBINATION_HOLD_MS);

    // State the last drag() ended in (ReleasedUp after any pressed drag)
    GestureState last_gesture_state() const { return gesture_; }

    static int dragSteps(int duration_ms);

protected:
    void pause(int ms) { ws_.sleep_ms(ms); }

    WindowSystem& ws_;
    WindowHandle target_;
    GestureState gesture_ = GestureState::Idle;
};

} // namespace marionette
