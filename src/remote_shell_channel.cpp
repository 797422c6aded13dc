// =============================================================================
// Marionette - Remote shell channel
// =============================================================================
#include "remote_shell_channel.hpp"
#include "marionette_log.hpp"
#include "shell_security.hpp"

#include <algorithm>
#include <exception>

namespace marionette {

std::string commandVerb(const std::string& command) {
    size_t start = command.find_first_not_of(' ');
    if (start == std::string::npos) return std::string();
    size_t first_end = command.find(' ', start);
    if (first_end == std::string::npos) return command.substr(start);
    size_t second = command.find_first_not_of(' ', first_end);
    if (second == std::string::npos) return command.substr(start, first_end - start);
    size_t second_end = command.find(' ', second);
    if (second_end == std::string::npos) return command.substr(start);
    return command.substr(start, second_end - start);
}

RemoteShellChannel::RemoteShellChannel(WindowSystem& ws, RemoteBridge& bridge, VmIndex index,
                                       WindowHandle target)
    : DeliveryChannel(ws, target), bridge_(bridge), index_(index) {}

bool RemoteShellChannel::shell(const std::string& command) {
    auto r = bridge_.run_shell(index_, command);
    if (r.is_err()) {
        MNLOG_WARN("remote", "vm %d: '%s' failed: %s", index_, commandVerb(command).c_str(),
                   r.error().message.c_str());
        return false;
    }
    return true;
}

bool RemoteShellChannel::click(int x, int y, MouseButton button) {
    if (button != MouseButton::Left) {
        MNLOG_ERROR("remote", "vm %d: %s button has no touch equivalent", index_, mouseButtonName(button));
        return false;
    }
    return shell("input tap " + std::to_string(x) + " " + std::to_string(y));
}

bool RemoteShellChannel::button_down(int, int, MouseButton) {
    MNLOG_ERROR("remote", "vm %d: separate press is not supported, use drag", index_);
    return false;
}

bool RemoteShellChannel::move_to(int, int, MouseButton) {
    return false;
}

bool RemoteShellChannel::button_up(int, int, MouseButton) {
    return false;
}

bool RemoteShellChannel::drag(int x1, int y1, int x2, int y2, MouseButton button, int duration_ms) {
    if (button != MouseButton::Left) {
        MNLOG_ERROR("remote", "vm %d: %s button drag has no touch equivalent", index_, mouseButtonName(button));
        return false;
    }
    gesture_ = GestureState::Moving;
    bool ok = shell("input swipe " + std::to_string(x1) + " " + std::to_string(y1) + " " +
                    std::to_string(x2) + " " + std::to_string(y2) + " " +
                    std::to_string(std::max(1, duration_ms)));
    gesture_ = GestureState::ReleasedUp;
    return ok;
}

bool RemoteShellChannel::drag_path(const std::vector<Point>& points, int duration_ms,
                                   MouseButton button) {
    if (points.size() < 2) {
        MNLOG_ERROR("remote", "vm %d: drag_path needs at least 2 points (got %zu)", index_, points.size());
        return false;
    }
    if (button != MouseButton::Left) {
        MNLOG_ERROR("remote", "vm %d: %s button drag has no touch equivalent", index_, mouseButtonName(button));
        return false;
    }

    auto motion = [](const char* action, const Point& p) {
        return std::string("input motionevent ") + action + " " + std::to_string(p.x) + " " +
               std::to_string(p.y);
    };

    gesture_ = GestureState::PressedDown;
    if (!shell(motion("DOWN", points.front()))) {
        gesture_ = GestureState::Idle;
        return false;
    }

    const int segments = static_cast<int>(points.size()) - 1;
    const int segment_ms = duration_ms / segments;
    int moved = 0;
    gesture_ = GestureState::Moving;
    try {
        for (size_t i = 1; i < points.size(); ++i) {
            pause(segment_ms);
            if (shell(motion("MOVE", points[i]))) {
                ++moved;
            } else {
                MNLOG_WARN("remote", "vm %d: drag_path move %zu/%d lost", index_, i, segments);
            }
        }
    } catch (const std::exception& e) {
        MNLOG_WARN("remote", "vm %d: drag_path move threw: %s", index_, e.what());
        moved = 0;
    }

    bool released = shell(motion("UP", points.back()));
    gesture_ = GestureState::ReleasedUp;
    if (!released) return false;

    bool ok = moved * 100 >= segments * DRAG_PATH_SUCCESS_PERCENT;
    if (!ok) {
        MNLOG_WARN("remote", "vm %d: drag_path: only %d/%d moves delivered", index_, moved, segments);
    }
    return ok;
}

bool RemoteShellChannel::scroll(int x, int y, int notches) {
    if (notches == 0) return true;
    // Wheel up (positive) scrolls content down: finger moves downwards
    int y2 = y + notches * SCROLL_PIXELS_PER_NOTCH;
    return drag(x, y, x, std::max(0, y2), MouseButton::Left, SCROLL_SWIPE_MS);
}

bool RemoteShellChannel::key_down(const ResolvedKey& key) {
    if (auto shortcut = remoteShortcutFor(key.name)) {
        auto r = bridge_.run_shortcut(index_, *shortcut);
        if (r.is_err()) {
            MNLOG_WARN("remote", "vm %d: shortcut %s failed: %s", index_, shortcut->c_str(),
                       r.error().message.c_str());
            return false;
        }
        return true;
    }
    if (!key.android_code) {
        MNLOG_ERROR("remote", "vm %d: key '%s' has no Android key code", index_, key.name.c_str());
        return false;
    }
    return shell("input keyevent " + std::to_string(*key.android_code));
}

bool RemoteShellChannel::key_up(const ResolvedKey&) {
    return true;
}

bool RemoteShellChannel::key_tap(const ResolvedKey& key) {
    return key_down(key);
}

bool RemoteShellChannel::send_text(const std::string& utf8) {
    if (utf8.empty()) return true;
    return shell("input text " + security::escapeShellArg(utf8));
}

} // namespace marionette
