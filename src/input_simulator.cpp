// =============================================================================
// Marionette - Input simulator facade
// =============================================================================
#include "input_simulator.hpp"
#include "marionette_log.hpp"

namespace marionette {

std::optional<OperationMode> parseOperationMode(const std::string& name) {
    if (name == "standard_window" || name == "standard") return OperationMode::StandardWindow;
    if (name == "emulator_window" || name == "emulator") return OperationMode::EmulatorWindow;
    if (name == "auto") return OperationMode::Auto;
    return std::nullopt;
}

const char* operationModeName(OperationMode mode) {
    switch (mode) {
        case OperationMode::StandardWindow: return "standard_window";
        case OperationMode::EmulatorWindow: return "emulator_window";
        case OperationMode::Auto:           return "auto";
    }
    return "auto";
}

ExecutionMode parseExecutionMode(const std::string& tag) {
    if (tag.rfind("foreground", 0) == 0) return ExecutionMode::Foreground;
    if (tag.rfind("background", 0) == 0) return ExecutionMode::Background;
    if (tag.rfind("emulator_", 0) == 0) return ExecutionMode::Emulator;
    MNLOG_WARN("simulator", "unknown execution mode '%s', using background", tag.c_str());
    return ExecutionMode::Background;
}

const char* executionModeName(ExecutionMode mode) {
    switch (mode) {
        case ExecutionMode::Foreground: return "foreground";
        case ExecutionMode::Background: return "background";
        case ExecutionMode::Emulator:   return "emulator";
    }
    return "background";
}

template<typename F>
bool InputSimulator::guarded(const char* op, F&& body) {
    try {
        return body();
    } catch (const std::exception& e) {
        MNLOG_ERROR("simulator", "[%s] %s on hwnd=0x%llx threw: %s", kind(), op,
                    (unsigned long long)hwnd_, e.what());
        return false;
    }
}

bool InputSimulator::windowAlive(const char* op) {
    if (ws_.is_window(hwnd_)) return true;
    MNLOG_WARN("simulator", "[%s] %s: hwnd=0x%llx is no longer a window", kind(), op,
               (unsigned long long)hwnd_);
    return false;
}

std::optional<MouseButton> InputSimulator::buttonOrLog(const char* op, const std::string& name) {
    auto b = parseMouseButton(name);
    if (!b) MNLOG_ERROR("simulator", "[%s] %s: unsupported button '%s'", kind(), op, name.c_str());
    return b;
}

std::optional<ResolvedKey> InputSimulator::keyOrLog(const char* op, const KeySpec& key) {
    auto k = resolveKey(key);
    if (!k) MNLOG_ERROR("simulator", "[%s] %s: unknown key %s", kind(), op, describeKey(key).c_str());
    return k;
}

bool InputSimulator::click(int x, int y, const std::string& button, int clicks, int interval_ms) {
    return guarded("click", [&] {
        auto b = buttonOrLog("click", button);
        if (!b || !windowAlive("click")) return false;
        if (clicks < 1) clicks = 1;
        if (clicks == 2) return do_double_click(x, y, *b, interval_ms);
        for (int i = 0; i < clicks; ++i) {
            if (i > 0) ws_.sleep_ms(interval_ms);
            if (!do_click(x, y, *b)) return false;
        }
        return true;
    });
}

bool InputSimulator::double_click(int x, int y, const std::string& button) {
    return guarded("double_click", [&] {
        auto b = buttonOrLog("double_click", button);
        if (!b || !windowAlive("double_click")) return false;
        return do_double_click(x, y, *b, DEFAULT_CLICK_INTERVAL_MS);
    });
}

bool InputSimulator::drag(int x1, int y1, int x2, int y2, const std::string& button, int duration_ms) {
    return guarded("drag", [&] {
        auto b = buttonOrLog("drag", button);
        if (!b || !windowAlive("drag")) return false;
        return do_drag(x1, y1, x2, y2, *b, duration_ms);
    });
}

bool InputSimulator::drag_path(const std::vector<Point>& points, int duration_ms, const std::string& button) {
    return guarded("drag_path", [&] {
        auto b = buttonOrLog("drag_path", button);
        if (!b || !windowAlive("drag_path")) return false;
        return do_drag_path(points, duration_ms, *b);
    });
}

bool InputSimulator::scroll(int x, int y, int notches) {
    return guarded("scroll", [&] {
        if (!windowAlive("scroll")) return false;
        return do_scroll(x, y, notches);
    });
}

bool InputSimulator::send_key(const KeySpec& key) {
    return guarded("send_key", [&] {
        auto k = keyOrLog("send_key", key);
        if (!k || !windowAlive("send_key")) return false;
        return do_key_tap(*k);
    });
}

bool InputSimulator::send_key_down(const KeySpec& key) {
    return guarded("send_key_down", [&] {
        auto k = keyOrLog("send_key_down", key);
        if (!k || !windowAlive("send_key_down")) return false;
        return do_key_down(*k);
    });
}

bool InputSimulator::send_key_up(const KeySpec& key) {
    return guarded("send_key_up", [&] {
        auto k = keyOrLog("send_key_up", key);
        if (!k || !windowAlive("send_key_up")) return false;
        return do_key_up(*k);
    });
}

bool InputSimulator::send_text(const std::string& text) {
    return guarded("send_text", [&] {
        if (!windowAlive("send_text")) return false;
        if (text.empty()) return true;
        return do_send_text(text);
    });
}

bool InputSimulator::send_key_combination(const std::vector<KeySpec>& keys, int hold_ms) {
    return guarded("send_key_combination", [&] {
        if (keys.empty()) {
            MNLOG_ERROR("simulator", "[%s] send_key_combination: no keys", kind());
            return false;
        }
        std::vector<ResolvedKey> resolved;
        resolved.reserve(keys.size());
        for (const auto& key : keys) {
            auto k = keyOrLog("send_key_combination", key);
            if (!k) return false;
            resolved.push_back(*k);
        }
        if (!windowAlive("send_key_combination")) return false;
        return do_key_combination(resolved, hold_ms);
    });
}

} // namespace marionette
