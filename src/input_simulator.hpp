// =============================================================================
// Marionette - Input simulator facade
// =============================================================================
// One interface for every window kind. Public methods validate arguments
// (button names, key specs), then call the protected do_* hooks inside a
// guard: an escaping std::exception is logged with the operation name and
// becomes `false`. Callers never see an exception.
// =============================================================================
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "key_tables.hpp"
#include "window_system.hpp"

namespace marionette {

enum class OperationMode {
    StandardWindow,
    EmulatorWindow,
    Auto
};

enum class ExecutionMode {
    Foreground,     // bring to front + OS injection
    Background,     // window messages, window may stay hidden
    Emulator        // background delivery + emulator-dedicated paths
};

std::optional<OperationMode> parseOperationMode(const std::string& name);
const char* operationModeName(OperationMode mode);

// foreground* / background* / emulator_*; anything else -> Background (logged)
ExecutionMode parseExecutionMode(const std::string& tag);
const char* executionModeName(ExecutionMode mode);

class InputSimulator {
public:
    static constexpr int DEFAULT_CLICK_INTERVAL_MS = 100;
    static constexpr int DEFAULT_DRAG_MS = 500;
    static constexpr int DEFAULT_HOLD_MS = 100;

    InputSimulator(WindowSystem& ws, WindowHandle hwnd, ExecutionMode mode)
        : ws_(ws), hwnd_(hwnd), mode_(mode) {}
    virtual ~InputSimulator() = default;

    InputSimulator(const InputSimulator&) = delete;
    InputSimulator& operator=(const InputSimulator&) = delete;

    virtual const char* kind() const = 0;
    WindowHandle window() const { return hwnd_; }
    ExecutionMode execution_mode() const { return mode_; }

    bool click(int x, int y, const std::string& button = "left", int clicks = 1,
               int interval_ms = DEFAULT_CLICK_INTERVAL_MS);
    bool double_click(int x, int y, const std::string& button = "left");
    bool drag(int x1, int y1, int x2, int y2, const std::string& button = "left",
              int duration_ms = DEFAULT_DRAG_MS);
    bool drag_path(const std::vector<Point>& points, int duration_ms = DEFAULT_DRAG_MS,
                   const std::string& button = "left");
    bool scroll(int x, int y, int notches);
    bool send_key(const KeySpec& key);
    bool send_key_down(const KeySpec& key);
    bool send_key_up(const KeySpec& key);
    bool send_text(const std::string& text);
    bool send_key_combination(const std::vector<KeySpec>& keys, int hold_ms = DEFAULT_HOLD_MS);

protected:
    virtual bool do_click(int x, int y, MouseButton button) = 0;
    virtual bool do_double_click(int x, int y, MouseButton button, int interval_ms) = 0;
    virtual bool do_drag(int x1, int y1, int x2, int y2, MouseButton button, int duration_ms) = 0;
    virtual bool do_drag_path(const std::vector<Point>& points, int duration_ms, MouseButton button) = 0;
    virtual bool do_scroll(int x, int y, int notches) = 0;
    virtual bool do_key_tap(const ResolvedKey& key) = 0;
    virtual bool do_key_down(const ResolvedKey& key) = 0;
    virtual bool do_key_up(const ResolvedKey& key) = 0;
    virtual bool do_send_text(const std::string& text) = 0;
    virtual bool do_key_combination(const std::vector<ResolvedKey>& keys, int hold_ms) = 0;

    // Logs and returns false when the handle died since the simulator was built
    bool windowAlive(const char* op);

    WindowSystem& ws_;
    WindowHandle hwnd_;
    ExecutionMode mode_;

private:
    template<typename F>
    bool guarded(const char* op, F&& body);

    std::optional<MouseButton> buttonOrLog(const char* op, const std::string& name);
    std::optional<ResolvedKey> keyOrLog(const char* op, const KeySpec& key);
};

} // namespace marionette
