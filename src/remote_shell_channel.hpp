// =============================================================================
// Marionette - Remote shell channel
// =============================================================================
// Input into an emulator VM through its manager binary:
//   <manager> adb -v <index> -c go_back              (shortcut keys)
//   <manager> adb -v <index> -c "shell input tap x y" (everything else)
// Coordinates are device coordinates. Android has no separate key down / up
// at this level: key_down sends the whole keyevent, key_up is a no-op.
// =============================================================================
#pragma once

#include <string>
#include <vector>
#include "delivery_channel.hpp"
#include "emulator_directory.hpp"

namespace marionette {

// First two words of a shell command: "input text a\ b" -> "input text"
std::string commandVerb(const std::string& command);

class RemoteShellChannel : public DeliveryChannel {
public:
    static constexpr int SCROLL_PIXELS_PER_NOTCH = 100;
    static constexpr int SCROLL_SWIPE_MS = 200;

    RemoteShellChannel(WindowSystem& ws, RemoteBridge& bridge, VmIndex index, WindowHandle target);

    const char* name() const override { return "remote"; }
    VmIndex vm_index() const { return index_; }

    bool click(int x, int y, MouseButton button) override;
    bool button_down(int x, int y, MouseButton button) override;
    bool move_to(int x, int y, MouseButton held) override;
    bool button_up(int x, int y, MouseButton button) override;
    bool scroll(int x, int y, int notches) override;
    bool key_down(const ResolvedKey& key) override;
    bool key_up(const ResolvedKey& key) override;
    bool send_text(const std::string& utf8) override;

    // One swipe instead of interpolated moves
    bool drag(int x1, int y1, int x2, int y2, MouseButton button, int duration_ms) override;
    bool key_tap(const ResolvedKey& key) override;

    // One continuous touch: motionevent DOWN, MOVE per point, UP at the end.
    // UP is sent exactly once whenever DOWN went through.
    bool drag_path(const std::vector<Point>& points, int duration_ms, MouseButton button) override;

private:
    bool shell(const std::string& command);

    RemoteBridge& bridge_;
    VmIndex index_;
};

} // namespace marionette
