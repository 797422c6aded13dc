// =============================================================================
// Marionette - Window message channel
// =============================================================================
// Delivers input as window messages to one handle.
//   Post: PostMessage, fire-and-forget (background input to normal windows)
//   Send: SendMessage, blocks until processed (LDPlayer render windows only
//         accept clicks this way)
// Coordinates are client coordinates of the target window.
// =============================================================================
#pragma once

#include "delivery_channel.hpp"

namespace marionette {

enum class MessageDelivery { Post, Send };

// WM_KEYDOWN / WM_KEYUP lParam
//   bits 0-15 repeat, 16-23 scan, 24 extended, 30 previous state, 31 transition
int64_t keyMessageLParam(uint32_t scan, bool extended, bool key_up);

class MessageChannel : public DeliveryChannel {
public:
    MessageChannel(WindowSystem& ws, WindowHandle target, MessageDelivery delivery);

    const char* name() const override;
    MessageDelivery delivery() const { return delivery_; }

    bool click(int x, int y, MouseButton button) override;
    bool button_down(int x, int y, MouseButton button) override;
    bool move_to(int x, int y, MouseButton held) override;
    bool button_up(int x, int y, MouseButton button) override;
    bool scroll(int x, int y, int notches) override;
    bool key_down(const ResolvedKey& key) override;
    bool key_up(const ResolvedKey& key) override;
    bool send_text(const std::string& utf8) override;

    // WM_CHAR for a single UTF-16 unit
    bool send_char(char16_t unit);

private:
    bool deliver(uint32_t msg, uint64_t wparam, int64_t lparam);

    MessageDelivery delivery_;
};

} // namespace marionette
