// =============================================================================
// Marionette - Window message channel
// =============================================================================
#include "message_channel.hpp"
#include "marionette_log.hpp"
#include "text_codec.hpp"

namespace marionette {

namespace {

struct ButtonMessages {
    uint32_t down;
    uint32_t up;
    uint64_t mk;
};

ButtonMessages buttonMessages(MouseButton button) {
    switch (button) {
        case MouseButton::Right:  return {wm::RBUTTONDOWN, wm::RBUTTONUP, wm::MK_RBUTTON};
        case MouseButton::Middle: return {wm::MBUTTONDOWN, wm::MBUTTONUP, wm::MK_MBUTTON};
        case MouseButton::Left:   break;
    }
    return {wm::LBUTTONDOWN, wm::LBUTTONUP, wm::MK_LBUTTON};
}

} // namespace

int64_t keyMessageLParam(uint32_t scan, bool extended, bool key_up) {
    uint32_t lp = 1;                              // repeat count
    lp |= (scan & 0xFFu) << 16;
    if (extended) lp |= 1u << 24;
    if (key_up) lp |= (1u << 30) | (1u << 31);   // previous state + transition
    return static_cast<int64_t>(lp);
}

MessageChannel::MessageChannel(WindowSystem& ws, WindowHandle target, MessageDelivery delivery)
    : DeliveryChannel(ws, target), delivery_(delivery) {}

const char* MessageChannel::name() const {
    return delivery_ == MessageDelivery::Post ? "post" : "send";
}

bool MessageChannel::deliver(uint32_t msg, uint64_t wparam, int64_t lparam) {
    bool ok = delivery_ == MessageDelivery::Post
        ? ws_.post_message(target_, msg, wparam, lparam)
        : ws_.send_message(target_, msg, wparam, lparam);
    if (!ok) {
        MNLOG_DEBUG("channel", "[%s] msg=0x%04x to hwnd=0x%llx failed", name(), msg,
                    (unsigned long long)target_);
    }
    return ok;
}

bool MessageChannel::click(int x, int y, MouseButton button) {
    const int64_t lp = makeLParam(x, y);
    const auto bm = buttonMessages(button);

    if (!deliver(wm::MOUSEMOVE, 0, lp)) return false;
    if (!deliver(bm.down, bm.mk, lp)) return false;
    return deliver(bm.up, 0, lp);
}

bool MessageChannel::button_down(int x, int y, MouseButton button) {
    const auto bm = buttonMessages(button);
    return deliver(bm.down, bm.mk, makeLParam(x, y));
}

bool MessageChannel::move_to(int x, int y, MouseButton held) {
    return deliver(wm::MOUSEMOVE, buttonMessages(held).mk, makeLParam(x, y));
}

bool MessageChannel::button_up(int x, int y, MouseButton button) {
    return deliver(buttonMessages(button).up, 0, makeLParam(x, y));
}

bool MessageChannel::scroll(int x, int y, int notches) {
    // WM_MOUSEWHEEL carries screen coordinates
    Point pt{x, y};
    if (auto screen = ws_.client_to_screen(target_, pt)) pt = *screen;

    const uint64_t wp = static_cast<uint64_t>(makeLParam(0, notches * wm::WHEEL_DELTA));
    return deliver(wm::MOUSEWHEEL, wp, makeLParam(pt.x, pt.y));
}

bool MessageChannel::key_down(const ResolvedKey& key) {
    if (key.vk == 0) {
        MNLOG_ERROR("channel", "[%s] key '%s' has no virtual-key code", name(), key.name.c_str());
        return false;
    }
    uint32_t scan = ws_.scan_code(key.vk);
    return deliver(wm::KEYDOWN, key.vk, keyMessageLParam(scan, key.extended, false));
}

bool MessageChannel::key_up(const ResolvedKey& key) {
    if (key.vk == 0) return false;
    uint32_t scan = ws_.scan_code(key.vk);
    return deliver(wm::KEYUP, key.vk, keyMessageLParam(scan, key.extended, true));
}

bool MessageChannel::send_char(char16_t unit) {
    return deliver(wm::CHAR, static_cast<uint64_t>(unit), 1);
}

bool MessageChannel::send_text(const std::string& utf8) {
    const std::u16string units = utf8ToUtf16(utf8);
    size_t sent = 0;
    for (char16_t u : units) {
        if (!send_char(u)) break;
        ++sent;
    }
    if (sent != units.size()) {
        MNLOG_WARN("channel", "[%s] WM_CHAR stopped after %zu/%zu units", name(), sent, units.size());
        return false;
    }
    return true;
}

} // namespace marionette
