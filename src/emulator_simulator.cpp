// =============================================================================
// Marionette - Emulator window simulator
// =============================================================================
#include "emulator_simulator.hpp"
#include "ldplayer_console.hpp"
#include "marionette_log.hpp"
#include "remote_shell_channel.hpp"
#include "text_codec.hpp"

namespace marionette {

EmulatorSimulator::EmulatorSimulator(WindowSystem& ws, InputInjector* injector, WindowHandle hwnd,
                                     ExecutionMode mode, WindowCategory category, Context context)
    : StandardSimulator(ws, injector, hwnd, mode), category_(category), ctx_(context) {}

const char* EmulatorSimulator::kind() const {
    return familyA() ? "emulator-a" : "emulator-b";
}

std::optional<AutomationTarget> EmulatorSimulator::target() {
    if (!ctx_.resolver) return std::nullopt;
    return ctx_.resolver->resolve(hwnd_, category_);
}

WindowHandle EmulatorSimulator::frameWindow() {
    auto t = target();
    return (t && t->is_window()) ? t->window() : hwnd_;
}

WindowHandle EmulatorSimulator::deviceWindow() {
    if (!ctx_.resolver) return hwnd_;
    return ctx_.resolver->device_window(hwnd_, category_);
}

std::unique_ptr<DeliveryChannel> EmulatorSimulator::pointerChannel() {
    if (familyA()) {
        return std::make_unique<MessageChannel>(ws_, hwnd_, MessageDelivery::Send);
    }
    auto t = target();
    if (t && t->is_vm() && ctx_.family_b_bridge && ctx_.family_b_bridge->available()) {
        return std::make_unique<RemoteShellChannel>(ws_, *ctx_.family_b_bridge, t->vm_index(), hwnd_);
    }
    MNLOG_DEBUG("simulator", "[emulator-b] no VM for hwnd=0x%llx, posting to device window",
                (unsigned long long)hwnd_);
    return std::make_unique<MessageChannel>(ws_, deviceWindow(), MessageDelivery::Post);
}

// Click is the only operation that honors the execution mode; everything
// else takes the family path in every mode.
bool EmulatorSimulator::do_click(int x, int y, MouseButton button) {
    if (!dedicated()) return StandardSimulator::do_click(x, y, button);
    return pointerChannel()->click(x, y, button);
}

bool EmulatorSimulator::do_double_click(int x, int y, MouseButton button, int interval_ms) {
    if (!dedicated()) return StandardSimulator::do_double_click(x, y, button, interval_ms);
    return pointerChannel()->double_click(x, y, button, interval_ms);
}

bool EmulatorSimulator::do_drag(int x1, int y1, int x2, int y2, MouseButton button, int duration_ms) {
    return pointerChannel()->drag(x1, y1, x2, y2, button, duration_ms);
}

bool EmulatorSimulator::do_drag_path(const std::vector<Point>& points, int duration_ms,
                                     MouseButton button) {
    return pointerChannel()->drag_path(points, duration_ms, button);
}

bool EmulatorSimulator::do_scroll(int x, int y, int notches) {
    if (familyA()) {
        // Wheel goes to the frame, not the render child
        MessageChannel post(ws_, frameWindow(), MessageDelivery::Post);
        return post.scroll(x, y, notches);
    }
    return pointerChannel()->scroll(x, y, notches);
}

bool EmulatorSimulator::do_key_tap(const ResolvedKey& key) {
    if (familyA()) {
        MessageChannel post(ws_, hwnd_, MessageDelivery::Post);
        return post.key_tap(key);
    }
    auto t = target();
    if (t && t->is_vm() && ctx_.family_b_bridge && ctx_.family_b_bridge->available()) {
        RemoteShellChannel remote(ws_, *ctx_.family_b_bridge, t->vm_index(), hwnd_);
        return remote.key_tap(key);
    }
    MessageChannel post(ws_, deviceWindow(), MessageDelivery::Post);
    return post.key_tap(key);
}

bool EmulatorSimulator::do_key_down(const ResolvedKey& key) {
    if (familyA()) {
        MessageChannel post(ws_, hwnd_, MessageDelivery::Post);
        return post.key_down(key);
    }
    MessageChannel send(ws_, deviceWindow(), MessageDelivery::Send);
    return send.key_down(key);
}

bool EmulatorSimulator::do_key_up(const ResolvedKey& key) {
    if (familyA()) {
        MessageChannel post(ws_, hwnd_, MessageDelivery::Post);
        return post.key_up(key);
    }
    MessageChannel send(ws_, deviceWindow(), MessageDelivery::Send);
    return send.key_up(key);
}

bool EmulatorSimulator::do_key_combination(const std::vector<ResolvedKey>& keys, int hold_ms) {
    if (familyA()) {
        MessageChannel post(ws_, hwnd_, MessageDelivery::Post);
        return post.send_combination(keys, hold_ms);
    }
    MessageChannel send(ws_, deviceWindow(), MessageDelivery::Send);
    return send.send_combination(keys, hold_ms);
}

bool EmulatorSimulator::sendTextViaEngine(const std::string& text) {
    TextInputEngine* engine = familyA() ? ctx_.family_a_text : ctx_.family_b_text;
    if (!engine) return false;

    TextRequest request;
    request.text = text;
    request.mode = ctx_.text_mode;
    request.window_index = ctx_.index_table ? ctx_.index_table->index_of(hwnd_) : 0;

    if (familyA()) {
        if (ctx_.family_a_directory) {
            const WindowHandle frame = frameWindow();
            const auto list = ctx_.family_a_directory->instances();
            if (const auto* inst = findInstanceByWindow(list, frame)) {
                request.preferred_instance = LdPlayerConsole::adb_serial(inst->index);
            }
        }
    } else {
        auto t = target();
        if (t && t->is_vm()) request.preferred_instance = std::to_string(t->vm_index());
    }

    auto report = engine->send_text(request);
    if (!report.success) {
        MNLOG_INFO("simulator", "[%s] text engine failed (%s), falling back to WM_CHAR",
                   kind(), report.summary().c_str());
    }
    return report.success;
}

bool EmulatorSimulator::sendTextViaMessages(const std::string& text, WindowHandle to) {
    MessageChannel post(ws_, to, MessageDelivery::Post);
    ResolvedKey shift;
    shift.name = "shift";
    shift.vk = vk::Shift;
    for (char16_t unit : utf8ToUtf16(text)) {
        auto ck = ws_.key_for_char(unit);
        if (!ck) {
            if (!post.send_char(unit)) return false;
            continue;
        }
        ResolvedKey key;
        key.name = "char";
        key.vk = ck->vk;
        if (ck->shift && !post.key_down(shift)) return false;
        bool ok = post.key_down(key);
        if (ok) {
            ok = post.send_char(unit);
            if (!post.key_up(key)) ok = false;
        }
        if (ck->shift && !post.key_up(shift)) ok = false;
        if (!ok) return false;
    }
    return true;
}

bool EmulatorSimulator::do_send_text(const std::string& text) {
    if (sendTextViaEngine(text)) return true;
    return sendTextViaMessages(text, familyA() ? hwnd_ : deviceWindow());
}

} // namespace marionette
