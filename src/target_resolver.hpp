// =============================================================================
// Marionette - Window -> automation target resolver
// =============================================================================
// Maps a UI window handle to what input should actually be delivered to:
//   family A (LDPlayer) : the emulator's frame / device window
//   family B (MuMu)     : the VM index used by the manager's remote shell
// Results are cached per binding session. A session bump (explicit, event
// driven, or triggered by a dead cached target) makes every entry stale.
// =============================================================================
#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <variant>
#include "emulator_directory.hpp"
#include "event_bus.hpp"
#include "window_classifier.hpp"
#include "window_index_table.hpp"
#include "window_system.hpp"

namespace marionette {

class AutomationTarget {
public:
    static AutomationTarget forWindow(WindowHandle hwnd) { return AutomationTarget(hwnd); }
    static AutomationTarget forVm(VmIndex index) { return AutomationTarget(index); }

    bool is_window() const { return std::holds_alternative<WindowHandle>(value_); }
    bool is_vm() const { return std::holds_alternative<VmIndex>(value_); }

    WindowHandle window() const { return is_window() ? std::get<WindowHandle>(value_) : 0; }
    VmIndex vm_index() const { return is_vm() ? std::get<VmIndex>(value_) : -1; }

    bool operator==(const AutomationTarget& o) const { return value_ == o.value_; }
    bool operator!=(const AutomationTarget& o) const { return !(*this == o); }

    std::string describe() const;

private:
    explicit AutomationTarget(WindowHandle hwnd) : value_(hwnd) {}
    explicit AutomationTarget(VmIndex index) : value_(index) {}

    std::variant<WindowHandle, VmIndex> value_;
};

class TargetResolver {
public:
    static constexpr int MAX_ANCESTOR_DEPTH = 10;

    // Directories may be null (emulator not installed). bus may be null.
    TargetResolver(WindowSystem& ws, EmulatorDirectory* family_a, EmulatorDirectory* family_b,
                   EventBus* bus = nullptr);

    TargetResolver(const TargetResolver&) = delete;
    TargetResolver& operator=(const TargetResolver&) = delete;

    // nullopt for Standard / Unknown, or when nothing can be resolved
    std::optional<AutomationTarget> resolve(WindowHandle hwnd, WindowCategory category);

    // Window that key messages should be posted to
    WindowHandle device_window(WindowHandle hwnd, WindowCategory category);

    // One handle, or everything when hwnd is nullopt
    void invalidate(std::optional<WindowHandle> hwnd = std::nullopt);

    void bump_session();
    uint64_t session() const;

private:
    struct CacheEntry {
        WindowHandle handle = 0;
        AutomationTarget target = AutomationTarget::forWindow(0);
        uint64_t session_id = 0;
    };

    std::optional<AutomationTarget> compute(WindowHandle hwnd, WindowCategory category);
    AutomationTarget resolveFamilyA(WindowHandle hwnd);
    std::optional<AutomationTarget> resolveFamilyB(WindowHandle hwnd);
    bool targetAlive(const AutomationTarget& target);

    WindowSystem& ws_;
    EmulatorDirectory* family_a_;
    EmulatorDirectory* family_b_;

    mutable std::mutex mutex_;
    uint64_t session_ = 1;
    std::unordered_map<WindowHandle, CacheEntry> cache_;
    StableAssignmentTable fallback_;
    uint64_t fallback_session_ = 0;

    SubscriptionHandle rebind_sub_;
    SubscriptionHandle session_sub_;
};

} // namespace marionette
