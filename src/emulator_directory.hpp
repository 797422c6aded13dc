// =============================================================================
// Marionette - Emulator directory / remote bridge interfaces
// =============================================================================
// EmulatorDirectory: enumerates running emulator instances and their windows
//                    (MuMuManager "info -v all", ldconsole "list2").
// RemoteBridge:      runs commands inside one emulator instance through the
//                    manager binary ("<manager> adb -v <index> -c <command>").
// =============================================================================
#pragma once

#include <string>
#include <vector>
#include "result.hpp"
#include "window_system.hpp"

namespace marionette {

using VmIndex = int;

struct EmulatorInstance {
    VmIndex index = -1;
    std::string name;
    WindowHandle main_window = 0;     // top-level frame
    WindowHandle render_window = 0;   // rendering surface / bound child
    bool running = false;             // Android booted
};

class EmulatorDirectory {
public:
    virtual ~EmulatorDirectory() = default;

    // Manager / console binary configured and present
    virtual bool available() = 0;

    // Cached enumeration; empty when unavailable or the call failed
    virtual std::vector<EmulatorInstance> instances() = 0;

    // Drop the enumeration cache (next instances() re-runs the command)
    virtual void refresh() = 0;
};

class RemoteBridge {
public:
    virtual ~RemoteBridge() = default;

    virtual bool available() = 0;

    // <manager> adb -v <index> -c <command>      (go_back, go_home, ...)
    virtual Result<std::string> run_shortcut(VmIndex index, const std::string& command) = 0;

    // <manager> adb -v <index> -c "shell <raw>"
    virtual Result<std::string> run_shell(VmIndex index, const std::string& raw) = 0;
};

// Finds the instance whose main or render window equals hwnd
inline const EmulatorInstance* findInstanceByWindow(const std::vector<EmulatorInstance>& list,
                                                    WindowHandle hwnd) {
    if (hwnd == 0) return nullptr;
    for (const auto& inst : list) {
        if (inst.main_window == hwnd || inst.render_window == hwnd) return &inst;
    }
    return nullptr;
}

inline const EmulatorInstance* findInstanceByIndex(const std::vector<EmulatorInstance>& list,
                                                   VmIndex index) {
    for (const auto& inst : list) {
        if (inst.index == index) return &inst;
    }
    return nullptr;
}

} // namespace marionette
