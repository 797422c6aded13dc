// =============================================================================
// Marionette - LDPlayer console bridge
// =============================================================================
// Wraps ldconsole.exe "list2":
//   index,title,top_hwnd,bind_hwnd,android_started,pid   (decimal handles)
// The resolver uses it to confirm family-A top windows; the text engine uses
// adb_serial() to reach an instance over adb.
// =============================================================================
#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include "config_loader.hpp"
#include "emulator_directory.hpp"
#include "process_runner.hpp"

namespace marionette {

// Parses list2 output; malformed lines are skipped
std::vector<EmulatorInstance> parseLdList2(const std::string& text);

class LdPlayerConsole : public EmulatorDirectory {
public:
    static constexpr int ADB_BASE_PORT = 5555;

    LdPlayerConsole(ProcessRunner& runner, config::LdPlayerConfig config);

    bool available() override;
    std::vector<EmulatorInstance> instances() override;
    void refresh() override;

    // True when hwnd is the top window of a listed instance
    bool is_instance_window(WindowHandle hwnd);

    // "127.0.0.1:<5555 + 2*index>"
    static std::string adb_serial(VmIndex index);

private:
    ProcessRunner& runner_;
    config::LdPlayerConfig config_;

    std::mutex mutex_;
    bool missing_ = false;
    bool cache_valid_ = false;
    std::chrono::steady_clock::time_point cache_time_;
    std::vector<EmulatorInstance> cache_;
};

} // namespace marionette
