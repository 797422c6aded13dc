// =============================================================================
// Marionette - MuMu manager bridge
// =============================================================================
// Wraps MuMuManager.exe:
//   info -v all                 -> instance / window enumeration (JSON)
//   adb -v <i> -c <command>     -> shortcut commands (go_back, go_home, ...)
//   adb -v <i> -c "shell <raw>" -> raw Android shell
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

// Parses "info -v all" output. Accepts an object keyed by index, a single
// instance object (has "index") or an array of instance objects.
Result<std::vector<EmulatorInstance>> parseMuMuInfo(const std::string& json_text);

class MuMuManager : public EmulatorDirectory, public RemoteBridge {
public:
    MuMuManager(ProcessRunner& runner, config::MuMuConfig config);

    // EmulatorDirectory
    bool available() override;
    std::vector<EmulatorInstance> instances() override;
    void refresh() override;

    // RemoteBridge
    Result<std::string> run_shortcut(VmIndex index, const std::string& command) override;
    Result<std::string> run_shell(VmIndex index, const std::string& raw) override;

    const config::MuMuConfig& config() const { return config_; }

private:
    Result<std::string> run(const std::vector<std::string>& args);

    ProcessRunner& runner_;
    config::MuMuConfig config_;

    std::mutex mutex_;
    bool missing_ = false;   // last spawn reported the binary as missing
    bool cache_valid_ = false;
    std::chrono::steady_clock::time_point cache_time_;
    std::vector<EmulatorInstance> cache_;
};

} // namespace marionette
