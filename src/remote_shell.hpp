// =============================================================================
// Marionette - Remote shell targets for the text engine
// =============================================================================
// A RemoteShell is a set of Android instances that accept shell commands.
//   AdbShell  : "adb -s <serial> shell <cmd>"; instances from "adb devices"
//               or from a caller-provided serial source (LDPlayer ports)
//   MuMuShell : "<manager> adb -v <index> -c \"shell <cmd>\""; instances are
//               the VM indices the manager enumerates
// Instance ids are strings so both kinds look the same to the engine.
// =============================================================================
#pragma once

#include <functional>
#include <string>
#include <vector>
#include "config_loader.hpp"
#include "emulator_directory.hpp"
#include "process_runner.hpp"
#include "result.hpp"

namespace marionette {

class RemoteShell {
public:
    virtual ~RemoteShell() = default;

    virtual const char* name() const = 0;

    // Instances currently reachable, in a stable order
    virtual std::vector<std::string> instances() = 0;

    // Runs a shell command on one instance; output on success
    virtual Result<std::string> shell(const std::string& instance, const std::string& command) = 0;
};

// "adb devices" output -> serials in state "device" (mDNS duplicates skipped)
std::vector<std::string> parseAdbDevices(const std::string& output);

class AdbShell : public RemoteShell {
public:
    using SerialSource = std::function<std::vector<std::string>()>;

    // serial_source empty = ask "adb devices"
    AdbShell(ProcessRunner& runner, config::AdbConfig config, SerialSource serial_source = {});

    const char* name() const override { return "adb"; }
    std::vector<std::string> instances() override;
    Result<std::string> shell(const std::string& instance, const std::string& command) override;

private:
    ProcessRunner& runner_;
    config::AdbConfig config_;
    SerialSource serial_source_;
};

class MuMuShell : public RemoteShell {
public:
    MuMuShell(EmulatorDirectory& directory, RemoteBridge& bridge);

    const char* name() const override { return "mumu"; }
    std::vector<std::string> instances() override;
    Result<std::string> shell(const std::string& instance, const std::string& command) override;

private:
    EmulatorDirectory& directory_;
    RemoteBridge& bridge_;
};

} // namespace marionette
