// =============================================================================
// Marionette - Remote shell targets for the text engine
// =============================================================================
#include "remote_shell.hpp"
#include "marionette_log.hpp"
#include "shell_security.hpp"

#include <sstream>

namespace marionette {

namespace {

void trimRight(std::string& s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
}

} // namespace

std::vector<std::string> parseAdbDevices(const std::string& output) {
    std::vector<std::string> devices;

    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.find("List of devices") != std::string::npos) continue;
        if (line.empty()) continue;

        // "serial\tdevice" / "serial\toffline"
        size_t tab_pos = line.find('\t');
        if (tab_pos == std::string::npos) continue;

        std::string id = line.substr(0, tab_pos);
        std::string status = line.substr(tab_pos + 1);
        trimRight(status);

        // mDNS records (adb-XXXX._adb-tls-connect._tcp) duplicate real devices
        if (id.rfind("adb-", 0) == 0 && id.find("._adb") != std::string::npos) continue;

        if (status == "device") devices.push_back(id);
    }
    return devices;
}

// =============================================================================
// AdbShell
// =============================================================================

AdbShell::AdbShell(ProcessRunner& runner, config::AdbConfig config, SerialSource serial_source)
    : runner_(runner), config_(std::move(config)), serial_source_(std::move(serial_source)) {}

std::vector<std::string> AdbShell::instances() {
    if (serial_source_) return serial_source_();

    std::vector<std::string> argv = {config_.adb_path, "devices"};
    auto r = runChecked(runner_, argv, config_.command_timeout_ms);
    if (r.is_err()) {
        MNLOG_WARN("text", "%s failed (%s): %s", describeCommand(argv).c_str(),
                   processErrorKindStr(r.error().kind), r.error().message.c_str());
        return {};
    }
    return parseAdbDevices(r.value().output);
}

Result<std::string> AdbShell::shell(const std::string& instance, const std::string& command) {
    if (!security::isValidDeviceSerial(instance)) {
        return Error("invalid device serial '" + instance + "'");
    }
    std::vector<std::string> argv = {config_.adb_path, "-s", instance, "shell", command};
    auto r = runChecked(runner_, argv, config_.command_timeout_ms);
    if (r.is_err()) {
        return Error(describeCommand(argv) + ": " + r.error().message, r.error().code);
    }
    return r.value().output;
}

// =============================================================================
// MuMuShell
// =============================================================================

MuMuShell::MuMuShell(EmulatorDirectory& directory, RemoteBridge& bridge)
    : directory_(directory), bridge_(bridge) {}

std::vector<std::string> MuMuShell::instances() {
    std::vector<std::string> ids;
    for (const auto& inst : directory_.instances()) ids.push_back(std::to_string(inst.index));
    return ids;
}

Result<std::string> MuMuShell::shell(const std::string& instance, const std::string& command) {
    VmIndex index = -1;
    try {
        size_t pos = 0;
        index = std::stoi(instance, &pos);
        if (pos != instance.size()) index = -1;
    } catch (const std::exception&) {
        index = -1;
    }
    if (!security::isValidVmIndex(index)) {
        return Error("invalid VM index '" + instance + "'");
    }
    return bridge_.run_shell(index, command);
}

} // namespace marionette
