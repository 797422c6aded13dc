// =============================================================================
// Marionette - LDPlayer console bridge
// =============================================================================
#include "ldplayer_console.hpp"
#include "marionette_log.hpp"

#include <sstream>

namespace marionette {

namespace {

bool isDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

std::vector<std::string> splitCsv(const std::string& line) {
    std::vector<std::string> parts;
    std::string field;
    std::istringstream iss(line);
    while (std::getline(iss, field, ',')) parts.push_back(field);
    return parts;
}

} // namespace

std::vector<EmulatorInstance> parseLdList2(const std::string& text) {
    std::vector<EmulatorInstance> list;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
        if (line.empty()) continue;

        auto parts = splitCsv(line);
        if (parts.size() < 4 || !isDigits(parts[0])) continue;

        try {
            EmulatorInstance inst;
            inst.index = std::stoi(parts[0]);
            inst.name = parts[1];
            inst.main_window = isDigits(parts[2]) ? static_cast<WindowHandle>(std::stoull(parts[2])) : 0;
            inst.render_window = isDigits(parts[3]) ? static_cast<WindowHandle>(std::stoull(parts[3])) : 0;
            inst.running = parts.size() > 4 && parts[4] == "1";
            list.push_back(inst);
        } catch (const std::exception& e) {
            MNLOG_DEBUG("ldplayer", "skipping list2 line '%s': %s", line.c_str(), e.what());
        }
    }
    return list;
}

LdPlayerConsole::LdPlayerConsole(ProcessRunner& runner, config::LdPlayerConfig config)
    : runner_(runner), config_(std::move(config)) {}

bool LdPlayerConsole::available() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !config_.console_path.empty() && !missing_;
}

std::vector<EmulatorInstance> LdPlayerConsole::instances() {
    if (!available()) return {};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto age = std::chrono::steady_clock::now() - cache_time_;
        if (cache_valid_ && age < std::chrono::milliseconds(config_.list_cache_ms)) {
            return cache_;
        }
    }

    std::vector<std::string> argv = {config_.console_path, "list2"};
    auto r = runChecked(runner_, argv, config_.command_timeout_ms);
    if (r.is_err()) {
        const auto& err = r.error();
        MNLOG_WARN("ldplayer", "%s failed (%s): %s", describeCommand(argv).c_str(),
                   processErrorKindStr(err.kind), err.message.c_str());
        if (err.kind == ProcessError::Kind::NotFound) {
            std::lock_guard<std::mutex> lock(mutex_);
            missing_ = true;
        }
        return {};
    }

    auto list = parseLdList2(r.value().output);

    std::lock_guard<std::mutex> lock(mutex_);
    cache_ = std::move(list);
    cache_valid_ = true;
    cache_time_ = std::chrono::steady_clock::now();
    MNLOG_DEBUG("ldplayer", "enumerated %zu instance(s)", cache_.size());
    return cache_;
}

void LdPlayerConsole::refresh() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_valid_ = false;
    cache_.clear();
}

bool LdPlayerConsole::is_instance_window(WindowHandle hwnd) {
    for (const auto& inst : instances()) {
        if (inst.main_window == hwnd) return true;
    }
    return false;
}

std::string LdPlayerConsole::adb_serial(VmIndex index) {
    return "127.0.0.1:" + std::to_string(ADB_BASE_PORT + 2 * index);
}

} // namespace marionette
