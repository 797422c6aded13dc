// =============================================================================
// Marionette - MuMu manager bridge
// =============================================================================
#include "mumu_manager.hpp"
#include "marionette_log.hpp"
#include "shell_security.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace marionette {

namespace {

using json = nlohmann::json;

// "0x0001A2B4" / "1A2B4" / number -> handle. 0 when missing or malformed.
WindowHandle parseHandle(const json& v) {
    if (v.is_number_unsigned()) return static_cast<WindowHandle>(v.get<uint64_t>());
    if (v.is_number_integer()) return static_cast<WindowHandle>(v.get<int64_t>());
    if (!v.is_string()) return 0;
    const std::string s = v.get<std::string>();
    if (s.empty()) return 0;
    try {
        size_t pos = 0;
        unsigned long long h = std::stoull(s, &pos, 16);
        if (pos != s.size()) return 0;
        return static_cast<WindowHandle>(h);
    } catch (const std::exception&) {
        return 0;
    }
}

std::optional<int> parseIndex(const json& v) {
    if (v.is_number_integer()) return v.get<int>();
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (s.empty()) return std::nullopt;
        for (char c : s) {
            if (c < '0' || c > '9') return std::nullopt;
        }
        try {
            return std::stoi(s);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

bool parseFlag(const json& v) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number_integer()) return v.get<int>() != 0;
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        return s == "true" || s == "1" || s == "True";
    }
    return false;
}

std::optional<EmulatorInstance> parseInstance(const json& obj) {
    if (!obj.is_object() || !obj.contains("index")) return std::nullopt;
    auto index = parseIndex(obj["index"]);
    if (!index) return std::nullopt;

    EmulatorInstance inst;
    inst.index = *index;
    if (obj.contains("name") && obj["name"].is_string()) inst.name = obj["name"].get<std::string>();
    if (obj.contains("main_wnd")) inst.main_window = parseHandle(obj["main_wnd"]);
    if (obj.contains("render_wnd")) inst.render_window = parseHandle(obj["render_wnd"]);
    if (obj.contains("is_android_started")) inst.running = parseFlag(obj["is_android_started"]);
    return inst;
}

} // namespace

Result<std::vector<EmulatorInstance>> parseMuMuInfo(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::exception& e) {
        return Error(std::string("info output is not JSON: ") + e.what());
    }

    std::vector<EmulatorInstance> list;
    if (j.is_array()) {
        for (const auto& item : j) {
            if (auto inst = parseInstance(item)) list.push_back(*inst);
        }
    } else if (j.is_object()) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (auto inst = parseInstance(it.value())) list.push_back(*inst);
        }
        if (list.empty()) {
            if (auto inst = parseInstance(j)) list.push_back(*inst);
        }
    } else {
        return Error("unsupported info output shape");
    }

    std::sort(list.begin(), list.end(),
              [](const EmulatorInstance& a, const EmulatorInstance& b) { return a.index < b.index; });
    return list;
}

MuMuManager::MuMuManager(ProcessRunner& runner, config::MuMuConfig config)
    : runner_(runner), config_(std::move(config)) {}

bool MuMuManager::available() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !config_.manager_path.empty() && !missing_;
}

Result<std::string> MuMuManager::run(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(config_.manager_path);
    argv.insert(argv.end(), args.begin(), args.end());

    auto r = runChecked(runner_, argv, config_.command_timeout_ms);
    if (r.is_err()) {
        const auto& err = r.error();
        if (err.kind == ProcessError::Kind::NotFound) {
            std::lock_guard<std::mutex> lock(mutex_);
            missing_ = true;
        }
        MNLOG_WARN("mumu", "%s failed (%s): %s", describeCommand(argv).c_str(),
                   processErrorKindStr(err.kind), err.message.c_str());
        return Error(err.message, err.code);
    }
    return r.value().output;
}

std::vector<EmulatorInstance> MuMuManager::instances() {
    if (!available()) return {};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto age = std::chrono::steady_clock::now() - cache_time_;
        if (cache_valid_ && age < std::chrono::milliseconds(config_.info_cache_ms)) {
            return cache_;
        }
    }

    auto out = run({"info", "-v", "all"});
    if (out.is_err()) return {};

    auto parsed = parseMuMuInfo(out.value());
    if (parsed.is_err()) {
        MNLOG_WARN("mumu", "cannot parse instance list: %s", parsed.error().message.c_str());
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_ = parsed.value();
    cache_valid_ = true;
    cache_time_ = std::chrono::steady_clock::now();
    MNLOG_DEBUG("mumu", "enumerated %zu instance(s)", cache_.size());
    return cache_;
}

void MuMuManager::refresh() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_valid_ = false;
    cache_.clear();
}

Result<std::string> MuMuManager::run_shortcut(VmIndex index, const std::string& command) {
    if (!security::isValidVmIndex(index)) {
        return Error("invalid VM index " + std::to_string(index));
    }
    if (!available()) return Error("MuMu manager not available");
    return run({"adb", "-v", std::to_string(index), "-c", command});
}

Result<std::string> MuMuManager::run_shell(VmIndex index, const std::string& raw) {
    if (!security::isValidVmIndex(index)) {
        return Error("invalid VM index " + std::to_string(index));
    }
    if (!available()) return Error("MuMu manager not available");
    return run({"adb", "-v", std::to_string(index), "-c", "shell " + raw});
}

} // namespace marionette
