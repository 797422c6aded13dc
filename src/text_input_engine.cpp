// =============================================================================
// Marionette - Multi-strategy text input engine
// =============================================================================
#include "text_input_engine.hpp"
#include "marionette_log.hpp"
#include "shell_security.hpp"
#include "text_codec.hpp"

#include <algorithm>

namespace marionette {

namespace {

// 单组文本 / 多组文本
const char* const LEGACY_BROADCAST_ALL = "\xe5\x8d\x95\xe7\xbb\x84\xe6\x96\x87\xe6\x9c\xac";
const char* const LEGACY_SINGLE_TARGET = "\xe5\xa4\x9a\xe7\xbb\x84\xe6\x96\x87\xe6\x9c\xac";

Result<void> runShell(RemoteShell& shell, const std::string& instance, const std::string& command) {
    auto r = shell.shell(instance, command);
    if (r.is_err()) return r.error();
    return {};
}

} // namespace

std::optional<TextInputMode> parseTextInputMode(const std::string& name) {
    if (name == "broadcast_all" || name == LEGACY_BROADCAST_ALL) return TextInputMode::BroadcastAll;
    if (name == "single_target" || name == LEGACY_SINGLE_TARGET) return TextInputMode::SingleTarget;
    return std::nullopt;
}

const char* textInputModeName(TextInputMode mode) {
    return mode == TextInputMode::BroadcastAll ? "broadcast_all" : "single_target";
}

std::string TextInputReport::summary() const {
    std::string s;
    for (const auto& a : attempts) {
        if (!s.empty()) s += ", ";
        s += a.strategy_name;
        s += a.success ? ":ok" : ":fail";
    }
    return s.empty() ? "(no attempts)" : s;
}

// =============================================================================
// KeyboardStateCache
// =============================================================================

KeyboardStateCache::KeyboardStateCache(std::chrono::seconds ttl) : ttl_(ttl) {}

bool KeyboardStateCache::is_active(const std::string& instance_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_since_.find(instance_key);
    if (it == active_since_.end()) return false;
    return std::chrono::steady_clock::now() - it->second < ttl_;
}

void KeyboardStateCache::mark_active(const std::string& instance_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_since_[instance_key] = std::chrono::steady_clock::now();
}

void KeyboardStateCache::invalidate(const std::string& instance_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_since_.erase(instance_key);
}

void KeyboardStateCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_since_.clear();
}

void KeyboardStateCache::set_ttl(std::chrono::seconds ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    ttl_ = ttl;
}

std::chrono::seconds KeyboardStateCache::ttl() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ttl_;
}

size_t KeyboardStateCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_since_.size();
}

// =============================================================================
// Strategies
// =============================================================================

Result<void> AdbKeyboardStrategy::ensureKeyboard(RemoteShell& shell, const std::string& instance) {
    const std::string key = std::string(shell.name()) + ":" + instance;
    if (cache_.is_active(key)) return {};

    auto pkgs = shell.shell(instance, std::string("pm list packages ") + ADB_KEYBOARD_PACKAGE);
    if (pkgs.is_err()) return pkgs.error();
    if (pkgs.value().find(ADB_KEYBOARD_PACKAGE) == std::string::npos) {
        return Error("ADB keyboard not installed on " + instance);
    }

    auto enabled = runShell(shell, instance, std::string("ime enable ") + ADB_KEYBOARD_IME);
    if (enabled.is_err()) return enabled;
    auto selected = runShell(shell, instance, std::string("ime set ") + ADB_KEYBOARD_IME);
    if (selected.is_err()) return selected;

    MNLOG_DEBUG("text", "ADB keyboard active on %s", key.c_str());
    cache_.mark_active(key);
    return {};
}

Result<void> AdbKeyboardStrategy::deliver(RemoteShell& shell, const std::string& instance,
                                          const std::string& text) {
    auto ready = ensureKeyboard(shell, instance);
    if (ready.is_err()) return ready;

    auto sent = runShell(shell, instance, command_for(text));
    if (sent.is_err()) {
        // Force a fresh readiness check next time
        cache_.invalidate(std::string(shell.name()) + ":" + instance);
    }
    return sent;
}

std::string AdbKeyboardTextStrategy::command_for(const std::string& text) const {
    return "am broadcast -a ADB_INPUT_TEXT --es msg " + security::quoteSingle(text);
}

std::string AdbKeyboardBase64Strategy::command_for(const std::string& text) const {
    return "am broadcast -a ADB_INPUT_B64 --es msg " + base64Encode(text);
}

std::string AdbKeyboardCharsStrategy::command_for(const std::string& text) const {
    return "am broadcast -a ADB_INPUT_CHARS --eia chars " + joinCodePoints(utf8ToCodePoints(text));
}

Result<void> InputTextStrategy::deliver(RemoteShell& shell, const std::string& instance,
                                        const std::string& text) {
    // Non-ASCII may be dropped by the device without an error
    return runShell(shell, instance, "input text " + security::escapeShellArg(text));
}

Result<void> LatinImeBroadcastStrategy::deliver(RemoteShell& shell, const std::string& instance,
                                                const std::string& text) {
    return runShell(shell, instance,
                    "am broadcast -a com.android.inputmethod.latin.SEND_TEXT --es text " +
                    security::quoteSingle(text));
}

std::vector<std::unique_ptr<TextStrategy>> defaultTextStrategies(KeyboardStateCache& cache) {
    std::vector<std::unique_ptr<TextStrategy>> list;
    list.push_back(std::make_unique<AdbKeyboardTextStrategy>(cache));
    list.push_back(std::make_unique<AdbKeyboardBase64Strategy>(cache));
    list.push_back(std::make_unique<AdbKeyboardCharsStrategy>(cache));
    list.push_back(std::make_unique<InputTextStrategy>());
    list.push_back(std::make_unique<LatinImeBroadcastStrategy>());
    return list;
}

// =============================================================================
// TextInputEngine
// =============================================================================

TextInputEngine::TextInputEngine(RemoteShell& shell, const config::TextInputConfig& config,
                                 EventBus* bus)
    : shell_(shell),
      keyboard_cache_(std::chrono::seconds(config.aggressive ? config.aggressive_cache_s
                                                             : config.keyboard_cache_s)),
      strategies_(defaultTextStrategies(keyboard_cache_)) {
    if (bus) {
        session_sub_ = bus->subscribe<BindingSessionChangedEvent>(
            [this](const BindingSessionChangedEvent&) { keyboard_cache_.clear(); });
    }
}

void TextInputEngine::set_strategies(std::vector<std::unique_ptr<TextStrategy>> strategies) {
    strategies_ = std::move(strategies);
}

std::vector<std::string> TextInputEngine::strategy_names() const {
    std::vector<std::string> names;
    for (const auto& s : strategies_) names.push_back(s->name());
    return names;
}

std::vector<std::string> TextInputEngine::pickTargets(const TextRequest& request,
                                                      const std::vector<std::string>& instances) const {
    if (instances.empty()) return {};
    if (request.mode == TextInputMode::BroadcastAll) return instances;

    if (request.preferred_instance &&
        std::find(instances.begin(), instances.end(), *request.preferred_instance) != instances.end()) {
        return {*request.preferred_instance};
    }
    return {instances[request.window_index % instances.size()]};
}

TextInputAttempt TextInputEngine::runStrategy(TextStrategy& strategy,
                                              const std::vector<std::string>& targets,
                                              const TextRequest& request) {
    TextInputAttempt attempt;
    attempt.strategy_name = strategy.name();

    if (targets.empty()) {
        attempt.diagnostic = "no instances";
        return attempt;
    }

    size_t accepted = 0;
    std::string errors;
    for (const auto& instance : targets) {
        std::string failure;
        try {
            auto r = strategy.deliver(shell_, instance, request.text);
            if (r.is_ok()) {
                ++accepted;
                continue;
            }
            failure = r.error().message;
        } catch (const std::exception& e) {
            failure = std::string("exception: ") + e.what();
        }
        if (!errors.empty()) errors += "; ";
        errors += instance + ": " + failure;
    }

    attempt.success = accepted > 0;
    if (attempt.success) {
        attempt.diagnostic = std::to_string(accepted) + "/" + std::to_string(targets.size()) +
                             " instance(s) accepted";
        if (!errors.empty()) attempt.diagnostic += " (" + errors + ")";
    } else {
        attempt.diagnostic = errors;
    }
    return attempt;
}

TextInputReport TextInputEngine::send_text(const TextRequest& request) {
    TextInputReport report;

    std::vector<std::string> instances;
    try {
        instances = shell_.instances();
    } catch (const std::exception& e) {
        MNLOG_WARN("text", "[%s] instance enumeration threw: %s", shell_.name(), e.what());
    }
    const auto targets = pickTargets(request, instances);

    MNLOG_DEBUG("text", "[%s] %zu byte(s), mode=%s, %zu/%zu instance(s) addressed",
                shell_.name(), request.text.size(), textInputModeName(request.mode),
                targets.size(), instances.size());

    for (auto& strategy : strategies_) {
        auto attempt = runStrategy(*strategy, targets, request);
        report.attempts.push_back(attempt);
        if (attempt.success) {
            report.success = true;
            MNLOG_INFO("text", "[%s] delivered via %s: %s", shell_.name(),
                       attempt.strategy_name.c_str(), attempt.diagnostic.c_str());
            return report;
        }
        MNLOG_DEBUG("text", "[%s] %s failed: %s", shell_.name(), attempt.strategy_name.c_str(),
                    attempt.diagnostic.c_str());
    }

    MNLOG_WARN("text", "[%s] all %zu strategies failed (%s)", shell_.name(),
               report.attempts.size(), report.summary().c_str());
    return report;
}

} // namespace marionette
