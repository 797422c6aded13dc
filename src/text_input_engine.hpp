// =============================================================================
// Marionette - Multi-strategy text input engine
// =============================================================================
// Types text into Android instances through a RemoteShell, trying strategies
// in a fixed order until one is accepted:
//   1. adb-keyboard         am broadcast -a ADB_INPUT_TEXT --es msg '<text>'
//   2. adb-keyboard-b64     am broadcast -a ADB_INPUT_B64 --es msg <base64>
//   3. adb-keyboard-chars   am broadcast -a ADB_INPUT_CHARS --eia chars <cp,...>
//   4. input-text           input text <escaped>          (ASCII only in practice)
//   5. latin-ime-broadcast  am broadcast -a com.android.inputmethod.latin.SEND_TEXT
// Strategies 1-3 first make sure the ADB keyboard IME is installed, enabled
// and selected; that check is cached per instance.
//
// Latency: every shell call is bounded by the shell's timeout, so the worst
// case of one send_text is the sum over all strategies of
//   (readiness calls + one call per addressed instance) * timeout.
// A failed report means nothing may be assumed about what was typed.
// =============================================================================
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "config_loader.hpp"
#include "event_bus.hpp"
#include "remote_shell.hpp"
#include "result.hpp"

namespace marionette {

enum class TextInputMode {
    BroadcastAll,   // every instance; success if any accepted
    SingleTarget    // one instance chosen by window index / preferred instance
};

// "broadcast_all" / "single_target" and the legacy labels 单组文本 / 多组文本
std::optional<TextInputMode> parseTextInputMode(const std::string& name);
const char* textInputModeName(TextInputMode mode);

struct TextRequest {
    std::string text;                               // UTF-8
    TextInputMode mode = TextInputMode::BroadcastAll;
    size_t window_index = 0;
    std::optional<std::string> preferred_instance;
};

struct TextInputAttempt {
    std::string strategy_name;
    bool success = false;
    std::string diagnostic;
};

struct TextInputReport {
    bool success = false;
    std::vector<TextInputAttempt> attempts;

    // "adb-keyboard:fail, input-text:ok"
    std::string summary() const;
};

// =============================================================================
// KeyboardStateCache - "ADB keyboard is active on instance X" with a TTL
// =============================================================================
class KeyboardStateCache {
public:
    explicit KeyboardStateCache(std::chrono::seconds ttl = std::chrono::seconds(300));

    bool is_active(const std::string& instance_key) const;
    void mark_active(const std::string& instance_key);
    void invalidate(const std::string& instance_key);
    void clear();

    void set_ttl(std::chrono::seconds ttl);
    std::chrono::seconds ttl() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::chrono::seconds ttl_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> active_since_;
};

// =============================================================================
// Strategies
// =============================================================================
class TextStrategy {
public:
    virtual ~TextStrategy() = default;
    virtual const char* name() const = 0;
    virtual Result<void> deliver(RemoteShell& shell, const std::string& instance,
                                 const std::string& text) = 0;
};

constexpr const char* ADB_KEYBOARD_PACKAGE = "com.android.adbkeyboard";
constexpr const char* ADB_KEYBOARD_IME = "com.android.adbkeyboard/.AdbIME";

// Strategies 1-3 share the keyboard readiness check
class AdbKeyboardStrategy : public TextStrategy {
public:
    explicit AdbKeyboardStrategy(KeyboardStateCache& cache) : cache_(cache) {}

    Result<void> deliver(RemoteShell& shell, const std::string& instance,
                         const std::string& text) override;

    // Shell command that types text once the keyboard is active
    virtual std::string command_for(const std::string& text) const = 0;

protected:
    Result<void> ensureKeyboard(RemoteShell& shell, const std::string& instance);

    KeyboardStateCache& cache_;
};

class AdbKeyboardTextStrategy : public AdbKeyboardStrategy {
public:
    using AdbKeyboardStrategy::AdbKeyboardStrategy;
    const char* name() const override { return "adb-keyboard"; }
    std::string command_for(const std::string& text) const override;
};

class AdbKeyboardBase64Strategy : public AdbKeyboardStrategy {
public:
    using AdbKeyboardStrategy::AdbKeyboardStrategy;
    const char* name() const override { return "adb-keyboard-b64"; }
    std::string command_for(const std::string& text) const override;
};

class AdbKeyboardCharsStrategy : public AdbKeyboardStrategy {
public:
    using AdbKeyboardStrategy::AdbKeyboardStrategy;
    const char* name() const override { return "adb-keyboard-chars"; }
    std::string command_for(const std::string& text) const override;
};

class InputTextStrategy : public TextStrategy {
public:
    const char* name() const override { return "input-text"; }
    Result<void> deliver(RemoteShell& shell, const std::string& instance,
                         const std::string& text) override;
};

class LatinImeBroadcastStrategy : public TextStrategy {
public:
    const char* name() const override { return "latin-ime-broadcast"; }
    Result<void> deliver(RemoteShell& shell, const std::string& instance,
                         const std::string& text) override;
};

std::vector<std::unique_ptr<TextStrategy>> defaultTextStrategies(KeyboardStateCache& cache);

// =============================================================================
// TextInputEngine
// =============================================================================
class TextInputEngine {
public:
    TextInputEngine(RemoteShell& shell, const config::TextInputConfig& config = {},
                    EventBus* bus = nullptr);

    TextInputEngine(const TextInputEngine&) = delete;
    TextInputEngine& operator=(const TextInputEngine&) = delete;

    TextInputReport send_text(const TextRequest& request);

    // Replaces the strategy chain (order = priority)
    void set_strategies(std::vector<std::unique_ptr<TextStrategy>> strategies);
    std::vector<std::string> strategy_names() const;

    RemoteShell& shell() { return shell_; }
    KeyboardStateCache& keyboard_cache() { return keyboard_cache_; }

private:
    std::vector<std::string> pickTargets(const TextRequest& request,
                                         const std::vector<std::string>& instances) const;
    TextInputAttempt runStrategy(TextStrategy& strategy, const std::vector<std::string>& targets,
                                 const TextRequest& request);

    RemoteShell& shell_;
    KeyboardStateCache keyboard_cache_;
    std::vector<std::unique_ptr<TextStrategy>> strategies_;
    SubscriptionHandle session_sub_;
};

} // namespace marionette
