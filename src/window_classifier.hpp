// =============================================================================
// Marionette - Window Classifier
// =============================================================================
// Decides which family a window belongs to by matching class name / title
// against an ordered list of signature rules. First matching rule wins.
// =============================================================================
#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "window_system.hpp"

namespace marionette {

enum class WindowCategory {
    Standard,
    EmulatorFamilyA,    // LDPlayer-like: input to the rendering / device frame via messages
    EmulatorFamilyB,    // MuMu-like: input via device window or VM index, text via remote IME
    Unknown             // OS query failed (window gone)
};

const char* windowCategoryName(WindowCategory c);

inline bool isEmulatorCategory(WindowCategory c) {
    return c == WindowCategory::EmulatorFamilyA || c == WindowCategory::EmulatorFamilyB;
}

// Everything a rule may look at, gathered once per classification
struct WindowFacts {
    WindowHandle handle = 0;
    std::string class_name;
    std::string title;
    bool has_parent = false;
    std::string parent_class_name;
    std::string parent_title;
};

struct ClassifierRule {
    std::string name;
    std::function<bool(const WindowFacts&)> matches;
    WindowCategory category = WindowCategory::Standard;
};

// Substring helpers shared with the resolver
bool containsText(const std::string& haystack, const std::string& needle);
bool containsTextNoCase(const std::string& haystack, const std::string& needle);

// Built-in signatures, in priority order
std::vector<ClassifierRule> defaultClassifierRules();

/**
 * Thread-safe classifier with a per-handle cache.
 *
 * Class name and title do not change while a window lives, so there is no
 * TTL; a cached entry is dropped once its handle stops being a window.
 * Never throws: OS failures classify as Unknown (not cached).
 */
class WindowClassifier {
public:
    explicit WindowClassifier(WindowSystem& ws,
                              std::vector<ClassifierRule> rules = defaultClassifierRules());

    WindowCategory classify(WindowHandle hwnd);

    // Rule registry
    void add_rule(ClassifierRule rule);       // lowest priority
    void prepend_rule(ClassifierRule rule);   // highest priority
    std::vector<std::string> rule_names() const;

    // Cache control
    void invalidate(WindowHandle hwnd);
    void clear();
    size_t cache_size() const;

private:
    std::optional<WindowFacts> gather(WindowHandle hwnd);

    WindowSystem& ws_;
    mutable std::mutex mutex_;
    std::vector<ClassifierRule> rules_;
    std::unordered_map<WindowHandle, WindowCategory> cache_;
};

} // namespace marionette
