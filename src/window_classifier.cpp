// =============================================================================
// Marionette - Window Classifier
// =============================================================================
#include "window_classifier.hpp"
#include "marionette_log.hpp"

#include <algorithm>
#include <cctype>

namespace marionette {

namespace {

// UTF-8 literals kept as escapes so the source stays ASCII
const char* const KW_LDPLAYER_CN = "\xe9\x9b\xb7\xe7\x94\xb5";           // 雷电
const char* const KW_EMULATOR_CN = "\xe6\xa8\xa1\xe6\x8b\x9f\xe5\x99\xa8"; // 模拟器

} // namespace

const char* windowCategoryName(WindowCategory c) {
    switch (c) {
        case WindowCategory::Standard:        return "standard";
        case WindowCategory::EmulatorFamilyA: return "emulator-a";
        case WindowCategory::EmulatorFamilyB: return "emulator-b";
        case WindowCategory::Unknown:         return "unknown";
    }
    return "unknown";
}

bool containsText(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool containsTextNoCase(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    return it != haystack.end();
}

std::vector<ClassifierRule> defaultClassifierRules() {
    std::vector<ClassifierRule> rules;

    // MuMu 12 render surface
    rules.push_back({"mumu-nemu-render", [](const WindowFacts& f) {
        return f.class_name == "nemuwin" && containsText(f.title, "nemudisplay");
    }, WindowCategory::EmulatorFamilyB});

    // MuMu render surface reusing the generic RenderWindow class
    rules.push_back({"mumu-render", [](const WindowFacts& f) {
        return f.class_name == "RenderWindow" && f.title == "TheRender" &&
               f.has_parent && containsText(f.parent_title, "MuMu");
    }, WindowCategory::EmulatorFamilyB});

    rules.push_back({"ldplayer-render", [](const WindowFacts& f) {
        return f.class_name == "RenderWindow";
    }, WindowCategory::EmulatorFamilyA});

    rules.push_back({"ldplayer-main", [](const WindowFacts& f) {
        return f.class_name == "LDPlayerMainFrame" ||
               containsText(f.title, KW_LDPLAYER_CN) ||
               containsTextNoCase(f.title, "LDPlayer");
    }, WindowCategory::EmulatorFamilyA});

    rules.push_back({"therender", [](const WindowFacts& f) {
        return f.class_name == "TheRender";
    }, WindowCategory::EmulatorFamilyA});

    rules.push_back({"mumu-main", [](const WindowFacts& f) {
        bool qt_main = f.class_name == "Qt5156QWindowIcon" || f.class_name == "Qt6QWindowIcon";
        return qt_main && (containsTextNoCase(f.title, "mumu") ||
                           containsText(f.title, KW_EMULATOR_CN));
    }, WindowCategory::EmulatorFamilyB});

    return rules;
}

WindowClassifier::WindowClassifier(WindowSystem& ws, std::vector<ClassifierRule> rules)
    : ws_(ws), rules_(std::move(rules)) {}

std::optional<WindowFacts> WindowClassifier::gather(WindowHandle hwnd) {
    auto cls = ws_.class_name(hwnd);
    auto title = ws_.window_title(hwnd);
    if (!cls || !title) return std::nullopt;

    WindowFacts facts;
    facts.handle = hwnd;
    facts.class_name = *cls;
    facts.title = *title;

    WindowHandle parent = ws_.parent(hwnd);
    if (parent != 0) {
        auto pcls = ws_.class_name(parent);
        auto ptitle = ws_.window_title(parent);
        if (pcls && ptitle) {
            facts.has_parent = true;
            facts.parent_class_name = *pcls;
            facts.parent_title = *ptitle;
        }
    }
    return facts;
}

WindowCategory WindowClassifier::classify(WindowHandle hwnd) {
    if (!ws_.is_window(hwnd)) {
        invalidate(hwnd);
        return WindowCategory::Unknown;
    }

    std::vector<ClassifierRule> rules;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(hwnd);
        if (it != cache_.end()) return it->second;
        rules = rules_;
    }

    WindowCategory category = WindowCategory::Standard;
    try {
        auto facts = gather(hwnd);
        if (!facts) {
            MNLOG_DEBUG("classifier", "hwnd=0x%llx vanished during classification",
                        (unsigned long long)hwnd);
            return WindowCategory::Unknown;
        }
        for (const auto& rule : rules) {
            if (rule.matches && rule.matches(*facts)) {
                category = rule.category;
                MNLOG_DEBUG("classifier", "hwnd=0x%llx class=%s matched rule %s -> %s",
                            (unsigned long long)hwnd, facts->class_name.c_str(),
                            rule.name.c_str(), windowCategoryName(category));
                break;
            }
        }
    } catch (const std::exception& e) {
        MNLOG_WARN("classifier", "hwnd=0x%llx classification failed: %s",
                   (unsigned long long)hwnd, e.what());
        return WindowCategory::Unknown;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[hwnd] = category;
    return category;
}

void WindowClassifier::add_rule(ClassifierRule rule) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.push_back(std::move(rule));
    cache_.clear();
}

void WindowClassifier::prepend_rule(ClassifierRule rule) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.insert(rules_.begin(), std::move(rule));
    cache_.clear();
}

std::vector<std::string> WindowClassifier::rule_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& r : rules_) names.push_back(r.name);
    return names;
}

void WindowClassifier::invalidate(WindowHandle hwnd) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.erase(hwnd);
}

void WindowClassifier::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

size_t WindowClassifier::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace marionette
