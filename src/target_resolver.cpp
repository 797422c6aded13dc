// =============================================================================
// Marionette - Window -> automation target resolver
// =============================================================================
#include "target_resolver.hpp"
#include "marionette_log.hpp"

#include <cstdio>
#include <vector>

namespace marionette {

namespace {

const char* const KW_LDPLAYER_CN = "\xe9\x9b\xb7\xe7\x94\xb5";   // 雷电
// MuMu安卓设备
const char* const KW_MUMU_DEVICE = "MuMu\xe5\xae\x89\xe5\x8d\x93\xe8\xae\xbe\xe5\xa4\x87";

bool isFamilyATitle(const std::string& title) {
    return containsText(title, KW_LDPLAYER_CN) || containsText(title, "LDPlayer") ||
           containsText(title, "TheRender");
}

} // namespace

std::string AutomationTarget::describe() const {
    if (is_vm()) return "vm:" + std::to_string(vm_index());
    char buf[32];
    std::snprintf(buf, sizeof(buf), "hwnd:0x%llx", (unsigned long long)window());
    return buf;
}

TargetResolver::TargetResolver(WindowSystem& ws, EmulatorDirectory* family_a,
                               EmulatorDirectory* family_b, EventBus* bus)
    : ws_(ws), family_a_(family_a), family_b_(family_b) {
    if (bus) {
        rebind_sub_ = bus->subscribe<WindowRebindEvent>([this](const WindowRebindEvent& e) {
            invalidate(static_cast<WindowHandle>(e.window));
        });
        session_sub_ = bus->subscribe<BindingSessionChangedEvent>(
            [this](const BindingSessionChangedEvent& e) {
                MNLOG_INFO("resolver", "binding session changed (%s)", e.session_id.c_str());
                bump_session();
            });
    }
}

std::optional<AutomationTarget> TargetResolver::resolve(WindowHandle hwnd, WindowCategory category) {
    if (!isEmulatorCategory(category)) return std::nullopt;

    if (!ws_.is_window(hwnd)) {
        invalidate(hwnd);
        return std::nullopt;
    }

    std::optional<AutomationTarget> cached;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(hwnd);
        if (it != cache_.end() && it->second.session_id == session_) {
            cached = it->second.target;
        }
    }

    if (cached) {
        if (targetAlive(*cached)) return cached;
        MNLOG_INFO("resolver", "cached target %s for hwnd=0x%llx stopped responding, new session",
                   cached->describe().c_str(), (unsigned long long)hwnd);
        bump_session();
    }

    auto target = compute(hwnd, category);
    if (target) {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_[hwnd] = CacheEntry{hwnd, *target, session_};
        MNLOG_DEBUG("resolver", "hwnd=0x%llx -> %s (session %llu)", (unsigned long long)hwnd,
                    target->describe().c_str(), (unsigned long long)session_);
    }
    return target;
}

std::optional<AutomationTarget> TargetResolver::compute(WindowHandle hwnd, WindowCategory category) {
    if (category == WindowCategory::EmulatorFamilyA) return resolveFamilyA(hwnd);
    return resolveFamilyB(hwnd);
}

AutomationTarget TargetResolver::resolveFamilyA(WindowHandle hwnd) {
    std::vector<WindowHandle> candidates;
    WindowHandle topmost = hwnd;
    WindowHandle cur = hwnd;

    for (int depth = 0; depth <= MAX_ANCESTOR_DEPTH && cur != 0; ++depth) {
        auto title = ws_.window_title(cur);
        auto cls = ws_.class_name(cur);
        if (title && cls && *cls != "RenderWindow" && isFamilyATitle(*title)) {
            candidates.push_back(cur);
        }
        topmost = cur;
        cur = ws_.parent(cur);
    }

    if (!candidates.empty() && family_a_ && family_a_->available()) {
        auto list = family_a_->instances();
        for (WindowHandle c : candidates) {
            for (const auto& inst : list) {
                if (inst.main_window == c) return AutomationTarget::forWindow(c);
            }
        }
        MNLOG_DEBUG("resolver", "console did not confirm any of %zu candidate(s)", candidates.size());
    }

    if (!candidates.empty()) return AutomationTarget::forWindow(candidates.front());
    return AutomationTarget::forWindow(topmost);
}

std::optional<AutomationTarget> TargetResolver::resolveFamilyB(WindowHandle hwnd) {
    if (!family_b_ || !family_b_->available()) {
        MNLOG_DEBUG("resolver", "no family-B directory, hwnd=0x%llx unresolved",
                    (unsigned long long)hwnd);
        return std::nullopt;
    }

    auto list = family_b_->instances();
    if (list.empty()) return std::nullopt;

    WindowHandle cur = hwnd;
    for (int depth = 0; depth <= MAX_ANCESTOR_DEPTH && cur != 0; ++depth) {
        if (const auto* inst = findInstanceByWindow(list, cur)) {
            return AutomationTarget::forVm(inst->index);
        }
        cur = ws_.parent(cur);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (fallback_session_ != session_ || fallback_.empty()) {
        std::vector<int> pool;
        pool.reserve(list.size());
        for (const auto& inst : list) pool.push_back(inst.index);
        fallback_.reset(std::move(pool));
        fallback_session_ = session_;
    }
    auto index = fallback_.assign(hwnd);
    if (!index) return std::nullopt;
    MNLOG_INFO("resolver", "hwnd=0x%llx has no exact VM match, assigned VM %d",
               (unsigned long long)hwnd, *index);
    return AutomationTarget::forVm(*index);
}

bool TargetResolver::targetAlive(const AutomationTarget& target) {
    if (target.is_window()) return ws_.is_window(target.window());
    if (!family_b_) return false;
    return findInstanceByIndex(family_b_->instances(), target.vm_index()) != nullptr;
}

WindowHandle TargetResolver::device_window(WindowHandle hwnd, WindowCategory category) {
    if (category == WindowCategory::EmulatorFamilyA) {
        auto target = resolve(hwnd, category);
        return (target && target->is_window()) ? target->window() : hwnd;
    }
    if (category != WindowCategory::EmulatorFamilyB) return hwnd;

    std::vector<WindowHandle> device_matches;
    WindowHandle topmost_match = 0;
    WindowHandle cur = hwnd;
    for (int depth = 0; depth <= MAX_ANCESTOR_DEPTH && cur != 0; ++depth) {
        auto title = ws_.window_title(cur);
        if (title) {
            if (containsText(*title, KW_MUMU_DEVICE)) device_matches.push_back(cur);
            if (containsText(*title, "MuMu")) topmost_match = cur;
        }
        cur = ws_.parent(cur);
    }

    if (!device_matches.empty()) {
        if (family_b_ && family_b_->available()) {
            auto list = family_b_->instances();
            for (WindowHandle c : device_matches) {
                if (findInstanceByWindow(list, c)) return c;
            }
        }
        return device_matches.front();
    }
    if (topmost_match != 0) return topmost_match;
    return hwnd;
}

void TargetResolver::invalidate(std::optional<WindowHandle> hwnd) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (hwnd) {
        cache_.erase(*hwnd);
    } else {
        cache_.clear();
    }
}

void TargetResolver::bump_session() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++session_;
        fallback_.clear();
        fallback_session_ = 0;
    }
    if (family_a_) family_a_->refresh();
    if (family_b_) family_b_->refresh();
}

uint64_t TargetResolver::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

} // namespace marionette
