// =============================================================================
// Marionette - Simulator registry
// =============================================================================
#include "simulator_registry.hpp"
#include "marionette_log.hpp"

#include <stdexcept>

namespace marionette {

SimulatorRegistry::SimulatorRegistry(Dependencies deps) : deps_(std::move(deps)) {
    if (!deps_.window_system || !deps_.classifier) {
        throw std::invalid_argument("SimulatorRegistry needs a window system and a classifier");
    }

    if (auto op = parseOperationMode(deps_.input.operation_mode)) {
        default_op_ = *op;
    } else {
        MNLOG_WARN("registry", "unknown operation mode '%s', using auto",
                   deps_.input.operation_mode.c_str());
    }
    default_exec_ = parseExecutionMode(deps_.input.execution_mode);

    if (deps_.bus) {
        rebind_sub_ = deps_.bus->subscribe<WindowRebindEvent>([this](const WindowRebindEvent& e) {
            evict(static_cast<WindowHandle>(e.window));
        });
        session_sub_ = deps_.bus->subscribe<BindingSessionChangedEvent>(
            [this](const BindingSessionChangedEvent&) {
                clear_cache();
                if (deps_.index_table) deps_.index_table->reset_session();
            });
    }
}

std::shared_ptr<InputSimulator> SimulatorRegistry::get_simulator(WindowHandle hwnd, OperationMode op,
                                                                 ExecutionMode exec) {
    if (!deps_.window_system->is_window(hwnd)) {
        invalidate(hwnd);
        MNLOG_WARN("registry", "no simulator available: hwnd=0x%llx is not a window",
                   (unsigned long long)hwnd);
        return nullptr;
    }

    const CacheKey key{hwnd, op, exec};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) return it->second;
    }

    auto sim = build(hwnd, op, exec);
    if (!sim) return nullptr;

    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = cache_.emplace(key, sim);
    MNLOG_DEBUG("registry", "hwnd=0x%llx op=%s exec=%s -> %s", (unsigned long long)hwnd,
                operationModeName(op), executionModeName(exec), inserted.first->second->kind());
    return inserted.first->second;
}

std::shared_ptr<InputSimulator> SimulatorRegistry::get_simulator(WindowHandle hwnd, const std::string& op,
                                                                 const std::string& exec_tag) {
    auto mode = parseOperationMode(op);
    if (!mode) {
        MNLOG_WARN("registry", "unknown operation mode '%s', using auto", op.c_str());
        mode = OperationMode::Auto;
    }
    return get_simulator(hwnd, *mode, parseExecutionMode(exec_tag));
}

std::shared_ptr<InputSimulator> SimulatorRegistry::get_simulator(WindowHandle hwnd) {
    OperationMode op;
    ExecutionMode exec;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        op = default_op_;
        exec = default_exec_;
    }
    return get_simulator(hwnd, op, exec);
}

std::shared_ptr<InputSimulator> SimulatorRegistry::build(WindowHandle hwnd, OperationMode op,
                                                         ExecutionMode exec) {
    WindowSystem& ws = *deps_.window_system;

    if (op == OperationMode::StandardWindow) {
        return std::make_shared<StandardSimulator>(ws, deps_.injector, hwnd, exec);
    }

    WindowCategory category = deps_.classifier->classify(hwnd);
    if (category == WindowCategory::Unknown && !ws.is_window(hwnd)) {
        invalidate(hwnd);
        MNLOG_WARN("registry", "hwnd=0x%llx vanished during classification",
                   (unsigned long long)hwnd);
        return nullptr;
    }

    if (isEmulatorCategory(category)) {
        EmulatorSimulator::Context ctx;
        ctx.resolver = deps_.resolver;
        ctx.family_b_bridge = deps_.family_b_bridge;
        ctx.family_a_directory = deps_.family_a_directory;
        ctx.family_a_text = deps_.family_a_text;
        ctx.family_b_text = deps_.family_b_text;
        ctx.index_table = deps_.index_table;
        ctx.text_mode = deps_.text_mode;
        return std::make_shared<EmulatorSimulator>(ws, deps_.injector, hwnd, exec, category, ctx);
    }

    if (op == OperationMode::EmulatorWindow) {
        MNLOG_WARN("registry", "hwnd=0x%llx requested as emulator but classified %s, using standard",
                   (unsigned long long)hwnd, windowCategoryName(category));
    }
    return std::make_shared<StandardSimulator>(ws, deps_.injector, hwnd, exec);
}

void SimulatorRegistry::set_default_operation_mode(OperationMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode == default_op_) return;
    default_op_ = mode;
    cache_.clear();
    MNLOG_INFO("registry", "default operation mode -> %s, cache cleared", operationModeName(mode));
}

void SimulatorRegistry::set_default_execution_mode(ExecutionMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mode == default_exec_) return;
    default_exec_ = mode;
    cache_.clear();
    MNLOG_INFO("registry", "default execution mode -> %s, cache cleared", executionModeName(mode));
}

OperationMode SimulatorRegistry::default_operation_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_op_;
}

ExecutionMode SimulatorRegistry::default_execution_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_exec_;
}

void SimulatorRegistry::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

void SimulatorRegistry::evict(WindowHandle hwnd) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (std::get<0>(it->first) == hwnd) {
            it = cache_.erase(it);
        } else {
            ++it;
        }
    }
}

void SimulatorRegistry::invalidate(WindowHandle hwnd) {
    evict(hwnd);
    deps_.classifier->invalidate(hwnd);
    if (deps_.resolver) deps_.resolver->invalidate(hwnd);
}

size_t SimulatorRegistry::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace marionette
