// =============================================================================
// Marionette - Simulator registry
// =============================================================================
// Builds and caches one InputSimulator per (window, operation mode,
// execution mode). Every lookup re-checks the window: a dead handle evicts
// its entries (here, in the classifier and in the resolver) and yields
// nullptr. Changing a default mode drops the whole cache.
// =============================================================================
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include "config_loader.hpp"
#include "emulator_simulator.hpp"
#include "event_bus.hpp"
#include "input_simulator.hpp"
#include "standard_simulator.hpp"
#include "target_resolver.hpp"
#include "text_input_engine.hpp"
#include "window_classifier.hpp"
#include "window_index_table.hpp"

namespace marionette {

class SimulatorRegistry {
public:
    // Borrowed collaborators; only window_system and classifier are required
    struct Dependencies {
        WindowSystem* window_system = nullptr;
        InputInjector* injector = nullptr;
        WindowClassifier* classifier = nullptr;
        TargetResolver* resolver = nullptr;
        RemoteBridge* family_b_bridge = nullptr;
        EmulatorDirectory* family_a_directory = nullptr;
        TextInputEngine* family_a_text = nullptr;
        TextInputEngine* family_b_text = nullptr;
        WindowIndexTable* index_table = nullptr;
        EventBus* bus = nullptr;
        config::InputConfig input;
        TextInputMode text_mode = TextInputMode::BroadcastAll;
    };

    explicit SimulatorRegistry(Dependencies deps);

    SimulatorRegistry(const SimulatorRegistry&) = delete;
    SimulatorRegistry& operator=(const SimulatorRegistry&) = delete;

    // nullptr = no simulator available (handle is not a window)
    std::shared_ptr<InputSimulator> get_simulator(WindowHandle hwnd, OperationMode op,
                                                  ExecutionMode exec);
    std::shared_ptr<InputSimulator> get_simulator(WindowHandle hwnd, const std::string& op,
                                                  const std::string& exec_tag);
    std::shared_ptr<InputSimulator> get_simulator(WindowHandle hwnd);   // defaults

    void set_default_operation_mode(OperationMode mode);
    void set_default_execution_mode(ExecutionMode mode);
    OperationMode default_operation_mode() const;
    ExecutionMode default_execution_mode() const;

    void clear_cache();
    void invalidate(WindowHandle hwnd);
    size_t cache_size() const;

private:
    using CacheKey = std::tuple<WindowHandle, OperationMode, ExecutionMode>;

    std::shared_ptr<InputSimulator> build(WindowHandle hwnd, OperationMode op, ExecutionMode exec);
    void evict(WindowHandle hwnd);

    Dependencies deps_;

    mutable std::mutex mutex_;
    OperationMode default_op_ = OperationMode::Auto;
    ExecutionMode default_exec_ = ExecutionMode::Background;
    std::map<CacheKey, std::shared_ptr<InputSimulator>> cache_;

    SubscriptionHandle rebind_sub_;
    SubscriptionHandle session_sub_;
};

} // namespace marionette
