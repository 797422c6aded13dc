// =============================================================================
// Marionette - Stable window index assignment
// =============================================================================
// StableAssignmentTable: hands out values from a sorted pool to handles in
// first-seen order. The same handle always gets the same value until reset().
// Used by the resolver (family-B fallback VM index) and WindowIndexTable.
// =============================================================================
#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include "window_system.hpp"

namespace marionette {

class StableAssignmentTable {
public:
    StableAssignmentTable() = default;
    explicit StableAssignmentTable(std::vector<int> pool) { reset(std::move(pool)); }

    // Replace the pool (sorted + deduplicated) and forget all assignments
    void reset(std::vector<int> pool);
    void clear();   // forget assignments, keep pool

    bool empty() const;
    const std::vector<int>& pool() const { return pool_; }

    // First-seen slot of the handle (0, 1, 2, ...). Assigns one if new.
    size_t slot_of(WindowHandle hwnd);

    // pool[slot_of(hwnd) % pool.size()]; nullopt when the pool is empty
    std::optional<int> assign(WindowHandle hwnd);

    size_t assigned_count() const { return slots_.size(); }

private:
    std::vector<int> pool_;
    std::unordered_map<WindowHandle, size_t> slots_;
};

/**
 * Maps a window handle to a small integer index used for text routing.
 *
 * Bound windows (from config or the binding UI) get their position in the
 * sorted list; any other window gets bound_count + first-seen slot.
 * Thread-safe.
 */
class WindowIndexTable {
public:
    WindowIndexTable() = default;
    explicit WindowIndexTable(std::vector<WindowHandle> bound) { set_bound_windows(std::move(bound)); }

    void set_bound_windows(std::vector<WindowHandle> bound);
    std::vector<WindowHandle> bound_windows() const;

    size_t index_of(WindowHandle hwnd);

    // New binding session: first-seen slots start over
    void reset_session();

private:
    mutable std::mutex mutex_;
    std::vector<WindowHandle> bound_;
    StableAssignmentTable unbound_;
};

} // namespace marionette
