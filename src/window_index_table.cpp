// =============================================================================
// Marionette - Stable window index assignment
// =============================================================================
#include "window_index_table.hpp"

#include <algorithm>

namespace marionette {

// =============================================================================
// StableAssignmentTable
// =============================================================================

void StableAssignmentTable::reset(std::vector<int> pool) {
    std::sort(pool.begin(), pool.end());
    pool.erase(std::unique(pool.begin(), pool.end()), pool.end());
    pool_ = std::move(pool);
    slots_.clear();
}

void StableAssignmentTable::clear() {
    slots_.clear();
}

bool StableAssignmentTable::empty() const {
    return pool_.empty();
}

size_t StableAssignmentTable::slot_of(WindowHandle hwnd) {
    auto it = slots_.find(hwnd);
    if (it != slots_.end()) return it->second;
    size_t slot = slots_.size();
    slots_.emplace(hwnd, slot);
    return slot;
}

std::optional<int> StableAssignmentTable::assign(WindowHandle hwnd) {
    if (pool_.empty()) return std::nullopt;
    return pool_[slot_of(hwnd) % pool_.size()];
}

// =============================================================================
// WindowIndexTable
// =============================================================================

void WindowIndexTable::set_bound_windows(std::vector<WindowHandle> bound) {
    std::sort(bound.begin(), bound.end());
    bound.erase(std::unique(bound.begin(), bound.end()), bound.end());
    std::lock_guard<std::mutex> lock(mutex_);
    bound_ = std::move(bound);
    unbound_.clear();
}

std::vector<WindowHandle> WindowIndexTable::bound_windows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bound_;
}

size_t WindowIndexTable::index_of(WindowHandle hwnd) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::lower_bound(bound_.begin(), bound_.end(), hwnd);
    if (it != bound_.end() && *it == hwnd) {
        return static_cast<size_t>(it - bound_.begin());
    }
    return bound_.size() + unbound_.slot_of(hwnd);
}

void WindowIndexTable::reset_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    unbound_.clear();
}

} // namespace marionette
