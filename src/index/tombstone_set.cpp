/** \file tombstone_set.cpp
 *  \brief Implementation of the tombstoned-slot bitmap
 */

#include "quiver/index/tombstone_set.hpp"

#include <mutex>

namespace quiver::index {

TombstoneSet::TombstoneSet()
    : bitmap_(std::make_unique<roaring::Roaring>()) {}

TombstoneSet::~TombstoneSet() = default;

auto TombstoneSet::mark(std::uint32_t slot) -> std::expected<void, core::error> {
    std::unique_lock lock(mutex_);
    if (!bitmap_->addChecked(slot)) {
        return core::make_error(core::error_code::precondition_failed,
                                "slot already tombstoned", "index.tombstone_set");
    }
    return {};
}

auto TombstoneSet::count() const -> std::uint64_t {
    std::shared_lock lock(mutex_);
    return bitmap_->cardinality();
}

auto TombstoneSet::clear() -> void {
    std::unique_lock lock(mutex_);
    *bitmap_ = roaring::Roaring();
}

auto TombstoneSet::needs_compaction(std::uint64_t total_slots, double ratio) const -> bool {
    if (ratio <= 0.0 || total_slots == 0) return false;
    const auto deleted = count();
    return static_cast<double>(deleted) / static_cast<double>(total_slots) >= ratio;
}

} // namespace quiver::index
