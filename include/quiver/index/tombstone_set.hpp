/** \file tombstone_set.hpp
 *  \brief Roaring-bitmap set of tombstoned graph slots.
 */

#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <shared_mutex>

#include "quiver/error.hpp"
#include "roaring.hh"

namespace quiver::index {

/**
 * \brief Thread-safe set of deleted slots.
 *
 * Slots are the graph's dense uint32 arena indices. The set is cleared and
 * rebuilt when compaction renumbers slots.
 */
class TombstoneSet {
public:
    TombstoneSet();
    ~TombstoneSet();

    TombstoneSet(const TombstoneSet&) = delete;
    TombstoneSet& operator=(const TombstoneSet&) = delete;

    /**
     * \brief Mark a slot as deleted
     * \return precondition_failed if already marked
     */
    auto mark(std::uint32_t slot) -> std::expected<void, core::error>;

    [[nodiscard]] auto count() const -> std::uint64_t;

    auto clear() -> void;

    /**
     * \brief Whether the deleted share of total_slots reached ratio (ratio <= 0 never triggers)
     */
    [[nodiscard]] auto needs_compaction(std::uint64_t total_slots, double ratio) const -> bool;

private:
    mutable std::shared_mutex mutex_;
    std::unique_ptr<roaring::Roaring> bitmap_;
};

} // namespace quiver::index
