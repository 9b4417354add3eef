#pragma once

/** \file cancellation.hpp
 *  \brief Cooperative cancellation flag shared between a caller and a running query.
 *
 * The owner calls cancel(); long-running loops poll is_cancelled() at their
 * checkpoints and bail out with error_code::cancelled.
 */

#include <atomic>

namespace quiver::core {

class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    void reset() noexcept { cancelled_.store(false, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace quiver::core
