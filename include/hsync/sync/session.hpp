#pragma once

#include "hsync/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace hsync::sync {

enum class CycleState {
    Idle,
    Gathering,
    Exchanging,
    Reconciling,
    Finalizing
};

const char* state_name(CycleState state);

struct CycleInfo {
    std::string cycle_id;
    CycleState state = CycleState::Idle;
    std::size_t changes_sent = 0;
    std::string last_error;   ///< Set when the cycle was abandoned
    std::chrono::steady_clock::time_point started_at{};
};

/**
 * @brief State machine for one sync cycle
 *
 *   Idle -> Gathering -> Exchanging -> Reconciling -> Finalizing -> Idle
 *
 * abandon() returns to Idle from any state; nothing else may skip ahead or
 * step back.
 */
class SyncCycle {
public:
    explicit SyncCycle(std::string cycle_id);

    [[nodiscard]] const std::string& cycle_id() const noexcept { return info_.cycle_id; }
    [[nodiscard]] CycleState state() const noexcept { return info_.state; }
    [[nodiscard]] const CycleInfo& info() const noexcept { return info_; }

    Result<void> start();
    Result<void> transition_to(CycleState next_state);
    void abandon(std::string reason);

    void set_changes_sent(std::size_t count) noexcept { info_.changes_sent = count; }

    [[nodiscard]] std::chrono::milliseconds elapsed() const;
    [[nodiscard]] bool completed() const noexcept { return completed_; }
    [[nodiscard]] bool abandoned() const noexcept { return abandoned_; }

private:
    [[nodiscard]] bool can_transition(CycleState target) const noexcept;

    CycleInfo info_;
    bool started_ = false;
    bool completed_ = false;
    bool abandoned_ = false;
};

} // namespace hsync::sync
