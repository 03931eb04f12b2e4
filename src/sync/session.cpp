#include "hsync/sync/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace hsync::sync {
namespace {

bool is_progressive(CycleState current, CycleState target) {
    static const std::unordered_map<CycleState, std::vector<CycleState>> transitions {
        {CycleState::Idle, {CycleState::Gathering}},
        {CycleState::Gathering, {CycleState::Exchanging, CycleState::Finalizing}},
        {CycleState::Exchanging, {CycleState::Reconciling}},
        {CycleState::Reconciling, {CycleState::Finalizing}},
        {CycleState::Finalizing, {CycleState::Idle}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* state_name(CycleState state) {
    switch (state) {
        case CycleState::Idle: return "idle";
        case CycleState::Gathering: return "gathering";
        case CycleState::Exchanging: return "exchanging";
        case CycleState::Reconciling: return "reconciling";
        case CycleState::Finalizing: return "finalizing";
    }
    return "idle";
}

SyncCycle::SyncCycle(std::string cycle_id) {
    info_.cycle_id = std::move(cycle_id);
    info_.state = CycleState::Idle;
}

Result<void> SyncCycle::start() {
    if (started_) {
        return Err<void>(ErrorKind::InvalidState, "cycle already started");
    }
    started_ = true;
    info_.started_at = std::chrono::steady_clock::now();
    return transition_to(CycleState::Gathering);
}

Result<void> SyncCycle::transition_to(CycleState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }
    if (!can_transition(next_state)) {
        return Err<void>(ErrorKind::InvalidState,
                         std::string("illegal cycle transition ") + state_name(info_.state) +
                         " -> " + state_name(next_state));
    }

    if (info_.state == CycleState::Finalizing && next_state == CycleState::Idle) {
        completed_ = true;
    }
    info_.state = next_state;
    return Ok();
}

void SyncCycle::abandon(std::string reason) {
    info_.last_error = std::move(reason);
    info_.state = CycleState::Idle;
    abandoned_ = true;
}

std::chrono::milliseconds SyncCycle::elapsed() const {
    if (!started_) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - info_.started_at);
}

bool SyncCycle::can_transition(CycleState target) const noexcept {
    if (!started_ || completed_ || abandoned_) {
        return false;
    }
    return is_progressive(info_.state, target);
}

} // namespace hsync::sync
