#include "swc/upload/state.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace swc::upload {
namespace {

bool is_allowed(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Initializing, {SessionState::CreatingTransfer, SessionState::Failed}},
        {SessionState::CreatingTransfer, {SessionState::Transferring, SessionState::Failed}},
        {SessionState::Transferring, {SessionState::Syncing, SessionState::Failed, SessionState::Detached}},
        {SessionState::Syncing, {SessionState::Completed, SessionState::Failed, SessionState::Detached}},
    };

    auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Initializing: return "initializing";
        case SessionState::CreatingTransfer: return "creating transfer";
        case SessionState::Transferring: return "transferring";
        case SessionState::Syncing: return "syncing";
        case SessionState::Completed: return "completed";
        case SessionState::Failed: return "failed";
        case SessionState::Detached: return "detached";
    }
    return "unknown";
}

UploadStateMachine::UploadStateMachine(std::string name) {
    info_.name = std::move(name);
    info_.started_at = std::chrono::system_clock::now();
}

Result<void> UploadStateMachine::transition_to(SessionState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorKind::PreconditionFailed,
                         std::string("Illegal session state transition: ") + to_string(info_.state) +
                             " -> " + to_string(next_state));
    }

    info_.state = next_state;
    if (next_state != SessionState::Failed) {
        info_.last_error.reset();
    }
    return Ok();
}

Result<void> UploadStateMachine::mark_failed(Error error) {
    if (!can_transition(SessionState::Failed)) {
        return Err<void>(ErrorKind::PreconditionFailed,
                         std::string("Cannot fail a session that is ") + to_string(info_.state));
    }
    info_.last_error = std::move(error);
    return transition_to(SessionState::Failed);
}

Result<void> UploadStateMachine::mark_completed(bool synced) {
    auto result = transition_to(SessionState::Completed);
    if (result.is_ok()) {
        info_.synced = synced;
    }
    return result;
}

bool UploadStateMachine::can_transition(SessionState target) const noexcept {
    if (info_.state == target) {
        return true;
    }
    if (is_terminal(info_.state)) {
        return false;
    }
    return is_allowed(info_.state, target);
}

} // namespace swc::upload
