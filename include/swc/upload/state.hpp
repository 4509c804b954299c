#pragma once

#include "swc/core/result.hpp"
#include "swc/transport/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace swc::upload {

enum class SessionState {
    Initializing,
    CreatingTransfer,
    Transferring,
    Syncing,
    Completed,
    Failed,
    Detached
};

const char* to_string(SessionState state);

inline bool is_terminal(SessionState state) noexcept {
    return state == SessionState::Completed || state == SessionState::Failed ||
           state == SessionState::Detached;
}

/**
 * @brief Summary of one upload, live or finished
 */
struct SessionInfo {
    std::string name;
    std::chrono::system_clock::time_point started_at{};
    SessionState state = SessionState::Initializing;
    std::optional<transport::TransferHandle> handle;
    std::optional<transport::ContentAddress> reference;
    bool synced = false;                 ///< Completed with full propagation
    std::optional<Error> last_error;     ///< Populated when state == Failed
};

/**
 * @brief Legal transitions between SessionState values
 *
 * Completed, Failed and Detached are terminal. Failure is reachable from
 * every live state; Detached only from Transferring and Syncing.
 */
class UploadStateMachine {
public:
    explicit UploadStateMachine(std::string name);

    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] const SessionInfo& info() const noexcept { return info_; }

    Result<void> transition_to(SessionState next_state);
    Result<void> mark_failed(Error error);
    Result<void> mark_completed(bool synced);

    void set_handle(transport::TransferHandle handle) { info_.handle = handle; }
    void set_reference(transport::ContentAddress reference) { info_.reference = std::move(reference); }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    SessionInfo info_;
};

} // namespace swc::upload
