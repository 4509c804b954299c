/**
 * @file components.hpp
 * @brief Ready-made subscribers for session and transfer list events
 *
 * EXAMPLE:
 * auto session = service.start_file_upload(path);
 * LoggerComponent logger(session->events());
 */

#pragma once

#include "swc/events/event_bus.hpp"
#include "swc/events/events.hpp"

#include <spdlog/spdlog.h>

namespace swc::events {

/**
 * @brief Logs every event published on a bus
 *
 * Progress goes out at debug level; transitions and outcomes at info, or
 * error for failures. The component must outlive the bus subscriptions,
 * so keep it alive for as long as the bus can emit.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<StateChangedEvent>([this](const StateChangedEvent& e) {
            on_state_changed(e);
        });

        bus_.subscribe<ProgressUpdatedEvent>([this](const ProgressUpdatedEvent& e) {
            on_progress(e);
        });

        bus_.subscribe<TransferCreatedEvent>([this](const TransferCreatedEvent& e) {
            on_transfer_created(e);
        });

        bus_.subscribe<PayloadStoredEvent>([this](const PayloadStoredEvent& e) {
            on_payload_stored(e);
        });

        bus_.subscribe<SessionCompletedEvent>([this](const SessionCompletedEvent& e) {
            on_completed(e);
        });

        bus_.subscribe<SessionFailedEvent>([this](const SessionFailedEvent& e) {
            on_failed(e);
        });

        bus_.subscribe<NodeUnreachableEvent>([this](const NodeUnreachableEvent& e) {
            on_node_unreachable(e);
        });

        bus_.subscribe<NodeReachableEvent>([this](const NodeReachableEvent& e) {
            on_node_reachable(e);
        });
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_state_changed(const StateChangedEvent& e) {
        spdlog::info("[State] name={} {} -> {}", e.name, upload::to_string(e.from), upload::to_string(e.to));
    }

    void on_progress(const ProgressUpdatedEvent& e) {
        spdlog::debug("[Progress] name={} tag={} {} {:.0f}% bytes={}/{}",
                      e.name, e.handle.value_or(0), upload::describe(e.progress),
                      e.progress.percent, e.progress.bytes, e.progress.total_bytes);
    }

    void on_transfer_created(const TransferCreatedEvent& e) {
        spdlog::info("[TransferCreated] name={} tag={}", e.name, e.handle);
    }

    void on_payload_stored(const PayloadStoredEvent& e) {
        spdlog::info("[PayloadStored] name={} tag={} reference={}", e.name, e.handle, e.reference);
    }

    void on_completed(const SessionCompletedEvent& e) {
        spdlog::info("[UploadCompleted] name={} tag={} reference={} synced={} duration={}ms",
                     e.name, e.handle, e.reference, e.synced, e.duration.count());
    }

    void on_failed(const SessionFailedEvent& e) {
        spdlog::error("[UploadFailed] name={} tag={} {}", e.name, e.handle.value_or(0), e.error.describe());
    }

    void on_node_unreachable(const NodeUnreachableEvent& e) {
        spdlog::warn("[NodeUnreachable] {}", e.error.describe());
    }

    void on_node_reachable(const NodeReachableEvent&) {
        spdlog::info("[NodeReachable] local node is answering again");
    }

    EventBus& bus_;
};

} // namespace swc::events
