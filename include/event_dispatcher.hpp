/**
 * @file event_dispatcher.hpp
 * @brief Entry point for event-triggered transfers (cron or queue message).
 *
 * Object-store-only transfers need no delegation. Anything touching an
 * on-premises share is handed to the RemoteTransferOrchestrator and the
 * dispatcher returns as soon as the instance is requested.
 */

#ifndef EVENT_DISPATCHER_HPP
#define EVENT_DISPATCHER_HPP

#include <string>
#include <optional>
#include <expected>
#include <json/json.h>
#include "shuttle_config.hpp"
#include "remote_orchestrator.hpp"

/**
 * @brief Gateway-style response envelope.
 *
 * statusCode is 200 whenever the event was well formed, including when the
 * delegation itself failed: that failure is reported in @c error. Failures of
 * the remote transfer happen later and are never reflected here.
 */
struct DispatchResponse {
    int statusCode = 200;                  ///< Envelope status.
    std::string body;                      ///< Human readable message.
    std::optional<std::string> instanceId; ///< Launched instance, if any.
    std::optional<std::string> error;      ///< "<ErrorKind>: <message>" when delegation failed.

    /**
     * @brief Renders {"statusCode", "body"[, "error"]}.
     */
    Json::Value toJson() const;
};

/**
 * @brief Routes transfer events.
 */
class EventDispatcher {
public:
    EventDispatcher(const ShuttleConfig& config, RemoteTransferOrchestrator& orchestrator);

    /**
     * @brief Handles one event.
     *
     * @param event JSON object with "source_location" and "target_location".
     * @return std::expected<DispatchResponse, Error> Response, or InvalidLocation
     * when either location is missing or unrecognized.
     */
    std::expected<DispatchResponse, Error> dispatch(const Json::Value& event);

private:
    const ShuttleConfig& config;
    RemoteTransferOrchestrator& orchestrator;
};

#endif // EVENT_DISPATCHER_HPP
