#include "event_dispatcher.hpp"
#include "location.hpp"
#include "transfer_strategy.hpp"
#include <format>

namespace {

std::expected<std::string, Error> locationField(const Json::Value& event, const char* name) {
    if (!event.isObject() || !event.isMember(name) || !event[name].isString()) {
        return std::unexpected(Error{ErrorKind::InvalidLocation, std::format("Event is missing {}", name)});
    }
    return event[name].asString();
}

} // namespace

Json::Value DispatchResponse::toJson() const {
    Json::Value json;
    json["statusCode"] = statusCode;
    json["body"] = body;
    if (error) {
        json["error"] = *error;
    }
    return json;
}

EventDispatcher::EventDispatcher(const ShuttleConfig& config, RemoteTransferOrchestrator& orchestrator)
    : config(config), orchestrator(orchestrator) {}

std::expected<DispatchResponse, Error> EventDispatcher::dispatch(const Json::Value& event) {
    auto source = locationField(event, "source_location");
    if (!source) {
        config.logError(describe(source.error()));
        return std::unexpected(source.error());
    }
    auto target = locationField(event, "target_location");
    if (!target) {
        config.logError(describe(target.error()));
        return std::unexpected(target.error());
    }

    auto request = makeTransferRequest(*source, *target);
    if (!request) {
        config.logError(describe(request.error()));
        return std::unexpected(request.error());
    }

    DispatchResponse response;
    TransferStrategy strategy = selectStrategy(request->sourceKind(), request->targetKind());
    if (!requiresRemoteExecution(strategy)) {
        response.body = "File transfer started. AWS transfer only - not required.";
        config.logMessage(std::format("No transfer instance required for {} -> {}.", *source, *target));
        return response;
    }

    auto handle = orchestrator.orchestrate(*source, *target, config.instance.handler.value_or(""));
    if (!handle) {
        response.body = std::format("File transfer not started. {}", handle.error().message);
        response.error = describe(handle.error());
        return response;
    }

    response.instanceId = handle->instanceId;
    response.body = std::format("File transfer started. EC2 file transfer spun up. instance id is {}", handle->instanceId);
    return response;
}
