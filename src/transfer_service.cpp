#include "transfer_service.hpp"
#include <format>

TransferService::TransferService(const ShuttleConfig& config, TransferCollaborators collaborators)
    : config(config), collaborators(collaborators) {}

std::expected<TransferOutcome, Error> TransferService::move(const std::string& source, const std::string& target) {
    auto request = makeTransferRequest(source, target);
    if (!request) {
        config.logError(describe(request.error()));
        return std::unexpected(request.error());
    }

    TransferStrategy strategy = selectStrategy(request->sourceKind(), request->targetKind());
    config.logMessage(std::format("Moving file {} to {} ({}).", source, target, strategyName(strategy)));

    auto result = run(*request, strategy);
    if (result) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(result->elapsed);
        config.logMessage(std::format("Completed transfer of {} bytes. Elapsed time: {} seconds.", result->bytes, seconds.count()));
    } else {
        config.logError(std::format("Transfer {} -> {} failed: {}", source, target, describe(result.error())));
    }
    record(source, target, strategy, result);
    return result;
}

std::expected<TransferOutcome, Error> TransferService::run(const TransferRequest& request, TransferStrategy strategy) {
    switch (strategy) {
    case TransferStrategy::StoreToStore: {
        StoreToStoreExecutor executor(collaborators.store);
        return executor.execute(request);
    }
    case TransferStrategy::OnPremToStore: {
        OnPremToStoreExecutor executor(collaborators.connector, collaborators.store);
        return executor.execute(request);
    }
    case TransferStrategy::StoreToOnPrem:
    case TransferStrategy::OnPremToOnPrem:
        break;
    }

    if (!collaborators.shares) {
        return std::unexpected(Error{ErrorKind::Transfer, std::format(
            "{} transfers run only where the shares are mounted; dispatch the transfer or pass --mount-root",
            strategyName(strategy))});
    }
    if (strategy == TransferStrategy::StoreToOnPrem) {
        StoreToOnPremExecutor executor(collaborators.store, *collaborators.shares);
        return executor.execute(request);
    }
    OnPremToOnPremExecutor executor(*collaborators.shares);
    return executor.execute(request);
}

void TransferService::record(const std::string& source, const std::string& target, TransferStrategy strategy,
                             const std::expected<TransferOutcome, Error>& result) {
    if (!collaborators.events) {
        return;
    }
    TransferEvent event;
    event.timestamp = std::chrono::system_clock::now();
    event.source = source;
    event.target = target;
    event.strategy = std::string(strategyName(strategy));
    event.succeeded = result.has_value();
    if (result) {
        event.bytes = result->bytes;
        event.elapsedMs = result->elapsed.count();
    } else {
        event.message = describe(result.error());
    }

    auto appended = collaborators.events->append(event);
    if (!appended) {
        config.logError(std::format("Failed to record transfer event: {}", appended.error()));
    }
}
