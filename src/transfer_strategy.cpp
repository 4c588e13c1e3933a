#include "transfer_strategy.hpp"
#include <format>
#include <stdexcept>

std::expected<TransferRequest, Error> makeTransferRequest(std::string_view source, std::string_view target) {
    auto parsedSource = parseLocation(source);
    if (!parsedSource) {
        return std::unexpected(parsedSource.error());
    }
    auto parsedTarget = parseLocation(target);
    if (!parsedTarget) {
        return std::unexpected(parsedTarget.error());
    }
    return TransferRequest{std::move(*parsedSource), std::move(*parsedTarget)};
}

TransferStrategy selectStrategy(LocationKind sourceKind, LocationKind targetKind) {
    switch (sourceKind) {
    case LocationKind::ObjectStore:
        switch (targetKind) {
        case LocationKind::ObjectStore:
            return TransferStrategy::StoreToStore;
        case LocationKind::OnPrem:
            return TransferStrategy::StoreToOnPrem;
        }
        break;
    case LocationKind::OnPrem:
        switch (targetKind) {
        case LocationKind::ObjectStore:
            return TransferStrategy::OnPremToStore;
        case LocationKind::OnPrem:
            return TransferStrategy::OnPremToOnPrem;
        }
        break;
    }
    throw std::logic_error(std::format("No transfer strategy for location kinds ({}, {})",
        static_cast<int>(sourceKind), static_cast<int>(targetKind)));
}

bool requiresRemoteExecution(TransferStrategy strategy) {
    return strategy != TransferStrategy::StoreToStore;
}

std::string_view strategyName(TransferStrategy strategy) {
    switch (strategy) {
    case TransferStrategy::StoreToStore:
        return "store-to-store";
    case TransferStrategy::StoreToOnPrem:
        return "store-to-onprem";
    case TransferStrategy::OnPremToStore:
        return "onprem-to-store";
    case TransferStrategy::OnPremToOnPrem:
        return "onprem-to-onprem";
    }
    return "unknown";
}
