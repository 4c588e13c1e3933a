/**
 * @file transfer_strategy.hpp
 * @brief Transfer requests and strategy selection.
 */

#ifndef TRANSFER_STRATEGY_HPP
#define TRANSFER_STRATEGY_HPP

#include <string>
#include <string_view>
#include <expected>
#include "location.hpp"

/**
 * @brief How a transfer is carried out, one per (source kind, target kind) pair.
 */
enum class TransferStrategy {
    StoreToStore,   ///< In-process object-store move.
    StoreToOnPrem,  ///< Delegated: download, then write to the mounted share.
    OnPremToStore,  ///< Delegated: read from the share, then upload.
    OnPremToOnPrem  ///< Delegated: copy between mounted shares.
};

/**
 * @brief A parsed source/target pair. Immutable once built.
 */
struct TransferRequest {
    Location source;
    Location target;

    LocationKind sourceKind() const { return kindOf(source); }
    LocationKind targetKind() const { return kindOf(target); }
};

/**
 * @brief Parses both locations of a transfer.
 *
 * @return std::expected<TransferRequest, Error> Request, or InvalidLocation for the
 * first location that fails to parse.
 */
std::expected<TransferRequest, Error> makeTransferRequest(std::string_view source, std::string_view target);

/**
 * @brief Maps a (source kind, target kind) pair to its strategy.
 *
 * Total over the 2x2 kind matrix.
 *
 * @throws std::logic_error For a value outside the LocationKind enumeration.
 */
TransferStrategy selectStrategy(LocationKind sourceKind, LocationKind targetKind);

/**
 * @brief True if the strategy needs on-premises filesystem access and therefore
 * runs on a transfer instance.
 */
bool requiresRemoteExecution(TransferStrategy strategy);

std::string_view strategyName(TransferStrategy strategy);

#endif // TRANSFER_STRATEGY_HPP
