/**
 * @file transfer_service.hpp
 * @brief In-process transfer orchestration for the fileshuttle command.
 *
 * Classifies the request, selects the strategy, runs the matching executor,
 * logs the outcome and appends it to the audit trail. Strategies with an
 * on-premises target or an on-premises-to-on-premises copy need mounted shares
 * and only run on a transfer instance.
 */

#ifndef TRANSFER_SERVICE_HPP
#define TRANSFER_SERVICE_HPP

#include <string>
#include <expected>
#include "shuttle_config.hpp"
#include "transfer_executor.hpp"
#include "event_store.hpp"

/**
 * @brief Collaborators the service runs transfers with. Not owned.
 */
struct TransferCollaborators {
    ObjectStoreClient& store;            ///< Object-store client.
    SmbConnector& connector;             ///< Connector for on-premises reads.
    const MountedShares* shares;         ///< Mounted shares; null outside a transfer instance.
    TransferEventStore* events;          ///< Audit trail; null to skip recording.
};

/**
 * @brief Runs one transfer end to end.
 */
class TransferService {
public:
    TransferService(const ShuttleConfig& config, TransferCollaborators collaborators);

    /**
     * @brief Moves a file from source to target.
     *
     * @param source Source location string.
     * @param target Target location string.
     * @return std::expected<TransferOutcome, Error> Outcome or the first error.
     */
    std::expected<TransferOutcome, Error> move(const std::string& source, const std::string& target);

private:
    std::expected<TransferOutcome, Error> run(const TransferRequest& request, TransferStrategy strategy);
    void record(const std::string& source, const std::string& target, TransferStrategy strategy,
                const std::expected<TransferOutcome, Error>& result);

    const ShuttleConfig& config;             ///< Configuration and logging.
    TransferCollaborators collaborators;     ///< Injected clients.
};

#endif // TRANSFER_SERVICE_HPP
