/**
 * @file transfer_executor.hpp
 * @brief Transfer executors, one per transfer strategy.
 *
 * Executors receive their collaborators by reference and own none of them.
 * None of them roll back: a failed upload or write may leave a partial or
 * zero-byte target behind.
 */

#ifndef TRANSFER_EXECUTOR_HPP
#define TRANSFER_EXECUTOR_HPP

#include <chrono>
#include <expected>
#include "transfer_strategy.hpp"
#include "object_store.hpp"
#include "smb_client.hpp"
#include "mounted_shares.hpp"

/**
 * @brief Result of a completed transfer.
 */
struct TransferOutcome {
    size_t bytes = 0;                      ///< Bytes moved; 0 for server-side moves.
    std::chrono::milliseconds elapsed{0};  ///< Wall-clock duration of the transfer.
};

/**
 * @brief Interface for transfer executors.
 */
class TransferExecutor {
public:
    virtual ~TransferExecutor() = default;

    /**
     * @brief Performs the transfer.
     *
     * @param request Parsed request whose kinds match the executor's strategy.
     * @return std::expected<TransferOutcome, Error> Outcome, or a Transfer error
     * (CredentialDecryption when share credentials cannot be resolved).
     */
    virtual std::expected<TransferOutcome, Error> execute(const TransferRequest& request) = 0;
};

/**
 * @brief Resolves the object key to write: a directory-like key (empty or ending
 * in '/') gets the source file name appended.
 */
ObjectStoreLocation resolveStoreTarget(const ObjectStoreLocation& target, const std::string& sourceFileName);

/**
 * @brief Moves an object between two store paths.
 */
class StoreToStoreExecutor : public TransferExecutor {
public:
    explicit StoreToStoreExecutor(ObjectStoreClient& store);

    std::expected<TransferOutcome, Error> execute(const TransferRequest& request) override;

private:
    ObjectStoreClient& store_;
};

/**
 * @brief Retrieves a share file into memory and uploads it to the store.
 */
class OnPremToStoreExecutor : public TransferExecutor {
public:
    OnPremToStoreExecutor(SmbConnector& connector, ObjectStoreClient& store);

    std::expected<TransferOutcome, Error> execute(const TransferRequest& request) override;

private:
    SmbConnector& connector_;
    ObjectStoreClient& store_;
};

/**
 * @brief Downloads an object into memory and writes it to a mounted share.
 */
class StoreToOnPremExecutor : public TransferExecutor {
public:
    StoreToOnPremExecutor(ObjectStoreClient& store, const MountedShares& shares);

    std::expected<TransferOutcome, Error> execute(const TransferRequest& request) override;

private:
    ObjectStoreClient& store_;
    const MountedShares& shares_;
};

/**
 * @brief Copies a file between two mounted shares.
 */
class OnPremToOnPremExecutor : public TransferExecutor {
public:
    explicit OnPremToOnPremExecutor(const MountedShares& shares);

    std::expected<TransferOutcome, Error> execute(const TransferRequest& request) override;

private:
    const MountedShares& shares_;
};

#endif // TRANSFER_EXECUTOR_HPP
