/**
 * @file remote_orchestrator.hpp
 * @brief Delegates transfers to transient compute instances.
 *
 * The orchestrator's contract ends once the instance has been requested: the
 * instance mounts the shares, runs the transfer, uploads its own log and
 * terminates itself. Completion is never awaited or polled, and a launched
 * instance cannot be cancelled from here.
 */

#ifndef REMOTE_ORCHESTRATOR_HPP
#define REMOTE_ORCHESTRATOR_HPP

#include <string>
#include <chrono>
#include <expected>
#include "shuttle_config.hpp"
#include "credentials.hpp"
#include "compute_provisioner.hpp"

/**
 * @brief Lifecycle of a transfer instance.
 *
 * Only Launched is ever recorded; the others are inferred, not observed.
 */
enum class InstanceState {
    Provisioning,  ///< Launch requested, not yet acknowledged.
    Launched,      ///< Provisioner returned an instance id.
    Running,       ///< Mounting, transferring, uploading its log.
    SelfTerminated ///< Instance shut itself down.
};

/**
 * @brief Identifier of a launched transfer instance. Holds no secrets.
 */
struct RemoteInstanceHandle {
    std::string instanceId;                          ///< Provider instance id.
    std::string name;                                ///< Name tag value.
    std::chrono::system_clock::time_point launchedAt; ///< When the launch call returned.
    InstanceState state = InstanceState::Launched;   ///< Last recorded state.
};

/**
 * @brief Builds bootstrap payloads and launches transfer instances.
 */
class RemoteTransferOrchestrator {
public:
    /**
     * @param config Configuration with instance settings and credential ciphertexts.
     * @param resolver Resolver for the share credentials.
     * @param provisioner Compute provisioner.
     */
    RemoteTransferOrchestrator(const ShuttleConfig& config,
                               const CredentialResolver& resolver,
                               ComputeProvisioner& provisioner);

    /**
     * @brief Launches one instance that performs the transfer.
     *
     * Never retries: a blind retry could launch a duplicate instance.
     *
     * @param source Source location string.
     * @param target Target location string.
     * @param handler Transfer handler run on the instance.
     * @return std::expected<RemoteInstanceHandle, Error> Handle, or Configuration,
     * InvalidLocation, CredentialDecryption, Provision.
     */
    std::expected<RemoteInstanceHandle, Error> orchestrate(const std::string& source,
                                                           const std::string& target,
                                                           const std::string& handler);

private:
    const ShuttleConfig& config;
    const CredentialResolver& resolver;
    ComputeProvisioner& provisioner;
};

#endif // REMOTE_ORCHESTRATOR_HPP
