#include "shuttle_api.hpp"
#include "aws_client.hpp"
#include "kms_decryptor.hpp"
#include "object_store.hpp"
#include "smb_client.hpp"
#include "mounted_shares.hpp"
#include "event_store.hpp"
#include "transfer_service.hpp"
#include "remote_orchestrator.hpp"
#include "compute_provisioner.hpp"
#include <format>
#include <memory>

namespace {

ShuttleConfig loadConfig(const std::optional<std::string>& configFile) {
    return configFile ? ShuttleConfig::fromFile(*configFile) : ShuttleConfig();
}

} // namespace

std::expected<void, std::string> ShuttleAPI::moveFiles(const std::string& source,
                                                       const std::string& target,
                                                       const MoveOptions& options) {
    try {
        ShuttleConfig config = loadConfig(options.configFile);
        AwsHttpClient aws(config.region, config.awsCredentials, config.requestTimeout());
        KmsDecryptor decryptor(aws);
        CredentialResolver resolver(decryptor);
        S3ObjectStoreClient store(aws);
        JsonLinesEventStore events(config.eventLogFile);

        std::unique_ptr<MountedShares> shares;
        std::unique_ptr<SmbConnector> connector;
        if (options.mountRoot) {
            shares = std::make_unique<MountedShares>(*options.mountRoot);
            connector = std::make_unique<MountedShareConnector>(*shares);
        } else {
            connector = std::make_unique<CurlSmbConnector>(resolver,
                config.encryptedUsername.value_or(""), config.encryptedPassword.value_or(""),
                config.smb, config.requestTimeout());
        }

        TransferService service(config, TransferCollaborators{store, *connector, shares.get(), &events});
        auto result = service.move(source, target);
        if (!result) {
            return std::unexpected(describe(result.error()));
        }
        return {};
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to move files: {}", e.what()));
    }
}

std::expected<DispatchResponse, std::string> ShuttleAPI::dispatchEvent(const Json::Value& event,
                                                                       const std::optional<std::string>& configFile) {
    try {
        ShuttleConfig config = loadConfig(configFile);
        AwsHttpClient aws(config.region, config.awsCredentials, config.requestTimeout());
        KmsDecryptor decryptor(aws);
        CredentialResolver resolver(decryptor);
        Ec2Provisioner provisioner(aws);
        RemoteTransferOrchestrator orchestrator(config, resolver, provisioner);
        EventDispatcher dispatcher(config, orchestrator);

        auto response = dispatcher.dispatch(event);
        if (!response) {
            return std::unexpected(describe(response.error()));
        }
        return *response;
    } catch (const std::exception& e) {
        return std::unexpected(std::format("Failed to dispatch event: {}", e.what()));
    }
}
