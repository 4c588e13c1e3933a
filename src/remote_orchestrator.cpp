#include "remote_orchestrator.hpp"
#include "bootstrap_script.hpp"
#include "location.hpp"
#include <format>
#include <ctime>

RemoteTransferOrchestrator::RemoteTransferOrchestrator(const ShuttleConfig& config,
                                                       const CredentialResolver& resolver,
                                                       ComputeProvisioner& provisioner)
    : config(config), resolver(resolver), provisioner(provisioner) {}

std::expected<RemoteInstanceHandle, Error> RemoteTransferOrchestrator::orchestrate(const std::string& source,
                                                                                   const std::string& target,
                                                                                   const std::string& handler) {
    if (handler.empty()) {
        return std::unexpected(Error{ErrorKind::Configuration, "Missing required configuration: TRANSFER_HANDLER"});
    }
    if (auto valid = config.validateForOrchestration(); !valid) {
        config.logError(describe(valid.error()));
        return std::unexpected(valid.error());
    }
    for (const auto& location : {source, target}) {
        if (auto parsed = parseLocation(location); !parsed) {
            return std::unexpected(parsed.error());
        }
    }

    const auto& instance = config.instance;
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timestampBuf[32];
    std::strftime(timestampBuf, sizeof(timestampBuf), "%Y%m%d-%H%M%S", std::localtime(&timeT));

    LaunchSpec spec;
    spec.imageId = *instance.imageId;
    spec.instanceProfile = *instance.instanceProfile;
    spec.instanceType = *instance.instanceType;
    spec.subnet = *instance.subnet;
    spec.securityGroup = *instance.securityGroup;
    spec.keyName = instance.keyName;
    spec.terminateOnShutdown = true;
    spec.tags = {
        {"Name", std::format("{}-{}", instance.namePrefix, timestampBuf)},
        {"squad", instance.squad},
        {"platform", instance.platform},
    };

    {
        auto credentials = resolver.resolve(*config.encryptedUsername, *config.encryptedPassword);
        if (!credentials) {
            config.logError(describe(credentials.error()));
            return std::unexpected(credentials.error());
        }
        auto script = buildBootstrapScript(source, target, handler, *credentials,
            BootstrapSettings{instance.mountRoot, instance.runtimePackages, instance.auditLocation});
        if (!script) {
            config.logError(describe(script.error()));
            return std::unexpected(script.error());
        }
        spec.userData = std::move(*script);
    }

    config.logMessage(std::format("Launching transfer instance {} for {} -> {}.", spec.tags.front().second, source, target));
    auto instanceId = provisioner.launch(spec);
    secureWipe(spec.userData);
    if (!instanceId) {
        Error error{ErrorKind::Provision, std::format("Failed to launch transfer instance: {}", instanceId.error())};
        config.logError(describe(error));
        return std::unexpected(error);
    }

    config.logMessage(std::format("EC2 instance created - now executing in EC2 {}.", *instanceId));
    return RemoteInstanceHandle{*instanceId, spec.tags.front().second, std::chrono::system_clock::now(), InstanceState::Launched};
}
