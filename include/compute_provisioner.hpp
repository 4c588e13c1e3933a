/**
 * @file compute_provisioner.hpp
 * @brief Compute provisioner interface and its EC2 implementation.
 */

#ifndef COMPUTE_PROVISIONER_HPP
#define COMPUTE_PROVISIONER_HPP

#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <expected>
#include "aws_client.hpp"

/**
 * @brief Everything needed to launch one transfer instance.
 *
 * @warning userData carries plaintext credentials.
 */
struct LaunchSpec {
    std::string imageId;                                   ///< Machine image.
    std::string instanceProfile;                           ///< Execution role / instance profile name.
    std::string instanceType;                              ///< Instance size.
    std::string subnet;                                    ///< Subnet id.
    std::string securityGroup;                             ///< Security group id.
    std::optional<std::string> keyName;                    ///< Optional key pair.
    bool terminateOnShutdown = true;                       ///< Shutdown from inside terminates the instance.
    std::string userData;                                  ///< Bootstrap script, plain text.
    std::vector<std::pair<std::string, std::string>> tags; ///< Instance tags, in order.
};

/**
 * @brief Interface for the compute provisioner.
 */
class ComputeProvisioner {
public:
    virtual ~ComputeProvisioner() = default;

    /**
     * @brief Launches exactly one instance.
     *
     * @param spec Launch parameters.
     * @return std::expected<std::string, std::string> Instance id or an error message.
     */
    virtual std::expected<std::string, std::string> launch(const LaunchSpec& spec) = 0;
};

/**
 * @brief Launches instances through the EC2 RunInstances query API.
 */
class Ec2Provisioner : public ComputeProvisioner {
public:
    explicit Ec2Provisioner(const AwsHttpClient& client);

    std::expected<std::string, std::string> launch(const LaunchSpec& spec) override;

    /**
     * @brief Encodes a launch spec as a RunInstances form body.
     */
    static std::string runInstancesBody(const LaunchSpec& spec);

private:
    const AwsHttpClient& client_;
};

#endif // COMPUTE_PROVISIONER_HPP
