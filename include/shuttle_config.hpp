/**
 * @file shuttle_config.hpp
 * @brief Configuration management for FileShuttle.
 *
 * Settings come from an optional JSON file, then environment variables are
 * overlaid on top. The deployment environment (event trigger or transfer
 * instance) supplies credential ciphertexts, network placement and instance
 * sizing through the environment; everything else has working defaults.
 *
 * @note Only ciphertexts are held here. Decrypted credentials never pass
 * through the configuration object.
 */

#ifndef SHUTTLE_CONFIG_HPP
#define SHUTTLE_CONFIG_HPP

#include <string>
#include <optional>
#include <functional>
#include <chrono>
#include <expected>
#include <json/json.h>
#include "errors.hpp"

/**
 * @brief Looks up an environment variable by name.
 */
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Reads variables from the process environment.
 */
std::optional<std::string> processEnvironment(const std::string& name);

/**
 * @brief SMB connection settings for direct share access.
 */
struct SmbSettings {
    std::string domain; ///< Authentication domain (e.g. "CORP").
    int port;           ///< SMB port, 445 for direct TCP.
};

/**
 * @brief Settings for transient transfer instances.
 */
struct InstanceSettings {
    std::optional<std::string> imageId;         ///< Machine image (AMI) id.
    std::optional<std::string> instanceProfile; ///< Execution role / instance profile name.
    std::optional<std::string> instanceType;    ///< Instance size (e.g. "t3.micro").
    std::optional<std::string> subnet;          ///< Subnet id for network placement.
    std::optional<std::string> securityGroup;   ///< Security group id.
    std::optional<std::string> keyName;         ///< Optional key pair for operator access.
    std::string namePrefix;                     ///< Prefix of the Name tag.
    std::string squad;                          ///< squad tag value.
    std::string platform;                       ///< platform tag value.
    std::string mountRoot;                      ///< Where shares are mounted on the instance.
    std::string runtimePackages;                ///< Packages installed before the transfer runs.
    std::string auditLocation;                  ///< Object-store prefix for instance logs.
    std::optional<std::string> handler;         ///< Transfer handler invoked on the instance.
};

/**
 * @brief Credentials used to sign AWS API requests.
 */
struct AwsCredentials {
    std::string accessKeyId;
    std::string secretAccessKey;
    std::optional<std::string> sessionToken;
};

/**
 * @brief Configuration class for FileShuttle.
 */
class ShuttleConfig {
public:
    /**
     * @brief Builds the configuration from parsed JSON and an environment.
     *
     * @param configJson Parsed configuration; a null value yields all defaults.
     * @param env Environment lookup used for overrides and secrets.
     */
    explicit ShuttleConfig(const Json::Value& configJson = Json::Value(),
                           const EnvironmentLookup& env = processEnvironment);

    /**
     * @brief Loads the configuration from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @param env Environment lookup used for overrides and secrets.
     * @throws std::runtime_error If the file is inaccessible or malformed.
     */
    static ShuttleConfig fromFile(const std::string& configFile,
                                  const EnvironmentLookup& env = processEnvironment);

    /**
     * @brief Logs a message to stdout and the configured log file.
     *
     * @param message Message to log. Must not contain credentials.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to stderr and the configured error log file.
     *
     * @param message Error message to log. Must not contain credentials.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Checks that every setting needed to launch a transfer instance is present.
     *
     * @return std::expected<void, Error> Success, or a Configuration error naming
     * the first missing variable.
     */
    std::expected<void, Error> validateForOrchestration() const;

    std::chrono::seconds requestTimeout() const { return std::chrono::seconds(requestTimeoutSeconds); }

    std::string region;                                ///< AWS region for every API call.
    std::string logFile;                               ///< Path to the log file; empty disables file logging.
    std::string errorLogFile;                          ///< Path to the error log file.
    std::string eventLogFile;                          ///< Append-only transfer event log.
    int requestTimeoutSeconds;                         ///< Timeout for each network call.
    std::optional<std::string> encryptedUsername;      ///< Ciphertext of the share username.
    std::optional<std::string> encryptedPassword;      ///< Ciphertext of the share password.
    std::optional<AwsCredentials> awsCredentials;      ///< Signing credentials, if provided.
    SmbSettings smb;                                   ///< Direct SMB settings.
    InstanceSettings instance;                         ///< Transfer instance settings.
};

#endif // SHUTTLE_CONFIG_HPP
