/**
 * @file bootstrap_script.hpp
 * @brief Generates the first-boot script of a transfer instance.
 *
 * The script mounts the on-premises shares involved in the transfer, installs
 * the runtime, runs the transfer handler with output captured in a timestamped
 * log, uploads that log to the audit location and shuts the instance down.
 *
 * @warning The generated script contains plaintext share credentials. It must
 * never be logged or kept after the provisioning call.
 */

#ifndef BOOTSTRAP_SCRIPT_HPP
#define BOOTSTRAP_SCRIPT_HPP

#include <string>
#include <string_view>
#include <expected>
#include "credentials.hpp"
#include "errors.hpp"

/**
 * @brief Instance-side settings baked into the script.
 */
struct BootstrapSettings {
    std::string mountRoot;       ///< Root under which shares are mounted.
    std::string runtimePackages; ///< Packages installed with yum before the transfer.
    std::string auditLocation;   ///< Object-store prefix receiving the log, e.g. "s3://bucket/ec2-log/".
};

/**
 * @brief Quotes a value for a POSIX shell using single quotes.
 */
std::string shellQuote(std::string_view value);

/**
 * @brief Builds the bootstrap script for one transfer.
 *
 * Source and target are embedded verbatim in the handler command line.
 *
 * @param source Source location string.
 * @param target Target location string.
 * @param handler Transfer handler executable run on the instance.
 * @param credentials Share credentials written to the mount table.
 * @param settings Instance-side settings.
 * @return std::expected<std::string, Error> Script text, InvalidLocation for an
 * unparseable location, or Configuration when the credentials cannot be
 * expressed as cifs mount options.
 */
std::expected<std::string, Error> buildBootstrapScript(const std::string& source,
                                                       const std::string& target,
                                                       const std::string& handler,
                                                       const Credentials& credentials,
                                                       const BootstrapSettings& settings);

#endif // BOOTSTRAP_SCRIPT_HPP
