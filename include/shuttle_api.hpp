/**
 * @file shuttle_api.hpp
 * @brief High-level API for FileShuttle.
 *
 * Wires the production collaborators (S3, KMS, SMB over libcurl, EC2) into the
 * transfer service and the event dispatcher. The two executables are thin
 * wrappers around these calls.
 */

#ifndef SHUTTLE_API_HPP
#define SHUTTLE_API_HPP

#include <string>
#include <optional>
#include <expected>
#include <json/json.h>
#include "event_dispatcher.hpp"

/**
 * @brief Options for a direct transfer.
 */
struct MoveOptions {
    std::optional<std::string> configFile; ///< JSON configuration; defaults only when absent.
    std::optional<std::string> mountRoot;  ///< Set on transfer instances where shares are mounted.
};

/**
 * @brief API for running and dispatching transfers.
 */
class ShuttleAPI {
public:
    /**
     * @brief Moves one file from source to target in this process.
     *
     * @param source Source location string.
     * @param target Target location string.
     * @param options Configuration file and mount root.
     * @return std::expected<void, std::string> Success or an error message.
     */
    static std::expected<void, std::string> moveFiles(const std::string& source,
                                                      const std::string& target,
                                                      const MoveOptions& options);

    /**
     * @brief Handles one trigger event.
     *
     * @param event Event JSON with source_location and target_location.
     * @param configFile Optional JSON configuration.
     * @return std::expected<DispatchResponse, std::string> Response envelope, or an
     * error message for a malformed event.
     */
    static std::expected<DispatchResponse, std::string> dispatchEvent(const Json::Value& event,
                                                                      const std::optional<std::string>& configFile);
};

#endif // SHUTTLE_API_HPP
