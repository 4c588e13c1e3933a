/**
 * @file location.hpp
 * @brief Location grammar and classification for FileShuttle.
 *
 * A location is either an object-store URI ("s3://bucket/key") or an
 * on-premises share path ("10.21.13.12/Share/dir/file.csv"). Strings are parsed
 * once at the boundary into a tagged variant; downstream code matches on the
 * variant and never re-parses strings.
 */

#ifndef LOCATION_HPP
#define LOCATION_HPP

#include <string>
#include <string_view>
#include <variant>
#include <expected>
#include "errors.hpp"

/**
 * @brief Kind of storage a location addresses.
 */
enum class LocationKind {
    ObjectStore, ///< S3 bucket/key.
    OnPrem       ///< SMB share reachable only from the private network.
};

/**
 * @brief Object-store location, e.g. "s3://bucket-test/out/hello.csv".
 */
struct ObjectStoreLocation {
    std::string bucket; ///< Bucket name.
    std::string key;    ///< Object key; empty for the bucket root.
};

/**
 * @brief On-premises share location, e.g. "10.21.13.12/Matillion_Output/hello.csv".
 */
struct OnPremLocation {
    std::string address; ///< Dotted-decimal IPv4 address of the file server.
    std::string share;   ///< Share root (first segment after the address).
    std::string path;    ///< Path inside the share; may be empty.
};

using Location = std::variant<ObjectStoreLocation, OnPremLocation>;

/// Markers that identify an object-store location. The first is canonical.
inline constexpr std::string_view kObjectStoreSchemes[] = {"s3://", "store://"};

/**
 * @brief Classifies a location string.
 *
 * Any string containing an object-store scheme marker is ObjectStore. Otherwise
 * the first segment must be a strict dotted-decimal IPv4 address followed by a
 * share segment.
 *
 * @param location Raw location string.
 * @return std::expected<LocationKind, Error> The kind, or InvalidLocation.
 */
std::expected<LocationKind, Error> classify(std::string_view location);

/**
 * @brief Parses a location string into its tagged form.
 *
 * @param location Raw location string.
 * On-premises paths must stay inside their share: an absolute path, a "." or
 * ".." share, or a ".." path component is rejected.
 *
 * @return std::expected<Location, Error> Parsed location, or InvalidLocation when
 * the string is unrecognized, names no bucket, or leaves its share.
 */
std::expected<Location, Error> parseLocation(std::string_view location);

/**
 * @brief Returns true if the text is a dotted-decimal IPv4 address (octets 0-255).
 */
bool isIpv4Address(std::string_view text);

LocationKind kindOf(const Location& location);

/**
 * @brief Renders a location back to its canonical string form.
 */
std::string toString(const Location& location);

/**
 * @brief Returns the last path component of a location ("hello.csv"), or an
 * empty string if the location names a directory or root.
 */
std::string fileNameOf(const Location& location);

#endif // LOCATION_HPP
