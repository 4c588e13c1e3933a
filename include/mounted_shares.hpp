/**
 * @file mounted_shares.hpp
 * @brief Access to on-premises shares mounted on a transfer instance.
 *
 * The bootstrap script mounts every share at <root>/<address>/<share>, so an
 * on-premises location maps to a plain local path and transfers run without
 * any SMB credentials on the instance.
 */

#ifndef MOUNTED_SHARES_HPP
#define MOUNTED_SHARES_HPP

#include <string>
#include <filesystem>
#include <expected>
#include <iosfwd>
#include "location.hpp"
#include "smb_client.hpp"

/**
 * @brief Returns the mount point used for one share under a mount root.
 */
std::filesystem::path shareMountPoint(const std::filesystem::path& root, const std::string& address, const std::string& share);

/**
 * @brief Local file access to shares mounted under one root directory.
 */
class MountedShares {
public:
    explicit MountedShares(std::filesystem::path root);

    /**
     * @brief Maps an on-premises location to its local path.
     *
     * @return std::expected<std::filesystem::path, std::string> Path below the
     * share's mount point, or an error when the location would leave it.
     */
    std::expected<std::filesystem::path, std::string> pathFor(const OnPremLocation& location) const;

    /**
     * @brief Copies a mounted file into a stream.
     *
     * @return std::expected<size_t, std::string> Bytes read or an error message.
     */
    std::expected<size_t, std::string> readFile(const OnPremLocation& location, std::ostream& out) const;

    /**
     * @brief Writes a stream to a mounted file, creating parent directories.
     *
     * If the location names a directory (empty path or trailing '/'), @p fileName
     * is appended.
     *
     * @return std::expected<size_t, std::string> Bytes written or an error message.
     */
    std::expected<size_t, std::string> writeFile(const OnPremLocation& location,
                                                 const std::string& fileName,
                                                 std::istream& in) const;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_; ///< Mount root, e.g. "/mnt/fileshuttle".
};

/**
 * @brief SmbConnector that serves retrievals from mounted shares.
 */
class MountedShareConnector : public SmbConnector {
public:
    explicit MountedShareConnector(const MountedShares& shares);

    std::expected<std::unique_ptr<SmbConnection>, Error> connect(const std::string& address) override;

private:
    const MountedShares& shares_;
};

#endif // MOUNTED_SHARES_HPP
