/**
 * @file smb_client.hpp
 * @brief SMB client interfaces and the libcurl-based implementation.
 *
 * A connector produces one connection per file server. The direct connector
 * resolves the share credentials when it connects and hands them to the
 * connection, which owns them until it is destroyed.
 */

#ifndef SMB_CLIENT_HPP
#define SMB_CLIENT_HPP

#include <string>
#include <memory>
#include <chrono>
#include <expected>
#include <iosfwd>
#include "errors.hpp"
#include "credentials.hpp"
#include "shuttle_config.hpp"
#include "curl_support.hpp"

/**
 * @brief An open session against one file server.
 */
class SmbConnection {
public:
    virtual ~SmbConnection() = default;

    /**
     * @brief Retrieves a file from a share into a stream.
     *
     * @param share Share root, e.g. "Matillion_Output".
     * @param path File path inside the share.
     * @param out Destination stream.
     * @return std::expected<size_t, std::string> Bytes retrieved or an error message.
     */
    virtual std::expected<size_t, std::string> retrieveFile(const std::string& share,
                                                            const std::string& path,
                                                            std::ostream& out) = 0;
};

/**
 * @brief Opens SMB connections.
 */
class SmbConnector {
public:
    virtual ~SmbConnector() = default;

    /**
     * @brief Connects to a file server.
     *
     * @param address IPv4 address of the server.
     * @return std::expected<std::unique_ptr<SmbConnection>, Error> Connection, or
     * CredentialDecryption / Transfer.
     */
    virtual std::expected<std::unique_ptr<SmbConnection>, Error> connect(const std::string& address) = 0;
};

/**
 * @brief SMB connection backed by a libcurl easy handle (NTLMv2, direct TCP).
 *
 * The handle is reused across retrievals, so the TCP session persists for the
 * lifetime of the connection.
 */
class CurlSmbConnection : public SmbConnection {
public:
    CurlSmbConnection(std::string address, SmbSettings settings, Credentials credentials, std::chrono::seconds timeout);

    std::expected<size_t, std::string> retrieveFile(const std::string& share,
                                                    const std::string& path,
                                                    std::ostream& out) override;

private:
    std::string address_;
    SmbSettings settings_;
    Credentials credentials_;
    std::chrono::seconds timeout_;
    CurlHandle curl_;
};

/**
 * @brief Connector that resolves credentials per connection and talks SMB directly.
 */
class CurlSmbConnector : public SmbConnector {
public:
    /**
     * @param resolver Resolver used to decrypt the share credentials.
     * @param encryptedUsername Ciphertext of the username.
     * @param encryptedPassword Ciphertext of the password.
     * @param settings Domain and port.
     * @param timeout Upper bound for each retrieval.
     */
    CurlSmbConnector(const CredentialResolver& resolver,
                     std::string encryptedUsername,
                     std::string encryptedPassword,
                     SmbSettings settings,
                     std::chrono::seconds timeout);

    std::expected<std::unique_ptr<SmbConnection>, Error> connect(const std::string& address) override;

private:
    const CredentialResolver& resolver_;
    std::string encryptedUsername_;
    std::string encryptedPassword_;
    SmbSettings settings_;
    std::chrono::seconds timeout_;
};

#endif // SMB_CLIENT_HPP
