/**
 * @file credentials.hpp
 * @brief On-premises credential handling for FileShuttle.
 *
 * Credentials are stored encrypted in the environment and decrypted on demand by
 * an external decryption service. Decrypted values live in a move-only
 * Credentials object that wipes its memory on destruction, so they exist only
 * for the scope that acquired them (one SMB connection or one bootstrap script).
 */

#ifndef CREDENTIALS_HPP
#define CREDENTIALS_HPP

#include <string>
#include <expected>
#include "errors.hpp"

/**
 * @brief Overwrites a string's characters before clearing it.
 */
void secureWipe(std::string& value);

/**
 * @brief Plaintext username/password pair, wiped on destruction.
 */
class Credentials {
public:
    Credentials(std::string username, std::string password);
    ~Credentials();

    Credentials(Credentials&& other) noexcept;
    Credentials& operator=(Credentials&& other) noexcept;
    Credentials(const Credentials&) = delete;
    Credentials& operator=(const Credentials&) = delete;

    const std::string& username() const { return username_; }
    const std::string& password() const { return password_; }

private:
    std::string username_;
    std::string password_;
};

/**
 * @brief Interface for the decryption collaborator.
 */
class Decryptor {
public:
    virtual ~Decryptor() = default;

    /**
     * @brief Decrypts one ciphertext.
     *
     * @param ciphertext Base64 ciphertext blob.
     * @return std::expected<std::string, std::string> Plaintext, or a reason for the rejection.
     * The reason must not echo the ciphertext.
     */
    virtual std::expected<std::string, std::string> decrypt(const std::string& ciphertext) = 0;
};

/**
 * @brief Resolves encrypted credential pairs through a Decryptor.
 */
class CredentialResolver {
public:
    explicit CredentialResolver(Decryptor& decryptor);

    /**
     * @brief Decrypts a username/password pair.
     *
     * @param encryptedUsername Ciphertext of the username.
     * @param encryptedPassword Ciphertext of the password.
     * @return std::expected<Credentials, Error> Credentials, or CredentialDecryption
     * naming the field that failed.
     */
    std::expected<Credentials, Error> resolve(const std::string& encryptedUsername,
                                              const std::string& encryptedPassword) const;

private:
    Decryptor& decryptor_;
};

#endif // CREDENTIALS_HPP
