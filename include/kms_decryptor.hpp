/**
 * @file kms_decryptor.hpp
 * @brief AWS KMS implementation of the Decryptor interface.
 */

#ifndef KMS_DECRYPTOR_HPP
#define KMS_DECRYPTOR_HPP

#include "credentials.hpp"
#include "aws_client.hpp"

/**
 * @brief Decrypts ciphertext blobs with the KMS Decrypt API (JSON protocol).
 */
class KmsDecryptor : public Decryptor {
public:
    explicit KmsDecryptor(const AwsHttpClient& client);

    /**
     * @brief Decrypts a base64 ciphertext blob.
     *
     * @param ciphertext Base64 ciphertext as stored in the environment.
     * @return std::expected<std::string, std::string> Plaintext, or the KMS error type.
     */
    std::expected<std::string, std::string> decrypt(const std::string& ciphertext) override;

private:
    const AwsHttpClient& client_;
};

#endif // KMS_DECRYPTOR_HPP
