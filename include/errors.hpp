/**
 * @file errors.hpp
 * @brief Error model shared by every FileShuttle component.
 *
 * Operations return std::expected<T, Error>. The kind tells callers whether a
 * failure happened before any side effect (location, configuration, credentials)
 * or possibly after one (transfer, provisioning).
 */

#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <string>
#include <string_view>

/**
 * @brief Categories of failure surfaced by FileShuttle.
 */
enum class ErrorKind {
    InvalidLocation,      ///< Location string matches neither recognized form.
    CredentialDecryption, ///< Decryption collaborator rejected a ciphertext.
    Transfer,             ///< Object-store or SMB operation failed.
    Provision,            ///< Transfer instance could not be launched.
    Configuration         ///< Required setting is missing or invalid.
};

/**
 * @brief Error value carried in std::expected results.
 */
struct Error {
    ErrorKind kind;      ///< Failure category.
    std::string message; ///< Human readable description. Never holds secrets.
};

/**
 * @brief Returns the display name of an error kind (e.g. "ProvisionError").
 */
std::string_view errorKindName(ErrorKind kind);

/**
 * @brief Formats an error as "<KindName>: <message>".
 */
std::string describe(const Error& error);

#endif // ERRORS_HPP
