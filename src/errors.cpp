#include "errors.hpp"
#include <format>

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidLocation:
        return "InvalidLocationError";
    case ErrorKind::CredentialDecryption:
        return "CredentialDecryptionError";
    case ErrorKind::Transfer:
        return "TransferError";
    case ErrorKind::Provision:
        return "ProvisionError";
    case ErrorKind::Configuration:
        return "ConfigurationError";
    }
    return "UnknownError";
}

std::string describe(const Error& error) {
    return std::format("{}: {}", errorKindName(error.kind), error.message);
}
