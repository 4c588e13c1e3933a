#include "credentials.hpp"
#include <format>

void secureWipe(std::string& value) {
    volatile char* data = value.data();
    for (size_t i = 0; i < value.size(); ++i) {
        data[i] = '\0';
    }
    value.clear();
}

Credentials::Credentials(std::string username, std::string password)
    : username_(std::move(username)), password_(std::move(password)) {}

Credentials::~Credentials() {
    secureWipe(username_);
    secureWipe(password_);
}

Credentials::Credentials(Credentials&& other) noexcept
    : username_(std::move(other.username_)), password_(std::move(other.password_)) {
    secureWipe(other.username_);
    secureWipe(other.password_);
}

Credentials& Credentials::operator=(Credentials&& other) noexcept {
    if (this != &other) {
        secureWipe(username_);
        secureWipe(password_);
        username_ = std::move(other.username_);
        password_ = std::move(other.password_);
        secureWipe(other.username_);
        secureWipe(other.password_);
    }
    return *this;
}

CredentialResolver::CredentialResolver(Decryptor& decryptor) : decryptor_(decryptor) {}

std::expected<Credentials, Error> CredentialResolver::resolve(const std::string& encryptedUsername,
                                                              const std::string& encryptedPassword) const {
    if (encryptedUsername.empty() || encryptedPassword.empty()) {
        return std::unexpected(Error{ErrorKind::CredentialDecryption, "Encrypted credentials are missing"});
    }

    auto username = decryptor_.decrypt(encryptedUsername);
    if (!username) {
        return std::unexpected(Error{ErrorKind::CredentialDecryption,
            std::format("Failed to decrypt username: {}", username.error())});
    }
    auto password = decryptor_.decrypt(encryptedPassword);
    if (!password) {
        secureWipe(*username);
        return std::unexpected(Error{ErrorKind::CredentialDecryption,
            std::format("Failed to decrypt password: {}", password.error())});
    }
    Credentials credentials(*username, *password);
    secureWipe(*username);
    secureWipe(*password);
    return credentials;
}
