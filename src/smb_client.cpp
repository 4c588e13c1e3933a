#include "smb_client.hpp"
#include "encoding.hpp"
#include <format>
#include <ostream>

namespace {

struct CountingSink {
    std::ostream* out;
    size_t bytes;
};

size_t writeCounted(char* contents, size_t size, size_t nmemb, void* userp) {
    auto* sink = static_cast<CountingSink*>(userp);
    size_t written = writeToStream(contents, size, nmemb, sink->out);
    sink->bytes += written;
    return written;
}

} // namespace

CurlSmbConnection::CurlSmbConnection(std::string address, SmbSettings settings, Credentials credentials, std::chrono::seconds timeout)
    : address_(std::move(address)),
      settings_(std::move(settings)),
      credentials_(std::move(credentials)),
      timeout_(timeout),
      curl_(makeCurlHandle(timeout)) {}

std::expected<size_t, std::string> CurlSmbConnection::retrieveFile(const std::string& share,
                                                                   const std::string& path,
                                                                   std::ostream& out) {
    if (!curl_) {
        return std::unexpected("Failed to initialize CURL");
    }
    if (path.empty()) {
        return std::unexpected(std::format("No file specified in share {}", share));
    }

    std::string url = std::format("smb://{}:{}/{}/{}", address_, settings_.port, uriEncode(share), uriEncode(path, true));
    std::string user = settings_.domain.empty()
        ? credentials_.username()
        : std::format("{}\\{}", settings_.domain, credentials_.username());

    CountingSink sink{&out, 0};
    curl_easy_setopt(curl_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_.get(), CURLOPT_USERNAME, user.c_str());
    curl_easy_setopt(curl_.get(), CURLOPT_PASSWORD, credentials_.password().c_str());
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEFUNCTION, writeCounted);
    curl_easy_setopt(curl_.get(), CURLOPT_WRITEDATA, &sink);

    CURLcode res = curl_easy_perform(curl_.get());
    secureWipe(user);
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Failed to retrieve {}/{}/{}: {}", address_, share, path, curl_easy_strerror(res)));
    }
    return sink.bytes;
}

CurlSmbConnector::CurlSmbConnector(const CredentialResolver& resolver,
                                   std::string encryptedUsername,
                                   std::string encryptedPassword,
                                   SmbSettings settings,
                                   std::chrono::seconds timeout)
    : resolver_(resolver),
      encryptedUsername_(std::move(encryptedUsername)),
      encryptedPassword_(std::move(encryptedPassword)),
      settings_(std::move(settings)),
      timeout_(timeout) {}

std::expected<std::unique_ptr<SmbConnection>, Error> CurlSmbConnector::connect(const std::string& address) {
    auto credentials = resolver_.resolve(encryptedUsername_, encryptedPassword_);
    if (!credentials) {
        return std::unexpected(credentials.error());
    }
    return std::make_unique<CurlSmbConnection>(address, settings_, std::move(*credentials), timeout_);
}
