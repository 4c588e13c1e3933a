#include "encoding.hpp"
#include <curl/curl.h>
#include <openssl/evp.h>
#include <memory>

namespace {

struct CurlFreeDeleter {
    void operator()(char* text) const { curl_free(text); }
};

std::string escapeSegment(std::string_view segment) {
    if (segment.empty()) {
        return {};
    }
    std::unique_ptr<char, CurlFreeDeleter> escaped(
        curl_easy_escape(nullptr, segment.data(), static_cast<int>(segment.size())));
    return escaped ? std::string(escaped.get()) : std::string();
}

} // namespace

std::string base64Encode(std::string_view data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                 reinterpret_cast<const unsigned char*>(data.data()),
                                 static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(length));
    return out;
}

std::optional<std::string> base64Decode(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            compact += c;
        }
    }
    if (compact.empty()) {
        return std::string();
    }
    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }
    // EVP_DecodeBlock tolerates '=' inside the data
    size_t padding = 0;
    while (padding < 2 && compact[compact.size() - 1 - padding] == '=') {
        ++padding;
    }
    if (compact.find('=') < compact.size() - padding) {
        return std::nullopt;
    }

    std::string out(3 * (compact.size() / 4), '\0');
    int length = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                 reinterpret_cast<const unsigned char*>(compact.data()),
                                 static_cast<int>(compact.size()));
    if (length < 0) {
        return std::nullopt;
    }
    out.resize(static_cast<size_t>(length) - padding);
    return out;
}

std::string uriEncode(std::string_view text, bool keepSlash) {
    if (!keepSlash) {
        return escapeSegment(text);
    }
    std::string out;
    size_t start = 0;
    while (true) {
        auto slash = text.find('/', start);
        out += escapeSegment(text.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start));
        if (slash == std::string_view::npos) {
            break;
        }
        out += '/';
        start = slash + 1;
    }
    return out;
}
