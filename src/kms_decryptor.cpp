#include "kms_decryptor.hpp"
#include "encoding.hpp"
#include <json/json.h>
#include <format>
#include <sstream>

KmsDecryptor::KmsDecryptor(const AwsHttpClient& client) : client_(client) {}

std::expected<std::string, std::string> KmsDecryptor::decrypt(const std::string& ciphertext) {
    Json::Value payload;
    payload["CiphertextBlob"] = ciphertext;
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";

    AwsRequest request;
    request.method = "POST";
    request.url = std::format("https://kms.{}.amazonaws.com/", client_.region());
    request.service = "kms";
    request.headers = {"Content-Type: application/x-amz-json-1.1", "X-Amz-Target: TrentService.Decrypt"};
    request.body = Json::writeString(writer, payload);

    auto response = client_.perform(request);
    if (!response) {
        return std::unexpected(response.error());
    }

    Json::Value result;
    Json::CharReaderBuilder reader;
    std::string errors;
    std::istringstream body(response->body);
    if (!Json::parseFromStream(reader, body, &result, &errors)) {
        return std::unexpected(std::format("Unreadable KMS response (HTTP {})", response->status));
    }
    if (response->status != 200) {
        return std::unexpected(std::format("KMS rejected the ciphertext: {} (HTTP {})",
            result.get("__type", "unknown error").asString(), response->status));
    }

    auto plaintext = base64Decode(result.get("Plaintext", "").asString());
    secureWipe(response->body);
    if (!plaintext || plaintext->empty()) {
        return std::unexpected("KMS response carried no plaintext");
    }
    return std::move(*plaintext);
}
