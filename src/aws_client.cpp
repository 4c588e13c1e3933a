#include "aws_client.hpp"
#include "curl_support.hpp"
#include <json/json.h>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <format>
#include <memory>
#include <sstream>

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct XmlXPathContextDeleter {
    void operator()(xmlXPathContext* context) const { xmlXPathFreeContext(context); }
};

struct XmlXPathObjectDeleter {
    void operator()(xmlXPathObject* object) const { xmlXPathFreeObject(object); }
};

struct XmlStringDeleter {
    void operator()(xmlChar* text) const { xmlFree(text); }
};

using XmlDocument = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlXPathContext = std::unique_ptr<xmlXPathContext, XmlXPathContextDeleter>;
using XmlXPathObject = std::unique_ptr<xmlXPathObject, XmlXPathObjectDeleter>;
using XmlString = std::unique_ptr<xmlChar, XmlStringDeleter>;

constexpr const char* kMetadataBase = "http://169.254.169.254/latest";

std::expected<std::string, std::string> metadataRequest(const std::string& path,
                                                        const std::vector<std::string>& headerLines,
                                                        bool put,
                                                        std::chrono::seconds timeout) {
    CurlHandle curl = makeCurlHandle(timeout);
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }
    std::string url = std::format("{}{}", kMetadataBase, path);
    std::string body;
    curl_slist* rawHeaders = nullptr;
    for (const auto& header : headerLines) {
        rawHeaders = curl_slist_append(rawHeaders, header.c_str());
    }
    CurlHeaders headers(rawHeaders);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    if (put) {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
    }
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Instance metadata request {} failed: {}", path, curl_easy_strerror(res)));
    }
    return body;
}

} // namespace

AwsHttpClient::AwsHttpClient(std::string region, std::optional<AwsCredentials> credentials, std::chrono::seconds timeout)
    : region_(std::move(region)), credentials_(std::move(credentials)), timeout_(timeout) {}

std::expected<const AwsCredentials*, std::string> AwsHttpClient::signingCredentials() const {
    if (!credentials_) {
        auto fetched = fetchInstanceCredentials(timeout_);
        if (!fetched) {
            return std::unexpected(std::format("AWS credentials not found in the environment or instance metadata: {}", fetched.error()));
        }
        credentials_ = std::move(*fetched);
    }
    return &*credentials_;
}

std::expected<HttpResponse, std::string> AwsHttpClient::perform(const AwsRequest& request) const {
    auto credentials = signingCredentials();
    if (!credentials) {
        return std::unexpected(credentials.error());
    }
    CurlHandle curl = makeCurlHandle(timeout_);
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    std::string sigv4 = std::format("aws:amz:{}:{}", region_, request.service);
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_AWS_SIGV4, sigv4.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERNAME, (*credentials)->accessKeyId.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, (*credentials)->secretAccessKey.c_str());

    curl_slist* rawHeaders = nullptr;
    for (const auto& header : request.headers) {
        rawHeaders = curl_slist_append(rawHeaders, header.c_str());
    }
    if ((*credentials)->sessionToken) {
        std::string tokenHeader = std::format("x-amz-security-token: {}", *(*credentials)->sessionToken);
        rawHeaders = curl_slist_append(rawHeaders, tokenHeader.c_str());
    }
    CurlHeaders headers(rawHeaders);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    if (request.method == "POST" || request.method == "PUT") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        if (request.method == "PUT") {
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
        }
    } else if (request.method == "DELETE") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
    } else if (request.method == "HEAD") {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else if (request.method != "GET") {
        return std::unexpected(std::format("Unsupported HTTP method: {}", request.method));
    }

    HttpResponse response;
    if (request.responseSink) {
        // error bodies must not end up in the caller's stream
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToStream);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, request.responseSink);
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToString);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    }

    CURLcode res = curl_easy_perform(curl.get());
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (res != CURLE_OK && !(res == CURLE_HTTP_RETURNED_ERROR && response.status != 0)) {
        return std::unexpected(std::format("{} {} failed: {}", request.method, request.url, curl_easy_strerror(res)));
    }
    return response;
}

std::expected<AwsCredentials, std::string> fetchInstanceCredentials(std::chrono::seconds timeout) {
    auto token = metadataRequest("/api/token", {"X-aws-ec2-metadata-token-ttl-seconds: 300"}, true, timeout);
    if (!token) {
        return std::unexpected(token.error());
    }
    std::string tokenHeader = std::format("X-aws-ec2-metadata-token: {}", *token);

    auto role = metadataRequest("/meta-data/iam/security-credentials/", {tokenHeader}, false, timeout);
    if (!role) {
        return std::unexpected(role.error());
    }
    auto roleName = role->substr(0, role->find('\n'));
    if (roleName.empty()) {
        return std::unexpected("No instance profile is attached to this instance");
    }

    auto document = metadataRequest(std::format("/meta-data/iam/security-credentials/{}", roleName), {tokenHeader}, false, timeout);
    if (!document) {
        return std::unexpected(document.error());
    }
    Json::Value json;
    Json::CharReaderBuilder reader;
    std::string errors;
    std::istringstream stream(*document);
    if (!Json::parseFromStream(reader, stream, &json, &errors)) {
        return std::unexpected(std::format("Unreadable instance credentials: {}", errors));
    }
    if (json.get("Code", "").asString() != "Success") {
        return std::unexpected(std::format("Instance credentials unavailable: {}", json.get("Code", "unknown").asString()));
    }
    return AwsCredentials{json["AccessKeyId"].asString(), json["SecretAccessKey"].asString(), json["Token"].asString()};
}

std::string xmlElementText(const std::string& xml, const std::string& elementPath) {
    // "/A/B" -> "/*[local-name()='A']/*[local-name()='B']"; an empty segment keeps "//"
    std::string expression;
    size_t start = 0;
    while (start <= elementPath.size()) {
        auto slash = elementPath.find('/', start);
        auto segment = elementPath.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (!segment.empty()) {
            expression += std::format("*[local-name()='{}']", segment);
        }
        if (slash == std::string::npos) {
            break;
        }
        expression += '/';
        start = slash + 1;
    }

    XmlDocument doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "response.xml", nullptr,
                                  XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        return {};
    }
    XmlXPathContext context(xmlXPathNewContext(doc.get()));
    if (!context) {
        return {};
    }
    XmlXPathObject result(xmlXPathEvalExpression(reinterpret_cast<const xmlChar*>(expression.c_str()), context.get()));
    if (!result || xmlXPathNodeSetIsEmpty(result->nodesetval)) {
        return {};
    }
    XmlString content(xmlNodeGetContent(result->nodesetval->nodeTab[0]));
    if (!content) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(content.get()));
}
