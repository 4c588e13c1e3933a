#include "object_store.hpp"
#include "encoding.hpp"
#include <format>
#include <istream>
#include <iterator>

namespace {

std::string s3ErrorDetail(const HttpResponse& response) {
    auto code = xmlElementText(response.body, "/Error/Code");
    return code.empty() ? std::format("HTTP {}", response.status)
                        : std::format("{} (HTTP {})", code, response.status);
}

} // namespace

S3ObjectStoreClient::S3ObjectStoreClient(const AwsHttpClient& client) : client_(client) {}

std::string S3ObjectStoreClient::objectUrl(const ObjectStoreLocation& location) const {
    return std::format("https://{}.s3.{}.amazonaws.com/{}", location.bucket, client_.region(), uriEncode(location.key, true));
}

std::expected<void, std::string> S3ObjectStoreClient::move(const ObjectStoreLocation& source,
                                                           const ObjectStoreLocation& target) {
    if (source.key.empty()) {
        return std::unexpected(std::format("Source s3://{} names no object", source.bucket));
    }

    AwsRequest copy;
    copy.method = "PUT";
    copy.url = objectUrl(target);
    copy.service = "s3";
    copy.headers = {std::format("x-amz-copy-source: {}/{}", source.bucket, uriEncode(source.key, true))};
    auto copied = client_.perform(copy);
    if (!copied) {
        return std::unexpected(copied.error());
    }
    // CopyObject can report failure inside a 200 response
    if (copied->status != 200 || !xmlElementText(copied->body, "/Error/Code").empty()) {
        return std::unexpected(std::format("Copy to s3://{}/{} failed: {}", target.bucket, target.key, s3ErrorDetail(*copied)));
    }

    AwsRequest remove;
    remove.method = "DELETE";
    remove.url = objectUrl(source);
    remove.service = "s3";
    auto removed = client_.perform(remove);
    if (!removed) {
        return std::unexpected(removed.error());
    }
    if (removed->status != 204 && removed->status != 200) {
        return std::unexpected(std::format("Copied, but deleting s3://{}/{} failed: {}", source.bucket, source.key, s3ErrorDetail(*removed)));
    }
    return {};
}

std::expected<size_t, std::string> S3ObjectStoreClient::upload(const ObjectStoreLocation& target, std::istream& data) {
    if (target.key.empty()) {
        return std::unexpected(std::format("Target s3://{} names no object", target.bucket));
    }

    AwsRequest put;
    put.method = "PUT";
    put.url = objectUrl(target);
    put.service = "s3";
    put.headers = {"Content-Type: application/octet-stream"};
    put.body.assign(std::istreambuf_iterator<char>(data), std::istreambuf_iterator<char>());

    auto response = client_.perform(put);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(std::format("Upload to s3://{}/{} failed: {}", target.bucket, target.key, s3ErrorDetail(*response)));
    }
    return put.body.size();
}

std::expected<void, std::string> S3ObjectStoreClient::download(const ObjectStoreLocation& source, std::ostream& out) {
    AwsRequest get;
    get.method = "GET";
    get.url = objectUrl(source);
    get.service = "s3";
    get.responseSink = &out;

    auto response = client_.perform(get);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(std::format("Download of s3://{}/{} failed: HTTP {}", source.bucket, source.key, response->status));
    }
    return {};
}
