/**
 * @file aws_client.hpp
 * @brief Signed HTTPS transport for the AWS APIs FileShuttle calls (S3, KMS, EC2).
 *
 * Requests are signed with AWS Signature Version 4 by libcurl itself
 * (CURLOPT_AWS_SIGV4). Every request is bounded by the configured timeout.
 */

#ifndef AWS_CLIENT_HPP
#define AWS_CLIENT_HPP

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <expected>
#include <iosfwd>
#include "shuttle_config.hpp"

/**
 * @brief One signed request.
 */
struct AwsRequest {
    std::string method;               ///< HTTP method ("GET", "PUT", "POST", "DELETE").
    std::string url;                  ///< Full endpoint URL.
    std::string service;              ///< Signing service name ("s3", "kms", "ec2").
    std::vector<std::string> headers; ///< Extra headers, "Name: value".
    std::string body;                 ///< Request payload; empty for none.
    std::ostream* responseSink = nullptr; ///< If set, the response body is streamed here.
};

/**
 * @brief HTTP status and (unless streamed) body of a response.
 */
struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief Performs SigV4-signed requests against AWS endpoints.
 */
class AwsHttpClient {
public:
    /**
     * @brief Constructs a client for one region.
     *
     * @param region AWS region, e.g. "ap-southeast-2".
     * @param credentials Signing credentials; when absent they are fetched from
     * the instance metadata service on the first request.
     * @param timeout Upper bound for each request.
     */
    AwsHttpClient(std::string region, std::optional<AwsCredentials> credentials, std::chrono::seconds timeout);

    /**
     * @brief Sends a request and collects the response.
     *
     * @param request Request description.
     * @return std::expected<HttpResponse, std::string> Response of any HTTP status,
     * or an error message when the request could not complete (DNS, TLS, timeout).
     */
    std::expected<HttpResponse, std::string> perform(const AwsRequest& request) const;

    const std::string& region() const { return region_; }

private:
    std::expected<const AwsCredentials*, std::string> signingCredentials() const;

    std::string region_;                                ///< Region used in the signing scope.
    mutable std::optional<AwsCredentials> credentials_; ///< Signing credentials, filled on first use.
    std::chrono::seconds timeout_;                      ///< Per-request timeout.
};

/**
 * @brief Fetches the instance profile's temporary credentials from the instance
 * metadata service (IMDSv2).
 *
 * Used on transfer instances, where no credentials are set in the environment.
 *
 * @param timeout Upper bound for each metadata request.
 * @return std::expected<AwsCredentials, std::string> Credentials or an error message.
 */
std::expected<AwsCredentials, std::string> fetchInstanceCredentials(std::chrono::seconds timeout);

/**
 * @brief Extracts the text of an element from an XML response body.
 *
 * The path names elements by local name, so the namespaces AWS puts on its
 * responses do not matter. "/Error/Code" is anchored at the root element;
 * "//Error/Code" matches at any depth. Entities and CDATA are decoded.
 *
 * @param xml Response body.
 * @param elementPath Slash-separated element path.
 * @return std::string Text of the first match, or an empty string when the body
 * is not XML or nothing matches.
 */
std::string xmlElementText(const std::string& xml, const std::string& elementPath);

#endif // AWS_CLIENT_HPP
