/**
 * @file object_store.hpp
 * @brief Object-store client interface and its S3 implementation.
 *
 * The executors only see the ObjectStoreClient interface so tests can swap in
 * an in-memory store.
 */

#ifndef OBJECT_STORE_HPP
#define OBJECT_STORE_HPP

#include <string>
#include <expected>
#include <iosfwd>
#include "location.hpp"
#include "aws_client.hpp"

/**
 * @brief Interface for object-store operations.
 */
class ObjectStoreClient {
public:
    virtual ~ObjectStoreClient() = default;

    /**
     * @brief Moves an object between two store paths (same or different bucket).
     *
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> move(const ObjectStoreLocation& source,
                                                  const ObjectStoreLocation& target) = 0;

    /**
     * @brief Uploads the remaining contents of a stream as one object.
     *
     * @return std::expected<size_t, std::string> Bytes uploaded or an error message.
     */
    virtual std::expected<size_t, std::string> upload(const ObjectStoreLocation& target, std::istream& data) = 0;

    /**
     * @brief Downloads an object into a stream.
     *
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> download(const ObjectStoreLocation& source, std::ostream& out) = 0;
};

/**
 * @brief S3 REST implementation of ObjectStoreClient.
 *
 * Move is a server-side copy followed by a delete of the source. Single
 * credential scope only; cross-account copies are not supported.
 */
class S3ObjectStoreClient : public ObjectStoreClient {
public:
    explicit S3ObjectStoreClient(const AwsHttpClient& client);

    std::expected<void, std::string> move(const ObjectStoreLocation& source,
                                          const ObjectStoreLocation& target) override;
    std::expected<size_t, std::string> upload(const ObjectStoreLocation& target, std::istream& data) override;
    std::expected<void, std::string> download(const ObjectStoreLocation& source, std::ostream& out) override;

private:
    std::string objectUrl(const ObjectStoreLocation& location) const;

    const AwsHttpClient& client_;
};

#endif // OBJECT_STORE_HPP
