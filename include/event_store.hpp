/**
 * @file event_store.hpp
 * @brief Append-only audit trail of processed transfers.
 */

#ifndef EVENT_STORE_HPP
#define EVENT_STORE_HPP

#include <string>
#include <chrono>
#include <expected>
#include <json/json.h>

/**
 * @brief One processed transfer.
 */
struct TransferEvent {
    std::chrono::system_clock::time_point timestamp; ///< When the transfer finished.
    std::string source;                              ///< Source location string.
    std::string target;                              ///< Target location string.
    std::string strategy;                            ///< Strategy name.
    bool succeeded = false;                          ///< Outcome.
    size_t bytes = 0;                                ///< Bytes moved.
    long long elapsedMs = 0;                         ///< Duration in milliseconds.
    std::string message;                             ///< Error description on failure.

    Json::Value toJson() const;
};

/**
 * @brief Interface for the audit trail. Entries are only ever appended.
 */
class TransferEventStore {
public:
    virtual ~TransferEventStore() = default;

    virtual std::expected<void, std::string> append(const TransferEvent& event) = 0;
};

/**
 * @brief Writes each event as one JSON object per line.
 */
class JsonLinesEventStore : public TransferEventStore {
public:
    /**
     * @param path File to append to; parent directories are created on demand.
     */
    explicit JsonLinesEventStore(std::string path);

    std::expected<void, std::string> append(const TransferEvent& event) override;

private:
    std::string path_;
};

#endif // EVENT_STORE_HPP
