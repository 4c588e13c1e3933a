#include "event_store.hpp"
#include <filesystem>
#include <fstream>
#include <format>
#include <ctime>

namespace fs = std::filesystem;

Json::Value TransferEvent::toJson() const {
    auto timeT = std::chrono::system_clock::to_time_t(timestamp);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&timeT));

    Json::Value json;
    json["timestamp"] = timeBuf;
    json["source"] = source;
    json["target"] = target;
    json["strategy"] = strategy;
    json["outcome"] = succeeded ? "succeeded" : "failed";
    json["bytes"] = static_cast<Json::UInt64>(bytes);
    json["elapsed_ms"] = static_cast<Json::Int64>(elapsedMs);
    if (!message.empty()) {
        json["message"] = message;
    }
    return json;
}

JsonLinesEventStore::JsonLinesEventStore(std::string path) : path_(std::move(path)) {}

std::expected<void, std::string> JsonLinesEventStore::append(const TransferEvent& event) {
    fs::path eventPath(path_);
    if (eventPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(eventPath.parent_path(), ec);
        if (ec) {
            return std::unexpected(std::format("Failed to create {}: {}", eventPath.parent_path().string(), ec.message()));
        }
    }

    std::ofstream out(path_, std::ios::app);
    if (!out.is_open()) {
        return std::unexpected(std::format("Failed to open event log: {}", path_));
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    out << Json::writeString(builder, event.toJson()) << '\n';
    if (!out) {
        return std::unexpected(std::format("Failed to write event log: {}", path_));
    }
    return {};
}
