#include "transfer_executor.hpp"
#include <sstream>
#include <format>

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::unexpected<Error> transferError(std::string message) {
    return std::unexpected(Error{ErrorKind::Transfer, std::move(message)});
}

} // namespace

ObjectStoreLocation resolveStoreTarget(const ObjectStoreLocation& target, const std::string& sourceFileName) {
    if (target.key.empty() || target.key.back() == '/') {
        return ObjectStoreLocation{target.bucket, target.key + sourceFileName};
    }
    return target;
}

StoreToStoreExecutor::StoreToStoreExecutor(ObjectStoreClient& store) : store_(store) {}

std::expected<TransferOutcome, Error> StoreToStoreExecutor::execute(const TransferRequest& request) {
    const auto& source = std::get<ObjectStoreLocation>(request.source);
    auto target = resolveStoreTarget(std::get<ObjectStoreLocation>(request.target), fileNameOf(request.source));

    auto start = Clock::now();
    auto moved = store_.move(source, target);
    if (!moved) {
        return transferError(std::format("Object-store move failed: {}", moved.error()));
    }
    return TransferOutcome{0, since(start)};
}

OnPremToStoreExecutor::OnPremToStoreExecutor(SmbConnector& connector, ObjectStoreClient& store)
    : connector_(connector), store_(store) {}

std::expected<TransferOutcome, Error> OnPremToStoreExecutor::execute(const TransferRequest& request) {
    const auto& source = std::get<OnPremLocation>(request.source);
    auto target = resolveStoreTarget(std::get<ObjectStoreLocation>(request.target), fileNameOf(request.source));
    if (source.path.empty()) {
        return transferError(std::format("No file specified in {}", toString(request.source)));
    }

    auto start = Clock::now();
    auto connection = connector_.connect(source.address);
    if (!connection) {
        return std::unexpected(connection.error());
    }

    std::stringstream buffer;
    auto retrieved = (*connection)->retrieveFile(source.share, source.path, buffer);
    if (!retrieved) {
        return transferError(std::format("Failed to retrieve file: {}", retrieved.error()));
    }

    buffer.seekg(0);
    auto uploaded = store_.upload(target, buffer);
    if (!uploaded) {
        return transferError(std::format("Failed to write to object store: {}", uploaded.error()));
    }
    return TransferOutcome{*uploaded, since(start)};
}

StoreToOnPremExecutor::StoreToOnPremExecutor(ObjectStoreClient& store, const MountedShares& shares)
    : store_(store), shares_(shares) {}

std::expected<TransferOutcome, Error> StoreToOnPremExecutor::execute(const TransferRequest& request) {
    const auto& source = std::get<ObjectStoreLocation>(request.source);
    const auto& target = std::get<OnPremLocation>(request.target);
    if (source.key.empty() || source.key.back() == '/') {
        return transferError(std::format("No object specified in {}", toString(request.source)));
    }

    auto start = Clock::now();
    std::stringstream buffer;
    auto downloaded = store_.download(source, buffer);
    if (!downloaded) {
        return transferError(std::format("Failed to read from object store: {}", downloaded.error()));
    }

    buffer.seekg(0);
    auto written = shares_.writeFile(target, fileNameOf(request.source), buffer);
    if (!written) {
        return transferError(std::format("Failed to write to share: {}", written.error()));
    }
    return TransferOutcome{*written, since(start)};
}

OnPremToOnPremExecutor::OnPremToOnPremExecutor(const MountedShares& shares) : shares_(shares) {}

std::expected<TransferOutcome, Error> OnPremToOnPremExecutor::execute(const TransferRequest& request) {
    const auto& source = std::get<OnPremLocation>(request.source);
    const auto& target = std::get<OnPremLocation>(request.target);
    if (source.path.empty()) {
        return transferError(std::format("No file specified in {}", toString(request.source)));
    }

    auto start = Clock::now();
    std::stringstream buffer;
    auto read = shares_.readFile(source, buffer);
    if (!read) {
        return transferError(std::format("Failed to read from share: {}", read.error()));
    }

    buffer.seekg(0);
    auto written = shares_.writeFile(target, fileNameOf(request.source), buffer);
    if (!written) {
        return transferError(std::format("Failed to write to share: {}", written.error()));
    }
    return TransferOutcome{*written, since(start)};
}
