#ifndef FILESHUTTLE_TEST_FAKES_HPP
#define FILESHUTTLE_TEST_FAKES_HPP

#include "credentials.hpp"
#include "object_store.hpp"
#include "smb_client.hpp"
#include "compute_provisioner.hpp"
#include "event_store.hpp"
#include "shuttle_config.hpp"

#include <filesystem>
#include <format>
#include <istream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <random>
#include <set>
#include <string>
#include <vector>

// Ciphertexts and plaintexts used throughout the tests
inline const std::string kEncryptedUser = "AQICAHhENCRYPTEDUSER==";
inline const std::string kEncryptedPassword = "AQICAHhENCRYPTEDPASS==";
inline const std::string kPlainUser = "svc_transfer";
inline const std::string kPlainPassword = "s3cr3t-Pa55";

class FakeDecryptor : public Decryptor {
public:
    FakeDecryptor() {
        plaintexts[kEncryptedUser] = kPlainUser;
        plaintexts[kEncryptedPassword] = kPlainPassword;
    }

    std::expected<std::string, std::string> decrypt(const std::string& ciphertext) override {
        ++calls;
        auto it = plaintexts.find(ciphertext);
        if (it == plaintexts.end()) {
            return std::unexpected("InvalidCiphertextException");
        }
        return it->second;
    }

    std::map<std::string, std::string> plaintexts;
    int calls = 0;
};

inline std::string storeKey(const ObjectStoreLocation& location) {
    return std::format("{}/{}", location.bucket, location.key);
}

class FakeObjectStore : public ObjectStoreClient {
public:
    std::expected<void, std::string> move(const ObjectStoreLocation& source,
                                          const ObjectStoreLocation& target) override {
        ++moves;
        if (failMove) {
            return std::unexpected("AccessDenied (HTTP 403)");
        }
        auto it = objects.find(storeKey(source));
        if (it == objects.end()) {
            return std::unexpected("NoSuchKey (HTTP 404)");
        }
        objects[storeKey(target)] = it->second;
        objects.erase(storeKey(source));
        return {};
    }

    std::expected<size_t, std::string> upload(const ObjectStoreLocation& target, std::istream& data) override {
        std::string body{std::istreambuf_iterator<char>(data), std::istreambuf_iterator<char>()};
        if (failUpload) {
            // a failed upload can leave an empty object behind
            objects[storeKey(target)] = "";
            return std::unexpected("RequestTimeout (HTTP 400)");
        }
        objects[storeKey(target)] = body;
        return body.size();
    }

    std::expected<void, std::string> download(const ObjectStoreLocation& source, std::ostream& out) override {
        auto it = objects.find(storeKey(source));
        if (it == objects.end()) {
            return std::unexpected("HTTP 404");
        }
        out << it->second;
        return {};
    }

    std::map<std::string, std::string> objects;
    bool failMove = false;
    bool failUpload = false;
    int moves = 0;
};

class FakeSmbConnection : public SmbConnection {
public:
    FakeSmbConnection(const std::map<std::string, std::string>& files, std::string address)
        : files_(files), address_(std::move(address)) {}

    std::expected<size_t, std::string> retrieveFile(const std::string& share,
                                                    const std::string& path,
                                                    std::ostream& out) override {
        auto it = files_.find(std::format("{}/{}/{}", address_, share, path));
        if (it == files_.end()) {
            return std::unexpected("STATUS_OBJECT_NAME_NOT_FOUND");
        }
        out << it->second;
        return it->second.size();
    }

private:
    const std::map<std::string, std::string>& files_;
    std::string address_;
};

class FakeSmbConnector : public SmbConnector {
public:
    std::expected<std::unique_ptr<SmbConnection>, Error> connect(const std::string& address) override {
        ++connects;
        if (connectError) {
            return std::unexpected(*connectError);
        }
        return std::make_unique<FakeSmbConnection>(files, address);
    }

    std::map<std::string, std::string> files; ///< "address/share/path" -> contents
    std::optional<Error> connectError;
    int connects = 0;
};

class FakeProvisioner : public ComputeProvisioner {
public:
    std::expected<std::string, std::string> launch(const LaunchSpec& spec) override {
        ++launches;
        lastSpec = spec;
        if (failure) {
            return std::unexpected(*failure);
        }
        return instanceId;
    }

    std::string instanceId = "i-0abc123def4567890";
    std::optional<std::string> failure;
    std::optional<LaunchSpec> lastSpec;
    int launches = 0;
};

class FakeEventStore : public TransferEventStore {
public:
    std::expected<void, std::string> append(const TransferEvent& event) override {
        events.push_back(event);
        return {};
    }

    std::vector<TransferEvent> events;
};

/// Environment lookup over a fixed map.
inline EnvironmentLookup fixedEnvironment(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

/// Environment of a fully configured event trigger.
inline std::map<std::string, std::string> completeEnvironment() {
    return {
        {"AD_username", kEncryptedUser},
        {"AD_key", kEncryptedPassword},
        {"EC2_INSTANCE_TYPE", "t3.micro"},
        {"VPC_SUBNET", "subnet-0123456789abcdef0"},
        {"SECURITY_GROUP", "sg-0123456789abcdef0"},
        {"TRANSFER_HANDLER", "/opt/fileshuttle/bin/fileshuttle"},
    };
}

/// Configuration that logs to the console only.
inline ShuttleConfig quietConfig(std::map<std::string, std::string> env = completeEnvironment()) {
    Json::Value json;
    json["log_file"] = "";
    json["error_log_file"] = "";
    json["event_log_file"] = "";
    return ShuttleConfig(json, fixedEnvironment(std::move(env)));
}

/// Scratch directory removed when the test ends.
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / std::format("fileshuttle-test-{:x}", rd());
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

#endif // FILESHUTTLE_TEST_FAKES_HPP
