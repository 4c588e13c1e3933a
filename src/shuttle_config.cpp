#include "shuttle_config.hpp"
#include <fstream>
#include <filesystem>
#include <chrono>
#include <format>
#include <print>
#include <cstdlib>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::optional<std::string> optionalString(const Json::Value& json, const char* key) {
    if (!json.isMember(key) || json[key].asString().empty()) {
        return std::nullopt;
    }
    return json[key].asString();
}

void overlay(std::optional<std::string>& field, const EnvironmentLookup& env, const std::string& name) {
    if (auto value = env(name); value && !value->empty()) {
        field = std::move(value);
    }
}

std::string timestampNow() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&timeT));
    return timeBuf;
}

void appendLine(const std::string& path, const std::string& line) {
    if (path.empty()) {
        return;
    }
    fs::path logPath(path);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(logPath.parent_path(), ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", path);
    }
}

} // namespace

std::optional<std::string> processEnvironment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

ShuttleConfig::ShuttleConfig(const Json::Value& configJson, const EnvironmentLookup& env) {
    const Json::Value& json = configJson.isObject() ? configJson : Json::Value::nullSingleton();

    region = json.get("region", "ap-southeast-2").asString();
    logFile = json.get("log_file", "./logs/fileshuttle.log").asString();
    errorLogFile = json.get("error_log_file", "./logs/errors.log").asString();
    eventLogFile = json.get("event_log_file", "./logs/transfer_events.jsonl").asString();
    requestTimeoutSeconds = json.get("request_timeout_seconds", 300).asInt();
    if (requestTimeoutSeconds <= 0) {
        throw std::runtime_error(std::format("Invalid request_timeout_seconds: {}", requestTimeoutSeconds));
    }

    Json::Value smbJson = json["smb"];
    smb.domain = smbJson.get("domain", "WORKGROUP").asString();
    smb.port = smbJson.get("port", 445).asInt();

    Json::Value instanceJson = json["instance"];
    instance.imageId = optionalString(instanceJson, "image_id").value_or("ami-07cc15c3ba6f8e287");
    instance.instanceProfile = optionalString(instanceJson, "instance_profile").value_or("nonprod-dataanalytics-filescheduler-ec2");
    instance.instanceType = optionalString(instanceJson, "instance_type");
    instance.subnet = optionalString(instanceJson, "subnet");
    instance.securityGroup = optionalString(instanceJson, "security_group");
    instance.keyName = optionalString(instanceJson, "key_name");
    instance.namePrefix = instanceJson.get("name_prefix", "nonprod-dataanalytics-filescheduler-ec2").asString();
    instance.squad = instanceJson.get("squad", "ninja").asString();
    instance.platform = instanceJson.get("platform", "dataanalytics").asString();
    instance.mountRoot = instanceJson.get("mount_root", "/mnt/fileshuttle").asString();
    instance.runtimePackages = instanceJson.get("runtime_packages", "cifs-utils libcurl jsoncpp").asString();
    instance.auditLocation = instanceJson.get("audit_location", "s3://bucket-test/ec2-log/").asString();
    instance.handler = optionalString(instanceJson, "handler");

    if (auto value = env("AWS_REGION"); value && !value->empty()) {
        region = *value;
    }
    overlay(encryptedUsername, env, "AD_username");
    overlay(encryptedPassword, env, "AD_key");
    overlay(instance.imageId, env, "EC2_IMAGE_ID");
    overlay(instance.instanceProfile, env, "EC2_INSTANCE_PROFILE");
    overlay(instance.instanceType, env, "EC2_INSTANCE_TYPE");
    overlay(instance.subnet, env, "VPC_SUBNET");
    overlay(instance.securityGroup, env, "SECURITY_GROUP");
    overlay(instance.keyName, env, "EC2_PEM_KEY");
    overlay(instance.handler, env, "TRANSFER_HANDLER");

    auto accessKey = env("AWS_ACCESS_KEY_ID");
    auto secretKey = env("AWS_SECRET_ACCESS_KEY");
    if (accessKey && secretKey && !accessKey->empty() && !secretKey->empty()) {
        AwsCredentials aws{*accessKey, *secretKey, std::nullopt};
        overlay(aws.sessionToken, env, "AWS_SESSION_TOKEN");
        awsCredentials = std::move(aws);
    }
}

ShuttleConfig ShuttleConfig::fromFile(const std::string& configFile, const EnvironmentLookup& env) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error(std::format("Failed to parse config file: {} ({})", configFile, errors));
    }
    return ShuttleConfig(configJson, env);
}

void ShuttleConfig::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", timestampNow(), message);
    std::println("{}", logEntry);
    appendLine(logFile, logEntry);
}

void ShuttleConfig::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", timestampNow(), message);
    std::println(stderr, "{}", logEntry);
    appendLine(errorLogFile, logEntry);
}

std::expected<void, Error> ShuttleConfig::validateForOrchestration() const {
    const std::pair<const std::optional<std::string>*, const char*> required[] = {
        {&encryptedUsername, "AD_username"},
        {&encryptedPassword, "AD_key"},
        {&instance.imageId, "EC2_IMAGE_ID"},
        {&instance.instanceProfile, "EC2_INSTANCE_PROFILE"},
        {&instance.instanceType, "EC2_INSTANCE_TYPE"},
        {&instance.subnet, "VPC_SUBNET"},
        {&instance.securityGroup, "SECURITY_GROUP"},
    };
    for (const auto& [value, name] : required) {
        if (!*value || (*value)->empty()) {
            return std::unexpected(Error{ErrorKind::Configuration,
                std::format("Missing required configuration: {}", name)});
        }
    }
    if (instance.mountRoot.empty() || instance.mountRoot.front() != '/') {
        return std::unexpected(Error{ErrorKind::Configuration,
            std::format("Instance mount_root must be an absolute path: '{}'", instance.mountRoot)});
    }
    return {};
}
