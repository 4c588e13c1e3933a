#include <catch2/catch.hpp>

#include "remote_orchestrator.hpp"
#include "fakes.hpp"

#include <regex>

namespace {

const std::string kHandler = "/opt/fileshuttle/bin/fileshuttle";

std::optional<std::string> tagValue(const LaunchSpec& spec, const std::string& key) {
    for (const auto& [name, value] : spec.tags) {
        if (name == key) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

TEST_CASE("orchestrate launches one instance with the bootstrap script", "[orchestrator]")
{
    ShuttleConfig config = quietConfig();
    FakeDecryptor decryptor;
    CredentialResolver resolver(decryptor);
    FakeProvisioner provisioner;
    RemoteTransferOrchestrator orchestrator(config, resolver, provisioner);

    auto handle = orchestrator.orchestrate("10.21.13.12/finance/a.csv", "s3://landing/", kHandler);
    REQUIRE(handle);
    CHECK(handle->instanceId == "i-0abc123def4567890");
    CHECK(handle->state == InstanceState::Launched);
    CHECK(provisioner.launches == 1);

    REQUIRE(provisioner.lastSpec);
    const LaunchSpec& spec = *provisioner.lastSpec;
    CHECK(spec.terminateOnShutdown);
    CHECK(spec.imageId == "ami-07cc15c3ba6f8e287");
    CHECK(spec.instanceType == "t3.micro");
    CHECK(spec.subnet == "subnet-0123456789abcdef0");
    CHECK(spec.securityGroup == "sg-0123456789abcdef0");
    CHECK_FALSE(spec.keyName);

    auto name = tagValue(spec, "Name");
    REQUIRE(name);
    CHECK(std::regex_match(*name, std::regex(R"(nonprod-dataanalytics-filescheduler-ec2-\d{8}-\d{6})")));
    CHECK(*name == handle->name);
    CHECK(tagValue(spec, "squad") == std::optional<std::string>("ninja"));
    CHECK(tagValue(spec, "platform") == std::optional<std::string>("dataanalytics"));

    CHECK(spec.userData.find(kPlainUser) != std::string::npos);
    CHECK(spec.userData.find(kPlainPassword) != std::string::npos);
    CHECK(spec.userData.find(kEncryptedUser) == std::string::npos);
    CHECK(spec.userData.find(kEncryptedPassword) == std::string::npos);
}

TEST_CASE("orchestrate validates everything before launching", "[orchestrator]")
{
    FakeDecryptor decryptor;
    CredentialResolver resolver(decryptor);
    FakeProvisioner provisioner;

    SECTION("missing handler")
    {
        ShuttleConfig config = quietConfig();
        RemoteTransferOrchestrator orchestrator(config, resolver, provisioner);
        auto handle = orchestrator.orchestrate("10.21.13.12/finance/a.csv", "s3://landing/", "");
        REQUIRE_FALSE(handle);
        CHECK(handle.error().kind == ErrorKind::Configuration);
    }

    SECTION("missing subnet")
    {
        auto env = completeEnvironment();
        env.erase("VPC_SUBNET");
        ShuttleConfig config = quietConfig(env);
        RemoteTransferOrchestrator orchestrator(config, resolver, provisioner);
        auto handle = orchestrator.orchestrate("10.21.13.12/finance/a.csv", "s3://landing/", kHandler);
        REQUIRE_FALSE(handle);
        CHECK(handle.error().kind == ErrorKind::Configuration);
        CHECK(handle.error().message.find("VPC_SUBNET") != std::string::npos);
        CHECK(decryptor.calls == 0);
    }

    SECTION("invalid location")
    {
        ShuttleConfig config = quietConfig();
        RemoteTransferOrchestrator orchestrator(config, resolver, provisioner);
        auto handle = orchestrator.orchestrate("fileserver/finance/a.csv", "s3://landing/", kHandler);
        REQUIRE_FALSE(handle);
        CHECK(handle.error().kind == ErrorKind::InvalidLocation);
        CHECK(decryptor.calls == 0);
    }

    SECTION("share path outside the share")
    {
        ShuttleConfig config = quietConfig();
        RemoteTransferOrchestrator orchestrator(config, resolver, provisioner);
        auto handle = orchestrator.orchestrate("s3://landing/a.csv", "10.21.13.12/finance//etc/cron.d/x", kHandler);
        REQUIRE_FALSE(handle);
        CHECK(handle.error().kind == ErrorKind::InvalidLocation);
        CHECK(decryptor.calls == 0);
    }

    SECTION("credentials that cannot be decrypted")
    {
        auto env = completeEnvironment();
        env["AD_key"] = "AQICAHhROTATEDKEY==";
        ShuttleConfig config = quietConfig(env);
        RemoteTransferOrchestrator orchestrator(config, resolver, provisioner);
        auto handle = orchestrator.orchestrate("10.21.13.12/finance/a.csv", "s3://landing/", kHandler);
        REQUIRE_FALSE(handle);
        CHECK(handle.error().kind == ErrorKind::CredentialDecryption);
    }

    CHECK(provisioner.launches == 0);
}

TEST_CASE("a failed launch is reported once and never retried", "[orchestrator]")
{
    ShuttleConfig config = quietConfig();
    FakeDecryptor decryptor;
    CredentialResolver resolver(decryptor);
    FakeProvisioner provisioner;
    provisioner.failure = "RunInstances failed: InsufficientInstanceCapacity (HTTP 500)";
    RemoteTransferOrchestrator orchestrator(config, resolver, provisioner);

    auto handle = orchestrator.orchestrate("s3://landing/a.csv", "10.21.13.12/finance/", kHandler);
    REQUIRE_FALSE(handle);
    CHECK(handle.error().kind == ErrorKind::Provision);
    CHECK(handle.error().message.find("InsufficientInstanceCapacity") != std::string::npos);
    CHECK(handle.error().message.find(kPlainPassword) == std::string::npos);
    CHECK(provisioner.launches == 1);
}

TEST_CASE("the optional key pair is passed through", "[orchestrator]")
{
    auto env = completeEnvironment();
    env["EC2_PEM_KEY"] = "ops-key";
    ShuttleConfig config = quietConfig(env);
    FakeDecryptor decryptor;
    CredentialResolver resolver(decryptor);
    FakeProvisioner provisioner;
    RemoteTransferOrchestrator orchestrator(config, resolver, provisioner);

    REQUIRE(orchestrator.orchestrate("10.21.13.12/finance/a.csv", "10.21.13.40/archive/", kHandler));
    REQUIRE(provisioner.lastSpec);
    CHECK(provisioner.lastSpec->keyName == std::optional<std::string>("ops-key"));
}
