#include "compute_provisioner.hpp"
#include "credentials.hpp"
#include "encoding.hpp"
#include <format>

namespace {

void addParam(std::string& body, std::string_view name, std::string_view value) {
    if (!body.empty()) {
        body += '&';
    }
    body += uriEncode(name);
    body += '=';
    body += uriEncode(value);
}

} // namespace

Ec2Provisioner::Ec2Provisioner(const AwsHttpClient& client) : client_(client) {}

std::string Ec2Provisioner::runInstancesBody(const LaunchSpec& spec) {
    std::string body;
    addParam(body, "Action", "RunInstances");
    addParam(body, "Version", "2016-11-15");
    addParam(body, "ImageId", spec.imageId);
    addParam(body, "IamInstanceProfile.Name", spec.instanceProfile);
    addParam(body, "InstanceInitiatedShutdownBehavior", spec.terminateOnShutdown ? "terminate" : "stop");
    addParam(body, "MinCount", "1");
    addParam(body, "MaxCount", "1");
    addParam(body, "InstanceType", spec.instanceType);
    addParam(body, "SecurityGroupId.1", spec.securityGroup);
    addParam(body, "SubnetId", spec.subnet);
    if (spec.keyName) {
        addParam(body, "KeyName", *spec.keyName);
    }
    addParam(body, "UserData", base64Encode(spec.userData));
    addParam(body, "TagSpecification.1.ResourceType", "instance");
    int index = 1;
    for (const auto& [key, value] : spec.tags) {
        addParam(body, std::format("TagSpecification.1.Tag.{}.Key", index), key);
        addParam(body, std::format("TagSpecification.1.Tag.{}.Value", index), value);
        ++index;
    }
    return body;
}

std::expected<std::string, std::string> Ec2Provisioner::launch(const LaunchSpec& spec) {
    AwsRequest request;
    request.method = "POST";
    request.url = std::format("https://ec2.{}.amazonaws.com/", client_.region());
    request.service = "ec2";
    request.headers = {"Content-Type: application/x-www-form-urlencoded; charset=utf-8"};
    request.body = runInstancesBody(spec);

    auto response = client_.perform(request);
    secureWipe(request.body);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(std::format("RunInstances failed: {} {} (HTTP {})",
            xmlElementText(response->body, "//Errors/Error/Code"), xmlElementText(response->body, "//Errors/Error/Message"), response->status));
    }

    auto instanceId = xmlElementText(response->body, "/RunInstancesResponse/instancesSet/item/instanceId");
    if (instanceId.empty()) {
        return std::unexpected("RunInstances response carried no instance id");
    }
    return instanceId;
}
