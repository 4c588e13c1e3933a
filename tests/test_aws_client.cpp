#include <catch2/catch.hpp>

#include "aws_client.hpp"

namespace {

const std::string kRunInstancesResponse = R"(<?xml version="1.0" encoding="UTF-8"?>
<RunInstancesResponse xmlns="http://ec2.amazonaws.com/doc/2016-11-15/">
    <requestId>5b3c9a2e-6f3e-4c55-8d61-1a2b3c4d5e6f</requestId>
    <reservationId>r-0123456789abcdef0</reservationId>
    <sourceInstance>
        <instanceId>i-0fffffffffffffff0</instanceId>
    </sourceInstance>
    <instancesSet>
        <item>
            <instanceId>i-0abc123def4567890</instanceId>
            <imageId>ami-07cc15c3ba6f8e287</imageId>
        </item>
    </instancesSet>
</RunInstancesResponse>)";

} // namespace

TEST_CASE("xmlElementText follows the element path through namespaces", "[xml]")
{
    CHECK(xmlElementText(kRunInstancesResponse, "/RunInstancesResponse/instancesSet/item/instanceId") == "i-0abc123def4567890");
    CHECK(xmlElementText(kRunInstancesResponse, "/RunInstancesResponse/reservationId") == "r-0123456789abcdef0");
    CHECK(xmlElementText(kRunInstancesResponse, "/RunInstancesResponse/instancesSet/item/keyName").empty());
}

TEST_CASE("xmlElementText decodes entities and CDATA", "[xml]")
{
    const std::string ec2Error = "<Response><Errors><Error><Code>UnauthorizedOperation</Code>"
                                 "<Message>Not authorized &amp; denied</Message></Error></Errors>"
                                 "<RequestID>abc</RequestID></Response>";
    CHECK(xmlElementText(ec2Error, "//Errors/Error/Code") == "UnauthorizedOperation");
    CHECK(xmlElementText(ec2Error, "//Errors/Error/Message") == "Not authorized & denied");

    const std::string s3Error = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                                "<Error><Code>NoSuchKey</Code><Message><![CDATA[The <key> does not exist]]></Message></Error>";
    CHECK(xmlElementText(s3Error, "/Error/Code") == "NoSuchKey");
    CHECK(xmlElementText(s3Error, "/Error/Message") == "The <key> does not exist");
}

TEST_CASE("xmlElementText finds nothing in non-error or non-XML bodies", "[xml]")
{
    const std::string copied = R"(<CopyObjectResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">)"
                               R"(<ETag>"9b2cf535f27731c974343645a3985328"</ETag></CopyObjectResult>)";
    CHECK(xmlElementText(copied, "/Error/Code").empty());
    CHECK(xmlElementText("Service Unavailable", "/Error/Code").empty());
    CHECK(xmlElementText("", "/Error/Code").empty());
}
