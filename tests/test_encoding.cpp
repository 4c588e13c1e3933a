#include <catch2/catch.hpp>

#include "encoding.hpp"

TEST_CASE("base64 matches RFC 4648 test vectors", "[encoding]")
{
    CHECK(base64Encode("") == "");
    CHECK(base64Encode("f") == "Zg==");
    CHECK(base64Encode("fo") == "Zm8=");
    CHECK(base64Encode("foo") == "Zm9v");
    CHECK(base64Encode("foobar") == "Zm9vYmFy");

    CHECK(base64Decode("Zm9vYg==") == std::optional<std::string>("foob"));
    CHECK(base64Decode("Zm9v\nYmE=") == std::optional<std::string>("fooba"));
}

TEST_CASE("base64Decode rejects malformed input", "[encoding]")
{
    CHECK_FALSE(base64Decode("Zm9v!"));
    CHECK_FALSE(base64Decode("Z"));
    CHECK_FALSE(base64Decode("Zg==Zg"));
    CHECK_FALSE(base64Decode("Zg==Zm8="));
    CHECK_FALSE(base64Decode("===="));
}

TEST_CASE("base64 carries binary data", "[encoding]")
{
    const std::string binary("\x00\xff\x10\x80", 4);
    CHECK(base64Encode(binary) == "AP8QgA==");
    CHECK(base64Decode("AP8QgA==") == std::optional<std::string>(binary));
}

TEST_CASE("uriEncode keeps unreserved characters only", "[encoding]")
{
    CHECK(uriEncode("daily/hello world.csv") == "daily%2Fhello%20world.csv");
    CHECK(uriEncode("daily/hello world.csv", true) == "daily/hello%20world.csv");
    CHECK(uriEncode("a+b=c&d~e") == "a%2Bb%3Dc%26d~e");
    CHECK(uriEncode("r\xc3\xa9sum\xc3\xa9.csv") == "r%C3%A9sum%C3%A9.csv");
    CHECK(uriEncode("/a//b c/", true) == "/a//b%20c/");
    CHECK(uriEncode("") == "");
}
