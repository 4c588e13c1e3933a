#include <catch2/catch.hpp>

#include "transfer_executor.hpp"
#include "fakes.hpp"

#include <fstream>
#include <sstream>

namespace {

TransferRequest requestFor(const std::string& source, const std::string& target) {
    auto request = makeTransferRequest(source, target);
    REQUIRE(request);
    return *request;
}

std::string readAll(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

TEST_CASE("resolveStoreTarget appends the file name to directory-like keys", "[executor]")
{
    CHECK(resolveStoreTarget({"bkt", "out/"}, "a.csv").key == "out/a.csv");
    CHECK(resolveStoreTarget({"bkt", ""}, "a.csv").key == "a.csv");
    CHECK(resolveStoreTarget({"bkt", "out/b.csv"}, "a.csv").key == "out/b.csv");
}

TEST_CASE("store-to-store moves the object server side", "[executor]")
{
    FakeObjectStore store;
    store.objects["data-bucket/in/daily.csv"] = "a,b\n1,2\n";
    StoreToStoreExecutor executor(store);

    auto outcome = executor.execute(requestFor("s3://data-bucket/in/daily.csv", "s3://archive/2024/"));
    REQUIRE(outcome);
    CHECK(outcome->bytes == 0);
    CHECK(store.objects.count("data-bucket/in/daily.csv") == 0);
    CHECK(store.objects["archive/2024/daily.csv"] == "a,b\n1,2\n");
}

TEST_CASE("store-to-store failures are transfer errors", "[executor]")
{
    FakeObjectStore store;
    StoreToStoreExecutor executor(store);

    auto outcome = executor.execute(requestFor("s3://data-bucket/in/missing.csv", "s3://archive/"));
    REQUIRE_FALSE(outcome);
    CHECK(outcome.error().kind == ErrorKind::Transfer);
    CHECK(outcome.error().message.find("NoSuchKey") != std::string::npos);
}

TEST_CASE("onprem-to-store uploads the retrieved bytes", "[executor]")
{
    FakeSmbConnector connector;
    connector.files["10.21.13.12/finance/exports/ledger.csv"] = "id,amount\n7,12.50\n";
    FakeObjectStore store;
    OnPremToStoreExecutor executor(connector, store);

    SECTION("to a full key")
    {
        auto outcome = executor.execute(requestFor("10.21.13.12/finance/exports/ledger.csv", "s3://landing/ledger/today.csv"));
        REQUIRE(outcome);
        CHECK(outcome->bytes == 18);
        CHECK(store.objects["landing/ledger/today.csv"] == "id,amount\n7,12.50\n");
    }

    SECTION("to a prefix")
    {
        auto outcome = executor.execute(requestFor("10.21.13.12/finance/exports/ledger.csv", "s3://landing/ledger/"));
        REQUIRE(outcome);
        CHECK(store.objects.count("landing/ledger/ledger.csv") == 1);
    }

    CHECK(connector.connects == 1);
}

TEST_CASE("onprem-to-store reports each stage of failure", "[executor]")
{
    FakeSmbConnector connector;
    FakeObjectStore store;
    OnPremToStoreExecutor executor(connector, store);

    SECTION("share root without a file")
    {
        auto outcome = executor.execute(requestFor("10.21.13.12/finance", "s3://landing/"));
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().kind == ErrorKind::Transfer);
        CHECK(connector.connects == 0);
    }

    SECTION("credential failure passes through")
    {
        connector.connectError = Error{ErrorKind::CredentialDecryption, "Failed to decrypt username: denied"};
        auto outcome = executor.execute(requestFor("10.21.13.12/finance/a.csv", "s3://landing/"));
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().kind == ErrorKind::CredentialDecryption);
    }

    SECTION("missing source file")
    {
        auto outcome = executor.execute(requestFor("10.21.13.12/finance/a.csv", "s3://landing/"));
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().message.find("Failed to retrieve file") != std::string::npos);
        CHECK(store.objects.empty());
    }

    SECTION("upload failure leaves the partial target")
    {
        connector.files["10.21.13.12/finance/a.csv"] = "payload";
        store.failUpload = true;
        auto outcome = executor.execute(requestFor("10.21.13.12/finance/a.csv", "s3://landing/"));
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().message.find("Failed to write to object store") != std::string::npos);
        CHECK(store.objects.count("landing/a.csv") == 1);
    }
}

TEST_CASE("mounted-share executors write below the mount root", "[executor]")
{
    TempDir dir;
    MountedShares shares(dir.path());
    std::filesystem::create_directories(dir.path() / "10.21.13.12" / "finance" / "exports");
    {
        std::ofstream out(dir.path() / "10.21.13.12" / "finance" / "exports" / "ledger.csv", std::ios::binary);
        out << "id,amount\n";
    }

    SECTION("store to onprem")
    {
        FakeObjectStore store;
        store.objects["landing/ledger/today.csv"] = "from the store";
        StoreToOnPremExecutor executor(store, shares);

        auto outcome = executor.execute(requestFor("s3://landing/ledger/today.csv", "10.21.13.12/finance/imports/"));
        REQUIRE(outcome);
        CHECK(outcome->bytes == 14);
        CHECK(readAll(dir.path() / "10.21.13.12" / "finance" / "imports" / "today.csv") == "from the store");
    }

    SECTION("store to onprem with a missing object")
    {
        FakeObjectStore store;
        StoreToOnPremExecutor executor(store, shares);

        auto outcome = executor.execute(requestFor("s3://landing/none.csv", "10.21.13.12/finance/imports/"));
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().kind == ErrorKind::Transfer);
        CHECK_FALSE(std::filesystem::exists(dir.path() / "10.21.13.12" / "finance" / "imports" / "none.csv"));
    }

    SECTION("onprem to onprem")
    {
        OnPremToOnPremExecutor executor(shares);

        auto outcome = executor.execute(requestFor("10.21.13.12/finance/exports/ledger.csv", "10.21.13.40/archive/2024/ledger.csv"));
        REQUIRE(outcome);
        CHECK(outcome->bytes == 10);
        CHECK(readAll(dir.path() / "10.21.13.40" / "archive" / "2024" / "ledger.csv") == "id,amount\n");
    }

    SECTION("onprem to onprem with a missing source")
    {
        OnPremToOnPremExecutor executor(shares);

        auto outcome = executor.execute(requestFor("10.21.13.12/finance/exports/absent.csv", "10.21.13.40/archive/"));
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().message.find("Failed to read from share") != std::string::npos);
    }
}

TEST_CASE("MountedShareConnector serves only mounted servers", "[executor]")
{
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "10.21.13.12" / "finance");
    {
        std::ofstream out(dir.path() / "10.21.13.12" / "finance" / "a.csv");
        out << "abc";
    }
    MountedShares shares(dir.path());
    MountedShareConnector connector(shares);

    auto connection = connector.connect("10.21.13.12");
    REQUIRE(connection);
    std::stringstream out;
    auto bytes = (*connection)->retrieveFile("finance", "a.csv", out);
    REQUIRE(bytes);
    CHECK(*bytes == 3);
    CHECK(out.str() == "abc");

    auto unmounted = connector.connect("10.0.0.9");
    REQUIRE_FALSE(unmounted);
    CHECK(unmounted.error().kind == ErrorKind::Transfer);
}

TEST_CASE("MountedShares keeps every path below its share", "[executor]")
{
    TempDir dir;
    MountedShares shares(dir.path() / "mnt");
    std::filesystem::create_directories(dir.path() / "mnt" / "10.0.0.1" / "share");

    auto inside = shares.pathFor(OnPremLocation{"10.0.0.1", "share", "daily/../a.csv"});
    REQUIRE(inside);
    CHECK(*inside == (dir.path() / "mnt" / "10.0.0.1" / "share" / "a.csv").lexically_normal());

    for (const auto& escaping : {OnPremLocation{"10.0.0.1", "share", (dir.path() / "outside.csv").string()},
                                 OnPremLocation{"10.0.0.1", "share", "../../../outside.csv"},
                                 OnPremLocation{"10.0.0.1", "..", "outside.csv"}}) {
        INFO(escaping.share << " " << escaping.path);
        CHECK_FALSE(shares.pathFor(escaping));

        std::istringstream payload("payload");
        CHECK_FALSE(shares.writeFile(escaping, "a.csv", payload));
        std::ostringstream sink;
        CHECK_FALSE(shares.readFile(escaping, sink));
    }
    CHECK_FALSE(std::filesystem::exists(dir.path() / "outside.csv"));
}
