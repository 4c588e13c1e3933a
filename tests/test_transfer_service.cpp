#include <catch2/catch.hpp>

#include "transfer_service.hpp"
#include "fakes.hpp"

#include <fstream>

TEST_CASE("TransferService runs the selected strategy and records it", "[service]")
{
    ShuttleConfig config = quietConfig();
    FakeObjectStore store;
    FakeSmbConnector connector;
    FakeEventStore events;
    TransferService service(config, TransferCollaborators{store, connector, nullptr, &events});

    SECTION("store to store")
    {
        store.objects["data-bucket/in/daily.csv"] = "x";
        auto outcome = service.move("s3://data-bucket/in/daily.csv", "s3://archive/daily.csv");
        REQUIRE(outcome);
        CHECK(store.moves == 1);
        REQUIRE(events.events.size() == 1);
        CHECK(events.events[0].strategy == "store-to-store");
        CHECK(events.events[0].succeeded);
        CHECK(events.events[0].message.empty());
    }

    SECTION("onprem to store")
    {
        connector.files["10.21.13.12/finance/a.csv"] = "hello";
        auto outcome = service.move("10.21.13.12/finance/a.csv", "s3://landing/");
        REQUIRE(outcome);
        CHECK(outcome->bytes == 5);
        REQUIRE(events.events.size() == 1);
        CHECK(events.events[0].strategy == "onprem-to-store");
        CHECK(events.events[0].bytes == 5);
    }

    SECTION("failed transfer is recorded with its reason")
    {
        auto outcome = service.move("10.21.13.12/finance/a.csv", "s3://landing/");
        REQUIRE_FALSE(outcome);
        REQUIRE(events.events.size() == 1);
        CHECK_FALSE(events.events[0].succeeded);
        CHECK(events.events[0].message.rfind("TransferError: ", 0) == 0);
    }
}

TEST_CASE("TransferService rejects bad locations before touching anything", "[service]")
{
    ShuttleConfig config = quietConfig();
    FakeObjectStore store;
    FakeSmbConnector connector;
    FakeEventStore events;
    TransferService service(config, TransferCollaborators{store, connector, nullptr, &events});

    auto outcome = service.move("fileserver/share/a.csv", "s3://landing/");
    REQUIRE_FALSE(outcome);
    CHECK(outcome.error().kind == ErrorKind::InvalidLocation);
    CHECK(connector.connects == 0);
    CHECK(store.moves == 0);
    CHECK(events.events.empty());
}

TEST_CASE("share targets need mounted shares", "[service]")
{
    ShuttleConfig config = quietConfig();
    FakeObjectStore store;
    store.objects["landing/a.csv"] = "payload";
    FakeSmbConnector connector;

    SECTION("without a mount root")
    {
        TransferService service(config, TransferCollaborators{store, connector, nullptr, nullptr});
        auto outcome = service.move("s3://landing/a.csv", "10.21.13.12/finance/");
        REQUIRE_FALSE(outcome);
        CHECK(outcome.error().kind == ErrorKind::Transfer);
        CHECK(outcome.error().message.find("--mount-root") != std::string::npos);
    }

    SECTION("with a mount root")
    {
        TempDir dir;
        MountedShares shares(dir.path());
        TransferService service(config, TransferCollaborators{store, connector, &shares, nullptr});
        auto outcome = service.move("s3://landing/a.csv", "10.21.13.12/finance/");
        REQUIRE(outcome);
        CHECK(outcome->bytes == 7);
        CHECK(std::filesystem::exists(dir.path() / "10.21.13.12" / "finance" / "a.csv"));
    }
}

TEST_CASE("an unwritable audit trail does not fail the transfer", "[service]")
{
    TempDir dir;
    {
        std::ofstream blocker(dir.path() / "blocker");
        blocker << "not a directory";
    }
    ShuttleConfig config = quietConfig();
    FakeObjectStore store;
    store.objects["data-bucket/a.csv"] = "x";
    FakeSmbConnector connector;
    JsonLinesEventStore events((dir.path() / "blocker" / "events.jsonl").string());
    TransferService service(config, TransferCollaborators{store, connector, nullptr, &events});

    CHECK(service.move("s3://data-bucket/a.csv", "s3://archive/"));
}
