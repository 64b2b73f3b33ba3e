#include <catch2/catch.hpp>

#include "test_support.hpp"

using namespace downlink;
using models::Priority;
using models::Request;
using models::Status;

TEST_CASE("Admission follows priority, then enqueue order") {
    test::EngineHarness harness("sched_order", 0);
    harness.transport->setMode(test::FakeTransport::Mode::Complete);
    auto engine = harness.open();

    Request normalFirst = test::makeRequest("normal1.bin", Priority::Normal);
    Request low = test::makeRequest("low.bin", Priority::Low);
    Request high = test::makeRequest("high.bin", Priority::High);
    Request normalSecond = test::makeRequest("normal2.bin", Priority::Normal);

    engine->enqueue(std::vector<Request>{normalFirst, low, high, normalSecond}).get();
    REQUIRE(harness.transport->starts().empty());

    engine->setDownloadConcurrentLimit(1).get();
    REQUIRE(test::waitUntil([&] { return harness.transport->starts().size() == 4; }));

    std::vector<int> expected{high.id, normalFirst.id, normalSecond.id, low.id};
    REQUIRE(harness.transport->starts() == expected);
    REQUIRE(harness.transport->maxRunning() == 1);

    for (int id : expected) {
        REQUIRE(test::waitForStatus(*engine, id, Status::Completed));
    }
}

TEST_CASE("Active transfers never exceed the limit") {
    test::EngineHarness harness("sched_limit", 2);
    auto engine = harness.open();

    std::vector<Request> requests;
    for (int i = 0; i < 5; ++i) {
        requests.push_back(test::makeRequest("file" + std::to_string(i) + ".bin"));
    }
    engine->enqueue(requests).get();

    REQUIRE(test::waitUntil([&] { return harness.transport->running() == 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(engine->getDownloadsWithStatus(Status::Downloading).get().size() == 2);
    REQUIRE(engine->getDownloadsWithStatus(Status::Queued).get().size() == 3);

    harness.transport->releaseAll();
    for (const auto& request : requests) {
        REQUIRE(test::waitForStatus(*engine, request.id, Status::Completed));
    }
    REQUIRE(harness.transport->maxRunning() == 2);
}

TEST_CASE("A limit of zero holds every download") {
    test::EngineHarness harness("sched_zero", 0);
    harness.transport->setMode(test::FakeTransport::Mode::Complete);
    auto engine = harness.open();

    Request request = test::makeRequest("held.bin");
    engine->enqueue(request).get();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    REQUIRE(test::statusOf(*engine, request.id) == Status::Queued);
    REQUIRE(harness.transport->executions(request.id) == 0);
}

TEST_CASE("Raising the limit admits waiting downloads") {
    test::EngineHarness harness("sched_raise", 1);
    auto engine = harness.open();

    Request first = test::makeRequest("first.bin");
    Request second = test::makeRequest("second.bin");
    engine->enqueue(std::vector<Request>{first, second}).get();

    REQUIRE(test::waitUntil([&] { return harness.transport->running() == 1; }));
    REQUIRE(test::statusOf(*engine, second.id) == Status::Queued);

    engine->setDownloadConcurrentLimit(2).get();
    REQUIRE(test::waitUntil([&] { return harness.transport->running() == 2; }));
    REQUIRE(test::statusOf(*engine, second.id) == Status::Downloading);
}

TEST_CASE("A negative limit is rejected") {
    test::EngineHarness harness("sched_negative", 1);
    auto engine = harness.open();

    REQUIRE(test::errorOf(engine->setDownloadConcurrentLimit(-1)) == core::ErrorCode::InvalidConcurrentLimit);

    harness.config.nameSpace = test::uniqueNamespace("sched_negative_ctor");
    harness.config.downloadConcurrentLimit = -2;
    try {
        harness.open();
        FAIL("engine opened with a negative limit");
    } catch (const core::EngineException& e) {
        REQUIRE(e.code() == core::ErrorCode::InvalidConcurrentLimit);
    }
}

TEST_CASE("Progress reports reach the catalog and the listeners") {
    test::EngineHarness harness("sched_progress", 1);
    auto engine = harness.open();

    struct ProgressListener : test::RecordingListener {
        std::atomic<int> progress{0};
        std::atomic<int> blocks{0};
        void onProgress(const models::Download&, int64_t, int64_t) override { ++progress; }
        void onBlockUpdated(const models::Download&, const models::DownloadBlock&, int) override { ++blocks; }
    };
    auto listener = std::make_shared<ProgressListener>();
    engine->addListener(listener, false).get();

    Request request = test::makeRequest("progress.bin");
    engine->enqueue(request).get();

    REQUIRE(test::waitUntil([&] {
        auto download = engine->getDownload(request.id).get();
        return download && download->downloaded == 250;
    }));
    auto download = engine->getDownload(request.id).get();
    REQUIRE(download->total == 1000);
    REQUIRE(download->progress() == 25);
    REQUIRE(listener->count("started", request.id) == 1);
    REQUIRE(listener->progress >= 1);
    REQUIRE(listener->blocks >= 1);

    harness.transport->release(request.id);
    REQUIRE(test::waitForStatus(*engine, request.id, Status::Completed));
    REQUIRE(engine->getDownload(request.id).get()->downloaded == 1000);
    REQUIRE(engine->getDownloadBlocks(request.id).get().size() == 1);
}

TEST_CASE("Queued rows of a previous session are picked up again") {
    test::EngineHarness harness("sched_restart", 0);
    Request request = test::makeRequest("again.bin");
    {
        auto engine = harness.open();
        engine->enqueue(request).get();
    }

    harness.transport->setMode(test::FakeTransport::Mode::Complete);
    harness.config.downloadConcurrentLimit = 1;
    auto engine = harness.open();
    REQUIRE(test::waitForStatus(*engine, request.id, Status::Completed));
}

TEST_CASE("Shutdown puts interrupted transfers back in the queue") {
    test::EngineHarness harness("sched_shutdown", 1);
    Request request = test::makeRequest("interrupted.bin");
    {
        auto engine = harness.open();
        engine->enqueue(request).get();
        REQUIRE(test::waitUntil([&] { return harness.transport->running() == 1; }));
    }

    std::lock_guard<std::mutex> lock(harness.store->mutex);
    REQUIRE(harness.store->rows.at(request.id).status == Status::Queued);
    REQUIRE(harness.store->rows.at(request.id).downloaded == 250);
}

TEST_CASE("A download whose start cannot be stored keeps its place") {
    test::EngineHarness harness("sched_start_failure", 0);
    auto engine = harness.open();

    Request first = test::makeRequest("first.bin");
    engine->enqueue(first).get();

    harness.store->failWrites = true;
    engine->setDownloadConcurrentLimit(1).get();
    REQUIRE(test::statusOf(*engine, first.id) == Status::Queued);
    REQUIRE(harness.transport->executions(first.id) == 0);
    harness.store->failWrites = false;

    Request second = test::makeRequest("second.bin");
    engine->enqueue(second).get();
    REQUIRE(test::waitForStatus(*engine, first.id, Status::Downloading));
    REQUIRE(test::statusOf(*engine, second.id) == Status::Queued);

    engine->setDownloadConcurrentLimit(2).get();
    REQUIRE(test::waitForStatus(*engine, second.id, Status::Downloading));
    std::vector<int> expected{first.id, second.id};
    REQUIRE(harness.transport->starts() == expected);

    harness.transport->releaseAll();
    REQUIRE(test::waitForStatus(*engine, first.id, Status::Completed));
    REQUIRE(test::waitForStatus(*engine, second.id, Status::Completed));
}
