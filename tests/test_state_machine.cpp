#include <catch2/catch.hpp>

#include "engine/CatalogStore.hpp"
#include "engine/ListenerCoordinator.hpp"
#include "engine/StateMachine.hpp"
#include "test_support.hpp"

using namespace downlink;
using engine::StateMachine;
using models::Download;
using models::DownloadError;
using models::Status;

namespace {

struct Machine {
    std::shared_ptr<test::MemoryStore> store = std::make_shared<test::MemoryStore>();
    engine::CatalogStore catalog{std::make_unique<test::MemoryCatalogPersistence>(store), "sm"};
    engine::ListenerCoordinator listeners;
    StateMachine machine{catalog, listeners};
    std::shared_ptr<test::RecordingListener> recorder = std::make_shared<test::RecordingListener>();

    Machine() {
        catalog.open();
        listeners.add(recorder, 1);
    }

    Download admit(const std::string& name, bool start) {
        Download download = Download::fromRequest(test::makeRequest(name), "sm");
        download.sequence = catalog.nextSequence();
        machine.admitNew(download, start);
        return download;
    }
};

} // namespace

TEST_CASE("Lifecycle edges") {
    REQUIRE(StateMachine::canTransition(Status::None, Status::Added));
    REQUIRE(StateMachine::canTransition(Status::None, Status::Queued));
    REQUIRE_FALSE(StateMachine::canTransition(Status::None, Status::Downloading));

    REQUIRE(StateMachine::canTransition(Status::Added, Status::Queued));
    REQUIRE_FALSE(StateMachine::canTransition(Status::Added, Status::Downloading));

    REQUIRE(StateMachine::canTransition(Status::Queued, Status::Downloading));
    REQUIRE_FALSE(StateMachine::canTransition(Status::Queued, Status::Completed));

    REQUIRE(StateMachine::canTransition(Status::Downloading, Status::Completed));
    REQUIRE(StateMachine::canTransition(Status::Downloading, Status::Queued));
    REQUIRE(StateMachine::canTransition(Status::Paused, Status::Queued));
    REQUIRE_FALSE(StateMachine::canTransition(Status::Paused, Status::Downloading));

    REQUIRE(StateMachine::canTransition(Status::Failed, Status::Queued));
    REQUIRE(StateMachine::canTransition(Status::Cancelled, Status::Queued));
    REQUIRE_FALSE(StateMachine::canTransition(Status::Failed, Status::Paused));
}

TEST_CASE("Completed downloads can only leave the catalog") {
    REQUIRE_FALSE(StateMachine::canTransition(Status::Completed, Status::Cancelled));
    REQUIRE_FALSE(StateMachine::canTransition(Status::Completed, Status::Queued));
    REQUIRE_FALSE(StateMachine::canTransition(Status::Completed, Status::Paused));
    REQUIRE(StateMachine::canTransition(Status::Completed, Status::Removed));
    REQUIRE(StateMachine::canTransition(Status::Completed, Status::Deleted));
}

TEST_CASE("Removed and deleted are final") {
    for (int value = 0; value <= static_cast<int>(Status::Added); ++value) {
        auto to = static_cast<Status>(value);
        REQUIRE_FALSE(StateMachine::canTransition(Status::Removed, to));
        REQUIRE_FALSE(StateMachine::canTransition(Status::Deleted, to));
        REQUIRE_FALSE(StateMachine::canTransition(to, to));
    }
    REQUIRE(StateMachine::isTerminal(Status::Removed));
    REQUIRE(StateMachine::isTerminal(Status::Deleted));
    REQUIRE_FALSE(StateMachine::isTerminal(Status::Completed));
}

TEST_CASE("Errors are kept only on failed and paused rows") {
    Download download;
    download.status = Status::Downloading;

    REQUIRE(StateMachine::apply(download, Status::Failed, DownloadError::HttpError));
    REQUIRE(download.error == DownloadError::HttpError);

    REQUIRE(StateMachine::apply(download, Status::Queued));
    REQUIRE(download.error == DownloadError::None);

    REQUIRE(StateMachine::apply(download, Status::Paused, DownloadError::NoNetworkConnection));
    REQUIRE(download.error == DownloadError::NoNetworkConnection);

    REQUIRE_FALSE(StateMachine::apply(download, Status::Completed));
    REQUIRE(download.status == Status::Paused);
}

TEST_CASE("A new row is reported as added then queued") {
    Machine m;
    Download download = m.admit("a.bin", true);

    REQUIRE(download.status == Status::Queued);
    REQUIRE(m.catalog.get(download.id)->status == Status::Queued);
    REQUIRE(m.store->rows.at(download.id).status == Status::Queued);

    auto events = m.recorder->events();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].first == "added");
    REQUIRE(events[1].first == "queued");
}

TEST_CASE("A row waiting for resume stays added") {
    Machine m;
    Download download = m.admit("b.bin", false);

    REQUIRE(download.status == Status::Added);
    REQUIRE(m.recorder->count("added", download.id) == 1);
    REQUIRE(m.recorder->count("queued", download.id) == 0);

    REQUIRE(m.machine.transition(download, Status::Queued));
    REQUIRE(m.recorder->count("resumed", download.id) == 1);
}

TEST_CASE("Transitions persist and notify") {
    Machine m;
    Download download = m.admit("c.bin", true);

    REQUIRE(m.machine.transition(download, Status::Downloading));
    REQUIRE(m.machine.transition(download, Status::Paused));
    REQUIRE(m.store->rows.at(download.id).status == Status::Paused);
    REQUIRE(m.recorder->count("paused", download.id) == 1);

    REQUIRE(m.machine.transition(download, Status::Queued));
    REQUIRE(m.recorder->count("resumed", download.id) == 1);

    REQUIRE_FALSE(m.machine.transition(download, Status::Completed));
    REQUIRE(m.catalog.get(download.id)->status == Status::Queued);
}

TEST_CASE("Removing a row drops it from the catalog") {
    Machine m;
    Download download = m.admit("d.bin", true);

    REQUIRE(m.machine.transition(download, Status::Removed));
    REQUIRE_FALSE(m.catalog.contains(download.id));
    REQUIRE(m.store->rows.count(download.id) == 0);
    REQUIRE(m.recorder->count("removed", download.id) == 1);
}

TEST_CASE("A failed write leaves the row unchanged") {
    Machine m;
    Download download = m.admit("e.bin", true);
    m.store->failWrites = true;

    REQUIRE_THROWS_AS(m.machine.transition(download, Status::Paused), core::EngineException);
    REQUIRE(download.status == Status::Queued);
    REQUIRE(m.catalog.get(download.id)->status == Status::Queued);
    REQUIRE(m.recorder->count("paused", download.id) == 0);
}
