#include <catch2/catch.hpp>

#include "engine/NetworkGate.hpp"
#include "test_support.hpp"
#include "utils/PlatformUtils.hpp"
#include "utils/SysfsConnectivity.hpp"

#include <fstream>
#include <stdexcept>

using namespace downlink;
using engine::NetworkGate;
using models::DownloadError;
using models::NetworkType;
using models::Status;

namespace {

class ThrowingConnectivity : public engine::Connectivity {
public:
    bool isNetworkAvailable(NetworkType) const override {
        throw std::runtime_error("netlink socket closed");
    }
    void setChangeHandler(std::function<void()>) override {}
};

void writeLine(const std::filesystem::path& path, const std::string& value) {
    std::ofstream out(path);
    out << value << '\n';
}

// Fake /sys/class/net entry
void addInterface(const std::filesystem::path& root, const std::string& name,
                  const std::string& operstate, bool wireless = false) {
    auto dir = root / name;
    std::filesystem::create_directories(dir);
    writeLine(dir / "operstate", operstate);
    writeLine(dir / "carrier", operstate == "up" ? "1" : "0");
    writeLine(dir / "type", name == "lo" ? "772" : "1");
    if (wireless) {
        std::filesystem::create_directories(dir / "wireless");
    }
}

models::Download downloadWith(NetworkType type) {
    models::Download download;
    download.networkType = type;
    return download;
}

} // namespace

TEST_CASE("Global network type overrides the download's own") {
    auto connectivity = std::make_shared<test::FakeConnectivity>();
    NetworkGate gate(connectivity, NetworkType::GlobalOff);

    REQUIRE(gate.effectiveType(downloadWith(NetworkType::WifiOnly)) == NetworkType::WifiOnly);
    REQUIRE(gate.effectiveType(downloadWith(NetworkType::GlobalOff)) == NetworkType::All);

    gate.setGlobalNetworkType(NetworkType::Unmetered);
    REQUIRE(gate.effectiveType(downloadWith(NetworkType::WifiOnly)) == NetworkType::Unmetered);
    REQUIRE(gate.globalNetworkType() == NetworkType::Unmetered);
}

TEST_CASE("Network gate asks the connectivity provider") {
    auto connectivity = std::make_shared<test::FakeConnectivity>();
    NetworkGate gate(connectivity, NetworkType::GlobalOff);

    connectivity->setAvailable(true, false, true);
    REQUIRE(gate.isPermitted(downloadWith(NetworkType::All)));
    REQUIRE_FALSE(gate.isPermitted(downloadWith(NetworkType::WifiOnly)));

    gate.setGlobalNetworkType(NetworkType::WifiOnly);
    REQUIRE_FALSE(gate.isPermitted(downloadWith(NetworkType::All)));
}

TEST_CASE("Network gate without a provider always permits") {
    NetworkGate gate(nullptr, NetworkType::WifiOnly);
    REQUIRE(gate.isPermitted(downloadWith(NetworkType::Unmetered)));
}

TEST_CASE("A failing provider counts as no network") {
    NetworkGate gate(std::make_shared<ThrowingConnectivity>(), NetworkType::GlobalOff);
    REQUIRE_FALSE(gate.isPermitted(downloadWith(NetworkType::All)));
}

TEST_CASE("Sysfs interfaces are classified") {
    test::TempDirectory sysfs("sysfs_list");
    addInterface(sysfs.path(), "lo", "unknown");
    addInterface(sysfs.path(), "eth0", "up");
    addInterface(sysfs.path(), "wlan0", "down", true);
    addInterface(sysfs.path(), "wwan0", "up");

    auto interfaces = utils::PlatformUtils::listNetworkInterfaces(sysfs.path());
    REQUIRE(interfaces.size() == 4);
    REQUIRE(interfaces[0].name == "eth0");
    REQUIRE(interfaces[0].up);
    REQUIRE_FALSE(interfaces[0].wireless);
    REQUIRE(interfaces[1].name == "lo");
    REQUIRE(interfaces[1].loopback);
    REQUIRE(interfaces[2].name == "wlan0");
    REQUIRE(interfaces[2].wireless);
    REQUIRE_FALSE(interfaces[2].up);
    REQUIRE(interfaces[3].metered);

    REQUIRE(utils::PlatformUtils::listNetworkInterfaces(sysfs.path() / "missing").empty());
}

TEST_CASE("Sysfs connectivity answers per network type") {
    test::TempDirectory sysfs("sysfs_types");
    addInterface(sysfs.path(), "lo", "up");

    utils::SysfsConnectivity connectivity(sysfs.path());
    REQUIRE_FALSE(connectivity.isNetworkAvailable(NetworkType::All));

    addInterface(sysfs.path(), "wwan0", "up");
    REQUIRE(connectivity.isNetworkAvailable(NetworkType::All));
    REQUIRE(connectivity.isNetworkAvailable(NetworkType::GlobalOff));
    REQUIRE_FALSE(connectivity.isNetworkAvailable(NetworkType::Unmetered));
    REQUIRE_FALSE(connectivity.isNetworkAvailable(NetworkType::WifiOnly));

    addInterface(sysfs.path(), "wlan0", "up", true);
    REQUIRE(connectivity.isNetworkAvailable(NetworkType::WifiOnly));
    REQUIRE(connectivity.isNetworkAvailable(NetworkType::Unmetered));
}

TEST_CASE("Sysfs connectivity fires its change handler on request") {
    utils::SysfsConnectivity connectivity("/nonexistent");
    int calls = 0;

    connectivity.notifyChanged();
    connectivity.setChangeHandler([&] { ++calls; });
    connectivity.notifyChanged();
    REQUIRE(calls == 1);
}

TEST_CASE("A download waits for its network and starts once it appears") {
    test::EngineHarness harness("network_wait");
    harness.transport->setMode(test::FakeTransport::Mode::Complete);
    harness.connectivity->setAvailable(true, false, true);

    auto engine = harness.open();
    auto listener = std::make_shared<test::RecordingListener>();
    engine->addListener(listener, false).get();

    models::Request request = test::makeRequest("wifi.bin");
    request.networkType = NetworkType::WifiOnly;
    engine->enqueue(request).get();

    REQUIRE(test::waitUntil([&] { return listener->count("waiting_network", request.id) == 1; }));
    REQUIRE(test::statusOf(*engine, request.id) == Status::Queued);
    REQUIRE(harness.transport->executions(request.id) == 0);

    harness.connectivity->setAvailable(true, true, true);
    REQUIRE(test::waitForStatus(*engine, request.id, Status::Completed));
    REQUIRE(listener->count("waiting_network", request.id) == 1);
}

TEST_CASE("Losing the network pauses a transfer and its return resumes it") {
    test::EngineHarness harness("network_loss");
    auto engine = harness.open();

    models::Request request = test::makeRequest("lost.bin");
    engine->enqueue(request).get();
    REQUIRE(test::waitUntil([&] { return harness.transport->running() == 1; }));

    harness.connectivity->setAvailable(false, false, false);
    REQUIRE(test::waitForStatus(*engine, request.id, Status::Paused));
    REQUIRE(engine->getDownload(request.id).get()->error == DownloadError::NoNetworkConnection);
    REQUIRE(test::waitUntil([&] { return harness.transport->running() == 0; }));

    harness.connectivity->setAvailable(true, true, true);
    REQUIRE(test::waitUntil([&] { return harness.transport->executions(request.id) == 2; }));

    harness.transport->releaseAll();
    REQUIRE(test::waitForStatus(*engine, request.id, Status::Completed));
    REQUIRE(engine->getDownload(request.id).get()->error == DownloadError::None);
}

TEST_CASE("Changing the global network type re-evaluates active transfers") {
    test::EngineHarness harness("network_global");
    harness.connectivity->setAvailable(true, false, true);
    auto engine = harness.open();

    models::Request request = test::makeRequest("global.bin");
    engine->enqueue(request).get();
    REQUIRE(test::waitUntil([&] { return harness.transport->running() == 1; }));

    engine->setGlobalNetworkType(NetworkType::WifiOnly).get();
    REQUIRE(test::statusOf(*engine, request.id) == Status::Paused);

    engine->setGlobalNetworkType(NetworkType::GlobalOff).get();
    REQUIRE(test::waitUntil([&] { return harness.transport->executions(request.id) == 2; }));
    REQUIRE(test::statusOf(*engine, request.id) == Status::Downloading);
}

TEST_CASE("Platform identification") {
#ifdef __linux__
    REQUIRE(utils::PlatformUtils::getOS() == utils::OS::Linux);
    REQUIRE(utils::PlatformUtils::getOSName() == "Linux");
#endif
    REQUIRE_FALSE(utils::PlatformUtils::getHostname().empty());
}
