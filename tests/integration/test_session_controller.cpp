#include <catch2/catch_test_macros.hpp>
#include "support/fake_multicast_client.hpp"
#include "ui/controllers/SessionController.hpp"

#include <QSignalSpy>
#include <QTest>

using namespace lantern;
using lantern::testing::FakeNetwork;
using lantern::ui::SessionController;

namespace {

DiscoveryConfig test_config() {
    DiscoveryConfig config;
    config.resolve_timeout = std::chrono::milliseconds(200);
    config.stop_timeout = std::chrono::milliseconds(2000);
    return config;
}

bool wait_running(SessionController& controller) {
    return QTest::qWaitFor([&]() {
        auto* engine = controller.engine();
        return engine && engine->state() == network::EngineState::Running;
    }, 2000);
}

void populate(FakeNetwork& net, SessionController& controller) {
    net.addRecord(lantern::testing::make_record(
        "_http._tcp.local.", "web._http._tcp.local.", "10.0.0.8", 80));
    net.announceType("_http._tcp.local.");
    REQUIRE(QTest::qWaitFor([&]() { return net.browseCount("_http._tcp.local.") == 1; }, 2000));
    net.announce("_http._tcp.local.", "web._http._tcp.local.");
    REQUIRE(QTest::qWaitFor([&]() { return controller.table()->instanceCount() == 1; }, 2000));
}

} // namespace

TEST_CASE("SessionController starts a session on all interfaces", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    QSignalSpy startedSpy(&controller, &SessionController::sessionStarted);

    REQUIRE_FALSE(controller.isRunning());
    controller.start();

    REQUIRE(controller.isRunning());
    REQUIRE(controller.sessionId() == 1);
    REQUIRE(controller.currentInterface().isNull());
    REQUIRE(startedSpy.count() == 1);
    REQUIRE(wait_running(controller));
    REQUIRE(net->openCount() == 1);
}

TEST_CASE("SessionController feeds the service table", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    controller.start();
    REQUIRE(wait_running(controller));

    populate(*net, controller);

    REQUIRE(controller.table()->types() == QStringList{"_http._tcp.local."});
    REQUIRE(controller.table()->instance("web._http._tcp.local.")->addresses
            == QStringList{"10.0.0.8:80"});

    net->withdraw("_http._tcp.local.", "web._http._tcp.local.");
    REQUIRE(QTest::qWaitFor([&]() { return controller.table()->instanceCount() == 0; }, 2000));
}

TEST_CASE("Switching interfaces starts from empty state", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    controller.start();
    REQUIRE(wait_running(controller));
    populate(*net, controller);
    controller.table()->setFilter("_http");

    const QHostAddress wired("192.168.1.10");
    controller.switchInterface(wired);

    REQUIRE(controller.table()->types().isEmpty());
    REQUIRE(controller.table()->instanceCount() == 0);
    REQUIRE(controller.table()->filter().isEmpty());
    REQUIRE(controller.sessionId() == 2);
    REQUIRE(controller.currentInterface() == wired);
    REQUIRE(net->closeCount() == 1);

    REQUIRE(wait_running(controller));
    REQUIRE(net->openedAddresses().last() == wired);
    QTest::qWait(30);
    REQUIRE(controller.table()->instanceCount() == 0);
}

TEST_CASE("Rescan restarts on the same interface with cleared state", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    const QHostAddress wifi("10.1.1.4");
    controller.start(wifi);
    REQUIRE(wait_running(controller));
    populate(*net, controller);
    controller.table()->toggleFilter("_http._tcp.local.");

    controller.rescan();

    REQUIRE(controller.table()->instanceCount() == 0);
    REQUIRE(controller.table()->filter().isEmpty());
    REQUIRE(controller.currentInterface() == wifi);
    REQUIRE(controller.sessionId() == 2);
    REQUIRE(wait_running(controller));

    // The new session discovers the same services again.
    populate(*net, controller);
}

TEST_CASE("Restart requests made during a restart are folded in", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    controller.start();

    const QHostAddress second("10.0.0.2");
    const QHostAddress third("10.0.0.3");
    QObject::connect(&controller, &SessionController::sessionStarted,
                     [&](quint64 id) {
                         if (id == 2) controller.switchInterface(third);
                     });

    controller.switchInterface(second);

    REQUIRE(controller.sessionId() == 3);
    REQUIRE(controller.currentInterface() == third);
    REQUIRE(wait_running(controller));
    REQUIRE(net->closeCount() == 2);
}

TEST_CASE("Manual queries are ignored without a session", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    QSignalSpy errorSpy(&controller, &SessionController::error);

    controller.submitManualQuery("_http._tcp");
    QTest::qWait(20);

    REQUIRE(errorSpy.isEmpty());
    REQUIRE(net->browseCalls().isEmpty());
}

TEST_CASE("Manual queries reach the running engine", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    controller.start();

    controller.submitManualQuery("_raop._tcp.");

    REQUIRE(QTest::qWaitFor([&]() { return controller.table()->types().size() == 1; }, 2000));
    REQUIRE(controller.table()->types().front() == "_raop._tcp.local.");
    REQUIRE(net->browseCount("_raop._tcp.local.") == 1);
}

TEST_CASE("Empty manual queries surface as errors", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    QSignalSpy errorSpy(&controller, &SessionController::error);
    controller.start();

    REQUIRE_NOTHROW(controller.submitManualQuery("   "));

    REQUIRE(QTest::qWaitFor([&]() { return errorSpy.count() == 1; }, 2000));
    REQUIRE(errorSpy.at(0).at(1).value<ErrorCode>() == ErrorCode::QuerySubmissionError);
    REQUIRE(controller.isRunning());
}

TEST_CASE("Preset queries continue past individual failures", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    QSignalSpy errorSpy(&controller, &SessionController::error);
    controller.start();

    controller.submitPresetQueries({"", "_http._tcp", "_services._dns-sd._udp", "_ipp._tcp"});

    REQUIRE(QTest::qWaitFor([&]() { return controller.table()->types().size() == 2; }, 2000));
    REQUIRE(QTest::qWaitFor([&]() { return errorSpy.count() == 2; }, 2000));
}

TEST_CASE("The dante preset browses every Dante type", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    controller.start();

    REQUIRE(SessionController::presetQueries("dante").size() == 8);
    REQUIRE(SessionController::presetQueries("unknown").isEmpty());
    controller.submitPreset("dante");

    REQUIRE(QTest::qWaitFor([&]() { return controller.table()->types().size() == 8; }, 2000));
    REQUIRE(net->browseCount("_netaudio-arc._udp.local.") == 1);
    REQUIRE(net->browseCount("_dante-ddm-c._tcp.local.") == 1);
}

TEST_CASE("Startup failures end the session", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    net->fail_open = true;
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    QSignalSpy errorSpy(&controller, &SessionController::error);

    controller.start();

    REQUIRE(QTest::qWaitFor([&]() { return errorSpy.count() == 1; }, 2000));
    REQUIRE(errorSpy.at(0).at(1).value<ErrorCode>() == ErrorCode::StartupError);
    REQUIRE(QTest::qWaitFor([&]() { return !controller.isRunning(); }, 2000));

    // A new session may be started after a failure.
    net->fail_open = false;
    controller.rescan();
    REQUIRE(wait_running(controller));
}

TEST_CASE("Shutdown is idempotent", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    SessionController controller(test_config(), lantern::testing::fake_client_factory(net));
    QSignalSpy stoppedSpy(&controller, &SessionController::sessionStopped);
    controller.start();
    REQUIRE(wait_running(controller));

    controller.shutdown();
    controller.shutdown();

    REQUIRE_FALSE(controller.isRunning());
    REQUIRE(controller.engine() == nullptr);
    REQUIRE(stoppedSpy.count() == 1);
    REQUIRE(net->closeCount() == 1);
}

TEST_CASE("A session that will not stop is abandoned", "[controller]") {
    auto net = std::make_shared<FakeNetwork>();
    auto config = test_config();
    config.stop_timeout = std::chrono::milliseconds(50);
    SessionController controller(config, lantern::testing::fake_client_factory(net));
    QSignalSpy errorSpy(&controller, &SessionController::error);
    controller.start();
    REQUIRE(wait_running(controller));

    net->block_close = true;
    controller.switchInterface(QHostAddress("10.0.0.9"));

    REQUIRE(errorSpy.count() == 1);
    REQUIRE(errorSpy.at(0).at(1).value<ErrorCode>() == ErrorCode::Timeout);
    REQUIRE(controller.sessionId() == 2);

    net->block_close = false;
    REQUIRE(wait_running(controller));
    REQUIRE(QTest::qWaitFor([&]() { return net->closeCount() == 1; }, 2000));
}
