#include "lanlink/reconcile/connection_reconciler.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace lanlink;
using namespace lanlink::test;
using namespace std::chrono_literals;

namespace
{

class ConnectionReconcilerTest : public ::testing::Test
{
protected:
    ConnectionReconcilerTest() : prober(io_context), discovery(io_context)
    {
        config.probe_timeout       = 200ms;
        config.discovery_window    = 60ms;
        config.revalidate_interval = 0ms;
    }

    ConnectionReconciler& make_reconciler()
    {
        instance = std::make_unique<ConnectionReconciler>(io_context, store, prober, discovery, config);
        instance->set_state_observer([this](const ConnectionState& state) { history.push_back(state.kind); });
        return *instance;
    }

    bool run_until_connected() { return run_until(io_context, [this]() { return instance->state().is_connected(); }); }

    boost::asio::io_context io_context;
    MemoryEndpointStore store;
    FakeProber prober;
    FakeDiscoveryChannel discovery;
    ReconcilerConfig config;
    std::unique_ptr<ConnectionReconciler> instance;
    std::vector<ConnectionStateKind> history;
};

} // namespace

TEST_F(ConnectionReconcilerTest, StartsIdle)
{
    auto& reconciler = make_reconciler();

    EXPECT_EQ(reconciler.state().kind, ConnectionStateKind::idle);
    EXPECT_FALSE(reconciler.current_endpoint().has_value());
    EXPECT_EQ(reconciler.status(), "Not connected");
}

TEST_F(ConnectionReconcilerTest, PersistedEndpointConnectsWithoutDiscovery)
{
    store.value = endpoint("http://192.168.1.50:4310");
    prober.set_alive("http://192.168.1.50:4310", true);
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until_connected());

    EXPECT_EQ(reconciler.current_endpoint(), endpoint("http://192.168.1.50:4310"));
    EXPECT_EQ(discovery.starts, 0);
    EXPECT_EQ(store.value, endpoint("http://192.168.1.50:4310"));
    EXPECT_EQ(reconciler.status(), "Connected to http://192.168.1.50:4310");

    const std::vector<ConnectionStateKind> expected {ConnectionStateKind::searching, ConnectionStateKind::probing,
                                                     ConnectionStateKind::connected};
    EXPECT_EQ(history, expected);
}

TEST_F(ConnectionReconcilerTest, UnreachablePersistedEndpointStartsDiscoveryAndStaysStored)
{
    store.value = endpoint("http://192.168.1.50:4310");
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));

    const auto state = reconciler.state();
    EXPECT_EQ(state.kind, ConnectionStateKind::searching);
    EXPECT_EQ(state.last_failure, FailureReason::unreachable_endpoint);
    EXPECT_EQ(discovery.last_service_type, default_service_type);
    EXPECT_EQ(store.value, endpoint("http://192.168.1.50:4310"));
}

TEST_F(ConnectionReconcilerTest, EmptyStoreStartsDiscoveryImmediately)
{
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));

    EXPECT_EQ(reconciler.state().kind, ConnectionStateKind::searching);
    EXPECT_TRUE(prober.probed.empty());
    EXPECT_EQ(reconciler.status(), "Searching for server...");
}

TEST_F(ConnectionReconcilerTest, FailedDiscoveredCandidateFallsThroughToNextOne)
{
    prober.set_alive("http://10.0.0.9:4310", true);
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));

    discovery.emit("http://10.0.0.5:4310");
    discovery.emit("http://10.0.0.9:4310");
    ASSERT_TRUE(run_until_connected());

    EXPECT_EQ(reconciler.current_endpoint(), endpoint("http://10.0.0.9:4310"));
    EXPECT_EQ(store.value, endpoint("http://10.0.0.9:4310"));
    const std::vector<std::string> probed {"http://10.0.0.5:4310", "http://10.0.0.9:4310"};
    EXPECT_EQ(prober.probed, probed);
    EXPECT_EQ(*discovery.active, 0);
}

TEST_F(ConnectionReconcilerTest, FirstCandidateToValidateWins)
{
    prober.set_alive("http://10.0.0.1:4310", true);
    prober.set_alive("http://10.0.0.2:4310", true);
    prober.default_delay = 20ms;
    auto& reconciler     = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));

    discovery.emit("http://10.0.0.1:4310");
    discovery.emit("http://10.0.0.2:4310");
    ASSERT_TRUE(run_until_connected());
    run_for(io_context, 60ms);

    EXPECT_EQ(reconciler.current_endpoint(), endpoint("http://10.0.0.1:4310"));
    EXPECT_EQ(prober.probed, std::vector<std::string> {"http://10.0.0.1:4310"});
    EXPECT_EQ(store.saves, 1);
}

TEST_F(ConnectionReconcilerTest, ProbesNeverOverlap)
{
    prober.default_delay = 10ms;
    prober.set_alive("http://10.0.0.4:4310", true);
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));

    discovery.emit("http://10.0.0.1:4310");
    discovery.emit("http://10.0.0.2:4310");
    discovery.emit("http://10.0.0.3:4310");
    discovery.emit("http://10.0.0.4:4310");
    ASSERT_TRUE(run_until_connected());

    EXPECT_EQ(prober.max_in_flight, 1);
    EXPECT_EQ(prober.probed.size(), 4U);
}

TEST_F(ConnectionReconcilerTest, DuplicateWhileQueuedIsProbedOnce)
{
    prober.default_delay = 20ms;
    auto& reconciler     = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));

    discovery.emit("http://10.0.0.1:4310");
    discovery.emit("http://10.0.0.1:4310");
    discovery.emit("http://10.0.0.2:4310");
    discovery.emit("http://10.0.0.2:4310");
    ASSERT_TRUE(run_until(io_context, [this]() { return prober.probed.size() == 2U && prober.in_flight == 0; }));
    run_for(io_context, 60ms);

    const std::vector<std::string> probed {"http://10.0.0.1:4310", "http://10.0.0.2:4310"};
    EXPECT_EQ(prober.probed, probed);
    EXPECT_EQ(reconciler.state().kind, ConnectionStateKind::searching);
}

TEST_F(ConnectionReconcilerTest, ReannouncedEndpointIsProbedAgain)
{
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));

    discovery.emit("http://10.0.0.5:4310");
    ASSERT_TRUE(run_until(io_context, [this]() { return prober.probed.size() == 1U && prober.in_flight == 0; }));
    EXPECT_EQ(reconciler.state().kind, ConnectionStateKind::searching);

    // The server went away with a goodbye and announced itself again.
    prober.set_alive("http://10.0.0.5:4310", true);
    discovery.emit("http://10.0.0.5:4310");
    ASSERT_TRUE(run_until_connected());

    EXPECT_EQ(reconciler.current_endpoint(), endpoint("http://10.0.0.5:4310"));
    EXPECT_EQ(prober.probed.size(), 2U);
}

TEST_F(ConnectionReconcilerTest, SavedEndpointFoundByDiscoveryAfterFailedProbe)
{
    store.value      = endpoint("http://192.168.1.50:4310");
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));
    ASSERT_TRUE(run_until(io_context, [&reconciler]() { return reconciler.state().hint == StatusHint::try_code; }));

    // The server finished booting and is now announced on the network.
    prober.set_alive("http://192.168.1.50:4310", true);
    discovery.emit("http://192.168.1.50:4310");
    ASSERT_TRUE(run_until_connected());

    EXPECT_EQ(reconciler.current_endpoint(), endpoint("http://192.168.1.50:4310"));
    EXPECT_EQ(prober.probed.size(), 2U);
    EXPECT_EQ(reconciler.status(), "Connected to http://192.168.1.50:4310");
}

TEST_F(ConnectionReconcilerTest, DiscoveryUnavailableSuggestsCode)
{
    config.discovery_window = 5000ms;
    auto& reconciler        = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));
    discovery.fail();
    ASSERT_TRUE(run_until(io_context, [&reconciler]() { return reconciler.state().hint == StatusHint::try_code; }));

    const auto state = reconciler.state();
    EXPECT_EQ(state.kind, ConnectionStateKind::searching);
    EXPECT_EQ(state.last_failure, FailureReason::discovery_unavailable);
    EXPECT_EQ(reconciler.status(), "Server not found. Scan a code to connect.");
}

TEST_F(ConnectionReconcilerTest, DiscoveryWindowSuggestsCodeButKeepsListening)
{
    prober.set_alive("http://10.0.0.7:4310", true);
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [&reconciler]() { return reconciler.state().hint == StatusHint::try_code; }));
    EXPECT_EQ(*discovery.active, 1);

    discovery.emit("http://10.0.0.7:4310");
    ASSERT_TRUE(run_until_connected());
    EXPECT_EQ(reconciler.state().hint, StatusHint::none);
}

TEST_F(ConnectionReconcilerTest, CodeCandidateConnectsAndIsPersisted)
{
    prober.set_alive("http://192.168.1.50:4310", true);
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));

    const auto candidate = reconciler.submit_code(R"({"baseUrl":"http://192.168.1.50:4310"})");
    EXPECT_EQ(candidate.provenance, Provenance::code);
    ASSERT_TRUE(run_until_connected());

    EXPECT_EQ(reconciler.current_endpoint(), endpoint("http://192.168.1.50:4310"));
    EXPECT_EQ(store.value, endpoint("http://192.168.1.50:4310"));
    EXPECT_EQ(*discovery.active, 0);
}

TEST_F(ConnectionReconcilerTest, CodeFromIdleStartsCycle)
{
    prober.set_alive("http://192.168.1.50:4310", true);
    auto& reconciler = make_reconciler();

    reconciler.submit_code(R"({"baseUrl":"http://192.168.1.50:4310"})");
    ASSERT_TRUE(run_until_connected());

    EXPECT_EQ(reconciler.current_endpoint(), endpoint("http://192.168.1.50:4310"));
}

TEST_F(ConnectionReconcilerTest, InvalidCodeLeavesStateUntouched)
{
    auto& reconciler = make_reconciler();
    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));
    const auto before = reconciler.state();

    EXPECT_THROW(reconciler.submit_code("{}"), InvalidCodeError);
    EXPECT_THROW(reconciler.submit_code(R"({"baseUrl":"not-a-url"})"), InvalidCodeError);
    EXPECT_THROW(reconciler.submit_code("not json"), InvalidCodeError);
    run_for(io_context, 20ms);

    const auto after = reconciler.state();
    EXPECT_EQ(after.kind, before.kind);
    EXPECT_EQ(after.epoch, before.epoch);
    EXPECT_TRUE(prober.probed.empty());
}

TEST_F(ConnectionReconcilerTest, FailedCodeCanBeScannedAgain)
{
    auto& reconciler = make_reconciler();
    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));

    reconciler.submit_code(R"({"baseUrl":"http://192.168.1.50:4310"})");
    ASSERT_TRUE(run_until(io_context, [this]() { return prober.probed.size() == 1U && prober.in_flight == 0; }));

    prober.set_alive("http://192.168.1.50:4310", true);
    reconciler.submit_code(R"({"baseUrl":"http://192.168.1.50:4310"})");
    ASSERT_TRUE(run_until_connected());
    EXPECT_EQ(prober.probed.size(), 2U);
}

TEST_F(ConnectionReconcilerTest, ForgetClearsStoreAndReturnsToIdle)
{
    store.value = endpoint("http://192.168.1.50:4310");
    prober.set_alive("http://192.168.1.50:4310", true);
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until_connected());

    reconciler.forget();
    ASSERT_TRUE(run_until(io_context, [&reconciler]() { return reconciler.state().kind == ConnectionStateKind::idle; }));

    EXPECT_FALSE(store.value.has_value());
    EXPECT_FALSE(reconciler.current_endpoint().has_value());
    EXPECT_EQ(reconciler.status(), "Not connected");
}

TEST_F(ConnectionReconcilerTest, ForgetDiscardsProbeInFlight)
{
    store.value   = endpoint("http://192.168.1.50:4310");
    prober.manual = true;
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return prober.pending_count() == 1U; }));
    EXPECT_EQ(reconciler.state().kind, ConnectionStateKind::probing);
    EXPECT_EQ(reconciler.status(), "Validating http://192.168.1.50:4310...");

    reconciler.forget();
    ASSERT_TRUE(run_until(io_context, [&reconciler]() { return reconciler.state().kind == ConnectionStateKind::idle; }));

    prober.complete_pending(true);
    run_for(io_context, 30ms);

    EXPECT_EQ(reconciler.state().kind, ConnectionStateKind::idle);
    EXPECT_FALSE(store.value.has_value());
    EXPECT_EQ(store.saves, 0);
}

TEST_F(ConnectionReconcilerTest, StartAfterForgetWaitsForStaleProbe)
{
    store.value   = endpoint("http://192.168.1.50:4310");
    prober.manual = true;
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return prober.pending_count() == 1U; }));
    reconciler.forget();
    reconciler.submit_code(R"({"baseUrl":"http://10.0.0.9:4310"})");
    run_for(io_context, 20ms);

    // The old probe still occupies the prober, so the code waits.
    EXPECT_EQ(prober.probed.size(), 1U);

    prober.complete_pending(true);
    ASSERT_TRUE(run_until(io_context, [this]() { return prober.pending_count() == 1U; }));
    EXPECT_EQ(prober.probed.back(), "http://10.0.0.9:4310");

    prober.complete_pending(true);
    ASSERT_TRUE(run_until_connected());
    EXPECT_EQ(reconciler.current_endpoint(), endpoint("http://10.0.0.9:4310"));
    EXPECT_EQ(prober.max_in_flight, 1);
}

TEST_F(ConnectionReconcilerTest, StoreReadFailureFallsBackToDiscovery)
{
    store.fail_load  = true;
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));

    EXPECT_EQ(reconciler.state().kind, ConnectionStateKind::searching);
    EXPECT_EQ(reconciler.state().last_failure, FailureReason::storage_error);
}

TEST_F(ConnectionReconcilerTest, StoreWriteFailureStillConnects)
{
    store.fail_save = true;
    prober.set_alive("http://10.0.0.9:4310", true);
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));
    discovery.emit("http://10.0.0.9:4310");
    ASSERT_TRUE(run_until_connected());

    const auto state = reconciler.state();
    EXPECT_TRUE(state.storage_warning);
    EXPECT_EQ(state.last_failure, FailureReason::storage_error);
    EXPECT_EQ(state.endpoint, endpoint("http://10.0.0.9:4310"));
}

TEST_F(ConnectionReconcilerTest, LostServerTriggersNewSearch)
{
    config.revalidate_interval = 20ms;
    store.value                = endpoint("http://192.168.1.50:4310");
    prober.set_alive("http://192.168.1.50:4310", true);
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until_connected());
    ASSERT_TRUE(run_until(io_context, [this]() { return prober.probed.size() >= 2U; }));
    EXPECT_TRUE(reconciler.state().is_connected());

    prober.set_alive("http://192.168.1.50:4310", false);
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));

    const auto state = reconciler.state();
    EXPECT_EQ(state.kind, ConnectionStateKind::searching);
    EXPECT_EQ(state.last_failure, FailureReason::unreachable_endpoint);
    EXPECT_EQ(store.value, endpoint("http://192.168.1.50:4310"));
}

TEST_F(ConnectionReconcilerTest, RetryDiscoveryKeepsSingleListener)
{
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));
    reconciler.retry_discovery();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 2; }));

    EXPECT_EQ(*discovery.active, 1);
    EXPECT_EQ(reconciler.state().hint, StatusHint::none);
}

TEST_F(ConnectionReconcilerTest, RetryDiscoveryAllowsFailedCandidateAgain)
{
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 1; }));
    discovery.emit("http://10.0.0.5:4310");
    ASSERT_TRUE(run_until(io_context, [this]() { return prober.probed.size() == 1U && prober.in_flight == 0; }));

    prober.set_alive("http://10.0.0.5:4310", true);
    reconciler.retry_discovery();
    ASSERT_TRUE(run_until(io_context, [this]() { return discovery.starts == 2; }));
    discovery.emit("http://10.0.0.5:4310");
    ASSERT_TRUE(run_until_connected());
}

TEST_F(ConnectionReconcilerTest, DiscoveredCandidateIgnoredWhileConnected)
{
    store.value = endpoint("http://192.168.1.50:4310");
    prober.set_alive("http://192.168.1.50:4310", true);
    prober.set_alive("http://10.0.0.9:4310", true);
    auto& reconciler = make_reconciler();

    reconciler.start();
    ASSERT_TRUE(run_until_connected());
    discovery.emit("http://10.0.0.9:4310");
    run_for(io_context, 20ms);

    EXPECT_EQ(reconciler.current_endpoint(), endpoint("http://192.168.1.50:4310"));
    EXPECT_EQ(prober.probed.size(), 1U);
}

TEST(ConnectionStateTest, StatusLines)
{
    ConnectionState state;
    EXPECT_EQ(status_line(state), "Not connected");

    state.kind = ConnectionStateKind::searching;
    EXPECT_EQ(status_line(state), "Searching for server...");

    state.hint = StatusHint::try_code;
    EXPECT_EQ(status_line(state), "Server not found. Scan a code to connect.");

    state.kind      = ConnectionStateKind::probing;
    state.candidate = Candidate::make(endpoint("http://10.0.0.5:4310"), Provenance::discovered);
    EXPECT_EQ(status_line(state), "Validating http://10.0.0.5:4310...");

    state.kind     = ConnectionStateKind::connected;
    state.endpoint = endpoint("http://10.0.0.5:4310");
    EXPECT_EQ(status_line(state), "Connected to http://10.0.0.5:4310");
}
