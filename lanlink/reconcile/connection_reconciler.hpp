#pragma once

#include "lanlink/discovery/discovery_channel.hpp"
#include "lanlink/discovery/service_advertisement.hpp"
#include "lanlink/probe/liveness_prober.hpp"
#include "lanlink/reconcile/connection_state.hpp"
#include "lanlink/store/endpoint_store.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace lanlink
{

struct ReconcilerConfig
{
    std::string service_type                      = default_service_type;
    std::chrono::milliseconds probe_timeout       = LivenessProber::default_timeout;
    std::chrono::milliseconds discovery_window    = std::chrono::milliseconds(6000);
    std::chrono::milliseconds revalidate_interval = std::chrono::milliseconds(2000); ///< 0 disables re-validation
};

/**
 * @brief Decides which server endpoint the client is connected to.
 *
 * Tries the persisted endpoint first, then multicast discovery, then any code the user
 * supplies. Every candidate is validated by the prober before it is accepted; probes are
 * strictly one at a time and the first candidate to validate wins. While connected the
 * endpoint is re-probed periodically and a failure sends the reconciler back to searching.
 *
 * All state changes happen on the io_context thread. The public operations may be called
 * from any thread; they post their work. The reconciler must outlive the io_context's
 * handlers, so destroy it only after the io_context has stopped.
 */
class ConnectionReconciler
{
public:
    using StateObserver = std::function<void(const ConnectionState& state)>;

    ConnectionReconciler(boost::asio::io_context& io_context, EndpointStore& store, LivenessProber& prober, DiscoveryChannel& discovery,
                         ReconcilerConfig config = {});
    ~ConnectionReconciler();

    ConnectionReconciler(const ConnectionReconciler&)            = delete;
    ConnectionReconciler& operator=(const ConnectionReconciler&) = delete;
    ConnectionReconciler(ConnectionReconciler&&)                 = delete;
    ConnectionReconciler& operator=(ConnectionReconciler&&)      = delete;

    /// Idle -> Searching. Ignored unless idle.
    void start();

    /// Any state -> Idle. Clears the store; results of probes still in flight are discarded.
    void forget();

    /// Restart the discovery listener, which reports every server it sees again. From idle this is start(); ignored while connected.
    void retry_discovery();

    /**
     * @brief Decode a scanned code and hand its candidate to the reconciler.
     *
     * Decoding happens on the calling thread. From idle or connected a new searching cycle
     * begins with this candidate.
     * @throws InvalidCodeError when the payload is unusable; the connection state is untouched
     */
    Candidate submit_code(const std::string& payload);

    ConnectionState state() const;

    /// The endpoint CRUD requests may use, or std::nullopt when not connected.
    std::optional<Endpoint> current_endpoint() const;

    std::string status() const { return status_line(state()); }

    /// Called on the io_context thread after every state change.
    void set_state_observer(StateObserver observer);

private:
    void do_start();
    void do_forget();
    void do_retry_discovery();
    void do_submit(const Candidate& candidate);

    void begin_cycle(FailureReason reason);
    void enqueue(const Candidate& candidate);
    void probe_next();
    void handle_probe_result(std::uint64_t epoch, const Candidate& candidate, const HealthResult& result);
    void commit(const Endpoint& endpoint);

    void start_discovery();
    void stop_discovery();
    void handle_discovered(std::uint64_t epoch, const Candidate& candidate);
    void handle_discovery_error(std::uint64_t epoch, const boost::system::error_code& error_code);
    void handle_discovery_window(std::uint64_t epoch, const boost::system::error_code& error_code);

    void schedule_revalidation();
    void handle_revalidation_timer(std::uint64_t epoch, const boost::system::error_code& error_code);
    void handle_revalidation_result(std::uint64_t epoch, const HealthResult& result);

    void cancel_timers();
    void publish(ConnectionState next);

    boost::asio::io_context& _io_context;
    EndpointStore& _store;
    LivenessProber& _prober;
    DiscoveryChannel& _discovery;
    ReconcilerConfig _config;

    // Owned by the io_context thread.
    ConnectionState _state;
    std::uint64_t _epoch = 0;
    std::unique_ptr<DiscoveryHandle> _discovery_handle;
    std::deque<Candidate> _pending;
    bool _probe_in_flight = false;
    bool _code_supplied   = false;
    boost::asio::steady_timer _discovery_window_timer;
    boost::asio::steady_timer _revalidation_timer;

    mutable std::mutex _mutex; // guards _snapshot and _observer
    ConnectionState _snapshot;
    StateObserver _observer;
};

} // namespace lanlink
