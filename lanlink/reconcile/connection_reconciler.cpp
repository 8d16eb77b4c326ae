#include "lanlink/reconcile/connection_reconciler.hpp"

#include "lanlink/code/code_channel.hpp"
#include "lanlink/logging/lanlink_logging.hpp"
#include "lanlink/net/errors.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <utility>

namespace lanlink
{

ConnectionReconciler::ConnectionReconciler(boost::asio::io_context& io_context, EndpointStore& store, LivenessProber& prober,
                                           DiscoveryChannel& discovery, ReconcilerConfig config)
    : _io_context(io_context)
    , _store(store)
    , _prober(prober)
    , _discovery(discovery)
    , _config(std::move(config))
    , _discovery_window_timer(io_context)
    , _revalidation_timer(io_context)
{
}

ConnectionReconciler::~ConnectionReconciler()
{
    stop_discovery();
    cancel_timers();
}

void ConnectionReconciler::start()
{
    boost::asio::post(_io_context, [this]() { do_start(); });
}

void ConnectionReconciler::forget()
{
    boost::asio::post(_io_context, [this]() { do_forget(); });
}

void ConnectionReconciler::retry_discovery()
{
    boost::asio::post(_io_context, [this]() { do_retry_discovery(); });
}

Candidate ConnectionReconciler::submit_code(const std::string& payload)
{
    Candidate candidate = CodeChannel::decode(payload);
    boost::asio::post(_io_context, [this, candidate]() { do_submit(candidate); });
    return candidate;
}

ConnectionState ConnectionReconciler::state() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _snapshot;
}

std::optional<Endpoint> ConnectionReconciler::current_endpoint() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_snapshot.is_connected())
    {
        return _snapshot.endpoint;
    }
    return std::nullopt;
}

void ConnectionReconciler::set_state_observer(StateObserver observer)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _observer = std::move(observer);
}

void ConnectionReconciler::do_start()
{
    if (_state.kind != ConnectionStateKind::idle)
    {
        LANLINK_LOG_DEBUG("Start ignored, already " << to_string(_state.kind));
        return;
    }

    std::optional<Endpoint> saved;
    FailureReason reason = FailureReason::none;
    try
    {
        saved = _store.load();
    }
    catch (const StorageError& error)
    {
        LANLINK_LOG_WARNING("Ignoring persisted endpoint: " << error.what());
        reason = FailureReason::storage_error;
    }

    begin_cycle(reason);

    if (saved)
    {
        LANLINK_LOG_INFO("Trying saved endpoint " << *saved);
        enqueue(Candidate::make(std::move(*saved), Provenance::persisted));
    }
    else
    {
        start_discovery();
    }
}

void ConnectionReconciler::do_forget()
{
    ++_epoch;
    stop_discovery();
    cancel_timers();
    _pending.clear();
    _code_supplied = false;

    ConnectionState next;
    try
    {
        _store.clear();
    }
    catch (const StorageError& error)
    {
        LANLINK_LOG_ERROR("Could not clear saved endpoint: " << error.what());
        next.last_failure = FailureReason::storage_error;
    }

    LANLINK_LOG_INFO("Forgot server");
    publish(std::move(next));
}

void ConnectionReconciler::do_retry_discovery()
{
    if (_state.kind == ConnectionStateKind::idle)
    {
        do_start();
        return;
    }
    if (!_state.is_searching())
    {
        LANLINK_LOG_DEBUG("Discovery retry ignored while " << to_string(_state.kind));
        return;
    }

    LANLINK_LOG_INFO("Retrying discovery");
    ConnectionState next = _state;
    next.hint            = StatusHint::none;
    publish(std::move(next));
    start_discovery();
}

void ConnectionReconciler::do_submit(const Candidate& candidate)
{
    if (!_state.is_searching())
    {
        begin_cycle(FailureReason::none);
        start_discovery();
    }

    _code_supplied = true;
    enqueue(candidate);
}

void ConnectionReconciler::begin_cycle(FailureReason reason)
{
    ++_epoch;
    cancel_timers();
    _pending.clear();
    _code_supplied = false;

    ConnectionState next;
    next.kind         = ConnectionStateKind::searching;
    next.last_failure = reason;
    publish(std::move(next));
}

// Every emission of the discovery channel is a fresh candidate: the channel itself drops
// repeated announcements and re-arms an endpoint after a goodbye. Only a candidate that is
// already waiting, or being probed, from the same source is collapsed here.
void ConnectionReconciler::enqueue(const Candidate& candidate)
{
    const auto same_candidate = [&candidate](const Candidate& other)
    { return other.endpoint == candidate.endpoint && other.provenance == candidate.provenance; };

    if (std::any_of(_pending.begin(), _pending.end(), same_candidate) ||
        (_state.kind == ConnectionStateKind::probing && _state.candidate && same_candidate(*_state.candidate)))
    {
        LANLINK_LOG_TRACE("Already queued " << to_string(candidate.provenance) << " candidate " << candidate.endpoint);
        return;
    }

    LANLINK_LOG_DEBUG("Queued " << to_string(candidate.provenance) << " candidate " << candidate.endpoint);
    _pending.push_back(candidate);
    probe_next();
}

void ConnectionReconciler::probe_next()
{
    if (_probe_in_flight || !_state.is_searching())
    {
        return;
    }

    if (_pending.empty())
    {
        return;
    }

    Candidate candidate = std::move(_pending.front());
    _pending.pop_front();

    ConnectionState next = _state;
    next.kind            = ConnectionStateKind::probing;
    next.candidate       = candidate;
    publish(std::move(next));

    _probe_in_flight = true;
    _prober.async_probe(candidate.endpoint, _config.probe_timeout,
                        [this, epoch = _epoch, candidate](const HealthResult& result) { handle_probe_result(epoch, candidate, result); });
}

void ConnectionReconciler::handle_probe_result(std::uint64_t epoch, const Candidate& candidate, const HealthResult& result)
{
    _probe_in_flight = false;

    if (epoch != _epoch)
    {
        LANLINK_LOG_DEBUG("Discarding stale probe result for " << candidate.endpoint);
        probe_next();
        return;
    }

    if (result.alive)
    {
        LANLINK_LOG_INFO("Server at " << candidate.endpoint << " is alive (server time " << result.server_time << ")");
        commit(candidate.endpoint);
        return;
    }

    LANLINK_LOG_INFO("Server at " << candidate.endpoint << " (" << to_string(candidate.provenance) << ") is unreachable");

    ConnectionState next = _state;
    next.kind            = ConnectionStateKind::searching;
    next.candidate.reset();
    next.last_failure = FailureReason::unreachable_endpoint;
    publish(std::move(next));

    // The saved endpoint stays in the store; the failure may be transient.
    if (candidate.provenance == Provenance::persisted && !_discovery_handle)
    {
        start_discovery();
    }
    probe_next();
}

void ConnectionReconciler::commit(const Endpoint& endpoint)
{
    stop_discovery();
    cancel_timers();
    _pending.clear();

    ConnectionState next;
    next.kind     = ConnectionStateKind::connected;
    next.endpoint = endpoint;

    try
    {
        _store.save(endpoint);
    }
    catch (const StorageError& error)
    {
        LANLINK_LOG_WARNING("Connected, but the endpoint will not be remembered: " << error.what());
        next.storage_warning = true;
        next.last_failure    = FailureReason::storage_error;
    }

    publish(std::move(next));
    schedule_revalidation();
}

void ConnectionReconciler::start_discovery()
{
    stop_discovery();

    LANLINK_LOG_INFO("Starting discovery for " << _config.service_type);
    const auto epoch  = _epoch;
    _discovery_handle = _discovery.start(
        _config.service_type, [this, epoch](const Candidate& candidate) { handle_discovered(epoch, candidate); },
        [this, epoch](const boost::system::error_code& error_code) { handle_discovery_error(epoch, error_code); });

    _discovery_window_timer.expires_after(_config.discovery_window);
    _discovery_window_timer.async_wait([this, epoch](const boost::system::error_code& error_code)
                                       { handle_discovery_window(epoch, error_code); });
}

void ConnectionReconciler::stop_discovery()
{
    if (_discovery_handle)
    {
        _discovery_handle->stop();
        _discovery_handle.reset();
    }
}

void ConnectionReconciler::handle_discovered(std::uint64_t epoch, const Candidate& candidate)
{
    if (epoch != _epoch || !_state.is_searching())
    {
        LANLINK_LOG_TRACE("Ignoring late discovery of " << candidate.endpoint);
        return;
    }
    enqueue(candidate);
}

void ConnectionReconciler::handle_discovery_error(std::uint64_t epoch, const boost::system::error_code& error_code)
{
    if (epoch != _epoch || !_state.is_searching())
    {
        return;
    }

    LANLINK_LOG_WARNING("Discovery unavailable (" << error_code.message() << "), waiting for a code");
    _discovery_handle.reset();
    _discovery_window_timer.cancel();

    ConnectionState next = _state;
    next.hint            = StatusHint::try_code;
    next.last_failure    = FailureReason::discovery_unavailable;
    publish(std::move(next));
}

void ConnectionReconciler::handle_discovery_window(std::uint64_t epoch, const boost::system::error_code& error_code)
{
    if (error_code == boost::asio::error::operation_aborted || epoch != _epoch || !_state.is_searching() || _code_supplied)
    {
        return;
    }

    // The listener keeps running; a slow server may still be found.
    LANLINK_LOG_INFO("No server found within " << _config.discovery_window.count() << " ms, suggesting a code");
    ConnectionState next = _state;
    next.hint            = StatusHint::try_code;
    publish(std::move(next));
}

void ConnectionReconciler::schedule_revalidation()
{
    if (_config.revalidate_interval.count() <= 0)
    {
        return;
    }

    const auto epoch = _epoch;
    _revalidation_timer.expires_after(_config.revalidate_interval);
    _revalidation_timer.async_wait([this, epoch](const boost::system::error_code& error_code)
                                   { handle_revalidation_timer(epoch, error_code); });
}

void ConnectionReconciler::handle_revalidation_timer(std::uint64_t epoch, const boost::system::error_code& error_code)
{
    if (error_code == boost::asio::error::operation_aborted || epoch != _epoch || !_state.is_connected())
    {
        return;
    }

    if (_probe_in_flight)
    {
        schedule_revalidation();
        return;
    }

    _probe_in_flight = true;
    _prober.async_probe(*_state.endpoint, _config.probe_timeout,
                        [this, epoch](const HealthResult& result) { handle_revalidation_result(epoch, result); });
}

void ConnectionReconciler::handle_revalidation_result(std::uint64_t epoch, const HealthResult& result)
{
    _probe_in_flight = false;

    if (epoch != _epoch || !_state.is_connected())
    {
        probe_next();
        return;
    }

    if (result.alive)
    {
        LANLINK_LOG_TRACE("Server at " << *_state.endpoint << " still alive");
        schedule_revalidation();
        return;
    }

    LANLINK_LOG_WARNING("Lost server at " << *_state.endpoint << ", searching again");
    begin_cycle(FailureReason::unreachable_endpoint);
    start_discovery();
}

void ConnectionReconciler::cancel_timers()
{
    _discovery_window_timer.cancel();
    _revalidation_timer.cancel();
}

void ConnectionReconciler::publish(ConnectionState next)
{
    next.epoch = _epoch;
    _state     = next;

    StateObserver observer;
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _snapshot = next;
        observer  = _observer;
    }

    LANLINK_LOG_DEBUG("State " << to_string(next.kind) << ": " << status_line(next));
    if (observer)
    {
        observer(next);
    }
}

} // namespace lanlink
