#ifndef CASTLINK_CHANNEL_HPP
#define CASTLINK_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "castlink/cast_event.hpp"
#include "castlink/cast_message.hpp"
#include "castlink/error.hpp"
#include "castlink/executor.hpp"
#include "castlink/listener_list.hpp"
#include "castlink/response.hpp"
#include "castlink/transport.hpp"

namespace castlink
{

using nlohmann::json;

struct channel_options
{
    // Used by send() when the caller does not pass a timeout
    std::chrono::milliseconds request_timeout {30000};

    // Bounds connecting, the TLS handshake and the device authentication together
    std::chrono::milliseconds connect_timeout {10000};

    std::chrono::milliseconds heartbeat_interval {5000};

    // The connection is considered dead if nothing was received for this long
    std::chrono::milliseconds heartbeat_timeout {15000};

    // Receivers reject messages above 64 KiB themselves
    uint64_t max_frame_size = 65536;

    // Generated as sender-<random> if empty
    std::string sender_id;

    // Listeners are notified on this executor. If none is set the channel creates its own worker.
    std::shared_ptr<executor> notifier;

    // Notifies listeners on the receiving thread instead of an executor. Listeners then must not
    // wait for responses, send() called from the receiving thread throws std::logic_error.
    bool synchronous_listeners = false;
};

// Connection to a single cast receiver. Owns the transport, the receiving thread and the heartbeat and
// matches responses to pending requests. Everything the receiver sends on its own is forwarded to the
// registered event listeners.
class channel
{
public:

    channel() = delete;
    channel(const channel&) = delete;
    channel& operator=(const channel&) = delete;
    channel(channel&&) = delete;
    channel& operator=(channel&&) = delete;
    ~channel();

    channel(std::string remote_name, transport_factory factory, channel_options options = {});

    // Opens the transport, authenticates and starts the receiving thread and the heartbeat.
    // Throws connection_error if the channel is not disconnected or the connection could not be established.
    void connect(const std::string& host, uint16_t port);

    void connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

    // Closes the connection and fails all pending requests. Safe to call at any time from any thread.
    void disconnect();

    // Sends a request and waits for the matching response.
    // Throws timeout_error, connection_error if the channel is or gets closed, and device_error if
    // the receiver answered with an error. Calling it from the receiving thread is a std::logic_error.
    decoded_message send(std::string_view destination_id, std::string_view nspace, json payload,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Like send(), but additionally throws unexpected_response_error if the response has another shape
    template<typename response_type>
    response_type send_request(std::string_view destination_id, std::string_view nspace, json payload,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        decoded_message response = send_impl(destination_id, nspace, std::move(payload), timeout,
            decoded_message {std::in_place_type<response_type>}.index());
        if(auto typed = std::get_if<response_type>(&response))
            return std::move(*typed);

        throw unexpected_response_error {
            fmt::format("Unexpected {} response from {}", type_name(response), m_remote_name), to_json(response)};
    }

    // Sends a request without waiting for the response, which is then delivered like any other event
    void post(std::string_view destination_id, std::string_view nspace, json payload);

    // Sends a message with a verbatim string payload, no request id is added
    void post_raw(std::string_view destination_id, std::string_view nspace, std::string payload);

    // Virtual connections are opened automatically before the first request to a destination
    void open_virtual_connection(std::string_view destination_id);

    void close_virtual_connection(std::string_view destination_id);

    connection_state state() const;

    bool connected() const
    {
        return state() == connection_state::connected;
    }

    const std::string& sender_id() const
    {
        return m_sender_id;
    }

    const std::string& remote_name() const
    {
        return m_remote_name;
    }

    size_t pending_requests() const;

    // Listener registrations survive disconnect and reconnect
    cast_event_listener_list& event_listeners()
    {
        return *m_events;
    }

    connection_listener_list& connection_listeners()
    {
        return *m_connection_events;
    }

    bool add_event_listener(const std::shared_ptr<cast_event_listener>& listener,
        const std::set<cast_event_type>& kinds = {})
    {
        return m_events->add(listener, kinds);
    }

    bool remove_event_listener(const std::shared_ptr<cast_event_listener>& listener)
    {
        return m_events->remove(listener);
    }

    bool add_connection_listener(const std::shared_ptr<connection_listener>& listener,
        const std::set<connection_state>& states = {})
    {
        return m_connection_events->add(listener, states);
    }

    bool remove_connection_listener(const std::shared_ptr<connection_listener>& listener)
    {
        return m_connection_events->remove(listener);
    }

private:

    struct pending_request
    {
        std::promise<decoded_message> promise;
        std::optional<size_t> expected;   // Index of the expected decoded_message alternative
    };

    struct pending_connect;

    /// Private member functions

    decoded_message send_impl(std::string_view destination_id, std::string_view nspace, json payload,
        std::optional<std::chrono::milliseconds> timeout, std::optional<size_t> expected);

    void receive_loop(uint64_t generation, std::shared_ptr<transport> conn);

    void heartbeat_loop(uint64_t generation);

    void handle_frame(uint64_t generation, const std::string& frame);

    bool fulfill(uint64_t request_id, decoded_message& response);

    bool remove_pending(uint64_t request_id);

    void fail_pending(const std::string& why);

    void write(const cast_message& msg);

    void write_to(transport& conn, const cast_message& msg);

    void close_connection(std::optional<uint64_t> generation, const std::string& why);

    // Returns false if the attempt was already ended by disconnect()
    bool abort_connect(uint64_t generation);

    void reap_threads();

    void notify_state(connection_state previous, connection_state current);

    bool stale(uint64_t generation) const
    {
        return m_generation.load() != generation;
    }

    uint64_t next_request_id()
    {
        return m_request_counter.fetch_add(1);
    }

    /// Private member variables

    const std::string m_remote_name;

    const transport_factory m_factory;

    const channel_options m_options;

    const std::string m_sender_id;

    std::unique_ptr<cast_event_listener_list> m_events;

    std::unique_ptr<connection_listener_list> m_connection_events;

    mutable std::mutex m_state_mutex;

    connection_state m_state = connection_state::disconnected;

    std::shared_ptr<transport> m_transport;

    std::shared_ptr<pending_connect> m_pending_connect;

    std::thread m_receiver;

    std::thread m_heartbeat;

    std::atomic<uint64_t> m_generation {0};   // Incremented whenever a connection is opened or closed

    std::mutex m_write_mutex;

    mutable std::mutex m_pending_mutex;

    std::unordered_map<uint64_t, pending_request> m_pending;

    std::atomic<uint64_t> m_request_counter;

    std::mutex m_sessions_mutex;

    std::set<std::string> m_sessions;   // Destinations with an open virtual connection

    std::mutex m_heartbeat_mutex;

    std::condition_variable m_heartbeat_cond;

    std::atomic<int64_t> m_last_received {0};   // Steady clock milliseconds

    std::atomic<std::thread::id> m_receiving_thread {std::thread::id {}};

};

} // namespace castlink

#endif
