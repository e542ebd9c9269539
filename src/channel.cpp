#include "castlink/channel.hpp"

#include <random>
#include <stdexcept>
#include <vector>

#include "cast_channel.pb.h"
#include "castlink/frame.hpp"
#include "castlink/log.hpp"

using namespace std::chrono_literals;

namespace castlink
{

namespace
{

int64_t now_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

std::string random_sender_id()
{
    static constexpr const char* alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::random_device rd;
    std::mt19937 gen {rd()};
    std::uniform_int_distribution<size_t> dist {0, 35};

    std::string id {"sender-"};
    for(int i = 0; i < 10; ++i)
        id.push_back(alphabet[dist(gen)]);
    return id;
}

uint64_t random_request_seed()
{
    std::random_device rd;
    std::mt19937 gen {rd()};
    std::uniform_int_distribution<uint64_t> dist {1, 65536};
    return dist(gen);
}

std::string connect_payload()
{
    return R"({"type":"CONNECT","origin":{}})";
}

std::string close_payload()
{
    return R"({"type":"CLOSE"})";
}

void write_frame(transport& conn, const cast_message& msg)
{
    std::vector<char> data = encode_frame(serialize(msg));
    conn.write(data.data(), data.size());
}

// Device authentication: the receiver answers an empty challenge with its certificate or an error
void authenticate(transport& conn, const std::string& sender_id, uint64_t max_frame_size)
{
    cast_channel::DeviceAuthMessage challenge;
    challenge.mutable_challenge();

    std::string payload;
    if(!challenge.SerializeToString(&payload))
        throw connection_error {connection_error::reason::handshake_failed, "Unable to serialize auth challenge"};

    cast_message response;
    try {
        write_frame(conn, cast_message::binary(sender_id, default_receiver_id, ns::deviceauth, std::move(payload)));
        response = parse_cast_message(read_frame(conn, max_frame_size));
    } catch(connection_error&) {
        throw;
    } catch(std::runtime_error& e) {
        throw connection_error {connection_error::reason::handshake_failed,
            fmt::format("Device authentication failed: {}", e.what())};
    }

    cast_channel::DeviceAuthMessage auth;
    if(response.nspace != ns::deviceauth || !auth.ParseFromString(response.payload))
        throw connection_error {connection_error::reason::handshake_failed, "Invalid device authentication response"};
    if(auth.has_error())
        throw connection_error {connection_error::reason::handshake_failed,
            fmt::format("Authentication failed: error type {}", static_cast<int>(auth.error().error_type()))};
}

} // namespace

// Shared between a connecting thread and the worker opening the transport
struct channel::pending_connect
{
    std::mutex mutex;
    std::shared_ptr<transport> conn;
    bool abandoned = false;

    // Returns false if the connect was abandoned in the meantime
    bool attach(std::shared_ptr<transport> c)
    {
        std::lock_guard<std::mutex> lock {mutex};
        if(abandoned)
            return false;
        conn = std::move(c);
        return true;
    }

    void abandon()
    {
        std::lock_guard<std::mutex> lock {mutex};
        abandoned = true;
        if(conn)
            conn->close();
    }
};

channel::channel(std::string remote_name, transport_factory factory, channel_options options)
    : m_remote_name {std::move(remote_name)},
      m_factory {std::move(factory)},
      m_options {std::move(options)},
      m_sender_id {m_options.sender_id.empty() ? random_sender_id() : m_options.sender_id},
      m_request_counter {random_request_seed()}
{
    GOOGLE_PROTOBUF_VERIFY_VERSION;

    if(!m_factory)
        throw std::invalid_argument {"transport factory must not be empty"};

    if(m_options.synchronous_listeners)
    {
        m_events = std::make_unique<simple_listener_list<cast_event>>(m_remote_name);
        m_connection_events = std::make_unique<simple_listener_list<connection_event>>(m_remote_name);
    }
    else
    {
        // Both lists share the executor so connection and message events keep their order
        std::shared_ptr<executor> notifier = m_options.notifier;
        if(!notifier)
            notifier = std::make_shared<worker_executor>();
        m_events = std::make_unique<threaded_listener_list<cast_event>>(notifier, m_remote_name);
        m_connection_events = std::make_unique<threaded_listener_list<connection_event>>(notifier, m_remote_name);
    }
}

channel::~channel()
{
    disconnect();
    reap_threads();
}

void channel::connect(const std::string& host, uint16_t port)
{
    connect(host, port, m_options.connect_timeout);
}

void channel::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout)
{
    reap_threads();

    uint64_t generation;
    auto attempt = std::make_shared<pending_connect>();
    {
        std::lock_guard<std::mutex> lock {m_state_mutex};
        if(m_state != connection_state::disconnected)
            throw connection_error {connection_error::reason::already_connected,
                fmt::format("Channel to {} already opened", m_remote_name)};
        m_state = connection_state::connecting;
        generation = ++m_generation;
        m_pending_connect = attempt;
    }
    notify_state(connection_state::disconnected, connection_state::connecting);
    log::info("Connecting to {} ({}:{})", m_remote_name, host, port);

    // The transport is opened on a worker so the timeout also covers a connect() which never returns.
    // The worker only holds copies, an abandoned attempt releases its transport once the worker is done.
    auto task = std::make_shared<std::packaged_task<std::shared_ptr<transport>()>>(
        [factory = m_factory, host, port, attempt, sender_id = m_sender_id, max_frame = m_options.max_frame_size]()
        {
            std::shared_ptr<transport> conn {factory(host, port)};
            if(!attempt->attach(conn))
            {
                conn->close();
                throw connection_error {connection_error::reason::closed, "Connect abandoned"};
            }
            authenticate(*conn, sender_id, max_frame);
            return conn;
        });
    std::future<std::shared_ptr<transport>> opened = task->get_future();
    std::thread {[task]() { (*task)(); }}.detach();

    std::shared_ptr<transport> conn;
    try {
        if(opened.wait_for(timeout) == std::future_status::timeout)
        {
            attempt->abandon();
            throw connection_error {connection_error::reason::timed_out,
                fmt::format("Connecting to {}:{} timed out after {} ms", host, port, timeout.count())};
        }
        conn = opened.get();
    } catch(std::exception& e) {
        log::warn("Unable to connect to {}: {}", m_remote_name, e.what());
        if(!abort_connect(generation))
            throw connection_error {connection_error::reason::closed, fmt::format("Channel to {} closed while connecting", m_remote_name)};
        throw;
    }

    {
        std::lock_guard<std::mutex> lock {m_state_mutex};
        if(stale(generation))
        {
            conn->close();
            throw connection_error {connection_error::reason::closed, fmt::format("Channel to {} closed while connecting", m_remote_name)};
        }
        m_transport = conn;
        m_pending_connect.reset();
    }
    m_last_received.store(now_ms());

    try {
        write(cast_message::text(m_sender_id, default_receiver_id, ns::heartbeat, R"({"type":"PING"})"));
        open_virtual_connection(default_receiver_id);
    } catch(std::exception& e) {
        log::warn("Unable to open virtual connection to {}: {}", m_remote_name, e.what());
        if(!abort_connect(generation))
            throw connection_error {connection_error::reason::closed, fmt::format("Channel to {} closed while connecting", m_remote_name)};
        throw connection_error {connection_error::reason::handshake_failed,
            fmt::format("Unable to open virtual connection to {}: {}", m_remote_name, e.what())};
    }

    {
        std::lock_guard<std::mutex> lock {m_state_mutex};
        if(stale(generation))
            throw connection_error {connection_error::reason::closed, fmt::format("Channel to {} closed while connecting", m_remote_name)};
        m_state = connection_state::connected;
        m_receiver = std::thread {&channel::receive_loop, this, generation, conn};
        m_heartbeat = std::thread {&channel::heartbeat_loop, this, generation};
    }
    log::info("Connected to {} as {}", m_remote_name, m_sender_id);
    notify_state(connection_state::connecting, connection_state::connected);
}

void channel::disconnect()
{
    close_connection(std::nullopt, fmt::format("Channel to {} closed", m_remote_name));
}

decoded_message channel::send(std::string_view destination_id, std::string_view nspace, json payload,
    std::optional<std::chrono::milliseconds> timeout)
{
    return send_impl(destination_id, nspace, std::move(payload), timeout, std::nullopt);
}

decoded_message channel::send_impl(std::string_view destination_id, std::string_view nspace, json payload,
    std::optional<std::chrono::milliseconds> timeout, std::optional<size_t> expected)
{
    if(destination_id.empty() || nspace.empty())
        throw std::invalid_argument {"destination id and namespace must not be empty"};
    if(!payload.is_object())
        throw std::invalid_argument {"payload must be a JSON object"};
    if(m_receiving_thread.load() == std::this_thread::get_id())
        throw std::logic_error {"send() would wait for its own receiving thread, use post() from synchronous listeners"};
    if(!connected())
        throw connection_error {connection_error::reason::not_connected, fmt::format("Channel to {} is not connected", m_remote_name)};

    open_virtual_connection(destination_id);

    const uint64_t req_id = next_request_id();
    payload["requestId"] = req_id;

    std::future<decoded_message> response;
    {
        std::lock_guard<std::mutex> lock {m_pending_mutex};
        pending_request& pending = m_pending[req_id];
        pending.expected = expected;
        response = pending.promise.get_future();
    }

    try {
        write(cast_message::text(m_sender_id, destination_id, nspace, payload.dump()));
    } catch(std::exception& e) {
        // If the entry is already gone the channel closed concurrently and get() reports that
        if(remove_pending(req_id))
            throw connection_error {connection_error::reason::closed,
                fmt::format("Unable to send request {} to {}: {}", req_id, m_remote_name, e.what())};
    }

    const auto wait = timeout.value_or(m_options.request_timeout);
    if(response.wait_for(wait) == std::future_status::timeout && remove_pending(req_id))
        throw timeout_error {fmt::format("Waiting for response to request {} timed out after {} ms", req_id, wait.count()), req_id};

    decoded_message result = response.get();
    if(auto err = std::get_if<error_response>(&result))
        throw device_error {fmt::format("Request {} failed: {} {}", req_id, err->type, err->reason.value_or("")),
            err->type, err->payload};
    if(auto err = std::get_if<launch_error_response>(&result))
        throw device_error {fmt::format("Application launch error: {}", err->reason), "LAUNCH_ERROR", err->payload};

    return result;
}

void channel::post(std::string_view destination_id, std::string_view nspace, json payload)
{
    if(destination_id.empty() || nspace.empty())
        throw std::invalid_argument {"destination id and namespace must not be empty"};
    if(!payload.is_object())
        throw std::invalid_argument {"payload must be a JSON object"};

    open_virtual_connection(destination_id);
    payload["requestId"] = next_request_id();
    write(cast_message::text(m_sender_id, destination_id, nspace, payload.dump()));
}

void channel::post_raw(std::string_view destination_id, std::string_view nspace, std::string payload)
{
    if(destination_id.empty() || nspace.empty())
        throw std::invalid_argument {"destination id and namespace must not be empty"};

    open_virtual_connection(destination_id);
    write(cast_message::text(m_sender_id, destination_id, nspace, std::move(payload)));
}

void channel::open_virtual_connection(std::string_view destination_id)
{
    std::string dest {destination_id};
    {
        std::lock_guard<std::mutex> lock {m_sessions_mutex};
        if(!m_sessions.insert(dest).second)
            return;
    }

    try {
        write(cast_message::text(m_sender_id, dest, ns::connection, connect_payload()));
    } catch(std::exception&) {
        std::lock_guard<std::mutex> lock {m_sessions_mutex};
        m_sessions.erase(dest);
        throw;
    }
}

void channel::close_virtual_connection(std::string_view destination_id)
{
    std::string dest {destination_id};
    {
        std::lock_guard<std::mutex> lock {m_sessions_mutex};
        if(m_sessions.erase(dest) == 0)
            return;
    }
    write(cast_message::text(m_sender_id, dest, ns::connection, close_payload()));
}

connection_state channel::state() const
{
    std::lock_guard<std::mutex> lock {m_state_mutex};
    return m_state;
}

size_t channel::pending_requests() const
{
    std::lock_guard<std::mutex> lock {m_pending_mutex};
    return m_pending.size();
}

void channel::receive_loop(uint64_t generation, std::shared_ptr<transport> conn)
{
    const std::thread::id self = std::this_thread::get_id();
    m_receiving_thread.store(self);

    while(!stale(generation))
    {
        std::string frame;
        try {
            frame = read_frame(*conn, m_options.max_frame_size);
        } catch(std::exception& e) {
            if(stale(generation))
            {
                log::debug("Reading from {} stopped, channel closed", m_remote_name);
                break;
            }
            log::warn("Error while reading from {}: {}", m_remote_name, e.what());
            close_connection(generation, fmt::format("Connection to {} lost: {}", m_remote_name, e.what()));
            break;
        }

        m_last_received.store(now_ms());
        try {
            handle_frame(generation, frame);
        } catch(std::exception& e) {
            log::warn("Error while handling message from {}: {}", m_remote_name, e.what());
        }
    }

    std::thread::id expected = self;
    m_receiving_thread.compare_exchange_strong(expected, std::thread::id {});
}

void channel::handle_frame(uint64_t generation, const std::string& frame)
{
    cast_message msg;
    try {
        msg = parse_cast_message(frame);
    } catch(decode_error& e) {
        log::warn("Error while processing protobuf from {}: {}", m_remote_name, e.what());
        return;
    }

    if(msg.nspace == ns::heartbeat)
    {
        log::trace(" <-- {} {}", msg.nspace, msg.payload);
        decoded_message beat = resolve(msg);
        if(std::holds_alternative<ping_response>(beat))
            write(cast_message::text(m_sender_id, msg.source_id, ns::heartbeat, R"({"type":"PONG"})"));
        return;
    }

    if(msg.kind == cast_message::payload_kind::string)
        log::debug(" <-- [{}] {}", msg.nspace, msg.payload);
    else
        log::debug(" <-- [{}] {} binary bytes", msg.nspace, msg.payload.size());

    decoded_message decoded = resolve(msg);
    if(auto req_id = request_id(decoded); req_id && fulfill(*req_id, decoded))
        return;

    if(auto failure = std::get_if<parse_failure>(&decoded))
        log::warn("Received malformed JSON from {}: {}", m_remote_name, failure->text);

    const bool closed_by_receiver = std::holds_alternative<close_response>(decoded) && msg.nspace == ns::connection;

    std::optional<cast_event> event = to_event(std::move(decoded), msg);
    if(event)
        m_events->fire(*event);

    if(closed_by_receiver)
    {
        if(msg.source_id == default_receiver_id)
        {
            close_connection(generation, fmt::format("Connection closed by {}", m_remote_name));
        }
        else
        {
            std::lock_guard<std::mutex> lock {m_sessions_mutex};
            m_sessions.erase(msg.source_id);
        }
    }
}

void channel::heartbeat_loop(uint64_t generation)
{
    std::unique_lock<std::mutex> lock {m_heartbeat_mutex};
    while(!m_heartbeat_cond.wait_for(lock, m_options.heartbeat_interval, [this, generation]() { return stale(generation); }))
    {
        lock.unlock();

        const int64_t silence = now_ms() - m_last_received.load();
        if(silence > m_options.heartbeat_timeout.count())
        {
            log::warn("Nothing received from {} for {} ms, closing channel", m_remote_name, silence);
            close_connection(generation, fmt::format("Heartbeat of {} timed out", m_remote_name));
            return;
        }

        try {
            log::trace(" --> [{}] PING", ns::heartbeat);
            write(cast_message::text(m_sender_id, default_receiver_id, ns::heartbeat, R"({"type":"PING"})"));
        } catch(std::exception& e) {
            log::warn("Error while sending PING to {}: {}", m_remote_name, e.what());
        }

        lock.lock();
    }
}

bool channel::fulfill(uint64_t request_id, decoded_message& response)
{
    pending_request pending;
    {
        std::lock_guard<std::mutex> lock {m_pending_mutex};
        auto it = m_pending.find(request_id);
        if(it == m_pending.end())
            return false;
        pending = std::move(it->second);
        m_pending.erase(it);
    }

    if(pending.expected && *pending.expected != response.index())
        log::debug("Response to request {} is {}, not the expected shape", request_id, type_name(response));

    pending.promise.set_value(std::move(response));
    return true;
}

bool channel::remove_pending(uint64_t request_id)
{
    std::lock_guard<std::mutex> lock {m_pending_mutex};
    return m_pending.erase(request_id) > 0;
}

void channel::fail_pending(const std::string& why)
{
    std::unordered_map<uint64_t, pending_request> failed;
    {
        std::lock_guard<std::mutex> lock {m_pending_mutex};
        failed.swap(m_pending);
    }

    for(auto& it : failed)
    {
        it.second.promise.set_exception(std::make_exception_ptr(
            connection_error {connection_error::reason::closed, fmt::format("{} (request {})", why, it.first)}));
    }
}

void channel::write(const cast_message& msg)
{
    std::shared_ptr<transport> conn;
    {
        std::lock_guard<std::mutex> lock {m_state_mutex};
        conn = m_transport;
    }
    if(!conn)
        throw connection_error {connection_error::reason::not_connected, fmt::format("Channel to {} is not connected", m_remote_name)};

    write_to(*conn, msg);
}

void channel::write_to(transport& conn, const cast_message& msg)
{
    if(msg.nspace != ns::heartbeat)
        log::debug(" --> [{}] {}", msg.nspace, msg.payload);

    std::vector<char> data = encode_frame(serialize(msg));
    std::lock_guard<std::mutex> lock {m_write_mutex};
    conn.write(data.data(), data.size());
}

void channel::close_connection(std::optional<uint64_t> generation, const std::string& why)
{
    std::shared_ptr<transport> conn;
    std::shared_ptr<pending_connect> attempt;
    std::vector<std::thread> threads;
    connection_state previous;
    {
        std::lock_guard<std::mutex> lock {m_state_mutex};
        if(m_state == connection_state::disconnected || (generation && stale(*generation)))
            return;

        previous = m_state;
        m_state = connection_state::disconnected;
        ++m_generation;
        conn = std::move(m_transport);
        attempt = std::move(m_pending_connect);

        // A thread closing its own channel is joined by the next connect() or the destructor
        for(std::thread* t : {&m_receiver, &m_heartbeat})
        {
            if(t->joinable() && t->get_id() != std::this_thread::get_id())
                threads.push_back(std::move(*t));
        }
    }

    {
        std::lock_guard<std::mutex> lock {m_heartbeat_mutex};
    }
    m_heartbeat_cond.notify_all();

    if(attempt)
        attempt->abandon();

    if(conn)
    {
        if(previous == connection_state::connected)
        {
            std::set<std::string> sessions;
            {
                std::lock_guard<std::mutex> lock {m_sessions_mutex};
                sessions = m_sessions;
            }

            try {
                for(const auto& dest : sessions)
                    write_to(*conn, cast_message::text(m_sender_id, dest, ns::connection, close_payload()));
            } catch(std::exception& e) {
                log::debug("Unable to send CLOSE to {}: {}", m_remote_name, e.what());
            }
        }
        conn->close();
    }

    // Requests are failed before joining, a synchronous listener may be waiting in send()
    fail_pending(why);

    for(auto& t : threads)
        t.join();

    {
        std::lock_guard<std::mutex> lock {m_sessions_mutex};
        m_sessions.clear();
    }

    log::info("{}", why);
    notify_state(previous, connection_state::disconnected);
}

bool channel::abort_connect(uint64_t generation)
{
    std::shared_ptr<transport> conn;
    {
        std::lock_guard<std::mutex> lock {m_state_mutex};
        if(stale(generation) || m_state != connection_state::connecting)
            return false;
        m_state = connection_state::disconnected;
        ++m_generation;
        conn = std::move(m_transport);
        m_pending_connect.reset();
    }

    if(conn)
        conn->close();

    {
        std::lock_guard<std::mutex> lock {m_sessions_mutex};
        m_sessions.clear();
    }
    notify_state(connection_state::connecting, connection_state::disconnected);
    return true;
}

void channel::reap_threads()
{
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock {m_state_mutex};
        if(m_state != connection_state::disconnected)
            return;
        for(std::thread* t : {&m_receiver, &m_heartbeat})
        {
            if(t->joinable())
                threads.push_back(std::move(*t));
        }
    }

    for(auto& t : threads)
    {
        // The thread which closed the channel may be the one reconnecting it from a listener
        if(t.get_id() == std::this_thread::get_id())
            t.detach();
        else
            t.join();
    }
}

void channel::notify_state(connection_state previous, connection_state current)
{
    const connection_event event {previous, current};
    m_connection_events->fire(event);
    if(current != connection_state::connecting)
        m_events->fire(cast_event {cast_event_type::connected, event});
}

} // namespace castlink
